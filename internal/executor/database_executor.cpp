#include "database_executor.hpp"

namespace demonlist::executor {

DatabaseExecutor::DatabaseExecutor(std::shared_ptr<const service::ServiceContext> services) : services_(std::move(services)) {
}

db::Connection& DatabaseExecutor::Connection() {
  if (!connection_) {
    throw util::InvalidState("no connection outside of command execution");
  }
  return *connection_;
}

db::Repository& DatabaseExecutor::Repository() {
  // handle is taken lazily, on the first command this worker runs
  if (!repository_) {
    repository_ = services_->repository;
    if (!repository_) {
      throw util::InvalidState("service context has no repository");
    }
  }
  return *repository_;
}

DatabaseExecutor::ConnectionLease::ConnectionLease(DatabaseExecutor& executor) : executor_(executor) {
  executor_.connection_ = executor_.Repository().Acquire();
}

DatabaseExecutor::ConnectionLease::~ConnectionLease() {
  executor_.connection_.reset();
}

} // namespace demonlist::executor
