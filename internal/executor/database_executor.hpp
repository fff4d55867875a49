#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <type_traits>

#include "internal/db/api/connection.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace demonlist::executor {

/*
  Runs commands on the calling thread.

  Each worker owns one executor. A top-level Execute() checks a
  connection out of the repository's pool for the duration of the
  command; Execute() calls made from inside a handler (sub-dispatch)
  reuse that connection and never touch the queue.

  A command is any type with
    using Result = ...;
    static constexpr const char* kName;
    Result Handle(DatabaseExecutor&) const;
*/
class DatabaseExecutor {
 public:
  explicit DatabaseExecutor(std::shared_ptr<const service::ServiceContext> services);

  DatabaseExecutor(const DatabaseExecutor&)            = delete;
  DatabaseExecutor& operator=(const DatabaseExecutor&) = delete;

  template <typename Command>
  typename Command::Result Execute(const Command& command) {
    if (connection_) {
      return Run(command);
    }

    ConnectionLease lease(*this);
    return Run(command);
  }

  // Connection of the command being executed. Throws InvalidState outside Execute().
  db::Connection& Connection();

  db::Repository& Repository();

  const service::ServiceContext& Services() const {
    return *services_;
  }

  bool HasConnection() const {
    return connection_ != nullptr;
  }

 private:
  class ConnectionLease {
   public:
    explicit ConnectionLease(DatabaseExecutor& executor);
    ~ConnectionLease();

   private:
    DatabaseExecutor& executor_;
  };

  template <typename Command>
  typename Command::Result Run(const Command& command) {
    DEMONLIST_LOG_DEBUG("executing command", {observability::StringField("command", Command::kName),
                                              observability::IntField("depth", static_cast<std::int64_t>(depth_))});
    ++depth_;
    try {
      if constexpr (std::is_void_v<typename Command::Result>) {
        command.Handle(*this);
        --depth_;
      } else {
        auto result = command.Handle(*this);
        --depth_;
        return result;
      }
    } catch (const util::Error& e) {
      if (--depth_ == 0) {
        DEMONLIST_LOG_WARN("command failed", {observability::StringField("command", Command::kName),
                                              observability::IntField("code", e.Code()),
                                              observability::StringField("error", e.what())});
      }
      throw;
    } catch (const std::exception& e) {
      if (--depth_ == 0) {
        DEMONLIST_LOG_ERROR("command failed", {observability::StringField("command", Command::kName),
                                               observability::StringField("error", e.what())});
      }
      throw;
    }
  }

  std::shared_ptr<const service::ServiceContext> services_;
  std::shared_ptr<db::Repository>                repository_;
  std::unique_ptr<db::Connection>                connection_;
  std::size_t                                    depth_ = 0;
};

} // namespace demonlist::executor
