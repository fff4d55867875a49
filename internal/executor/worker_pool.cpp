#include "worker_pool.hpp"

#include "internal/observability/logging.hpp"

namespace demonlist::executor {

WorkerPool::WorkerPool(std::shared_ptr<const service::ServiceContext> services, std::size_t threads)
    : services_(std::move(services)), threads_(threads == 0 ? 1 : threads) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  std::lock_guard lock(lifecycle_mutex_);
  if (running_ || queue_.IsShutdown()) return;

  running_ = true;
  workers_.reserve(threads_);
  for (std::size_t i = 0; i < threads_; ++i) {
    workers_.emplace_back(&WorkerPool::Run, this, i);
  }
  DEMONLIST_LOG_INFO("worker pool started", {observability::IntField("threads", static_cast<std::int64_t>(threads_))});
}

void WorkerPool::Stop() {
  std::lock_guard lock(lifecycle_mutex_);
  queue_.Shutdown();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();
  if (running_.exchange(false)) {
    DEMONLIST_LOG_INFO("worker pool stopped");
  }
}

void WorkerPool::Run(std::size_t index) {
  DatabaseExecutor executor(services_);

  while (auto task = queue_.Dequeue()) {
    // packaged_task stores handler exceptions for the caller
    (*task)(executor);
  }

  DEMONLIST_LOG_DEBUG("worker exiting", {observability::IntField("worker", static_cast<std::int64_t>(index))});
}

} // namespace demonlist::executor
