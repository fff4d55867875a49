#pragma once

#include <atomic>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/executor/command_queue.hpp"
#include "internal/executor/database_executor.hpp"
#include "internal/util/errors.hpp"

namespace demonlist::executor {

/*
  Fixed pool of worker threads consuming the shared CommandQueue.

  Send() blocks the caller until a worker has run the command and hands
  back its result, rethrowing any exception the handler raised. Sending
  to a pool that is not running throws util::InvalidState. Each
  worker runs one command at a time; there is no ordering between
  workers.
*/
class WorkerPool {
 public:
  WorkerPool(std::shared_ptr<const service::ServiceContext> services, std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();

  // Drains queued commands, then joins the workers. Idempotent.
  void Stop();

  std::size_t Threads() const {
    return threads_;
  }

  template <typename Command>
  typename Command::Result Send(Command command) {
    using Result = typename Command::Result;

    if (!running_) {
      throw util::InvalidState("worker pool is not running");
    }

    auto task = std::make_shared<std::packaged_task<Result(DatabaseExecutor&)>>(
        [command = std::move(command)](DatabaseExecutor& executor) { return executor.Execute(command); });
    auto reply = task->get_future();

    queue_.Enqueue([task](DatabaseExecutor& executor) { (*task)(executor); });
    return reply.get();
  }

 private:
  void Run(std::size_t index);

  std::shared_ptr<const service::ServiceContext> services_;
  std::size_t                                    threads_;

  CommandQueue             queue_;
  std::vector<std::thread> workers_;
  std::mutex               lifecycle_mutex_;
  std::atomic<bool>        running_{false};
};

} // namespace demonlist::executor
