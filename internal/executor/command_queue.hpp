#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace demonlist::executor {

class DatabaseExecutor;

// Type-erased command bound to its reply channel.
using Task = std::function<void(DatabaseExecutor&)>;

/*
  Thread-safe blocking queue shared by all workers.

  After Shutdown() no new tasks are accepted; tasks already queued are
  still handed out until the queue is empty.
*/
class CommandQueue {
 public:
  // Throws util::InvalidState once the queue is shut down.
  void Enqueue(Task task);

  // blocking wait; nullopt once shut down and drained
  std::optional<Task> Dequeue();

  void Shutdown();

  bool IsShutdown() const;

  std::size_t Pending() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace demonlist::executor
