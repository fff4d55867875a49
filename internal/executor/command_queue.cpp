#include "command_queue.hpp"

#include "internal/util/errors.hpp"

namespace demonlist::executor {

void CommandQueue::Enqueue(Task task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw util::InvalidState("command queue is shut down");
    }
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<Task> CommandQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  Task task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void CommandQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

bool CommandQueue::IsShutdown() const {
  std::lock_guard lock(mutex_);
  return shutdown_;
}

std::size_t CommandQueue::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace demonlist::executor
