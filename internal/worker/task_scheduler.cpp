#include "task_scheduler.hpp"

namespace outbox::worker {

bool TaskScheduler::Enqueue(Task task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::optional<Task> TaskScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  Task task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void TaskScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

void TaskScheduler::Reopen() {
  std::lock_guard lock(mutex_);
  shutdown_ = false;
}

bool TaskScheduler::IsShutdown() const {
  std::lock_guard lock(mutex_);
  return shutdown_;
}

} // namespace outbox::worker
