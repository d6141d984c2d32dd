#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "task.hpp"

namespace outbox::worker {

/*
  Thread-safe blocking queue for background workers.
*/
class TaskScheduler {
 public:
  // false once Shutdown() has been called
  bool Enqueue(Task task);

  // blocking wait
  std::optional<Task> Dequeue();

  void Shutdown();

  // accept tasks again after Shutdown(); queued tasks are kept
  void Reopen();

  bool IsShutdown() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace outbox::worker
