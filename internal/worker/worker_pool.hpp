#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include "task_scheduler.hpp"

namespace outbox::worker {

/*
  Background threads that execute scheduled tasks.

  Executes:
      truncation passes
      drain runs
*/
class WorkerPool {
 public:
  WorkerPool(std::shared_ptr<TaskScheduler> scheduler, uint32_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();

  // Runs every task already queued, then joins.
  void Stop();

 private:
  void Run();

  std::shared_ptr<TaskScheduler> scheduler_;
  uint32_t                       thread_count_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace outbox::worker
