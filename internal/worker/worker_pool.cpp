#include "worker_pool.hpp"

#include "internal/observability/logging.hpp"

namespace outbox::worker {

using outbox::observability::StringField;

WorkerPool::WorkerPool(std::shared_ptr<TaskScheduler> scheduler, uint32_t threads)
    : scheduler_(std::move(scheduler)),
      thread_count_(threads == 0 ? 1 : threads) {}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) return;

  // a previous Stop() shut the scheduler down
  scheduler_->Reopen();

  threads_.reserve(thread_count_);
  for (uint32_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

void WorkerPool::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable())
      thread.join();
  }
  threads_.clear();
}

void WorkerPool::Run() {
  while (true) {

    auto task = scheduler_->Dequeue();
    if (!task)
      break;

    try {
      task->run();
    }
    catch (const std::exception& e) {
      OUTBOX_LOG_ERROR("background task failed", {StringField("task", task->name), StringField("error", e.what())});
    }
  }
}

}
