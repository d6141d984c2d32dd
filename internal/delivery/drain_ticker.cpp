#include "drain_ticker.hpp"

#include <algorithm>

#include "drain_loop.hpp"

namespace outbox::delivery {

DrainTicker::DrainTicker(std::shared_ptr<DrainLoop> drain, std::chrono::milliseconds interval, std::chrono::milliseconds poll)
    : drain_(std::move(drain)),
      interval_(std::max(interval, std::chrono::milliseconds(1))),
      poll_(std::clamp(poll, std::chrono::milliseconds(1), std::max(interval, std::chrono::milliseconds(1)))) {
}

DrainTicker::~DrainTicker() {
  Stop();
}

void DrainTicker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&DrainTicker::Loop, this);
}

void DrainTicker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void DrainTicker::Loop() {
  auto next_periodic = std::chrono::steady_clock::now() + interval_;

  std::unique_lock lock(mutex_);
  while (running_) {
    cv_.wait_for(lock, poll_, [&] { return !running_; });
    if (!running_) break;

    const auto now      = std::chrono::steady_clock::now();
    const bool periodic = now >= next_periodic;
    if (periodic) {
      next_periodic = now + interval_;
    }

    lock.unlock();
    drain_->OnTick(periodic);
    lock.lock();
  }
}

} // namespace outbox::delivery
