#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace outbox::delivery {

class DrainLoop;

/*
  Periodically triggers drains and re-arms lanes whose backoff expired.

  Wakes every `poll` to check backoff deadlines; issues a periodic trigger
  for every lane once per `interval`.
*/
class DrainTicker {
public:
  DrainTicker(std::shared_ptr<DrainLoop> drain, std::chrono::milliseconds interval, std::chrono::milliseconds poll);
  ~DrainTicker();

  DrainTicker(const DrainTicker&)            = delete;
  DrainTicker& operator=(const DrainTicker&) = delete;

  void Start();
  void Stop();

private:
  void Loop();

  std::shared_ptr<DrainLoop> drain_;
  std::chrono::milliseconds  interval_;
  std::chrono::milliseconds  poll_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

}
