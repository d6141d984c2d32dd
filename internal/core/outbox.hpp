#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/delivery/drain_loop.hpp"
#include "internal/queue/error_sink.hpp"
#include "internal/queue/payload_queue.hpp"
#include "outbox/v1.hpp"

namespace outbox::worker {
class TaskScheduler;
class WorkerPool;
}
namespace outbox::delivery {
class DrainTicker;
}

namespace outbox::core {

/*
  Host-facing entry point: one durable queue per resource type plus the
  machinery that drains them.

  Producers call Enqueue from any thread; it returns once the payload is on
  disk. Truncation and delivery happen on the worker pool. Connectivity and
  app lifecycle signals from the host are forwarded with
  OnConnectivityChanged / OnResume.

  Built by factory::Build.
*/
class Outbox {
 public:
  Outbox(std::vector<std::shared_ptr<outbox::queue::PayloadQueue>> queues, std::shared_ptr<outbox::queue::ErrorSink> sink,
         std::shared_ptr<delivery::DrainLoop> drain, std::shared_ptr<worker::TaskScheduler> scheduler,
         std::unique_ptr<worker::WorkerPool> workers, std::unique_ptr<delivery::DrainTicker> ticker);
  ~Outbox();

  Outbox(const Outbox&)            = delete;
  Outbox& operator=(const Outbox&) = delete;

  /*
    Start workers and the ticker, then retry whatever a previous process
    left behind.
  */
  void Start();

  /*
    Stop the ticker, let queued background work finish, join workers.
    Undelivered payloads stay on disk.
  */
  void Stop();

  std::optional<outbox::v1::PayloadID> Enqueue(outbox::v1::ResourceType type, std::string body,
                                               const outbox::queue::EnqueueOptions& options = {});

  void OnConnectivityChanged(bool connected);
  void OnResume();

  // Drain one resource type on the calling thread.
  delivery::DrainReport Flush(outbox::v1::ResourceType type);

  std::shared_ptr<outbox::queue::PayloadQueue> Queue(outbox::v1::ResourceType type) const;
  delivery::DrainLoop&                         Drain() { return *drain_; }

  outbox::v1::StatsResponse Stats() const;

 private:
  std::unordered_map<int, std::shared_ptr<outbox::queue::PayloadQueue>> queues_;
  std::vector<outbox::v1::ResourceType>                                 order_;
  std::shared_ptr<outbox::queue::ErrorSink>                             sink_;
  std::shared_ptr<delivery::DrainLoop>                                  drain_;
  std::shared_ptr<worker::TaskScheduler>                                scheduler_;
  std::unique_ptr<worker::WorkerPool>                                   workers_;
  std::unique_ptr<delivery::DrainTicker>                                ticker_;
  bool                                                                  started_ = false;
};

} // namespace outbox::core
