#include "outbox.hpp"

#include "internal/delivery/drain_ticker.hpp"
#include "internal/model/resource_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/worker/task_scheduler.hpp"
#include "internal/worker/worker_pool.hpp"

namespace outbox::core {

using namespace outbox::v1;
using outbox::delivery::TriggerReason;
using outbox::observability::IntField;
using outbox::observability::StringField;

Outbox::Outbox(std::vector<std::shared_ptr<outbox::queue::PayloadQueue>> queues, std::shared_ptr<outbox::queue::ErrorSink> sink,
               std::shared_ptr<delivery::DrainLoop> drain, std::shared_ptr<worker::TaskScheduler> scheduler,
               std::unique_ptr<worker::WorkerPool> workers, std::unique_ptr<delivery::DrainTicker> ticker)
    : sink_(sink ? std::move(sink) : std::make_shared<outbox::queue::LoggingErrorSink>()),
      drain_(std::move(drain)),
      scheduler_(std::move(scheduler)),
      workers_(std::move(workers)),
      ticker_(std::move(ticker)) {
  for (auto& queue : queues) {
    if (!queue) continue;
    order_.push_back(queue->Type());
    queues_[static_cast<int>(queue->Type())] = std::move(queue);
  }
}

Outbox::~Outbox() {
  Stop();

  // Tasks queued while never started still point into the queues; drop them
  // before the queues go away.
  if (scheduler_) {
    scheduler_->Shutdown();
    while (scheduler_->Dequeue()) {
    }
  }
}

void Outbox::Start() {
  if (started_) return;
  started_ = true;

  for (const auto type : order_) {
    Queue(type)->Init();
  }

  if (workers_) workers_->Start();
  if (ticker_) ticker_->Start();

  for (const auto type : order_) {
    const auto depth = Queue(type)->Size();
    if (depth > 0) {
      OUTBOX_LOG_INFO("resuming undelivered payloads",
                      {StringField("resource", outbox::model::ToString(type)), IntField("depth", static_cast<int64_t>(depth))});
    }
    drain_->Trigger(type, TriggerReason::kResume);
  }
}

void Outbox::Stop() {
  if (!started_) return;
  started_ = false;

  if (ticker_) ticker_->Stop();
  if (workers_) workers_->Stop();
}

std::optional<PayloadID> Outbox::Enqueue(ResourceType type, std::string body, const outbox::queue::EnqueueOptions& options) {
  auto queue = Queue(type);
  if (!queue) {
    outbox::queue::QueueError error;
    error.kind          = outbox::queue::ErrorKind::kStorageFailure;
    error.resource_type = type;
    error.message       = "no queue configured for resource " + std::string(outbox::model::ToString(type));
    outbox::queue::ReportTo(*sink_, error);
    return std::nullopt;
  }

  auto id = queue->Enqueue(std::move(body), options);
  if (id) {
    drain_->Trigger(type, TriggerReason::kEnqueue);
  }
  return id;
}

void Outbox::OnConnectivityChanged(bool connected) {
  drain_->SetOnline(connected);
}

void Outbox::OnResume() {
  for (const auto type : order_) {
    drain_->Trigger(type, TriggerReason::kResume);
  }
}

delivery::DrainReport Outbox::Flush(ResourceType type) {
  return drain_->DrainNow(type);
}

std::shared_ptr<outbox::queue::PayloadQueue> Outbox::Queue(ResourceType type) const {
  auto it = queues_.find(static_cast<int>(type));
  return it == queues_.end() ? nullptr : it->second;
}

StatsResponse Outbox::Stats() const {
  StatsResponse resp;
  for (const auto type : order_) {
    auto        queue    = Queue(type);
    const auto& counters = queue->Counters();

    auto* stats = resp.add_queues();
    stats->set_resource_type(type);
    stats->set_depth(queue->Size());
    stats->set_enqueued(counters.enqueued.load());
    stats->set_delivered(counters.delivered.load());
    stats->set_retried(counters.retried.load());
    stats->set_dropped(counters.dropped.load());
    stats->set_evicted(counters.evicted.load());
    stats->set_corrupt(counters.corrupt.load());
  }
  return resp;
}

} // namespace outbox::core
