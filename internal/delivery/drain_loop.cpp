#include "drain_loop.hpp"

#include <string>

#include "internal/model/resource_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/queue/payload_queue.hpp"
#include "internal/worker/task_scheduler.hpp"

namespace outbox::delivery {

using namespace outbox::v1;
using outbox::model::DrainState;
using outbox::observability::IntField;
using outbox::observability::StringField;

DrainLoop::DrainLoop(std::vector<std::shared_ptr<outbox::queue::PayloadQueue>> queues, std::shared_ptr<Transport> transport,
                     RetryCoordinator coordinator, std::shared_ptr<worker::TaskScheduler> scheduler)
    : transport_(std::move(transport)), coordinator_(std::move(coordinator)), scheduler_(std::move(scheduler)) {
  for (auto& queue : queues) {
    if (!queue) continue;
    auto lane   = std::make_unique<Lane>();
    lane->queue = std::move(queue);
    lanes_[static_cast<int>(lane->queue->Type())] = std::move(lane);
  }
}

DrainLoop::Lane* DrainLoop::Find(ResourceType type) const {
  auto it = lanes_.find(static_cast<int>(type));
  return it == lanes_.end() ? nullptr : it->second.get();
}

std::vector<ResourceType> DrainLoop::Types() const {
  std::vector<ResourceType> types;
  types.reserve(lanes_.size());
  for (const auto& [type, lane] : lanes_) {
    types.push_back(lane->queue->Type());
  }
  return types;
}

// ------------------------------------------------------------
// Triggers
// ------------------------------------------------------------

bool DrainLoop::Trigger(ResourceType type, TriggerReason reason) {
  auto* lane = Find(type);
  if (!lane || !online_) {
    return false;
  }

  if (reason == TriggerReason::kEnqueue || reason == TriggerReason::kTick) {
    const auto retry_at = lane->retry_at_ms.load();
    if (retry_at != 0 && util::ToUnixMillis(util::Now()) < retry_at) {
      return false;
    }
  } else {
    lane->retry_at_ms = 0;
  }

  auto lease = lane->flight.TryAcquire();
  if (!lease) {
    if (reason != TriggerReason::kTick) {
      lane->rerun = true;
      if (reason != TriggerReason::kEnqueue) {
        lane->rerun_forced = true;
      }
    }
    return false;
  }

  if (!scheduler_) {
    Drain(*lane);
    lease.Release();
    ReplayIfRequested(*lane);
    return true;
  }

  auto shared = std::make_shared<util::SingleFlight::Lease>(std::move(lease));

  worker::Task task;
  task.name = "drain:" + std::string(outbox::model::ToString(type));
  task.run  = [this, lane, shared] {
    Drain(*lane);
    shared->Release();
    ReplayIfRequested(*lane);
  };

  // A scheduler that has shut down means we are stopping; the payloads stay
  // queued for the next start.
  return scheduler_->Enqueue(std::move(task));
}

DrainReport DrainLoop::DrainNow(ResourceType type) {
  DrainReport report;
  report.skipped = true;

  auto* lane = Find(type);
  if (!lane || !online_) {
    return report;
  }

  auto lease = lane->flight.TryAcquire();
  if (!lease) {
    return report;
  }

  lane->retry_at_ms = 0;
  report            = Drain(*lane);
  lease.Release();
  ReplayIfRequested(*lane);
  return report;
}

/*
  Triggers that found the lane busy collapse into one replay. The replay
  keeps the strongest of them: if any could cancel a backoff, so does the
  replay; otherwise a backoff set by the drain that just finished holds.
*/
void DrainLoop::ReplayIfRequested(Lane& lane) {
  if (!lane.rerun.exchange(false)) {
    return;
  }
  const bool forced = lane.rerun_forced.exchange(false);
  Trigger(lane.queue->Type(), forced ? TriggerReason::kManual : TriggerReason::kEnqueue);
}

void DrainLoop::Park(Lane& lane, uint32_t retries) {
  const auto delay = coordinator_.Backoff(retries);
  lane.retry_at_ms = util::ToUnixMillis(util::Now()) + static_cast<uint64_t>(delay.count());
}

void DrainLoop::OnTick(bool periodic) {
  const auto now_ms = util::ToUnixMillis(util::Now());
  for (const auto& [type, lane] : lanes_) {
    const auto retry_at = lane->retry_at_ms.load();
    const bool due      = retry_at != 0 && now_ms >= retry_at;
    if (due || periodic) {
      Trigger(lane->queue->Type(), TriggerReason::kTick);
    }
  }
}

void DrainLoop::SetOnline(bool online) {
  const bool was_online = online_.exchange(online);
  OUTBOX_LOG_INFO("connectivity changed", {outbox::observability::BoolField("online", online)});

  if (online && !was_online) {
    for (const auto& [type, lane] : lanes_) {
      Trigger(lane->queue->Type(), TriggerReason::kConnectivity);
    }
  }
}

DrainState DrainLoop::State(ResourceType type) const {
  auto* lane = Find(type);
  return lane ? lane->state.load() : DrainState::kIdle;
}

std::optional<util::TimePoint> DrainLoop::RetryAt(ResourceType type) const {
  auto* lane = Find(type);
  if (!lane) {
    return std::nullopt;
  }
  const auto retry_at = lane->retry_at_ms.load();
  if (retry_at == 0) {
    return std::nullopt;
  }
  return util::TimePoint{} + std::chrono::milliseconds(retry_at);
}

// ------------------------------------------------------------
// Drain
// ------------------------------------------------------------

void DrainLoop::SetState(Lane& lane, DrainState next) {
  const auto current = lane.state.load();
  if (!model::CanTransition(current, next)) {
    OUTBOX_LOG_ERROR("invalid drain transition", {StringField("resource", outbox::model::ToString(lane.queue->Type())),
                                                  StringField("from", model::ToString(current)), StringField("to", model::ToString(next))});
  }
  lane.state = next;
}

TransportResult DrainLoop::SendSafely(Lane& lane, const StoredPayload& payload) {
  if (!transport_) {
    return TransportResult::NetworkError("no transport configured");
  }

  try {
    return transport_->Send(payload);
  } catch (const std::exception& e) {
    OUTBOX_LOG_WARN("transport threw", {StringField("resource", outbox::model::ToString(lane.queue->Type())),
                                        StringField("payload_id", payload.id().value()), StringField("error", e.what())});
    return TransportResult::NetworkError(std::string("transport threw: ") + e.what());
  } catch (...) {
    return TransportResult::NetworkError("transport threw a non-standard exception");
  }
}

/*
  Idle → Attempting → Settling → (Attempting ...) → Idle

  Called with the lane's flight lease held.
*/
DrainReport DrainLoop::Drain(Lane& lane) {
  DrainReport report;
  auto&       queue = *lane.queue;

  lane.retry_at_ms = 0;

  bool keep_going = true;
  while (keep_going && online_) {
    SetState(lane, DrainState::kAttempting);

    auto payload = queue.Peek();
    if (!payload) {
      break;
    }

    const auto result = SendSafely(lane, *payload);
    SetState(lane, DrainState::kSettling);

    const auto decision = coordinator_.Classify(result, payload->retries());
    const bool applied  = coordinator_.Apply(queue, *payload, decision);
    ++report.attempted;

    if (!applied) {
      // Still at the head; hold off before sending it again.
      Park(lane, payload->retries());
      OUTBOX_LOG_WARN("queue update failed, drain parked",
                      {StringField("resource", outbox::model::ToString(queue.Type())), StringField("payload_id", payload->id().value())});
      break;
    }

    switch (decision.outcome) {
      case DELIVERY_OUTCOME_SUCCESS:
        ++report.delivered;
        break;
      case DELIVERY_OUTCOME_PERMANENT_FAILURE:
        ++report.dropped;
        break;
      case DELIVERY_OUTCOME_RETRYABLE_FAILURE: {
        ++report.retried;
        Park(lane, payload->retries());
        OUTBOX_LOG_INFO("delivery deferred", {StringField("resource", outbox::model::ToString(queue.Type())),
                                              StringField("payload_id", payload->id().value()), IntField("retries", payload->retries() + 1),
                                              IntField("backoff_ms", coordinator_.Backoff(payload->retries()).count())});
        keep_going = false;
        break;
      }
      case DELIVERY_OUTCOME_UNSPECIFIED:
      default:
        keep_going = false;
        break;
    }
  }

  SetState(lane, DrainState::kIdle);

  if (report.attempted > 0) {
    OUTBOX_LOG_DEBUG("drain finished", {StringField("resource", outbox::model::ToString(queue.Type())),
                                        IntField("attempted", static_cast<int64_t>(report.attempted)),
                                        IntField("delivered", static_cast<int64_t>(report.delivered)),
                                        IntField("retried", static_cast<int64_t>(report.retried)),
                                        IntField("dropped", static_cast<int64_t>(report.dropped))});
  }
  return report;
}

} // namespace outbox::delivery
