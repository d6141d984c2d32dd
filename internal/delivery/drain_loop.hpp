#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "retry_coordinator.hpp"
#include "transport.hpp"
#include "internal/model/drain_state.hpp"
#include "internal/util/single_flight.hpp"
#include "internal/util/time.hpp"
#include "outbox/v1.hpp"

namespace outbox::queue {
class PayloadQueue;
}
namespace outbox::worker {
class TaskScheduler;
}

namespace outbox::delivery {

enum class TriggerReason : std::uint8_t {
  kEnqueue      = 0,
  kConnectivity = 1,
  kTick         = 2,
  kResume       = 3,
  kManual       = 4,
};

constexpr std::string_view ToString(TriggerReason reason) {
  switch (reason) {
    case TriggerReason::kEnqueue:
      return "enqueue";
    case TriggerReason::kConnectivity:
      return "connectivity";
    case TriggerReason::kTick:
      return "tick";
    case TriggerReason::kResume:
      return "resume";
    case TriggerReason::kManual:
      return "manual";
  }
  return "unknown";
}

struct DrainReport {
  bool        skipped   = false;
  std::size_t attempted = 0;
  std::size_t delivered = 0;
  std::size_t retried   = 0;
  std::size_t dropped   = 0;
};

/*
  Delivers queued payloads, oldest first, one at a time per resource type.

  Each resource type is a lane with its own single-flight guard, so errors
  and sessions drain concurrently on different workers while a second
  trigger for a busy lane does not start a second drain. Such triggers
  (ticks excepted) are remembered and replayed as one once the running drain
  finishes, so a payload enqueued at the tail end of a drain is not left
  waiting for the next tick.

  After a retryable failure, or when the queue cannot be updated after a
  send, the lane parks until its backoff expires. Enqueue and tick triggers
  are ignored until then; connectivity, resume and manual triggers cancel
  the backoff, also when they arrived during the drain that parked.

  Queues must outlive the DrainLoop and any drain it scheduled.
*/
class DrainLoop {
 public:
  DrainLoop(std::vector<std::shared_ptr<outbox::queue::PayloadQueue>> queues, std::shared_ptr<Transport> transport, RetryCoordinator coordinator,
            std::shared_ptr<worker::TaskScheduler> scheduler = nullptr);

  DrainLoop(const DrainLoop&)            = delete;
  DrainLoop& operator=(const DrainLoop&) = delete;

  /*
    Schedule a drain on the worker scheduler. Returns true if one was
    scheduled by this call.
  */
  bool Trigger(outbox::v1::ResourceType type, TriggerReason reason);

  /*
    Drain on the calling thread under the same guard. `skipped` is set when
    another drain of the lane is in flight or the device is offline.
  */
  DrainReport DrainNow(outbox::v1::ResourceType type);

  /*
    Periodic hook for DrainTicker: lanes whose backoff expired are always
    triggered, the rest only when `periodic` is set.
  */
  void OnTick(bool periodic);

  void SetOnline(bool online);
  bool Online() const { return online_.load(); }

  model::DrainState              State(outbox::v1::ResourceType type) const;
  std::optional<util::TimePoint> RetryAt(outbox::v1::ResourceType type) const;

  std::vector<outbox::v1::ResourceType> Types() const;

 private:
  struct Lane {
    std::shared_ptr<outbox::queue::PayloadQueue> queue;
    util::SingleFlight                           flight;
    std::atomic<model::DrainState>               state{model::DrainState::kIdle};
    std::atomic<bool>                            rerun{false};
    // a busy-lane trigger that cancels backoff was among those replayed
    std::atomic<bool>                            rerun_forced{false};
    // unix millis; 0 = no backoff
    std::atomic<uint64_t>                        retry_at_ms{0};
  };

  Lane*       Find(outbox::v1::ResourceType type) const;
  void        SetState(Lane& lane, model::DrainState next);
  DrainReport Drain(Lane& lane);
  TransportResult SendSafely(Lane& lane, const outbox::v1::StoredPayload& payload);
  void        ReplayIfRequested(Lane& lane);
  void        Park(Lane& lane, uint32_t retries);

  std::unordered_map<int, std::unique_ptr<Lane>> lanes_;
  std::shared_ptr<Transport>                      transport_;
  RetryCoordinator                                coordinator_;
  std::shared_ptr<worker::TaskScheduler>          scheduler_;
  std::atomic<bool>                               online_{true};
};

} // namespace outbox::delivery
