#include "truncation_policy.hpp"

#include <memory>
#include <string>
#include <vector>

#include "internal/model/resource_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/worker/task_scheduler.hpp"
#include "payload_queue.hpp"

namespace outbox::queue {

using outbox::observability::IntField;
using outbox::observability::StringField;

TruncationPolicy::TruncationPolicy(PayloadQueue& queue, uint32_t max_items) : queue_(queue), max_items_(max_items) {
}

void TruncationPolicy::Trigger(worker::TaskScheduler* scheduler) {
  auto lease = guard_.TryAcquire();
  if (!lease) {
    return;
  }

  if (scheduler) {
    // The lease travels with the task and is released when the pass ends.
    auto shared = std::make_shared<util::SingleFlight::Lease>(std::move(lease));

    worker::Task task;
    task.name = "truncate:" + std::string(outbox::model::ToString(queue_.Type()));
    task.run  = [this, shared] {
      RunGuarded();
      shared->Release();
    };
    if (scheduler->Enqueue(std::move(task))) {
      return;
    }
    lease = std::move(*shared);
  }

  RunGuarded();
}

std::size_t TruncationPolicy::Run() {
  auto lease = guard_.TryAcquire();
  if (!lease) {
    return 0;
  }
  return RunGuarded();
}

/*
  list (FIFO) → overflow = count - max_items → remove the overflow oldest.

  Every removal is attempted even if an earlier one failed; failures are
  reported by PayloadQueue::Erase.
*/
std::size_t TruncationPolicy::RunGuarded() {
  const auto ids = queue_.List();
  if (ids.size() <= max_items_) {
    return 0;
  }

  const std::size_t overflow = ids.size() - max_items_;
  std::size_t       evicted  = 0;
  for (std::size_t i = 0; i < overflow; ++i) {
    outbox::v1::PayloadID id;
    id.set_value(ids[i]);
    // Records already gone (delivered meanwhile) are not evictions.
    if (queue_.Erase(id) == RemoveOutcome::kRemoved) {
      ++evicted;
    }
  }

  queue_.Counters().evicted += evicted;
  if (evicted == 0) {
    return 0;
  }
  OUTBOX_LOG_WARN("queue over capacity, evicted oldest payloads",
                  {StringField("resource", outbox::model::ToString(queue_.Type())), IntField("evicted", static_cast<int64_t>(evicted)),
                   IntField("max_items", max_items_)});
  return evicted;
}

} // namespace outbox::queue
