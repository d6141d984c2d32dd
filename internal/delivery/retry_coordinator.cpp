#include "retry_coordinator.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/queue/payload_queue.hpp"

namespace outbox::delivery {

using namespace outbox::v1;
using outbox::queue::ErrorKind;
using outbox::queue::QueueError;

namespace {

std::string DescribeResult(const TransportResult& result) {
  switch (result.kind) {
    case TransportResult::Kind::kResponse:
      return "http " + std::to_string(result.status_code) + (result.message.empty() ? "" : ": " + result.message);
    case TransportResult::Kind::kTimeout:
      return "timeout" + (result.message.empty() ? std::string() : ": " + result.message);
    case TransportResult::Kind::kNetworkError:
    default:
      return "network error" + (result.message.empty() ? std::string() : ": " + result.message);
  }
}

void Report(outbox::queue::PayloadQueue& queue, ErrorKind kind, const StoredPayload& payload, const std::string& message) {
  QueueError error;
  error.kind          = kind;
  error.resource_type = queue.Type();
  error.payload_id    = payload.id().value();
  error.message       = message;
  outbox::queue::ReportTo(queue.Sink(), error);
}

} // namespace

RetryCoordinator::RetryCoordinator(RetryOptions options) : options_(options) {
  if (options_.max_backoff < options_.min_backoff) {
    options_.max_backoff = options_.min_backoff;
  }
}

DeliveryOutcome RetryCoordinator::ClassifyStatus(int status_code) {
  if (status_code >= 200 && status_code < 300) {
    return DELIVERY_OUTCOME_SUCCESS;
  }
  if (status_code == 408 || status_code == 429 || (status_code >= 500 && status_code < 600)) {
    return DELIVERY_OUTCOME_RETRYABLE_FAILURE;
  }
  return DELIVERY_OUTCOME_PERMANENT_FAILURE;
}

Decision RetryCoordinator::Classify(const TransportResult& result, uint32_t retries) const {
  Decision decision;
  decision.reason = DescribeResult(result);

  if (result.kind == TransportResult::Kind::kResponse) {
    decision.outcome = ClassifyStatus(result.status_code);
  } else {
    decision.outcome = DELIVERY_OUTCOME_RETRYABLE_FAILURE;
  }

  if (decision.outcome == DELIVERY_OUTCOME_RETRYABLE_FAILURE && options_.max_retries > 0 && retries >= options_.max_retries) {
    decision.outcome = DELIVERY_OUTCOME_PERMANENT_FAILURE;
    decision.reason  = "retry limit exceeded after " + std::to_string(retries) + " retries, last " + decision.reason;
  }
  return decision;
}

/*
  Counters and delivery reports follow the queue: nothing is counted or
  reported for a mutation that did not land, so a payload that stays at the
  head is reported once, when it finally leaves.
*/
bool RetryCoordinator::Apply(outbox::queue::PayloadQueue& queue, const StoredPayload& payload, const Decision& decision) const {
  using outbox::queue::RemoveOutcome;

  switch (decision.outcome) {
    case DELIVERY_OUTCOME_SUCCESS:
      if (queue.Erase(payload.id()) == RemoveOutcome::kFailed) {
        return false;
      }
      ++queue.Counters().delivered;
      return true;

    case DELIVERY_OUTCOME_RETRYABLE_FAILURE: {
      StoredPayload patch;
      patch.set_retries(payload.retries() + 1);
      if (!queue.Update(payload.id(), patch)) {
        return false;
      }
      ++queue.Counters().retried;
      Report(queue, ErrorKind::kDeliveryRetryable, payload, decision.reason);
      return true;
    }

    case DELIVERY_OUTCOME_PERMANENT_FAILURE:
      if (queue.Erase(payload.id()) == RemoveOutcome::kFailed) {
        return false;
      }
      ++queue.Counters().dropped;
      Report(queue, ErrorKind::kDeliveryPermanent, payload, decision.reason);
      return true;

    case DELIVERY_OUTCOME_UNSPECIFIED:
    default:
      OUTBOX_LOG_ERROR("unclassified delivery outcome, payload left queued",
                       {outbox::observability::StringField("payload_id", payload.id().value())});
      return false;
  }
}

std::chrono::milliseconds RetryCoordinator::Backoff(uint32_t retries) const {
  const auto shift = std::min<uint32_t>(retries, 10);
  const std::chrono::milliseconds delay = options_.min_backoff * (int64_t{1} << shift);
  return std::min(delay, options_.max_backoff);
}

} // namespace outbox::delivery
