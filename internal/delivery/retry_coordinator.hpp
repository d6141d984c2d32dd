#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "transport.hpp"
#include "outbox/v1.hpp"

namespace outbox::queue {
class PayloadQueue;
}

namespace outbox::delivery {

struct RetryOptions {
  // 0 = retry until truncation evicts the payload
  uint32_t                  max_retries = 0;
  std::chrono::milliseconds min_backoff{1000};
  std::chrono::milliseconds max_backoff{60000};
};

struct Decision {
  outbox::v1::DeliveryOutcome outcome = outbox::v1::DELIVERY_OUTCOME_UNSPECIFIED;
  std::string                 reason;
};

/*
  Turns transport results into queue mutations.

    Success            → remove
    RetryableFailure   → retries + 1, payload keeps its position
    PermanentFailure   → remove + one ErrorSink report
*/
class RetryCoordinator {
 public:
  explicit RetryCoordinator(RetryOptions options = {});

  /*
    network error / timeout      retryable
    2xx                          success
    408, 429, 5xx                retryable
    anything else                permanent

    A retryable result that would push retries past max_retries is
    permanent.
  */
  Decision Classify(const TransportResult& result, uint32_t retries) const;

  /*
    Returns false when the queue could not be changed (storage failure);
    the payload is then still at the head, unchanged.
  */
  bool Apply(outbox::queue::PayloadQueue& queue, const outbox::v1::StoredPayload& payload, const Decision& decision) const;

  // min_backoff * 2^retries, capped at max_backoff
  std::chrono::milliseconds Backoff(uint32_t retries) const;

  static outbox::v1::DeliveryOutcome ClassifyStatus(int status_code);

  const RetryOptions& Options() const { return options_; }

 private:
  RetryOptions options_;
};

} // namespace outbox::delivery
