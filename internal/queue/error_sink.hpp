#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <string_view>

#include "outbox/v1.hpp"

namespace outbox::queue {

enum class ErrorKind : std::uint8_t {
  kStorageFailure    = 0,
  kCorruptEntry      = 1,
  kDeliveryRetryable = 2,
  kDeliveryPermanent = 3,
};

constexpr std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kStorageFailure:
      return "storage_failure";
    case ErrorKind::kCorruptEntry:
      return "corrupt_entry";
    case ErrorKind::kDeliveryRetryable:
      return "delivery_retryable";
    case ErrorKind::kDeliveryPermanent:
      return "delivery_permanent";
  }
  return "unknown";
}

struct QueueError {
  ErrorKind                kind          = ErrorKind::kStorageFailure;
  outbox::v1::ResourceType resource_type = outbox::v1::RESOURCE_TYPE_UNSPECIFIED;
  std::string              payload_id;
  std::string              message;
};

/*
  Receives every internal failure of the queue and the delivery engine.

  Core operations never throw to their callers; they report here and fall
  back to a safe default (skip, drop, retain unchanged). Implementations
  may be called concurrently from worker threads.
*/
class ErrorSink {
 public:
  virtual ~ErrorSink() = default;

  virtual void Report(const QueueError& error) = 0;
};

/*
  Default sink: one structured log line per failure.
*/
class LoggingErrorSink final : public ErrorSink {
 public:
  void Report(const QueueError& error) override;
};

/*
  Maps internal exceptions onto the error taxonomy.
*/
ErrorKind ToErrorKind(const std::exception& e);

/*
  Delivers to the sink, containing anything the sink itself throws.
*/
void ReportTo(ErrorSink& sink, const QueueError& error);

} // namespace outbox::queue
