#pragma once

#include <cstdint>
#include <string>

#include "outbox/v1.hpp"

namespace outbox::delivery {

/*
  Raw result of one send. Classification into success / retryable /
  permanent happens in RetryCoordinator, not in the transport.
*/
struct TransportResult {
  enum class Kind : std::uint8_t {
    kResponse     = 0,
    kNetworkError = 1,
    kTimeout      = 2,
  };

  Kind        kind        = Kind::kNetworkError;
  int         status_code = 0;
  std::string message;

  static TransportResult Response(int status_code, std::string message = {}) {
    return {Kind::kResponse, status_code, std::move(message)};
  }

  static TransportResult NetworkError(std::string message) {
    return {Kind::kNetworkError, 0, std::move(message)};
  }

  static TransportResult Timeout(std::string message = "timed out") {
    return {Kind::kTimeout, 0, std::move(message)};
  }
};

/*
  Sends one payload to the collector.

  Called from worker threads, one payload at a time per resource type.
  Ordinary network conditions must come back as kNetworkError / kTimeout
  rather than exceptions, and every call must eventually return: the drain
  for that resource type waits on it.
*/
class Transport {
 public:
  virtual ~Transport() = default;

  virtual TransportResult Send(const outbox::v1::StoredPayload& payload) = 0;
};

} // namespace outbox::delivery
