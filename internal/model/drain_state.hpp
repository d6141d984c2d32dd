#pragma once

#include <cstdint>
#include <string_view>

namespace outbox::model {

/*
  Per resource type delivery state.

      Idle ──peek──▶ Attempting ──send──▶ Settling
        ▲                                   │
        └──────── no payload / backoff ─────┘

  Settling loops straight back to Attempting while payloads remain and the
  last attempt did not end in a retryable failure.
*/
enum class DrainState : std::uint8_t {
  kIdle       = 0,
  kAttempting = 1,
  kSettling   = 2,
};

constexpr bool CanTransition(DrainState from, DrainState to) {
  switch (from) {
    case DrainState::kIdle:
      return to == DrainState::kAttempting || to == DrainState::kIdle;
    case DrainState::kAttempting:
      return to == DrainState::kSettling || to == DrainState::kIdle;
    case DrainState::kSettling:
      return to == DrainState::kAttempting || to == DrainState::kIdle;
  }
  return false;
}

constexpr std::string_view ToString(DrainState state) {
  switch (state) {
    case DrainState::kIdle:
      return "idle";
    case DrainState::kAttempting:
      return "attempting";
    case DrainState::kSettling:
      return "settling";
  }
  return "unknown";
}

} // namespace outbox::model
