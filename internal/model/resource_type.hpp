#pragma once

#include <optional>
#include <string_view>

#include "outbox/v1.hpp"

namespace outbox::model {

constexpr std::string_view ToString(outbox::v1::ResourceType type) {
  switch (type) {
    case outbox::v1::RESOURCE_TYPE_ERRORS:
      return "errors";
    case outbox::v1::RESOURCE_TYPE_SESSIONS:
      return "sessions";
    case outbox::v1::RESOURCE_TYPE_UNSPECIFIED:
    default:
      return "unspecified";
  }
}

constexpr std::optional<outbox::v1::ResourceType> ParseResourceType(std::string_view name) {
  if (name == "errors") {
    return outbox::v1::RESOURCE_TYPE_ERRORS;
  }
  if (name == "sessions") {
    return outbox::v1::RESOURCE_TYPE_SESSIONS;
  }
  return std::nullopt;
}

} // namespace outbox::model
