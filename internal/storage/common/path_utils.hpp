#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace outbox::storage::common {

inline constexpr std::string_view kRecordExtension = ".json";
inline constexpr std::string_view kTempExtension   = ".tmp";

inline void ValidateRecordName(const std::string& name) {
  if (name.empty()) {
    throw outbox::util::InvalidArgument("record name must not be empty");
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw outbox::util::InvalidArgument("record name contains invalid character");
    }
  }
  if (name == "." || name == "..") {
    throw outbox::util::InvalidArgument("record name must not be a relative path component");
  }
}

inline std::filesystem::path RecordPath(const std::filesystem::path& dir, const std::string& payload_id) {
  ValidateRecordName(payload_id);
  return dir / (payload_id + std::string(kRecordExtension));
}

inline bool IsTempName(std::string_view name) {
  return name.size() >= kTempExtension.size() && name.substr(name.size() - kTempExtension.size()) == kTempExtension;
}

} // namespace outbox::storage::common
