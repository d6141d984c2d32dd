#include "payload_id.hpp"

#include <charconv>
#include <iomanip>
#include <random>
#include <sstream>

#include "internal/model/resource_type.hpp"

namespace outbox::util {

std::string RandomDigits(std::size_t count) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<int>  digit(0, 9);

  std::string out;
  out.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    out.push_back(static_cast<char>('0' + digit(rng)));
  }
  return out;
}

std::string IdPrefix(outbox::v1::ResourceType type) {
  std::string prefix(kIdPrefix);
  prefix += outbox::model::ToString(type);
  prefix += '-';
  return prefix;
}

outbox::v1::PayloadID MakePayloadID(outbox::v1::ResourceType type, uint64_t sequence, TimePoint created_at) {
  std::ostringstream value;
  value << IdPrefix(type) << std::setw(kSequenceWidth) << std::setfill('0') << sequence << '-' << ToCompactUtc(created_at) << '-'
        << RandomDigits(kDisambiguatorSize);

  outbox::v1::PayloadID id;
  id.set_value(value.str());
  return id;
}

std::optional<uint64_t> ParseSequence(std::string_view value, outbox::v1::ResourceType type) {
  const auto prefix = IdPrefix(type);
  if (value.size() < prefix.size() + kSequenceWidth + 1 || value.substr(0, prefix.size()) != prefix) {
    return std::nullopt;
  }

  const auto digits = value.substr(prefix.size(), kSequenceWidth);
  if (value[prefix.size() + kSequenceWidth] != '-') {
    return std::nullopt;
  }

  uint64_t   sequence = 0;
  const auto result   = std::from_chars(digits.data(), digits.data() + digits.size(), sequence);
  if (result.ec != std::errc{} || result.ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return sequence;
}

bool IsPayloadID(std::string_view value, outbox::v1::ResourceType type) {
  if (!ParseSequence(value, type)) {
    return false;
  }
  for (char c : value) {
    if (c == '/' || c == '\\' || c == '\0') {
      return false;
    }
  }
  return true;
}

} // namespace outbox::util
