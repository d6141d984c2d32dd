#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"
#include "outbox/v1.hpp"

namespace outbox::util {

/*
  Payload identifiers.

  Layout:
      outbox-<resource>-<sequence:020>-<compact utc>-<16 random digits>

  The zero padded sequence is the primary sort key, so lexicographic order
  of ids equals allocation order for one resource type. The timestamp and
  random digits only disambiguate ids minted after the sequence counter was
  lost.
*/

inline constexpr std::string_view kIdPrefix          = "outbox-";
inline constexpr std::size_t      kSequenceWidth     = 20;
inline constexpr std::size_t      kDisambiguatorSize = 16;

std::string RandomDigits(std::size_t count);

outbox::v1::PayloadID MakePayloadID(outbox::v1::ResourceType type, uint64_t sequence, TimePoint created_at);

// "outbox-errors-"
std::string IdPrefix(outbox::v1::ResourceType type);

bool                    IsPayloadID(std::string_view value, outbox::v1::ResourceType type);
std::optional<uint64_t> ParseSequence(std::string_view value, outbox::v1::ResourceType type);

} // namespace outbox::util
