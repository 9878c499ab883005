#include "scru128/id/scru128_id.h"

#include "scru128/id/codec.h"

#include <ostream>

namespace scru128::id {

core::Result<Scru128Id, core::RangeError> Scru128Id::from_fields(std::uint64_t timestamp,
                                                                 std::uint32_t counter_hi,
                                                                 std::uint32_t counter_lo,
                                                                 std::uint32_t entropy) {
  using R = core::Result<Scru128Id, core::RangeError>;

  if (timestamp > kMaxTimestamp) {
    return R::err(core::RangeError::kTimestamp);
  }
  if (counter_hi > kMaxCounterHi) {
    return R::err(core::RangeError::kCounterHi);
  }
  if (counter_lo > kMaxCounterLo) {
    return R::err(core::RangeError::kCounterLo);
  }

  const std::uint64_t hi = (timestamp << 16) | (counter_hi >> 8);
  const std::uint64_t lo = (static_cast<std::uint64_t>(counter_hi & 0xFF) << 56) |
                           (static_cast<std::uint64_t>(counter_lo) << 32) | entropy;
  return R::ok(Scru128Id{hi, lo});
}

Scru128Id Scru128Id::from_bytes(const std::array<std::uint8_t, 16>& bytes) {
  std::uint64_t hi = 0;
  std::uint64_t lo = 0;
  for (std::size_t i = 0; i < 8; ++i) {
    hi = (hi << 8) | bytes[i];
    lo = (lo << 8) | bytes[i + 8];
  }
  return Scru128Id{hi, lo};
}

std::array<std::uint8_t, 16> Scru128Id::to_bytes() const {
  std::array<std::uint8_t, 16> bytes{};
  for (std::size_t i = 0; i < 8; ++i) {
    const auto shift = static_cast<unsigned>(56 - 8 * i);
    bytes[i] = static_cast<std::uint8_t>(hi_ >> shift);
    bytes[i + 8] = static_cast<std::uint8_t>(lo_ >> shift);
  }
  return bytes;
}

core::Result<Scru128Id, core::ParseError> Scru128Id::from_string(std::string_view text) {
  return decode(text);
}

std::string Scru128Id::to_string() const {
  return encode(*this);
}

std::ostream& operator<<(std::ostream& os, const Scru128Id& id) {
  return os << encode(id);
}

}  // namespace scru128::id
