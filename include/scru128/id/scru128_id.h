#pragma once

#include "scru128/core/result.h"

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>

namespace scru128::id {

// Field widths of the 128-bit layout, most significant field first:
//   timestamp (48) | counter_hi (24) | counter_lo (24) | entropy (32)
constexpr std::uint64_t kMaxTimestamp = 0xFFFF'FFFF'FFFF;
constexpr std::uint32_t kMaxCounterHi = 0xFF'FFFF;
constexpr std::uint32_t kMaxCounterLo = 0xFF'FFFF;

// Scru128Id is an immutable 128-bit unsigned integer holding four bit-packed fields.
//
// The value is kept as two 64-bit halves:
//   hi = timestamp << 16 | counter_hi >> 8
//   lo = (counter_hi & 0xFF) << 56 | counter_lo << 32 | entropy
// so the defaulted three-way comparison on (hi, lo) is the numeric order, which is
// also the lexicographic order of the canonical text form.
class Scru128Id {
 public:
  // Raw construction accepts every 128-bit value.
  constexpr Scru128Id() = default;
  constexpr Scru128Id(std::uint64_t hi, std::uint64_t lo) : hi_(hi), lo_(lo) {}

  // from_fields packs the four fields; fails with the RangeError naming the first
  // field that does not fit its width.
  [[nodiscard]] static core::Result<Scru128Id, core::RangeError> from_fields(
      std::uint64_t timestamp, std::uint32_t counter_hi, std::uint32_t counter_lo,
      std::uint32_t entropy);

  // Big-endian byte interchange (16 bytes, most significant first).
  [[nodiscard]] static Scru128Id from_bytes(const std::array<std::uint8_t, 16>& bytes);
  [[nodiscard]] std::array<std::uint8_t, 16> to_bytes() const;

  // Shorthands for id::decode / id::encode.
  [[nodiscard]] static core::Result<Scru128Id, core::ParseError> from_string(
      std::string_view text);
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] constexpr std::uint64_t hi() const { return hi_; }
  [[nodiscard]] constexpr std::uint64_t lo() const { return lo_; }

  [[nodiscard]] constexpr std::uint64_t timestamp() const { return hi_ >> 16; }
  [[nodiscard]] constexpr std::uint32_t counter_hi() const {
    return static_cast<std::uint32_t>(((hi_ & 0xFFFF) << 8) | (lo_ >> 56));
  }
  [[nodiscard]] constexpr std::uint32_t counter_lo() const {
    return static_cast<std::uint32_t>((lo_ >> 32) & kMaxCounterLo);
  }
  [[nodiscard]] constexpr std::uint32_t entropy() const {
    return static_cast<std::uint32_t>(lo_ & 0xFFFF'FFFF);
  }

  auto operator<=>(const Scru128Id&) const = default;  // C++20: generates ==, !=, <, <=, >, >=

 private:
  std::uint64_t hi_{0};
  std::uint64_t lo_{0};
};

// Streams the canonical 25-digit text.
std::ostream& operator<<(std::ostream& os, const Scru128Id& id);

}  // namespace scru128::id

template <>
struct std::hash<scru128::id::Scru128Id> {
  std::size_t operator()(const scru128::id::Scru128Id& id) const noexcept {
    constexpr auto kGolden = static_cast<std::size_t>(0x9E37'79B9'7F4A'7C15ULL);
    const std::size_t h = std::hash<std::uint64_t>{}(id.hi());
    return h ^ (std::hash<std::uint64_t>{}(id.lo()) + kGolden + (h << 6) + (h >> 2));
  }
};
