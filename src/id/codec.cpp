#include "scru128/id/codec.h"

#include <array>
#include <cstdint>

namespace scru128::id {

namespace {

constexpr std::uint64_t kBase = 36;
constexpr std::uint64_t kLimbMask = 0xFFFF'FFFF;

// Big-endian 32-bit limbs; small enough that limb * 36 + carry fits in 64 bits.
using Limbs = std::array<std::uint32_t, 4>;

// digit_value maps [0-9A-Za-z] to 0..35 and everything else to -1.
// Explicit char math keeps it locale-independent.
int digit_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'z') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'Z') {
    return ch - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::string encode(const Scru128Id& id) {
  Limbs limbs = {
      static_cast<std::uint32_t>(id.hi() >> 32),
      static_cast<std::uint32_t>(id.hi() & kLimbMask),
      static_cast<std::uint32_t>(id.lo() >> 32),
      static_cast<std::uint32_t>(id.lo() & kLimbMask),
  };

  std::string out(kEncodedLength, '0');
  for (std::size_t pos = kEncodedLength; pos-- > 0;) {
    // Long division of the whole value by 36; the remainder is the next digit.
    std::uint64_t rem = 0;
    for (auto& limb : limbs) {
      const std::uint64_t cur = (rem << 32) | limb;
      limb = static_cast<std::uint32_t>(cur / kBase);
      rem = cur % kBase;
    }
    out[pos] = kDigits[rem];
  }
  return out;
}

core::Result<Scru128Id, core::ParseError> decode(std::string_view text) {
  using R = core::Result<Scru128Id, core::ParseError>;

  if (text.size() != kEncodedLength) {
    return R::err(core::ParseError::kInvalidLength);
  }
  for (const char ch : text) {
    if (digit_value(ch) < 0) {
      return R::err(core::ParseError::kInvalidDigit);
    }
  }

  Limbs limbs{};
  for (const char ch : text) {
    auto carry = static_cast<std::uint64_t>(digit_value(ch));
    for (std::size_t i = limbs.size(); i-- > 0;) {
      const std::uint64_t cur = static_cast<std::uint64_t>(limbs[i]) * kBase + carry;
      limbs[i] = static_cast<std::uint32_t>(cur & kLimbMask);
      carry = cur >> 32;
    }
    if (carry != 0) {
      return R::err(core::ParseError::kOutOfRange);
    }
  }

  const std::uint64_t hi = (static_cast<std::uint64_t>(limbs[0]) << 32) | limbs[1];
  const std::uint64_t lo = (static_cast<std::uint64_t>(limbs[2]) << 32) | limbs[3];
  return R::ok(Scru128Id{hi, lo});
}

}  // namespace scru128::id
