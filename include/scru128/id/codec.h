#pragma once

#include "scru128/core/result.h"
#include "scru128/id/scru128_id.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace scru128::id {

// Canonical text form: 25 base-36 digits, big-endian, zero-padded, lowercase.
//
// LOCKED FORMAT:
// - Alphabet 0-9 then a-z; character codes increase with digit value, so
//   fixed-width text sorts exactly like the 128-bit integer.
// - Decoding is case-insensitive; encoding always emits lowercase.
// - 36^25 > 2^128, so the top of the digit range is rejected on decode.
constexpr std::size_t kEncodedLength = 25;
constexpr std::string_view kDigits = "0123456789abcdefghijklmnopqrstuvwxyz";

// encode renders any 128-bit value. Never fails.
[[nodiscard]] std::string encode(const Scru128Id& id);

// decode parses exactly 25 characters drawn case-insensitively from the alphabet.
// ParseError::kInvalidLength — length != 25
// ParseError::kInvalidDigit  — character outside [0-9A-Za-z]
// ParseError::kOutOfRange    — value >= 2^128
[[nodiscard]] core::Result<Scru128Id, core::ParseError> decode(std::string_view text);

}  // namespace scru128::id
