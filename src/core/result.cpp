#include "scru128/core/result.h"

namespace scru128::core {

std::string_view to_string(RangeError error) {
  switch (error) {
    case RangeError::kTimestamp:
      return "timestamp must be a 48-bit unsigned integer";
    case RangeError::kCounterHi:
      return "counter_hi must be a 24-bit unsigned integer";
    case RangeError::kCounterLo:
      return "counter_lo must be a 24-bit unsigned integer";
    case RangeError::kRollbackAllowance:
      return "rollback allowance out of reasonable range";
  }
  return "unknown range error";
}

std::string_view to_string(ParseError error) {
  switch (error) {
    case ParseError::kInvalidLength:
      return "invalid length: expected 25 characters";
    case ParseError::kInvalidDigit:
      return "invalid digit: expected [0-9A-Za-z]";
    case ParseError::kOutOfRange:
      return "out of 128-bit value range";
  }
  return "unknown parse error";
}

std::string_view to_string(GenerateError error) {
  switch (error) {
    case GenerateError::kTimestampOutOfRange:
      return "timestamp must be a 48-bit positive integer";
    case GenerateError::kRollbackExceeded:
      return "clock went backwards beyond the rollback allowance";
  }
  return "unknown generate error";
}

}  // namespace scru128::core
