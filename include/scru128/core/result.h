#pragma once

#include <string_view>
#include <utility>
#include <variant>

namespace scru128::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).
// Each enum names one failure family; the enumerators say which check failed.

// RangeError: a value does not fit the bit width it is destined for.
enum class RangeError {
  kTimestamp,          // NOLINT(readability-identifier-naming)
  kCounterHi,          // NOLINT(readability-identifier-naming)
  kCounterLo,          // NOLINT(readability-identifier-naming)
  kRollbackAllowance,  // NOLINT(readability-identifier-naming)
};

// ParseError: text is not a valid 25-digit canonical representation.
enum class ParseError {
  kInvalidLength,  // NOLINT(readability-identifier-naming)
  kInvalidDigit,   // NOLINT(readability-identifier-naming)
  kOutOfRange,     // NOLINT(readability-identifier-naming)
};

// GenerateError: a generation call produced no identifier.
// kTimestampOutOfRange — clock reading is 0 or wider than 48 bits
// kRollbackExceeded    — strict flavors only; clock went back past the allowance
enum class GenerateError {
  kTimestampOutOfRange,  // NOLINT(readability-identifier-naming)
  kRollbackExceeded,     // NOLINT(readability-identifier-naming)
};

// Stable human-readable messages, used by the command-line tools.
[[nodiscard]] std::string_view to_string(RangeError error);
[[nodiscard]] std::string_view to_string(ParseError error);
[[nodiscard]] std::string_view to_string(GenerateError error);

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(E error) { return Result(std::move(error)); }

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] const T& value() const { return std::get<T>(data_); }
  [[nodiscard]] const E& error() const { return std::get<E>(data_); }

 private:
  explicit Result(T value) : data_(std::move(value)) {}
  explicit Result(E error) : data_(std::move(error)) {}

  std::variant<T, E> data_;
};

}  // namespace scru128::core
