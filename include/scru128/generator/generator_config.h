#pragma once

#include "scru128/core/result.h"

#include <chrono>
#include <optional>

namespace scru128::generator {

// Default tolerance for backward clock jumps (NTP slews, VM migrations).
constexpr std::chrono::milliseconds kDefaultRollbackAllowance{10'000};

// GeneratorConfig holds the tunable policy of a Scru128Generator.
// Every field has an explicit default.
struct GeneratorConfig {
  // Largest backward clock jump that still reuses the stored timestamp.
  // Must be within [0, 2^48 - 1] milliseconds.
  std::chrono::milliseconds rollback_allowance{  // NOLINT(readability-identifier-naming)
                                               kDefaultRollbackAllowance};

  // validate returns the first problem found, or nullopt when the config is usable.
  [[nodiscard]] std::optional<core::RangeError> validate() const;
};

}  // namespace scru128::generator
