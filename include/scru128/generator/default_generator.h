#pragma once

#include "scru128/id/scru128_id.h"

#include <string>

namespace scru128::generator {

// Process-wide convenience generator backed by SystemClock and SystemRandom with the
// default GeneratorConfig. Constructed on first use; thread-safe.
// Callers that need their own clock, randomness or allowance construct a
// Scru128Generator instead.
//
// Both throw std::runtime_error if the system clock reads outside the 48-bit range.
[[nodiscard]] id::Scru128Id new_id();
[[nodiscard]] std::string new_string();

}  // namespace scru128::generator
