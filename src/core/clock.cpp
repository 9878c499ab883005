#include "scru128/core/clock.h"

#include "scru128/core/time.h"

namespace scru128::core {

std::uint64_t SystemClock::now_unix_millis() {
  const auto millis = to_unix_millis(now_utc());
  // A clock set before 1970 reads as 0, which the generator rejects.
  return millis > 0 ? static_cast<std::uint64_t>(millis) : 0;
}

std::uint64_t FixedClock::now_unix_millis() {
  return fixed_millis_;
}

}  // namespace scru128::core
