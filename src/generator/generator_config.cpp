#include "scru128/generator/generator_config.h"

#include "scru128/id/scru128_id.h"

namespace scru128::generator {

std::optional<core::RangeError> GeneratorConfig::validate() const {
  const auto millis = rollback_allowance.count();
  if (millis < 0 || static_cast<std::uint64_t>(millis) > id::kMaxTimestamp) {
    return core::RangeError::kRollbackAllowance;
  }
  return std::nullopt;
}

}  // namespace scru128::generator
