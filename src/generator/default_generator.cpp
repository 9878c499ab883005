#include "scru128/generator/default_generator.h"

#include "scru128/core/clock.h"
#include "scru128/core/random_source.h"
#include "scru128/generator/generator.h"
#include "scru128/id/codec.h"

#include <stdexcept>
#include <string>

namespace scru128::generator {

namespace {

// Members are declared in dependency order so the generator's borrowed
// references stay valid for its whole lifetime.
struct DefaultGenerator {
  core::SystemClock clock;                    // NOLINT(readability-identifier-naming)
  core::SystemRandom random;                  // NOLINT(readability-identifier-naming)
  Scru128Generator generator{clock, random};  // NOLINT(readability-identifier-naming)
};

DefaultGenerator& default_generator() {
  static DefaultGenerator instance;
  return instance;
}

}  // namespace

id::Scru128Id new_id() {
  const auto result = default_generator().generator.generate();
  if (!result.has_value()) {
    throw std::runtime_error("Failed to generate identifier: " +
                             std::string(core::to_string(result.error())));
  }
  return result.value();
}

std::string new_string() {
  return id::encode(new_id());
}

}  // namespace scru128::generator
