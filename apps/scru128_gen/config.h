#pragma once

#include "shared/arg_parser.h"

#include "scru128/generator/generator_config.h"

#include <cstdint>
#include <vector>

namespace scru128::gen {

// GenCliConfig holds all parsed flags for scru128_gen.
// Every field has an explicit default.
struct GenCliConfig {
  std::uint64_t count{1};                // NOLINT(readability-identifier-naming)
  generator::GeneratorConfig generator;  // NOLINT(readability-identifier-naming)
  bool strict{false};                    // NOLINT(readability-identifier-naming)
  bool help{false};                      // NOLINT(readability-identifier-naming)
};

std::vector<apps::Option<GenCliConfig>> build_option_registry();

// parse_args returns the populated config; error_count > 0 means the command line
// was rejected (details already written to stderr).
apps::ParsedArgs<GenCliConfig> parse_args(int argc,
                                          char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

}  // namespace scru128::gen
