#include "scru128/core/clock.h"
#include "scru128/core/random_source.h"
#include "scru128/core/version.h"
#include "scru128/generator/generator.h"

#include "config.h"
#include "generate_logic.h"
#include "shared/arg_parser.h"

#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto parsed = scru128::gen::parse_args(argc, argv);
  if (parsed.config.help) {
    std::cout << "scru128_gen v" << scru128::core::kBuildVersion << "\n";
    scru128::apps::print_usage(std::cout, "scru128_gen [-n <count>] [options]",
                               scru128::gen::build_option_registry());
    return 0;
  }
  if (parsed.error_count > 0) {
    std::cerr << "Run 'scru128_gen --help' for usage.\n";
    return 2;
  }

  const auto& config = parsed.config;

  scru128::core::SystemClock clock;
  scru128::core::SystemRandom random;

  try {
    scru128::generator::Scru128Generator generator(clock, random, config.generator);
    return execute_generate(generator, config.count, config.strict, std::cout, std::cerr);
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }
}
