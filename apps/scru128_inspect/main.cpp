#include "scru128/core/version.h"

#include "inspect_logic.h"
#include "shared/arg_parser.h"

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct InspectCliConfig {
  bool help{false};  // NOLINT(readability-identifier-naming)
};

std::vector<scru128::apps::Option<InspectCliConfig>> build_option_registry() {
  return {
      {"--help", false, "Show this help",
       [](InspectCliConfig& c, const std::string& /*value*/) {
         c.help = true;
         return true;
       }},
  };
}

}  // namespace

// Usage: scru128_inspect [file]
// Reads from stdin when file is omitted or "-".
int main(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = build_option_registry();
  auto parsed = scru128::apps::parse_options(argc, argv, options);

  if (parsed.config.help) {
    std::cout << "scru128_inspect v" << scru128::core::kBuildVersion << "\n"
              << "Show components of identifiers read from a file or stdin.\n";
    scru128::apps::print_usage(std::cout, "scru128_inspect [file]", options);
    return 0;
  }
  if (parsed.error_count > 0 || parsed.positional.size() > 1) {
    std::cerr << "Usage: scru128_inspect [file]\n";
    return 2;
  }

  if (parsed.positional.empty() || parsed.positional.front() == "-") {
    return execute_inspect(std::cin, std::cout, std::cerr);
  }

  const std::string& path = parsed.positional.front();
  std::ifstream file(path);
  if (!file) {
    std::cerr << "Error: cannot open " << path << "\n";
    return 2;
  }
  return execute_inspect(file, std::cout, std::cerr);
}
