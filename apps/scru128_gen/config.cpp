#include "config.h"

#include "scru128/id/scru128_id.h"

#include <charconv>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>

namespace scru128::gen {

namespace {

// ────────────────────────────────────────────────────────────────
// Value Parsing
// ────────────────────────────────────────────────────────────────

// Strict unsigned decimal: digits only, no sign, no whitespace, no overflow.
std::optional<std::uint64_t> parse_uint64(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  std::uint64_t out = 0;
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return out;
}

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_count(GenCliConfig& config, const std::string& value) {
  const auto parsed = parse_uint64(value);
  if (!parsed.has_value()) {
    std::cerr << "Invalid -n: " << value << " (expected a non-negative integer)\n";
    return false;
  }
  config.count = parsed.value();
  return true;
}

bool handle_rollback_allowance(GenCliConfig& config, const std::string& value) {
  const auto parsed = parse_uint64(value);
  if (!parsed.has_value()) {
    std::cerr << "Invalid --rollback-allowance: " << value << " (expected milliseconds)\n";
    return false;
  }
  if (parsed.value() > id::kMaxTimestamp) {
    std::cerr << "Invalid --rollback-allowance: " << value << " (must fit in 48 bits)\n";
    return false;
  }
  config.generator.rollback_allowance =
      std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(parsed.value())};
  return true;
}

bool handle_strict(GenCliConfig& config, const std::string& /*value*/) {
  config.strict = true;
  return true;
}

bool handle_help(GenCliConfig& config, const std::string& /*value*/) {
  config.help = true;
  return true;
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<GenCliConfig>> build_option_registry() {
  return {
      {"-n", true, "Number of identifiers to generate (default 1)", handle_count},
      {"--rollback-allowance", true,
       "Tolerated backward clock jump in milliseconds (default 10000)",
       handle_rollback_allowance},
      {"--strict", false, "Fail instead of resetting on a larger clock rollback", handle_strict},
      {"--help", false, "Show this help", handle_help},
  };
}

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

apps::ParsedArgs<GenCliConfig> parse_args(int argc, char* argv[]) {
  auto parsed = apps::parse_options(argc, argv, build_option_registry());
  for (const auto& extra : parsed.positional) {
    std::cerr << "Unexpected argument: " << extra << "\n";
    ++parsed.error_count;
  }
  return parsed;
}

}  // namespace scru128::gen
