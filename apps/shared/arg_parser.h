#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace scru128::apps {

// Option describes a single command-line flag accepted by an app.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure; a failed handler
// leaves the config field at its previous value and counts as a parse error.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedArgs {
  Config config;                        // NOLINT(readability-identifier-naming)
  std::vector<std::string> positional;  // NOLINT(readability-identifier-naming)
  int error_count{0};                   // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag
// to its handler, and returns the populated config.
// Unknown flags and missing values are reported to stderr and counted. Non-flag
// tokens (and a lone "-") are collected as positional arguments in order.
template <typename Config>
ParsedArgs<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                 const std::vector<Option<Config>>& options, int start = 1,
                                 Config default_config = {}) {
  ParsedArgs<Config> parsed{std::move(default_config), {}, 0};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      bool ok = true;
      if (opt->requires_value) {
        if (i + 1 < argc) {
          ok = opt->handler(parsed.config,
                            argv[++i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        } else {
          std::cerr << "Option " << arg << " requires a value\n";
          ok = false;
        }
      } else {
        ok = opt->handler(parsed.config, "");
      }
      if (!ok) {
        ++parsed.error_count;
      }
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      ++parsed.error_count;
    } else {
      parsed.positional.push_back(std::move(arg));
    }
  }

  return parsed;
}

// print_usage writes one line per option: name, "<value>" marker, description.
template <typename Config>
void print_usage(std::ostream& out, const std::string& synopsis,
                 const std::vector<Option<Config>>& options) {
  out << "Usage: " << synopsis << "\n\nOptions:\n";
  for (const auto& opt : options) {
    std::string flag = opt.name + (opt.requires_value ? " <value>" : "");
    if (flag.size() < 28) {
      flag.append(28 - flag.size(), ' ');
    }
    out << "  " << flag << opt.description << "\n";
  }
}

}  // namespace scru128::apps
