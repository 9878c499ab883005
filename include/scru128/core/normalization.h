#pragma once

#include <string>
#include <string_view>

namespace scru128::core {

// Deterministic ASCII-only text helpers, locale-independent.

// trim removes leading and trailing whitespace (ASCII space/tab/newline/carriage return)
inline std::string_view trim(const std::string_view input) {
  const auto is_space = [](const char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
  };

  std::size_t start = 0;
  while (start < input.size() && is_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_space(input[end - 1])) {
    --end;
  }

  return input.substr(start, end - start);
}

}  // namespace scru128::core
