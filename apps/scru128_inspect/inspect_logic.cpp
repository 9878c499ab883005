#include "inspect_logic.h"

#include "scru128/core/normalization.h"
#include "scru128/inspect/inspection.h"

#include <nlohmann/json.hpp>

#include <istream>
#include <ostream>
#include <string>

int execute_inspect(std::istream& in, std::ostream& out, std::ostream& err) {
  int status = 0;
  std::string line;
  while (std::getline(in, line)) {
    const auto trimmed = scru128::core::trim(line);
    if (trimmed.empty()) {
      continue;
    }

    const auto record = scru128::inspect::inspect_line(trimmed);
    if (record.contains("error")) {
      err << "warning: invalid identifier: " << trimmed << " ("
          << record["error"].get<std::string>() << ")\n";
      status = 1;
    }
    // Input is arbitrary bytes; invalid UTF-8 is rendered as U+FFFD.
    out << record.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
  }
  out.flush();
  if (in.bad()) {
    err << "Error: read failed\n";
    return 2;
  }
  return status;
}
