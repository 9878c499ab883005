#include "generate_logic.h"

#include "scru128/id/codec.h"

#include <ostream>

int execute_generate(scru128::generator::Scru128Generator& generator, std::uint64_t count,
                     bool strict, std::ostream& out, std::ostream& err) {
  for (std::uint64_t i = 0; i < count; ++i) {
    const auto result = strict ? generator.generate_or_abort() : generator.generate();
    if (!result.has_value()) {
      err << "Error: generation failed after " << i
          << " identifier(s): " << scru128::core::to_string(result.error()) << "\n";
      return 1;
    }
    out << scru128::id::encode(result.value()) << '\n';
  }
  out.flush();
  return 0;
}
