#pragma once

#include "scru128/generator/generator.h"

#include <cstdint>
#include <iosfwd>

// execute_generate: print `count` canonical identifiers to out, one per line.
// strict selects the abort flavor; a rollback beyond the allowance then stops the run
// with a diagnostic on err and exit status 1. Any other generation failure also returns 1.
// Takes the generator by reference so tests can inject clock and randomness.
int execute_generate(scru128::generator::Scru128Generator& generator, std::uint64_t count,
                     bool strict, std::ostream& out, std::ostream& err);
