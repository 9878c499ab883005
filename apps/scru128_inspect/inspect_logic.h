#pragma once

#include <iosfwd>

// execute_inspect: read identifiers line by line from in and print one JSON object
// (indent 2) per non-blank line to out. Lines are trimmed before decoding.
// Invalid lines are printed as {input, error} objects and reported on err.
// Returns 0 when every line decoded, 1 otherwise, and 2 if reading from in failed.
int execute_inspect(std::istream& in, std::ostream& out, std::ostream& err);
