#pragma once

#include "scru128/id/scru128_id.h"

#include <nlohmann/json.hpp>

#include <array>
#include <string>
#include <string_view>

namespace scru128::inspect {

// fields_hex renders the four fields as lowercase zero-padded hex, most significant
// field first: timestamp (12 digits), counter_hi (6), counter_lo (6), entropy (8).
[[nodiscard]] std::array<std::string, 4> fields_hex(const id::Scru128Id& id);

// inspection_to_json describes a decoded identifier.
// Keys: input, canonical, timestampIso, timestamp, counterHi, counterLo, entropy, fieldsHex.
// Numeric fields are decimal strings so 48-bit values survive any JSON reader.
[[nodiscard]] nlohmann::json inspection_to_json(std::string_view input, const id::Scru128Id& id);

// inspect_line decodes one line of text and describes it.
// On decode failure the object carries only `input` and `error`; never partial fields.
[[nodiscard]] nlohmann::json inspect_line(std::string_view input);

}  // namespace scru128::inspect
