#include "scru128/inspect/inspection.h"

#include "scru128/core/time.h"
#include "scru128/id/codec.h"

#include <cstdint>
#include <iomanip>
#include <sstream>

namespace scru128::inspect {

namespace {

std::string to_hex(std::uint64_t value, int width) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0') << std::setw(width) << value;
  return oss.str();
}

}  // namespace

std::array<std::string, 4> fields_hex(const id::Scru128Id& id) {
  return {
      to_hex(id.timestamp(), 12),
      to_hex(id.counter_hi(), 6),
      to_hex(id.counter_lo(), 6),
      to_hex(id.entropy(), 8),
  };
}

nlohmann::json inspection_to_json(std::string_view input, const id::Scru128Id& id) {
  using json = nlohmann::json;

  json out;
  out["input"] = std::string(input);
  out["canonical"] = id::encode(id);
  out["timestampIso"] = core::format_iso8601_millis(id.timestamp());
  out["timestamp"] = std::to_string(id.timestamp());
  out["counterHi"] = std::to_string(id.counter_hi());
  out["counterLo"] = std::to_string(id.counter_lo());
  out["entropy"] = std::to_string(id.entropy());

  json hex = json::array();
  for (auto& field : fields_hex(id)) {
    hex.push_back(std::move(field));
  }
  out["fieldsHex"] = std::move(hex);
  return out;
}

nlohmann::json inspect_line(std::string_view input) {
  const auto decoded = id::decode(input);
  if (!decoded.has_value()) {
    nlohmann::json out;
    out["input"] = std::string(input);
    out["error"] = std::string(core::to_string(decoded.error()));
    return out;
  }
  return inspection_to_json(input, decoded.value());
}

}  // namespace scru128::inspect
