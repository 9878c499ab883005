#pragma once

#include "scru128/core/clock.h"
#include "scru128/core/random_source.h"

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace scru128::testing {

// ScriptedRandom replays a fixed list of values (masked to the requested width),
// wrapping around at the end. The generator draws counter_hi, counter_lo, then
// entropy on a new timestamp, and only entropy on a plain counter_lo increment.
class ScriptedRandom final : public core::IRandomSource {
 public:
  explicit ScriptedRandom(std::vector<std::uint32_t> values) : values_(std::move(values)) {}

  std::uint32_t next_bits(unsigned bits) override {
    const std::uint32_t value = values_[index_ % values_.size()];
    ++index_;
    return bits >= 32 ? value : value & ((std::uint32_t{1} << bits) - 1);
  }

  [[nodiscard]] std::size_t draws() const { return index_; }

 private:
  std::vector<std::uint32_t> values_;
  std::size_t index_{0};
};

// ScriptedClock returns the listed timestamps in order, repeating the last one.
class ScriptedClock final : public core::IClock {
 public:
  explicit ScriptedClock(std::vector<std::uint64_t> readings) : readings_(std::move(readings)) {}

  std::uint64_t now_unix_millis() override {
    const std::size_t i = index_ < readings_.size() ? index_ : readings_.size() - 1;
    ++index_;
    return readings_[i];
  }

 private:
  std::vector<std::uint64_t> readings_;
  std::size_t index_{0};
};

}  // namespace scru128::testing
