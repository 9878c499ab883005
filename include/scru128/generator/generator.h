#pragma once

#include "scru128/core/clock.h"
#include "scru128/core/random_source.h"
#include "scru128/core/result.h"
#include "scru128/generator/generator_config.h"
#include "scru128/id/scru128_id.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <mutex>
#include <string_view>

namespace scru128::generator {

// GenerateStatus reports which branch of the state machine produced an identifier.
// kNewTimestamp  — clock advanced; both counters renewed
// kCounterLoInc  — same (or slightly regressed) tick; counter_lo incremented
// kCounterHiInc  — counter_lo wrapped; counter_hi incremented, counter_lo renewed
// kTimestampInc  — both counters wrapped; stored timestamp pushed forward by 1 ms
// kClockRollback — clock went back beyond the allowance; generator reset to it
enum class GenerateStatus {
  kNewTimestamp,   // NOLINT(readability-identifier-naming)
  kCounterLoInc,   // NOLINT(readability-identifier-naming)
  kCounterHiInc,   // NOLINT(readability-identifier-naming)
  kTimestampInc,   // NOLINT(readability-identifier-naming)
  kClockRollback,  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::string_view generate_status_to_string(GenerateStatus status);

struct GenerateOutcome {
  id::Scru128Id id;       // NOLINT(readability-identifier-naming)
  GenerateStatus status;  // NOLINT(readability-identifier-naming)
};

// Scru128Generator produces monotonically increasing identifiers from a clock and a
// random source. It owns the (timestamp, counter_hi, counter_lo) state; the clock and
// random source are borrowed and must outlive the generator.
//
// Flavors differ only in how a rollback beyond the allowance is handled:
//
// | Flavor                 | Timestamp | On big clock rewind         |
// | ---------------------- | --------- | --------------------------- |
// | generate               | Clock     | Resets generator            |
// | generate_or_abort      | Clock     | kRollbackExceeded           |
// | generate_or_report     | Clock     | Resets, kClockRollback      |
// | generate_or_reset_core | Argument  | Resets generator            |
// | generate_or_abort_core | Argument  | kRollbackExceeded           |
// | generate_core          | Argument  | Resets, kClockRollback      |
//
// Every flavor fails with kTimestampOutOfRange if the timestamp is 0 or wider than
// 48 bits. A failed call leaves the state untouched.
//
// Thread-safe: every entry point runs the whole state transition under one mutex.
class Scru128Generator {
 public:
  // Throws std::invalid_argument if config.validate() reports a problem.
  Scru128Generator(core::IClock& clock, core::IRandomSource& random, GeneratorConfig config = {});
  ~Scru128Generator() = default;

  // Not copyable or movable (owns a mutex and the monotonic state)
  Scru128Generator(const Scru128Generator&) = delete;
  Scru128Generator& operator=(const Scru128Generator&) = delete;
  Scru128Generator(Scru128Generator&&) = delete;
  Scru128Generator& operator=(Scru128Generator&&) = delete;

  [[nodiscard]] core::Result<id::Scru128Id, core::GenerateError> generate();
  [[nodiscard]] core::Result<id::Scru128Id, core::GenerateError> generate_or_abort();
  [[nodiscard]] core::Result<GenerateOutcome, core::GenerateError> generate_or_report();

  // Core flavors take the timestamp (ms since epoch) and allowance from the caller
  // instead of the clock and config.
  // Throws std::invalid_argument if rollback_allowance is outside [0, 2^48 - 1] ms.
  [[nodiscard]] core::Result<id::Scru128Id, core::GenerateError> generate_or_reset_core(
      std::uint64_t timestamp, std::chrono::milliseconds rollback_allowance);
  [[nodiscard]] core::Result<id::Scru128Id, core::GenerateError> generate_or_abort_core(
      std::uint64_t timestamp, std::chrono::milliseconds rollback_allowance);
  [[nodiscard]] core::Result<GenerateOutcome, core::GenerateError> generate_core(
      std::uint64_t timestamp, std::chrono::milliseconds rollback_allowance);

  [[nodiscard]] const GeneratorConfig& config() const { return config_; }

  // Endless input range over generate(): `gen | std::views::take(n)`.
  // Like std::istream_iterator, begin() and operator++ each draw one identifier.
  class Iterator;
  [[nodiscard]] Iterator begin();
  [[nodiscard]] std::default_sentinel_t end() const { return std::default_sentinel; }

 private:
  enum class RollbackPolicy {
    kReset,  // NOLINT(readability-identifier-naming)
    kAbort,  // NOLINT(readability-identifier-naming)
  };

  struct State {
    std::uint64_t timestamp{0};  // 0 means "no prior call"
    std::uint32_t counter_hi{0};
    std::uint32_t counter_lo{0};
  };

  // advance_locked is the single state transition shared by every flavor.
  // Caller holds mutex_.
  core::Result<GenerateOutcome, core::GenerateError> advance_locked(std::uint64_t timestamp,
                                                                    std::uint64_t allowance,
                                                                    RollbackPolicy policy);

  core::IClock& clock_;
  core::IRandomSource& random_;
  GeneratorConfig config_;

  std::mutex mutex_;
  State state_;
};

// Throws std::runtime_error when generate() fails (clock outside the 48-bit range).
class Scru128Generator::Iterator {
 public:
  using iterator_concept = std::input_iterator_tag;
  using value_type = id::Scru128Id;
  using difference_type = std::ptrdiff_t;

  Iterator() = default;
  explicit Iterator(Scru128Generator& generator);

  const id::Scru128Id& operator*() const { return current_; }
  const id::Scru128Id* operator->() const { return &current_; }

  Iterator& operator++();
  void operator++(int) { ++*this; }

  // The sequence never ends.
  friend bool operator==(const Iterator& /*it*/, std::default_sentinel_t /*end*/) {
    return false;
  }

 private:
  Scru128Generator* generator_{nullptr};
  id::Scru128Id current_;
};

}  // namespace scru128::generator
