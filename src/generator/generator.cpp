#include "scru128/generator/generator.h"

#include <stdexcept>
#include <string>

namespace scru128::generator {

namespace {

constexpr unsigned kCounterBits = 24;
constexpr unsigned kEntropyBits = 32;

// Throws for allowances the caller could never have meant (negative or wider than a timestamp).
std::uint64_t checked_allowance(std::chrono::milliseconds rollback_allowance) {
  const GeneratorConfig candidate{rollback_allowance};
  if (const auto problem = candidate.validate(); problem.has_value()) {
    throw std::invalid_argument(std::string(core::to_string(problem.value())));
  }
  return static_cast<std::uint64_t>(rollback_allowance.count());
}

}  // namespace

std::string_view generate_status_to_string(GenerateStatus status) {
  switch (status) {
    case GenerateStatus::kNewTimestamp:
      return "new_timestamp";
    case GenerateStatus::kCounterLoInc:
      return "counter_lo_inc";
    case GenerateStatus::kCounterHiInc:
      return "counter_hi_inc";
    case GenerateStatus::kTimestampInc:
      return "timestamp_inc";
    case GenerateStatus::kClockRollback:
      return "clock_rollback";
  }
  return "unknown";
}

Scru128Generator::Scru128Generator(core::IClock& clock, core::IRandomSource& random,
                                   GeneratorConfig config)
    : clock_(clock), random_(random), config_(config) {
  if (const auto problem = config_.validate(); problem.has_value()) {
    throw std::invalid_argument("Invalid generator config: " +
                                std::string(core::to_string(problem.value())));
  }
}

core::Result<id::Scru128Id, core::GenerateError> Scru128Generator::generate() {
  using R = core::Result<id::Scru128Id, core::GenerateError>;
  std::lock_guard<std::mutex> lock(mutex_);
  const auto outcome =
      advance_locked(clock_.now_unix_millis(),
                     static_cast<std::uint64_t>(config_.rollback_allowance.count()),
                     RollbackPolicy::kReset);
  if (!outcome.has_value()) {
    return R::err(outcome.error());
  }
  return R::ok(outcome.value().id);
}

core::Result<id::Scru128Id, core::GenerateError> Scru128Generator::generate_or_abort() {
  using R = core::Result<id::Scru128Id, core::GenerateError>;
  std::lock_guard<std::mutex> lock(mutex_);
  const auto outcome =
      advance_locked(clock_.now_unix_millis(),
                     static_cast<std::uint64_t>(config_.rollback_allowance.count()),
                     RollbackPolicy::kAbort);
  if (!outcome.has_value()) {
    return R::err(outcome.error());
  }
  return R::ok(outcome.value().id);
}

core::Result<GenerateOutcome, core::GenerateError> Scru128Generator::generate_or_report() {
  std::lock_guard<std::mutex> lock(mutex_);
  return advance_locked(clock_.now_unix_millis(),
                        static_cast<std::uint64_t>(config_.rollback_allowance.count()),
                        RollbackPolicy::kReset);
}

core::Result<id::Scru128Id, core::GenerateError> Scru128Generator::generate_or_reset_core(
    std::uint64_t timestamp, std::chrono::milliseconds rollback_allowance) {
  using R = core::Result<id::Scru128Id, core::GenerateError>;
  const auto allowance = checked_allowance(rollback_allowance);
  std::lock_guard<std::mutex> lock(mutex_);
  const auto outcome = advance_locked(timestamp, allowance, RollbackPolicy::kReset);
  if (!outcome.has_value()) {
    return R::err(outcome.error());
  }
  return R::ok(outcome.value().id);
}

core::Result<id::Scru128Id, core::GenerateError> Scru128Generator::generate_or_abort_core(
    std::uint64_t timestamp, std::chrono::milliseconds rollback_allowance) {
  using R = core::Result<id::Scru128Id, core::GenerateError>;
  const auto allowance = checked_allowance(rollback_allowance);
  std::lock_guard<std::mutex> lock(mutex_);
  const auto outcome = advance_locked(timestamp, allowance, RollbackPolicy::kAbort);
  if (!outcome.has_value()) {
    return R::err(outcome.error());
  }
  return R::ok(outcome.value().id);
}

core::Result<GenerateOutcome, core::GenerateError> Scru128Generator::generate_core(
    std::uint64_t timestamp, std::chrono::milliseconds rollback_allowance) {
  const auto allowance = checked_allowance(rollback_allowance);
  std::lock_guard<std::mutex> lock(mutex_);
  return advance_locked(timestamp, allowance, RollbackPolicy::kReset);
}

core::Result<GenerateOutcome, core::GenerateError> Scru128Generator::advance_locked(
    std::uint64_t timestamp, std::uint64_t allowance, RollbackPolicy policy) {
  using R = core::Result<GenerateOutcome, core::GenerateError>;

  if (timestamp == 0 || timestamp > id::kMaxTimestamp) {
    return R::err(core::GenerateError::kTimestampOutOfRange);
  }

  // Work on a copy; state_ is only replaced once an identifier is certain.
  State next = state_;
  GenerateStatus status = GenerateStatus::kNewTimestamp;

  const auto draw_counter = [this]() {
    return random_.next_bits(kCounterBits) & id::kMaxCounterLo;
  };
  const auto renew_counters = [&next, &draw_counter]() {
    next.counter_hi = draw_counter();
    next.counter_lo = draw_counter();
  };

  if (timestamp > next.timestamp) {
    next.timestamp = timestamp;
    renew_counters();
  } else if (next.timestamp - timestamp <= allowance) {
    // Same tick, or a small regression: keep the stored (greater) timestamp.
    if (next.counter_lo < id::kMaxCounterLo) {
      ++next.counter_lo;
      status = GenerateStatus::kCounterLoInc;
    } else if (next.counter_hi < id::kMaxCounterHi) {
      ++next.counter_hi;
      next.counter_lo = draw_counter();
      status = GenerateStatus::kCounterHiInc;
    } else {
      // Counter space of this millisecond exhausted: borrow the next one.
      if (next.timestamp >= id::kMaxTimestamp) {
        return R::err(core::GenerateError::kTimestampOutOfRange);
      }
      ++next.timestamp;
      renew_counters();
      status = GenerateStatus::kTimestampInc;
    }
  } else if (policy == RollbackPolicy::kAbort) {
    return R::err(core::GenerateError::kRollbackExceeded);
  } else {
    next.timestamp = timestamp;
    renew_counters();
    status = GenerateStatus::kClockRollback;
  }

  const auto built = id::Scru128Id::from_fields(next.timestamp, next.counter_hi, next.counter_lo,
                                                random_.next_bits(kEntropyBits));
  if (!built.has_value()) {
    // Unreachable: every field was range-checked above.
    return R::err(core::GenerateError::kTimestampOutOfRange);
  }

  state_ = next;
  return R::ok(GenerateOutcome{built.value(), status});
}

Scru128Generator::Iterator Scru128Generator::begin() {
  return Iterator(*this);
}

Scru128Generator::Iterator::Iterator(Scru128Generator& generator) : generator_(&generator) {
  ++*this;
}

Scru128Generator::Iterator& Scru128Generator::Iterator::operator++() {
  const auto result = generator_->generate();
  if (!result.has_value()) {
    throw std::runtime_error("Failed to generate identifier: " +
                             std::string(core::to_string(result.error())));
  }
  current_ = result.value();
  return *this;
}

}  // namespace scru128::generator
