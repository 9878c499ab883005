#pragma once

#include <cstdint>

namespace scru128::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests/demos use fixed timestamps.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return current time as milliseconds since 1970-01-01T00:00:00Z.
  // Contract: a plain read with no side effects visible to the caller.
  virtual std::uint64_t now_unix_millis() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::uint64_t now_unix_millis() override;
};

// Fixed clock: returns the stored timestamp until set() changes it.
// For deterministic tests and demos. Not thread-safe.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::uint64_t fixed_millis) : fixed_millis_(fixed_millis) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::uint64_t now_unix_millis() override;

  void set(std::uint64_t millis) { fixed_millis_ = millis; }

 private:
  std::uint64_t fixed_millis_;
};

}  // namespace scru128::core
