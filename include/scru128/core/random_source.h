#pragma once

#include <cstdint>
#include <random>

namespace scru128::core {

// Abstract random bit source for entropy injection.
// Production code draws from the OS entropy pool; tests inject seeded or scripted sources.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IRandomSource {
 public:
  virtual ~IRandomSource() = default;

  // Return `bits` uniformly distributed random bits in the low end of the result.
  // Contract: 1 <= bits <= 32; bits above position `bits` are zero.
  virtual std::uint32_t next_bits(unsigned bits) = 0;

 protected:
  IRandomSource() = default;
  IRandomSource(const IRandomSource&) = default;
  IRandomSource& operator=(const IRandomSource&) = default;
  IRandomSource(IRandomSource&&) = default;
  IRandomSource& operator=(IRandomSource&&) = default;
};

// Production source backed by std::random_device (the kernel CSPRNG on Linux).
// Not thread-safe on its own; the generator calls it under its lock.
class SystemRandom final : public IRandomSource {
 public:
  SystemRandom() = default;
  ~SystemRandom() override = default;

  // Not copyable or movable (std::random_device)
  SystemRandom(const SystemRandom&) = delete;
  SystemRandom& operator=(const SystemRandom&) = delete;
  SystemRandom(SystemRandom&&) = delete;
  SystemRandom& operator=(SystemRandom&&) = delete;

  std::uint32_t next_bits(unsigned bits) override;

 private:
  std::random_device device_;
};

// Deterministic source: std::mt19937_64 with an explicit seed.
// For tests and reproducible demos only; predictable output.
class SeededRandom final : public IRandomSource {
 public:
  explicit SeededRandom(std::uint64_t seed) : engine_(seed) {}
  ~SeededRandom() override = default;

  SeededRandom(const SeededRandom&) = default;
  SeededRandom& operator=(const SeededRandom&) = default;
  SeededRandom(SeededRandom&&) = default;
  SeededRandom& operator=(SeededRandom&&) = default;

  std::uint32_t next_bits(unsigned bits) override;

 private:
  std::mt19937_64 engine_;
};

}  // namespace scru128::core
