#include "scru128/core/random_source.h"

namespace scru128::core {

namespace {

std::uint32_t mask_bits(std::uint32_t value, unsigned bits) {
  if (bits >= 32) {
    return value;
  }
  return value & ((std::uint32_t{1} << bits) - 1);
}

}  // namespace

std::uint32_t SystemRandom::next_bits(unsigned bits) {
  // random_device yields unsigned int; 32 bits on every supported platform.
  static_assert(sizeof(std::random_device::result_type) >= sizeof(std::uint32_t));
  return mask_bits(static_cast<std::uint32_t>(device_()), bits);
}

std::uint32_t SeededRandom::next_bits(unsigned bits) {
  return mask_bits(static_cast<std::uint32_t>(engine_() >> 32), bits);
}

}  // namespace scru128::core
