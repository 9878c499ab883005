#include "scru128/id/scru128_id.h"

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstdint>
#include <sstream>
#include <unordered_set>
#include <vector>

using namespace scru128;

namespace {

id::Scru128Id fields(std::uint64_t ts, std::uint32_t hi, std::uint32_t lo, std::uint32_t ent) {
  const auto result = id::Scru128Id::from_fields(ts, hi, lo, ent);
  REQUIRE(result.has_value());
  return result.value();
}

}  // namespace

// ── Field packing ───────────────────────────────────────────────────────────

TEST_CASE("Scru128Id: from_fields packs fields most significant first", "[id]") {
  SECTION("all zero") {
    const auto v = fields(0, 0, 0, 0);
    CHECK(v.hi() == 0);
    CHECK(v.lo() == 0);
  }

  SECTION("max timestamp only") {
    const auto v = fields(id::kMaxTimestamp, 0, 0, 0);
    CHECK(v.hi() == 0xFFFF'FFFF'FFFF'0000ULL);
    CHECK(v.lo() == 0);
  }

  SECTION("max counter_hi straddles the two halves") {
    const auto v = fields(0, id::kMaxCounterHi, 0, 0);
    CHECK(v.hi() == 0xFFFFULL);
    CHECK(v.lo() == 0xFF00'0000'0000'0000ULL);
  }

  SECTION("max counter_lo only") {
    const auto v = fields(0, 0, id::kMaxCounterLo, 0);
    CHECK(v.hi() == 0);
    CHECK(v.lo() == 0x00FF'FFFF'0000'0000ULL);
  }

  SECTION("max entropy only") {
    const auto v = fields(0, 0, 0, 0xFFFF'FFFF);
    CHECK(v.hi() == 0);
    CHECK(v.lo() == 0xFFFF'FFFFULL);
  }

  SECTION("mixed values") {
    const auto v = fields(0x0123'4567'89AB, 0xABCDEF, 0x123456, 0xDEADBEEF);
    CHECK(v.hi() == 0x0123'4567'89AB'ABCDULL);
    CHECK(v.lo() == 0xEF12'3456'DEAD'BEEFULL);
  }
}

TEST_CASE("Scru128Id: accessors return the packed fields", "[id]") {
  const std::vector<std::array<std::uint64_t, 4>> cases = {
      {0, 0, 0, 0},
      {id::kMaxTimestamp, 0, 0, 0},
      {0, id::kMaxCounterHi, 0, 0},
      {0, 0, id::kMaxCounterLo, 0},
      {0, 0, 0, 0xFFFF'FFFF},
      {id::kMaxTimestamp, id::kMaxCounterHi, id::kMaxCounterLo, 0xFFFF'FFFF},
      {1'700'000'000'123, 0x00ABCD, 0x0000FF, 0x01020304},
  };

  for (const auto& c : cases) {
    const auto v = fields(c[0], static_cast<std::uint32_t>(c[1]), static_cast<std::uint32_t>(c[2]),
                          static_cast<std::uint32_t>(c[3]));
    CHECK(v.timestamp() == c[0]);
    CHECK(v.counter_hi() == c[1]);
    CHECK(v.counter_lo() == c[2]);
    CHECK(v.entropy() == c[3]);

    // Raw construction from the same halves yields the same value.
    CHECK(id::Scru128Id{v.hi(), v.lo()} == v);
  }
}

TEST_CASE("Scru128Id: from_fields rejects values wider than their field", "[id][error]") {
  SECTION("timestamp") {
    const auto r = id::Scru128Id::from_fields(id::kMaxTimestamp + 1, 0, 0, 0);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == core::RangeError::kTimestamp);
  }

  SECTION("counter_hi") {
    const auto r = id::Scru128Id::from_fields(0, id::kMaxCounterHi + 1, 0, 0);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == core::RangeError::kCounterHi);
  }

  SECTION("counter_lo") {
    const auto r = id::Scru128Id::from_fields(0, 0, id::kMaxCounterLo + 1, 0);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == core::RangeError::kCounterLo);
  }

  SECTION("entropy uses its full 32-bit width") {
    const auto r = id::Scru128Id::from_fields(0, 0, 0, 0xFFFF'FFFF);
    REQUIRE(r.has_value());
    CHECK(r.value().entropy() == 0xFFFF'FFFF);
  }

  SECTION("first offending field is reported") {
    const auto r = id::Scru128Id::from_fields(id::kMaxTimestamp + 1, id::kMaxCounterHi + 1, 0, 0);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == core::RangeError::kTimestamp);
  }
}

// ── Ordering ────────────────────────────────────────────────────────────────

TEST_CASE("Scru128Id: comparison follows the 128-bit integer order", "[id][ordering]") {
  const std::vector<id::Scru128Id> ordered = {
      fields(0, 0, 0, 0),
      fields(0, 0, 0, 1),
      fields(0, 0, 0, 0xFFFF'FFFF),
      fields(0, 0, 1, 0),
      fields(0, 0, id::kMaxCounterLo, 0),
      fields(0, 1, 0, 0),
      fields(0, 0xFF, 0, 0),
      fields(0, 0x100, 0, 0),
      fields(0, id::kMaxCounterHi, 0, 0),
      fields(1, 0, 0, 0),
      fields(2, 0, 0, 0),
      fields(id::kMaxTimestamp, id::kMaxCounterHi, id::kMaxCounterLo, 0xFFFF'FFFF),
  };

  for (std::size_t i = 1; i < ordered.size(); ++i) {
    const auto& prev = ordered[i - 1];
    const auto& curr = ordered[i];
    CHECK(prev < curr);
    CHECK(prev <= curr);
    CHECK(curr > prev);
    CHECK(curr >= prev);
    CHECK(prev != curr);

    const auto clone = curr;
    CHECK(clone == curr);
    CHECK(clone <= curr);
    CHECK(clone >= curr);
    CHECK(std::hash<id::Scru128Id>{}(clone) == std::hash<id::Scru128Id>{}(curr));
  }
}

TEST_CASE("Scru128Id: usable as an unordered_set key", "[id]") {
  std::unordered_set<id::Scru128Id> set;
  set.insert(fields(1, 2, 3, 4));
  set.insert(fields(1, 2, 3, 4));
  set.insert(fields(1, 2, 3, 5));
  CHECK(set.size() == 2);
}

TEST_CASE("std::hash<Scru128Id>: stable across the full value range", "[id]") {
  const id::Scru128Id max_value(~std::uint64_t{0}, ~std::uint64_t{0});
  const id::Scru128Id zero(0, 0);
  const std::hash<id::Scru128Id> hasher;
  CHECK(hasher(max_value) == hasher(id::Scru128Id(~std::uint64_t{0}, ~std::uint64_t{0})));
  CHECK(hasher(zero) == hasher(id::Scru128Id(0, 0)));

  std::unordered_set<id::Scru128Id> set{max_value, zero, max_value};
  CHECK(set.size() == 2);
}

// ── Byte interchange ────────────────────────────────────────────────────────

TEST_CASE("Scru128Id: to_bytes is big-endian and from_bytes inverts it", "[id]") {
  const auto v = fields(0x0123'4567'89AB, 0xABCDEF, 0x123456, 0xDEADBEEF);
  const std::array<std::uint8_t, 16> expected = {0x01, 0x23, 0x45, 0x67, 0x89, 0xAB,
                                                 0xAB, 0xCD, 0xEF, 0x12, 0x34, 0x56,
                                                 0xDE, 0xAD, 0xBE, 0xEF};
  CHECK(v.to_bytes() == expected);
  CHECK(id::Scru128Id::from_bytes(expected) == v);
}

TEST_CASE("Scru128Id: operator<< streams canonical text", "[id]") {
  std::ostringstream oss;
  oss << fields(0, 0, 0, 0);
  CHECK(oss.str() == "0000000000000000000000000");
}
