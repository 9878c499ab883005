#include "scru128/core/clock.h"
#include "scru128/core/random_source.h"
#include "scru128/generator/default_generator.h"
#include "scru128/generator/generator.h"
#include "scru128/id/codec.h"

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace scru128;

namespace {

constexpr std::size_t kThreads = 4;
constexpr std::size_t kPerThread = 10'000;

}  // namespace

TEST_CASE("Scru128Generator: concurrent callers never receive duplicate ids",
          "[generator][threading]") {
  core::SystemClock clock;
  core::SystemRandom random;
  generator::Scru128Generator gen(clock, random);

  std::vector<std::vector<id::Scru128Id>> produced(kThreads);
  std::vector<std::thread> workers;
  workers.reserve(kThreads);
  for (std::size_t t = 0; t < kThreads; ++t) {
    workers.emplace_back([&gen, &out = produced[t]]() {
      out.reserve(kPerThread);
      for (std::size_t i = 0; i < kPerThread; ++i) {
        const auto result = gen.generate();
        if (result.has_value()) {
          out.push_back(result.value());
        }
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  std::unordered_set<id::Scru128Id> seen;
  for (const auto& ids : produced) {
    REQUIRE(ids.size() == kPerThread);
    // Each thread observes its own ids in strictly increasing order.
    for (std::size_t i = 1; i < ids.size(); ++i) {
      CHECK(ids[i - 1] < ids[i]);
    }
    seen.insert(ids.begin(), ids.end());
  }
  CHECK(seen.size() == kThreads * kPerThread);
}

TEST_CASE("default generator: new_string yields increasing canonical text",
          "[generator][default]") {
  std::string prev = generator::new_string();
  REQUIRE(prev.size() == id::kEncodedLength);
  for (int i = 0; i < 1'000; ++i) {
    const std::string curr = generator::new_string();
    REQUIRE(curr.size() == id::kEncodedLength);
    CHECK(prev < curr);
    prev = curr;
  }
}

TEST_CASE("default generator: new_id round-trips through the codec", "[generator][default]") {
  const auto value = generator::new_id();
  const auto decoded = id::decode(id::encode(value));
  REQUIRE(decoded.has_value());
  CHECK(decoded.value() == value);
  CHECK(value.timestamp() > 0);
}
