#include "yulid/core/random_source.h"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace yulid::core;

TEST_CASE("SystemRandomSource stays within bound", "[random]") {
  SystemRandomSource source;

  SECTION("bound of 36") {
    for (int i = 0; i < 1000; ++i) {
      CHECK(source.uniform_index(36) < 36);
    }
  }

  SECTION("bound of 1 always yields 0") {
    for (int i = 0; i < 100; ++i) {
      CHECK(source.uniform_index(1) == 0);
    }
  }

  SECTION("bound of 0 is rejected") {
    CHECK_THROWS_AS(source.uniform_index(0), RandomSourceError);
  }
}

TEST_CASE("SystemRandomSource reaches every index", "[random]") {
  SystemRandomSource source;
  std::vector<int> seen(36, 0);
  for (int i = 0; i < 5000; ++i) {
    ++seen[source.uniform_index(36)];
  }
  for (const int count : seen) {
    CHECK(count > 0);
  }
}

TEST_CASE("process_random_source returns a single shared instance", "[random]") {
  CHECK(&process_random_source() == &process_random_source());
}

TEST_CASE("DeterministicRandomSource replays and cycles", "[random]") {
  DeterministicRandomSource source({3, 1, 4});

  CHECK(source.uniform_index(36) == 3);
  CHECK(source.uniform_index(36) == 1);
  CHECK(source.uniform_index(36) == 4);
  CHECK(source.uniform_index(36) == 3);
  CHECK(source.draws() == 4);
}

TEST_CASE("DeterministicRandomSource reduces values into bound", "[random]") {
  DeterministicRandomSource source({37, 71});
  CHECK(source.uniform_index(36) == 1);
  CHECK(source.uniform_index(36) == 35);
}

TEST_CASE("DeterministicRandomSource rejects empty sequence and zero bound", "[random]") {
  DeterministicRandomSource empty(std::vector<std::size_t>{});
  CHECK_THROWS_AS(empty.uniform_index(36), RandomSourceError);

  DeterministicRandomSource source({1});
  CHECK_THROWS_AS(source.uniform_index(0), RandomSourceError);
}
