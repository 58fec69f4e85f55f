#include "yulid/codec/yulid.h"
#include "yulid/core/alphabet.h"

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstddef>
#include <string>

using namespace yulid::codec;

// Each (position, character) cell expects samples/36 hits, ~2778 for 100k samples,
// with a standard deviation near 52. A ±15% window is about 8 standard deviations.
TEST_CASE("create: suffix characters are uniform at every position", "[yulid][distribution]") {
  constexpr int kSamples = 100000;
  constexpr double kExpected = static_cast<double>(kSamples) / yulid::core::kAlphabetSize;
  constexpr double kTolerance = 0.15;

  std::array<std::array<int, yulid::core::kAlphabetSize>, kGeneratedSuffixLen> counts{};

  for (int i = 0; i < kSamples; ++i) {
    const auto id = Yulid::create("DIST");
    REQUIRE(id.has_value());
    const auto suffix = id.value().suffix();
    REQUIRE(suffix.size() == kGeneratedSuffixLen);

    for (std::size_t pos = 0; pos < kGeneratedSuffixLen; ++pos) {
      const auto index = yulid::core::kAlphanumeric.find(suffix[pos]);
      REQUIRE(index != std::string::npos);
      ++counts[pos][index];
    }
  }

  for (std::size_t pos = 0; pos < kGeneratedSuffixLen; ++pos) {
    for (std::size_t c = 0; c < yulid::core::kAlphabetSize; ++c) {
      INFO("position " << pos << " char " << yulid::core::kAlphanumeric[c]);
      CHECK(counts[pos][c] > kExpected * (1.0 - kTolerance));
      CHECK(counts[pos][c] < kExpected * (1.0 + kTolerance));
    }
  }
}
