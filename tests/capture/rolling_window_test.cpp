/// @file rolling_window_test.cpp
/// @brief Tests for the rolling sample window.

#include "capture/rolling_window.h"

#include <catch2/catch_test_macros.hpp>
#include <numeric>
#include <vector>

#include "util/exception.h"

using namespace cadence;

namespace {
std::vector<Sample> ramp(int first, int count) {
  std::vector<Sample> v(count);
  std::iota(v.begin(), v.end(), static_cast<Sample>(first));
  return v;
}
}  // namespace

TEST_CASE("RollingAudioWindow starts empty", "[rolling_window]") {
  RollingAudioWindow window(8);
  REQUIRE(window.empty());
  REQUIRE(window.capacity() == 8);
  REQUIRE(window.to_vector().empty());
}

TEST_CASE("RollingAudioWindow keeps order below capacity", "[rolling_window]") {
  RollingAudioWindow window(8);
  window.append(ramp(0, 3));
  window.append(ramp(3, 2));

  REQUIRE(window.size() == 5);
  REQUIRE_FALSE(window.full());
  REQUIRE(window.to_vector() == ramp(0, 5));
}

TEST_CASE("RollingAudioWindow evicts oldest samples", "[rolling_window]") {
  RollingAudioWindow window(8);
  window.append(ramp(0, 6));
  window.append(ramp(6, 5));

  REQUIRE(window.full());
  REQUIRE(window.to_vector() == ramp(3, 8));

  SECTION("wraps repeatedly") {
    for (int i = 0; i < 10; ++i) {
      window.append(ramp(11 + 3 * i, 3));
    }
    REQUIRE(window.to_vector() == ramp(33, 8));
  }
}

TEST_CASE("RollingAudioWindow block larger than capacity", "[rolling_window]") {
  RollingAudioWindow window(4);
  window.append(ramp(0, 2));
  window.append(ramp(100, 10));

  REQUIRE(window.to_vector() == ramp(106, 4));
}

TEST_CASE("RollingAudioWindow clear", "[rolling_window]") {
  RollingAudioWindow window(4);
  window.append(ramp(0, 4));
  window.clear();

  REQUIRE(window.empty());
  window.append(ramp(7, 1));
  REQUIRE(window.to_vector() == ramp(7, 1));
}

TEST_CASE("RollingAudioWindow zero capacity", "[rolling_window]") {
  REQUIRE_THROWS_AS(RollingAudioWindow(0), CadenceException);
}
