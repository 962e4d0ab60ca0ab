/// @file math_utils_test.cpp
/// @brief Tests for math utility functions.

#include "util/math_utils.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vector>

using namespace cadence;
using Catch::Matchers::WithinAbs;

TEST_CASE("argmax_abs picks largest magnitude", "[math_utils]") {
  std::vector<float> data = {0.1f, -0.9f, 0.5f, 0.8f};
  REQUIRE(argmax_abs(data.data(), data.size()) == 1);
}

TEST_CASE("argmax_abs keeps first occurrence on ties", "[math_utils]") {
  std::vector<float> data = {0.0f, 0.7f, -0.7f, 0.7f};
  REQUIRE(argmax_abs(data.data(), data.size()) == 1);

  std::vector<float> silent(16, 0.0f);
  REQUIRE(argmax_abs(silent.data(), silent.size()) == 0);
}

TEST_CASE("argmax_abs empty", "[math_utils]") {
  REQUIRE(argmax_abs<float>(nullptr, 0) == 0);
}

TEST_CASE("round_to", "[math_utils]") {
  REQUIRE_THAT(round_to(120.456, 2), WithinAbs(120.46, 1e-9));
  REQUIRE_THAT(round_to(120.454, 2), WithinAbs(120.45, 1e-9));
  REQUIRE_THAT(round_to(99.999, 1), WithinAbs(100.0, 1e-9));
}

TEST_CASE("format_fixed", "[math_utils]") {
  REQUIRE(format_fixed(120.0, 2) == "120.00");
  REQUIRE(format_fixed(0.0, 2) == "0.00");
  REQUIRE(format_fixed(87.456, 2) == "87.46");
}
