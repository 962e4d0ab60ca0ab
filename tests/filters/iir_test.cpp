/// @file iir_test.cpp
/// @brief Tests for IIR filter implementation.

#include "filters/iir.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <vector>

#include "util/exception.h"

using namespace cadence;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {
constexpr float kPi = 3.14159265358979323846f;
constexpr float kTwoPi = 2.0f * kPi;

std::vector<float> generate_sine(int samples, float freq, int sr) {
  std::vector<float> result(samples);
  for (int i = 0; i < samples; ++i) {
    result[i] = std::sin(kTwoPi * freq * i / sr);
  }
  return result;
}

float rms_after(const std::vector<float>& signal, size_t skip) {
  double sum_sq = 0.0;
  size_t count = 0;
  for (size_t i = skip; i < signal.size(); ++i) {
    sum_sq += signal[i] * signal[i];
    count++;
  }
  return static_cast<float>(std::sqrt(sum_sq / count));
}
}  // namespace

TEST_CASE("butterworth sections are finite", "[iir]") {
  for (const auto& c : butterworth_bandpass(6, 60.0f, 3000.0f, 11025).sections) {
    REQUIRE(std::isfinite(c.b0));
    REQUIRE(std::isfinite(c.b1));
    REQUIRE(std::isfinite(c.b2));
    REQUIRE(std::isfinite(c.a1));
    REQUIRE(std::isfinite(c.a2));
  }
}

TEST_CASE("butterworth lowpass sections have unity DC gain", "[iir]") {
  for (const auto& c : butterworth_lowpass(6, 1000.0f, 11025).sections) {
    float dc_gain = (c.b0 + c.b1 + c.b2) / (1.0f + c.a1 + c.a2);
    REQUIRE_THAT(dc_gain, WithinAbs(1.0f, 1e-4f));
  }
}

TEST_CASE("butterworth highpass sections block DC", "[iir]") {
  for (const auto& c : butterworth_highpass(6, 100.0f, 11025).sections) {
    REQUIRE_THAT(c.b0 + c.b1 + c.b2, WithinAbs(0.0f, 1e-6f));
  }
}

TEST_CASE("cutoff at or above nyquist throws", "[iir]") {
  REQUIRE_THROWS_AS(butterworth_lowpass(2, 6000.0f, 11025), CadenceException);
  REQUIRE_THROWS_AS(butterworth_highpass(2, 0.0f, 11025), CadenceException);
}

TEST_CASE("butterworth section count", "[iir]") {
  REQUIRE(butterworth_highpass(6, 60.0f, 11025).sections.size() == 3);
  REQUIRE(butterworth_lowpass(4, 3000.0f, 11025).sections.size() == 2);
  REQUIRE(butterworth_bandpass(6, 60.0f, 3000.0f, 11025).sections.size() == 6);
}

TEST_CASE("butterworth order must be even", "[iir]") {
  REQUIRE_THROWS_AS(butterworth_highpass(5, 60.0f, 11025), CadenceException);
  REQUIRE_THROWS_AS(butterworth_lowpass(0, 3000.0f, 11025), CadenceException);
}

TEST_CASE("butterworth_bandpass edges must be ordered", "[iir]") {
  REQUIRE_THROWS_AS(butterworth_bandpass(6, 3000.0f, 60.0f, 11025), CadenceException);
}

TEST_CASE("second order butterworth has Q of 1/sqrt(2)", "[iir]") {
  auto cascade = butterworth_lowpass(2, 1000.0f, 11025);
  REQUIRE(cascade.sections.size() == 1);

  // For an RBJ lowpass, a2 = (1 - alpha) / (1 + alpha) with alpha = sin(w) / (2Q).
  float omega = kTwoPi * 1000.0f / 11025;
  float alpha = std::sin(omega) / (2.0f / std::sqrt(2.0f));
  REQUIRE_THAT(cascade.sections[0].a2, WithinRel((1.0f - alpha) / (1.0f + alpha), 1e-5f));
}

TEST_CASE("butterworth lowpass is -3 dB at cutoff", "[iir]") {
  int sr = 11025;
  float cutoff = 1000.0f;
  auto cascade = butterworth_lowpass(6, cutoff, sr);

  auto input = generate_sine(sr, cutoff, sr);
  auto output = apply_cascade(input.data(), input.size(), cascade);

  float ratio = rms_after(output, 2000) / rms_after(input, 2000);
  REQUIRE_THAT(ratio, WithinAbs(1.0f / std::sqrt(2.0f), 0.03f));
}

TEST_CASE("butterworth_bandpass passes band and attenuates outside", "[iir]") {
  int sr = 11025;
  auto cascade = butterworth_bandpass(6, 60.0f, 3000.0f, sr);

  auto in_band = generate_sine(sr, 1000.0f, sr);
  auto rumble = generate_sine(sr, 15.0f, sr);
  auto hiss = generate_sine(sr, 5000.0f, sr);

  auto out_band = apply_cascade(in_band.data(), in_band.size(), cascade);
  auto out_rumble = apply_cascade(rumble.data(), rumble.size(), cascade);
  auto out_hiss = apply_cascade(hiss.data(), hiss.size(), cascade);

  REQUIRE_THAT(rms_after(out_band, 2000) / rms_after(in_band, 2000), WithinAbs(1.0f, 0.05f));
  REQUIRE(rms_after(out_rumble, 4000) < 0.01f * rms_after(rumble, 4000));
  REQUIRE(rms_after(out_hiss, 2000) < 0.05f * rms_after(hiss, 2000));
}

TEST_CASE("apply_cascade is causal", "[iir]") {
  auto cascade = butterworth_bandpass(6, 60.0f, 3000.0f, 11025);
  std::vector<float> input(512, 0.0f);
  input[300] = 1.0f;

  auto output = apply_cascade(input.data(), input.size(), cascade);
  for (size_t i = 0; i < 300; ++i) {
    REQUIRE(output[i] == 0.0f);
  }
  REQUIRE(output[300] != 0.0f);
}

TEST_CASE("apply_cascade empty input", "[iir]") {
  auto cascade = butterworth_lowpass(2, 1000.0f, 11025);
  REQUIRE(apply_cascade(nullptr, 0, cascade).empty());
}
