#include "filters/iir.h"

#include <cmath>

#include "util/exception.h"

namespace cadence {

namespace {
constexpr float kPi = 3.14159265358979323846f;

/// @brief Q of the k-th biquad section (0-based) of an Nth order Butterworth.
float butterworth_q(int order, int k) {
  float theta = kPi * static_cast<float>(2 * k + 1) / static_cast<float>(2 * order);
  return 1.0f / (2.0f * std::sin(theta));
}

BiquadCoeffs highpass_section(float cos_omega, float sin_omega, float q) {
  float alpha = sin_omega / (2.0f * q);
  float a0 = 1.0f + alpha;

  BiquadCoeffs c;
  c.b0 = (1.0f + cos_omega) / 2.0f / a0;
  c.b1 = -(1.0f + cos_omega) / a0;
  c.b2 = (1.0f + cos_omega) / 2.0f / a0;
  c.a1 = -2.0f * cos_omega / a0;
  c.a2 = (1.0f - alpha) / a0;
  return c;
}

BiquadCoeffs lowpass_section(float cos_omega, float sin_omega, float q) {
  float alpha = sin_omega / (2.0f * q);
  float a0 = 1.0f + alpha;

  BiquadCoeffs c;
  c.b0 = (1.0f - cos_omega) / 2.0f / a0;
  c.b1 = (1.0f - cos_omega) / a0;
  c.b2 = (1.0f - cos_omega) / 2.0f / a0;
  c.a1 = -2.0f * cos_omega / a0;
  c.a2 = (1.0f - alpha) / a0;
  return c;
}

void check_cutoff(float cutoff_hz, int sr) {
  CADENCE_CHECK(cutoff_hz > 0 && sr > 0, ErrorCode::InvalidParameter);
  CADENCE_CHECK(cutoff_hz < sr / 2.0f, ErrorCode::InvalidParameter);
}

void check_order(int order) {
  CADENCE_CHECK_MSG(order >= 2 && order % 2 == 0, ErrorCode::InvalidParameter,
                    "Butterworth order must be even and >= 2");
}

}  // namespace

std::vector<float> apply_biquad(const float* input, size_t size, const BiquadCoeffs& coeffs) {
  if (size == 0) {
    return {};
  }
  CADENCE_CHECK(input != nullptr, ErrorCode::InvalidParameter);

  std::vector<float> output(size);

  // Direct Form II Transposed
  float z1 = 0.0f;
  float z2 = 0.0f;

  for (size_t i = 0; i < size; ++i) {
    float x = input[i];
    float y = coeffs.b0 * x + z1;
    z1 = coeffs.b1 * x - coeffs.a1 * y + z2;
    z2 = coeffs.b2 * x - coeffs.a2 * y;
    output[i] = y;
  }

  return output;
}

CascadedBiquad butterworth_highpass(int order, float cutoff_hz, int sr) {
  check_order(order);
  check_cutoff(cutoff_hz, sr);

  float omega = 2.0f * kPi * cutoff_hz / sr;
  float cos_omega = std::cos(omega);
  float sin_omega = std::sin(omega);

  // An Nth order Butterworth is N/2 second order sections whose Q values
  // come from the pole angles, e.g. 0.518, 0.707, 1.932 for N = 6.
  CascadedBiquad cascade;
  cascade.sections.reserve(order / 2);
  for (int k = 0; k < order / 2; ++k) {
    cascade.sections.push_back(highpass_section(cos_omega, sin_omega, butterworth_q(order, k)));
  }
  return cascade;
}

CascadedBiquad butterworth_lowpass(int order, float cutoff_hz, int sr) {
  check_order(order);
  check_cutoff(cutoff_hz, sr);

  float omega = 2.0f * kPi * cutoff_hz / sr;
  float cos_omega = std::cos(omega);
  float sin_omega = std::sin(omega);

  CascadedBiquad cascade;
  cascade.sections.reserve(order / 2);
  for (int k = 0; k < order / 2; ++k) {
    cascade.sections.push_back(lowpass_section(cos_omega, sin_omega, butterworth_q(order, k)));
  }
  return cascade;
}

CascadedBiquad butterworth_bandpass(int order, float low_hz, float high_hz, int sr) {
  CADENCE_CHECK_MSG(low_hz < high_hz, ErrorCode::InvalidParameter,
                    "Bandpass lower edge must be below upper edge");

  CascadedBiquad cascade = butterworth_highpass(order, low_hz, sr);
  CascadedBiquad lowpass = butterworth_lowpass(order, high_hz, sr);
  cascade.sections.insert(cascade.sections.end(), lowpass.sections.begin(),
                          lowpass.sections.end());
  return cascade;
}

std::vector<float> apply_cascade(const float* input, size_t size, const CascadedBiquad& cascade) {
  if (size == 0) {
    return {};
  }
  CADENCE_CHECK(input != nullptr, ErrorCode::InvalidParameter);
  CADENCE_CHECK(!cascade.sections.empty(), ErrorCode::InvalidParameter);

  std::vector<float> result(input, input + size);
  for (const auto& section : cascade.sections) {
    result = apply_biquad(result.data(), result.size(), section);
  }
  return result;
}

}  // namespace cadence
