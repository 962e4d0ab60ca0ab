#pragma once

/// @file iir.h
/// @brief IIR filter (biquad) implementation.

#include <cstddef>
#include <vector>

namespace cadence {

/// @brief Biquad filter coefficients.
/// @details Transfer function: H(z) = (b0 + b1*z^-1 + b2*z^-2) / (1 + a1*z^-1 + a2*z^-2)
struct BiquadCoeffs {
  float b0 = 1.0f;
  float b1 = 0.0f;
  float b2 = 0.0f;
  float a1 = 0.0f;
  float a2 = 0.0f;
};

/// @brief Applies biquad filter to signal.
/// @param input Input signal
/// @param size Signal length
/// @param coeffs Biquad coefficients
/// @return Filtered signal
std::vector<float> apply_biquad(const float* input, size_t size, const BiquadCoeffs& coeffs);

/// @brief Cascaded biquad sections for higher-order filters.
struct CascadedBiquad {
  std::vector<BiquadCoeffs> sections;
};

/// @brief Creates an Nth order Butterworth highpass as cascaded biquads.
/// @param order Filter order (even, >= 2)
/// @param cutoff_hz Cutoff frequency in Hz
/// @param sr Sample rate in Hz
/// @return order/2 cascaded sections
CascadedBiquad butterworth_highpass(int order, float cutoff_hz, int sr);

/// @brief Creates an Nth order Butterworth lowpass as cascaded biquads.
/// @param order Filter order (even, >= 2)
/// @param cutoff_hz Cutoff frequency in Hz
/// @param sr Sample rate in Hz
/// @return order/2 cascaded sections
CascadedBiquad butterworth_lowpass(int order, float cutoff_hz, int sr);

/// @brief Creates a Butterworth bandpass as a highpass/lowpass cascade.
/// @param order Order of each edge (even, >= 2)
/// @param low_hz Lower band edge in Hz
/// @param high_hz Upper band edge in Hz
/// @param sr Sample rate in Hz
/// @return Highpass sections followed by lowpass sections
CascadedBiquad butterworth_bandpass(int order, float low_hz, float high_hz, int sr);

/// @brief Applies cascaded biquad sections in a single causal pass.
/// @details Each section starts from zero state.
/// @param input Input signal
/// @param size Signal length
/// @param cascade Cascaded biquad sections
/// @return Filtered signal
std::vector<float> apply_cascade(const float* input, size_t size, const CascadedBiquad& cascade);

}  // namespace cadence
