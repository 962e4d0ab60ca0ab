#pragma once

/// @file prefilter.h
/// @brief Band-pass pre-filter applied to each analysis window.

#include <cstddef>
#include <vector>

#include "filters/iir.h"
#include "util/types.h"

namespace cadence {

/// @brief Configuration for the analysis pre-filter.
struct FilterConfig {
  float low_hz = 60.0f;    ///< Lower band edge (suppresses rumble)
  float high_hz = 3000.0f; ///< Upper band edge (suppresses hiss)
  int order = 6;           ///< Butterworth order of each edge
};

/// @brief Butterworth band-pass applied in a single causal pass.
/// @details Coefficients are designed once. Every call filters from zero state,
/// so the output depends only on the given window.
class BandpassPrefilter {
 public:
  /// @brief Designs the filter.
  /// @param config Filter configuration
  /// @param sample_rate Sample rate in Hz
  /// @throws CadenceException on invalid band edges or order
  BandpassPrefilter(const FilterConfig& config, int sample_rate);

  /// @brief Filters a PCM window.
  /// @param samples Input samples
  /// @param size Number of samples
  /// @return Filtered signal, normalized to the [-1, 1] PCM scale
  std::vector<float> process(const Sample* samples, size_t size) const;

  /// @brief Filters a PCM window.
  std::vector<float> process(const std::vector<Sample>& samples) const {
    return process(samples.data(), samples.size());
  }

  /// @brief Returns the designed sections.
  const CascadedBiquad& cascade() const { return cascade_; }

 private:
  CascadedBiquad cascade_;
};

}  // namespace cadence
