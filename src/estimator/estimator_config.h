#pragma once

/// @file estimator_config.h
/// @brief Configuration for TempoEstimator.

#include <cstddef>

#include "capture/audio_capture.h"
#include "filters/prefilter.h"
#include "pattern/tempo_band.h"
#include "pattern/template_grid.h"

namespace cadence {

/// @brief Configuration for TempoEstimator.
struct EstimatorConfig {
  PatternConfig pattern;                         ///< Template generation
  CaptureConfig capture;                         ///< Capture buffer
  FilterConfig filter;                           ///< Analysis pre-filter
  size_t average_window = 8;                     ///< Estimates in the running average
  TempoBand initial_band = TempoBand::Band60To160;

  /// @brief Checks that the sections agree with each other.
  /// @throws CadenceException with InvalidParameter on mismatch
  void validate() const;
};

}  // namespace cadence
