#pragma once

/// @file cadence.h
/// @brief Main header for libcadence - live tempo estimation library.
/// @details Include this file to access all libcadence functionality.

// Version information
#define CADENCE_VERSION_MAJOR 1
#define CADENCE_VERSION_MINOR 0
#define CADENCE_VERSION_PATCH 0
#define CADENCE_VERSION_STRING "1.0.0"

// Utility
#include "util/exception.h"
#include "util/log.h"
#include "util/math_utils.h"
#include "util/types.h"

// Core
#include "core/pcm.h"

// Filters
#include "filters/iir.h"
#include "filters/prefilter.h"

// Patterns
#include "pattern/pattern_factory.h"
#include "pattern/template_grid.h"
#include "pattern/template_store.h"
#include "pattern/tempo_band.h"

// Capture
#include "capture/audio_capture.h"
#include "capture/capture_device.h"
#include "capture/rolling_window.h"
#include "capture/synthetic_backend.h"

// Analysis
#include "analysis/beat_events.h"
#include "analysis/tempo_search.h"

// Estimator
#include "estimator/bpm_history.h"
#include "estimator/estimator_config.h"
#include "estimator/sinks.h"
#include "estimator/tempo_estimator.h"

namespace cadence {

/// @brief Returns the library version string.
inline const char* version() { return CADENCE_VERSION_STRING; }

}  // namespace cadence
