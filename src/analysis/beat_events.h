#pragma once

/// @file beat_events.h
/// @brief Envelope peak picking on half-second sub-windows.

#include <cstddef>
#include <vector>

namespace cadence {

/// @brief Picks one candidate beat per half-second sub-window.
/// @details The signal is split into consecutive sub-windows of sample_rate / 2
///          samples (the last one may be shorter). For each sub-window the
///          position of the largest absolute value is reported as an absolute
///          offset into the signal; the first occurrence wins on ties, so a
///          silent sub-window reports its own start.
/// @param samples Filtered signal
/// @param size Number of samples
/// @param sample_rate Sample rate in Hz
/// @return ceil(size / (sample_rate / 2)) sample offsets in sub-window order
std::vector<int> extract_beat_events(const float* samples, size_t size, int sample_rate);

/// @brief Picks one candidate beat per half-second sub-window.
std::vector<int> extract_beat_events(const std::vector<float>& samples, int sample_rate);

}  // namespace cadence
