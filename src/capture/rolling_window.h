#pragma once

/// @file rolling_window.h
/// @brief Fixed-capacity FIFO of the most recent samples.

#include <cstddef>
#include <vector>

#include "util/types.h"

namespace cadence {

/// @brief Ring buffer keeping the latest `capacity` samples.
/// @details Appending beyond capacity evicts the oldest samples. Not
/// thread-safe; AudioCaptureBuffer serializes access.
class RollingAudioWindow {
 public:
  /// @brief Creates an empty window.
  /// @param capacity Maximum number of samples (> 0)
  explicit RollingAudioWindow(size_t capacity);

  /// @brief Appends samples in order, evicting the oldest on overflow.
  void append(const Sample* samples, size_t count);

  /// @brief Appends samples in order, evicting the oldest on overflow.
  void append(const std::vector<Sample>& samples) { append(samples.data(), samples.size()); }

  /// @brief Returns the contents, oldest first.
  std::vector<Sample> to_vector() const;

  /// @brief Removes all samples.
  void clear();

  size_t size() const { return size_; }
  size_t capacity() const { return buffer_.size(); }
  bool empty() const { return size_ == 0; }
  bool full() const { return size_ == buffer_.size(); }

 private:
  std::vector<Sample> buffer_;
  size_t head_ = 0;  // index of the oldest sample
  size_t size_ = 0;
};

}  // namespace cadence
