#pragma once

/// @file bpm_history.h
/// @brief Published tempo and the running average behind it.

#include <cstddef>
#include <deque>
#include <string>

namespace cadence {

/// @brief Tempo value with its 2-decimal text form.
struct BpmEstimate {
  float bpm = 0.0f;          ///< Tempo in BPM (0 when nothing was estimated)
  std::string text = "0.00"; ///< bpm formatted with 2 decimals

  /// @brief Builds an estimate from a value.
  static BpmEstimate from_value(double bpm);
};

/// @brief Bounded queue of recent estimates.
class BpmHistory {
 public:
  /// @brief Creates an empty history.
  /// @param capacity Maximum number of estimates kept (> 0)
  explicit BpmHistory(size_t capacity);

  /// @brief Appends an estimate, dropping the oldest when full.
  /// @return The new average, rounded to 2 decimals
  double push(double bpm);

  /// @brief Average of the kept estimates, rounded to 2 decimals (0 if empty).
  double average() const;

  size_t size() const { return values_.size(); }
  size_t capacity() const { return capacity_; }
  bool empty() const { return values_.empty(); }
  const std::deque<double>& values() const { return values_; }

 private:
  size_t capacity_;
  std::deque<double> values_;
};

}  // namespace cadence
