#pragma once

/// @file math_utils.h
/// @brief Small numeric helpers shared by the analysis code.

#include <cmath>
#include <cstddef>
#include <string>

namespace cadence {

/// @brief Returns the index of the maximum absolute value.
/// @details The first occurrence wins on ties.
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Index of maximum-magnitude element (0 if empty)
template <typename T>
size_t argmax_abs(const T* data, size_t size) {
  size_t best = 0;
  for (size_t i = 1; i < size; ++i) {
    if (std::abs(data[i]) > std::abs(data[best])) {
      best = i;
    }
  }
  return best;
}

/// @brief Rounds to a fixed number of decimal places.
/// @param value Value to round
/// @param decimals Number of decimals
/// @return Rounded value
double round_to(double value, int decimals);

/// @brief Formats a value with a fixed number of decimal places.
/// @param value Value to format
/// @param decimals Number of decimals
/// @return Formatted string (e.g. "120.00")
std::string format_fixed(double value, int decimals);

}  // namespace cadence
