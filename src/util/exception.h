#pragma once

/// @file exception.h
/// @brief Exception classes for libcadence.

#include <stdexcept>
#include <string>

#include "util/types.h"

namespace cadence {

/// @brief Base exception class for libcadence errors.
class CadenceException : public std::runtime_error {
 public:
  /// @brief Constructs exception with error code.
  /// @param code Error code
  explicit CadenceException(ErrorCode code)
      : std::runtime_error(error_message(code)), code_(code) {}

  /// @brief Constructs exception with error code and custom message.
  /// @param code Error code
  /// @param message Custom error message
  CadenceException(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  /// @brief Returns the error code.
  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

/// @def CADENCE_CHECK
/// @brief Throws CadenceException if condition is false.
#define CADENCE_CHECK(cond, code)   \
  do {                              \
    if (!(cond)) {                  \
      throw CadenceException(code); \
    }                               \
  } while (0)

/// @def CADENCE_CHECK_MSG
/// @brief Throws CadenceException with custom message if condition is false.
#define CADENCE_CHECK_MSG(cond, code, msg) \
  do {                                     \
    if (!(cond)) {                         \
      throw CadenceException(code, msg);   \
    }                                      \
  } while (0)

}  // namespace cadence
