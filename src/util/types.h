#pragma once

/// @file types.h
/// @brief Common type definitions for libcadence.

#include <cstdint>

namespace cadence {

/// @brief One PCM sample (signed 16-bit, mono).
using Sample = int16_t;

/// @brief Error codes for library operations.
enum class ErrorCode : int {
  Ok = 0,
  InvalidFormat,
  InvalidParameter,
  IoError,
  DeviceNotFound,
  DeviceError,
  InvalidState,
  NotImplemented,
};

/// @brief Template grid resolution.
enum class Resolution {
  Coarse,
  Fine,
};

/// @brief Returns the name of a resolution.
/// @param r Resolution
/// @return "coarse" or "fine"
inline const char* resolution_name(Resolution r) {
  return r == Resolution::Coarse ? "coarse" : "fine";
}

/// @brief Returns error message for an error code.
/// @param code Error code
/// @return Human-readable error message
inline const char* error_message(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:
      return "OK";
    case ErrorCode::InvalidFormat:
      return "Invalid format";
    case ErrorCode::InvalidParameter:
      return "Invalid parameter";
    case ErrorCode::IoError:
      return "I/O error";
    case ErrorCode::DeviceNotFound:
      return "Device not found";
    case ErrorCode::DeviceError:
      return "Device error";
    case ErrorCode::InvalidState:
      return "Invalid state";
    case ErrorCode::NotImplemented:
      return "Not implemented";
  }
  return "Unknown error";
}

}  // namespace cadence
