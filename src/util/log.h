#pragma once

/// @file log.h
/// @brief Library-wide logger.

#include <memory>

#include <spdlog/spdlog.h>

namespace cadence {
namespace log {

/// @brief Returns the shared "cadence" logger, creating it on first use.
/// @details Writes to stdout with colour. Thread-safe.
std::shared_ptr<spdlog::logger> logger();

/// @brief Sets the verbosity of the library logger.
/// @param level Minimum level that is emitted
void set_level(spdlog::level::level_enum level);

}  // namespace log
}  // namespace cadence
