#include "util/log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace cadence {
namespace log {

namespace {
constexpr const char* kLoggerName = "cadence";
}

std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> instance = [] {
    auto existing = spdlog::get(kLoggerName);
    if (existing) {
      return existing;
    }
    auto created = spdlog::stdout_color_mt(kLoggerName);
    created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    return created;
  }();
  return instance;
}

void set_level(spdlog::level::level_enum level) { logger()->set_level(level); }

}  // namespace log
}  // namespace cadence
