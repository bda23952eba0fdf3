#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

#include "pxid/common.hpp"

namespace pxid::util {

inline constexpr const char* kLoggerName = "pxid";

// Parse a level name (trace|debug|info|warn|error|critical|off)
Result<spdlog::level::level_enum> parseLogLevel(std::string_view name);

// Lower a level by `steps` notches towards trace (used for -v flags)
spdlog::level::level_enum raiseVerbosity(spdlog::level::level_enum level, int steps);

// Logger setup for the pxid application
class Logging {
 public:
  static Logging& instance();

  // Install a stderr colour logger named "pxid" as the spdlog default
  void initialize(spdlog::level::level_enum level);

  void setLevel(spdlog::level::level_enum level);

  bool initialized() const { return initialized_; }

 private:
  Logging() = default;

  bool initialized_ = false;
  std::shared_ptr<spdlog::logger> logger_;
};

// Logger used by library code. Falls back to the spdlog default logger
// when the application has not installed one.
std::shared_ptr<spdlog::logger> logger();

}  // namespace pxid::util
