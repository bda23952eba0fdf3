#include "pxid/util/logging.hpp"

#include <array>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace pxid::util {

namespace {

struct LevelName {
  std::string_view name;
  spdlog::level::level_enum level;
};

constexpr std::array<LevelName, 8> kLevelNames = {{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

}  // namespace

Result<spdlog::level::level_enum> parseLogLevel(std::string_view name) {
  for (const auto& entry : kLevelNames) {
    if (entry.name == name) {
      return entry.level;
    }
  }
  return makeErrorResult<spdlog::level::level_enum>(
      ErrorCode::kInvalidArgument, "Unknown log level: " + std::string(name));
}

spdlog::level::level_enum raiseVerbosity(spdlog::level::level_enum level, int steps) {
  int value = static_cast<int>(level) - steps;
  if (value < static_cast<int>(spdlog::level::trace)) {
    value = static_cast<int>(spdlog::level::trace);
  }
  return static_cast<spdlog::level::level_enum>(value);
}

Logging& Logging::instance() {
  static Logging instance_;
  return instance_;
}

void Logging::initialize(spdlog::level::level_enum level) {
  if (initialized_) {
    setLevel(level);
    return;
  }

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  logger_ = std::make_shared<spdlog::logger>(kLoggerName, console_sink);

  // Timestamp, level and logger name
  logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
  logger_->set_level(level);

  spdlog::set_default_logger(logger_);
  initialized_ = true;
}

void Logging::setLevel(spdlog::level::level_enum level) {
  if (logger_) {
    logger_->set_level(level);
  }
}

std::shared_ptr<spdlog::logger> logger() {
  if (auto named = spdlog::get(kLoggerName)) {
    return named;
  }
  return spdlog::default_logger();
}

}  // namespace pxid::util
