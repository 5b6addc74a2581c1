#include "slotest/common/logger.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace slotest::common {

namespace {

auto ToSpdlogLevel(LogLevel level) -> spdlog::level::level_enum {
  switch (level) {
    case LogLevel::kDebug:
      return spdlog::level::trace;
    case LogLevel::kVerbose:
      return spdlog::level::debug;
    case LogLevel::kInfo:
      return spdlog::level::info;
    case LogLevel::kWarning:
      return spdlog::level::warn;
    case LogLevel::kError:
    case LogLevel::kException:
      return spdlog::level::err;
  }
  return spdlog::level::err;
}

}  // namespace

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {
}

auto SpdlogLogger::CreateConsole(std::string_view name, LogLevel min_level)
    -> std::unique_ptr<SpdlogLogger> {
  auto logger = spdlog::get(std::string(name));
  if (!logger) {
    logger = spdlog::stderr_color_mt(std::string(name));
    logger->set_pattern("[%n][%^%l%$] %v");
  }
  auto result = std::make_unique<SpdlogLogger>(std::move(logger));
  result->SetLevel(min_level);
  return result;
}

auto SpdlogLogger::Enabled(LogLevel level) const -> bool {
  return logger_->should_log(ToSpdlogLevel(level));
}

void SpdlogLogger::SetLevel(LogLevel min_level) {
  logger_->set_level(ToSpdlogLevel(min_level));
}

void SpdlogLogger::Write(LogLevel level, std::string message) {
  logger_->log(ToSpdlogLevel(level), message);
}

auto LogLevelName(LogLevel level) -> std::string_view {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kVerbose:
      return "verbose";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarning:
      return "warning";
    case LogLevel::kError:
      return "error";
    case LogLevel::kException:
      return "exception";
  }
  return "unknown";
}

}  // namespace slotest::common
