#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace slotest::common {

enum class LogLevel : uint8_t {
  kDebug,
  kVerbose,
  kInfo,
  kWarning,
  kError,
  kException,
};

// Leveled logging capability injected into the harness core.
//
// The variadic front-end formats with fmt and hands the finished message to
// Write(). Implementations decide where (or whether) it goes. The core must
// behave identically with NullLogger.
//
// Exception() is Error() plus a detail string describing the failure that
// was caught (the exit status, the spawn error, ...).
//
// Implementations must be safe to call from several worker threads.
class Logger {
 public:
  Logger() = default;
  virtual ~Logger() = default;
  Logger(const Logger&) = delete;
  auto operator=(const Logger&) -> Logger& = delete;
  Logger(Logger&&) = delete;
  auto operator=(Logger&&) -> Logger& = delete;

  template <typename... Args>
  void Debug(fmt::format_string<Args...> format, Args&&... args) {
    Emit(LogLevel::kDebug, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void Verbose(fmt::format_string<Args...> format, Args&&... args) {
    Emit(LogLevel::kVerbose, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void Info(fmt::format_string<Args...> format, Args&&... args) {
    Emit(LogLevel::kInfo, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void Warning(fmt::format_string<Args...> format, Args&&... args) {
    Emit(LogLevel::kWarning, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void Error(fmt::format_string<Args...> format, Args&&... args) {
    Emit(LogLevel::kError, format, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void Exception(
      std::string_view detail, fmt::format_string<Args...> format,
      Args&&... args) {
    if (!Enabled(LogLevel::kException)) {
      return;
    }
    Write(
        LogLevel::kException,
        fmt::format(
            "{}\n  caused by: {}",
            fmt::format(format, std::forward<Args>(args)...), detail));
  }

  [[nodiscard]] virtual auto Enabled(LogLevel level) const -> bool = 0;

 protected:
  virtual void Write(LogLevel level, std::string message) = 0;

 private:
  template <typename... Args>
  void Emit(
      LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
    if (!Enabled(level)) {
      return;
    }
    Write(level, fmt::format(format, std::forward<Args>(args)...));
  }
};

// Discards everything.
class NullLogger final : public Logger {
 public:
  [[nodiscard]] auto Enabled(LogLevel /*level*/) const -> bool override {
    return false;
  }

 protected:
  void Write(LogLevel /*level*/, std::string /*message*/) override {
  }
};

// Forwards to an spdlog logger. Debug maps to trace and Verbose to debug so
// that -v/-vv on the command line expose them one step at a time.
class SpdlogLogger final : public Logger {
 public:
  explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

  // Colored stderr logger named `name` showing messages at `min_level` and
  // above. Reuses an already registered logger of the same name.
  static auto CreateConsole(std::string_view name, LogLevel min_level)
      -> std::unique_ptr<SpdlogLogger>;

  [[nodiscard]] auto Enabled(LogLevel level) const -> bool override;

  void SetLevel(LogLevel min_level);

 protected:
  void Write(LogLevel level, std::string message) override;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

auto LogLevelName(LogLevel level) -> std::string_view;

}  // namespace slotest::common
