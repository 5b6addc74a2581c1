#include "slotest/harness/process_runner.hpp"

#include <algorithm>
#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <unistd.h>

#include <fmt/core.h>

#include "slotest/common/internal_error.hpp"
#include "slotest/common/subprocess.hpp"
#include "slotest/harness/execution_outcome.hpp"

namespace slotest::harness {

namespace fs = std::filesystem;

namespace {

// Limits beyond what milliseconds can hold are as good as none
constexpr auto kLongestTimeout =
    std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::milliseconds::max());

// posix_spawnp searches PATH for a bare name; launch the file that
// CheckInterpreter() inspected instead
auto LaunchPath(const fs::path& interpreter) -> std::string {
  if (interpreter.has_parent_path()) {
    return interpreter.string();
  }
  return (fs::path(".") / interpreter).string();
}

}  // namespace

auto LaunchFailureKindName(LaunchFailureKind kind) -> std::string_view {
  switch (kind) {
    case LaunchFailureKind::kMissingExecutable:
      return "missing-executable";
    case LaunchFailureKind::kNotExecutable:
      return "not-executable";
    case LaunchFailureKind::kSpawnFailed:
      return "spawn-failed";
    case LaunchFailureKind::kTimedOut:
      return "timed-out";
  }
  return "unknown";
}

ProcessRunner::ProcessRunner(Config config) : config_(std::move(config)) {
}

auto ProcessRunner::CheckInterpreter() const
    -> std::expected<void, LaunchFailure> {
  std::error_code ec;
  if (!fs::is_regular_file(config_.interpreter, ec)) {
    return std::unexpected(
        LaunchFailure{
            .kind = LaunchFailureKind::kMissingExecutable,
            .detail = fmt::format(
                "interpreter binary not found at {}",
                config_.interpreter.string()),
        });
  }
  if (access(config_.interpreter.c_str(), X_OK) != 0) {
    return std::unexpected(
        LaunchFailure{
            .kind = LaunchFailureKind::kNotExecutable,
            .detail = fmt::format(
                "interpreter binary at {} is not executable",
                config_.interpreter.string()),
        });
  }
  return {};
}

auto ProcessRunner::Run(const fs::path& script) const -> ExecutionOutcome {
  if (config_.interrupt != nullptr && config_.interrupt->Requested()) {
    return Interrupted{};
  }

  if (auto ready = CheckInterpreter(); !ready) {
    return ready.error();
  }

  common::SubprocessOptions options{
      .capture_stderr = false,
      .timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::min(config_.timeout, kLongestTimeout)),
      .interrupt = config_.interrupt,
  };
  auto result = common::RunSubprocess(
      {LaunchPath(config_.interpreter), script.string()}, options);

  switch (result.status) {
    case common::SubprocessStatus::kExited:
      if (result.exit_code == 0) {
        return Succeeded{.output = std::move(result.output)};
      }
      return ExitFailure{
          .exit_code = result.exit_code,
          .detail = fmt::format(
              "'{} {}' returned non-zero exit status {}",
              config_.interpreter.string(), script.string(),
              result.exit_code),
      };
    case common::SubprocessStatus::kSignaled:
      return ExitFailure{
          .exit_code = result.exit_code,
          .detail = fmt::format(
              "'{} {}' {}", config_.interpreter.string(), script.string(),
              result.error),
      };
    case common::SubprocessStatus::kTimedOut:
      return LaunchFailure{
          .kind = LaunchFailureKind::kTimedOut,
          .detail = fmt::format(
              "'{} {}' timed out after {}s", config_.interpreter.string(),
              script.string(), config_.timeout.count()),
      };
    case common::SubprocessStatus::kInterrupted:
      return Interrupted{};
    case common::SubprocessStatus::kSpawnFailed:
      return LaunchFailure{
          .kind = LaunchFailureKind::kSpawnFailed,
          .detail = std::move(result.error),
      };
  }
  common::ThrowInternalError(
      "ProcessRunner::Run",
      fmt::format(
          "unknown subprocess status {}", static_cast<int>(result.status)));
}

}  // namespace slotest::harness
