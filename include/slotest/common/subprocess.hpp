#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "slotest/common/interrupt.hpp"

namespace slotest::common {

enum class SubprocessStatus : uint8_t {
  kExited,       // Child exited normally (exit_code holds its status)
  kSignaled,     // Child was killed by a signal (exit_code = 128 + signal)
  kSpawnFailed,  // pipe/spawn failed, error holds the reason
  kTimedOut,     // Killed after exceeding SubprocessOptions::timeout
  kInterrupted,  // Killed because the interrupt flag was raised
};

struct SubprocessOptions {
  // When false, the child's stderr is redirected to /dev/null.
  bool capture_stderr = false;

  // Zero means wait forever.
  std::chrono::milliseconds timeout{0};

  // Polled while the child runs; may be null.
  const InterruptFlag* interrupt = nullptr;
};

struct SubprocessResult {
  SubprocessStatus status = SubprocessStatus::kSpawnFailed;
  int exit_code = -1;
  std::string output;
  std::string error;

  [[nodiscard]] auto Success() const -> bool {
    return status == SubprocessStatus::kExited && exit_code == 0;
  }
};

// Execute argv directly (no shell interpretation), capturing stdout.
// argv[0] = program path or name, argv[1..n] = arguments.
// The wait is aborted, and the child killed, when the interrupt flag is
// raised or the timeout elapses.
auto RunSubprocess(
    const std::vector<std::string>& argv,
    const SubprocessOptions& options = {}) -> SubprocessResult;

}  // namespace slotest::common
