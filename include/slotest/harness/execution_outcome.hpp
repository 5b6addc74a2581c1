#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace slotest::harness {

// Interpreter exited with status 0; output holds its captured stdout.
struct Succeeded {
  std::string output;
};

// Interpreter ran but exited non-zero (or was killed by a signal, in which
// case exit_code is 128 + signal number).
struct ExitFailure {
  int exit_code = -1;
  std::string detail;
};

enum class LaunchFailureKind : uint8_t {
  kMissingExecutable,  // No regular file at the interpreter path
  kNotExecutable,      // File exists but this process may not execute it
  kSpawnFailed,        // pipe/posix_spawn failed
  kTimedOut,           // Killed after exceeding the configured timeout
};

// Interpreter never produced a result.
struct LaunchFailure {
  LaunchFailureKind kind = LaunchFailureKind::kSpawnFailed;
  std::string detail;

  // Missing or non-executable interpreter: a harness configuration problem,
  // not something the script under test did.
  [[nodiscard]] auto IsPrecondition() const -> bool {
    return kind == LaunchFailureKind::kMissingExecutable ||
           kind == LaunchFailureKind::kNotExecutable;
  }
};

// The operator asked the run to stop while the interpreter was running.
struct Interrupted {};

using ExecutionOutcome =
    std::variant<Succeeded, ExitFailure, LaunchFailure, Interrupted>;

// Visitor helper for std::visit with multiple lambdas.
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

auto LaunchFailureKindName(LaunchFailureKind kind) -> std::string_view;

}  // namespace slotest::harness
