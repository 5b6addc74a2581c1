#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace slotest::harness {

enum class Verdict : uint8_t {
  kPass,
  kFail,
  kInterrupted,  // Cut short by the operator; counts as neither
};

// Which reconciliation rule decided the verdict
enum class CaseRule : uint8_t {
  kSucceeded,            // Exit 0, no output check requested
  kOutputMatched,        // Exit 0, output equal to golden (or no golden)
  kGoldenRecorded,       // Exit 0, golden file written from this run
  kExpectedFailure,      // Marked to fail and the interpreter failed
  kUnexpectedSuccess,    // Marked to fail but exited 0
  kUnexpectedFailure,    // Not marked, interpreter failed
  kOutputMismatch,       // Exit 0 but output differs from golden
  kPrecondition,         // Interpreter missing or not executable
  kTimedOut,             // Killed by the per-case timeout
  kClassificationError,  // Script (or golden file) unreadable
  kInterrupted,          // Operator interrupt
};

struct CaseResult {
  std::filesystem::path script;
  Verdict verdict = Verdict::kFail;
  CaseRule rule = CaseRule::kUnexpectedFailure;
  bool expected_error = false;
  std::string detail;

  [[nodiscard]] auto Passed() const -> bool {
    return verdict == Verdict::kPass;
  }
  [[nodiscard]] auto WasInterrupted() const -> bool {
    return verdict == Verdict::kInterrupted;
  }
};

auto VerdictName(Verdict verdict) -> std::string_view;
auto CaseRuleName(CaseRule rule) -> std::string_view;

}  // namespace slotest::harness
