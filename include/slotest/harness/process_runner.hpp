#pragma once

#include <chrono>
#include <expected>
#include <filesystem>

#include "slotest/common/interrupt.hpp"
#include "slotest/harness/execution_outcome.hpp"

namespace slotest::harness {

// Runs the interpreter under test on one script.
class ProcessRunner {
 public:
  struct Config {
    std::filesystem::path interpreter;

    // Zero means no limit
    std::chrono::seconds timeout{0};

    // Raised by the operator to abort the current wait; may be null
    const common::InterruptFlag* interrupt = nullptr;
  };

  explicit ProcessRunner(Config config);

  // The interpreter must be a regular file this process may execute.
  [[nodiscard]] auto CheckInterpreter() const
      -> std::expected<void, LaunchFailure>;

  // Launch `<interpreter> <script>` with stdout captured and stderr
  // discarded. Never throws for interpreter misbehaviour; every failure is
  // one of the ExecutionOutcome alternatives.
  [[nodiscard]] auto Run(const std::filesystem::path& script) const
      -> ExecutionOutcome;

 private:
  Config config_;
};

}  // namespace slotest::harness
