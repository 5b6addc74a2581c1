#pragma once

#include "slotest/common/logger.hpp"
#include "slotest/config/harness_options.hpp"

namespace slotest::driver {

// Process exit codes of the slotest binary
inline constexpr int kExitAllPassed = 0;
inline constexpr int kExitSomeFailed = 1;
inline constexpr int kExitConfigError = 2;
inline constexpr int kExitInterrupted = 130;

// Run the harness with fully resolved options, print the summary, write the
// JSON report if requested, and return the process exit code.
auto RunHarness(
    const config::HarnessOptions& options, common::LogLevel log_level) -> int;

}  // namespace slotest::driver
