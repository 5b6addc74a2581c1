#pragma once

#include <string>

#include "slotest/common/diagnostic.hpp"
#include "slotest/harness/runner.hpp"

namespace slotest::driver {

void PrintError(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

// Final summary on stdout: counts, then either the list of failed files or
// the all-passed line.
void PrintSummary(const harness::RunReport& report);

}  // namespace slotest::driver
