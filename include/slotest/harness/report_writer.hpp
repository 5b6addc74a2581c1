#pragma once

#include <filesystem>
#include <string>

#include "slotest/common/diagnostic.hpp"
#include "slotest/harness/runner.hpp"

namespace slotest::harness {

// Machine-readable summary of a run:
//
//   {
//     "discovered": 3, "passed": 2, "failed": 1, "interrupted": false,
//     "passed_files": [...], "failed_files": [...],
//     "failures": [{"file": ..., "rule": ..., "expected_error": ...,
//                   "detail": ...}]
//   }
auto FormatJsonReport(const RunReport& report) -> std::string;

// Write FormatJsonReport() to `destination`, creating parent directories.
auto WriteJsonReport(
    const std::filesystem::path& destination, const RunReport& report)
    -> Result<void>;

}  // namespace slotest::harness
