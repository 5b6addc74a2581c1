#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "slotest/common/diagnostic.hpp"

namespace slotest::config {

inline constexpr std::string_view kConfigFileName = "slotest.toml";

// Largest accepted per-case timeout, the range of the --timeout flag
inline constexpr std::chrono::seconds kMaxTimeout{
    std::numeric_limits<int32_t>::max()};

struct HarnessOptions {
  // Directory scanned recursively for scripts
  std::filesystem::path root_directory = "tests/slo";

  // Interpreter under test, invoked as `<interpreter> <script>`
  std::filesystem::path interpreter = "build/cslo";

  bool verify_output = false;
  bool parallel = false;
  std::size_t jobs = 4;

  std::string script_extension = ".slo";
  std::string golden_extension = ".out";

  // Exact line (without the newline) marking a script as expected to fail
  std::string expected_error_marker = "# slo: exp error";

  // File names expected to fail regardless of their contents
  std::vector<std::string> expected_errors;

  // Per-case limit; zero waits forever
  std::chrono::seconds timeout{0};

  // Write missing golden files from the captured output
  bool record_golden = false;

  // Optional JSON summary destination
  std::optional<std::filesystem::path> report_path;

  // Directory containing the slotest.toml that was applied, if any
  std::optional<std::filesystem::path> config_dir;
};

// Search for slotest.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = ".")
    -> std::optional<std::filesystem::path>;

// Apply the values in config_path on top of `base`. Relative paths in the
// file resolve against the file's directory; list values are appended.
auto LoadConfig(
    const std::filesystem::path& config_path, HarnessOptions base = {})
    -> Result<HarnessOptions>;

// Reject option combinations the harness cannot run with.
auto ValidateOptions(const HarnessOptions& options) -> Result<void>;

}  // namespace slotest::config
