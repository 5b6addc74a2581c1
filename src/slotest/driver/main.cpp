#include <argparse/argparse.hpp>
#include <chrono>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "print.hpp"
#include "run.hpp"
#include "slotest/common/logger.hpp"
#include "slotest/config/harness_options.hpp"

namespace {

namespace fs = std::filesystem;

using slotest::config::HarnessOptions;

// Config file first, then command-line flags on top. Scalars from the
// command line replace file values; --expect-error adds to the file's list.
auto BuildOptions(const argparse::ArgumentParser& program)
    -> std::optional<HarnessOptions> {
  HarnessOptions options;

  std::optional<fs::path> config_path;
  if (auto explicit_path = program.present<std::string>("--config")) {
    config_path = *explicit_path;
    std::error_code ec;
    if (!fs::exists(*config_path, ec)) {
      slotest::driver::PrintError(
          fmt::format("config file not found: {}", config_path->string()));
      return std::nullopt;
    }
  } else if (!program.get<bool>("--no-config")) {
    config_path = slotest::config::FindConfig();
  }

  if (config_path) {
    auto loaded = slotest::config::LoadConfig(*config_path, options);
    if (!loaded) {
      slotest::driver::PrintDiagnostic(loaded.error());
      return std::nullopt;
    }
    options = std::move(*loaded);
  }

  if (auto root = program.present<std::string>("root")) {
    options.root_directory = *root;
  }
  if (auto interpreter = program.present<std::string>("--interpreter")) {
    options.interpreter = *interpreter;
  }
  if (program.get<bool>("--check-output")) {
    options.verify_output = true;
  }
  if (program.get<bool>("--parallel")) {
    options.parallel = true;
  }
  if (program.get<bool>("--sequential")) {
    options.parallel = false;
  }
  if (auto jobs = program.present<int>("--jobs")) {
    if (*jobs < 1) {
      slotest::driver::PrintError("--jobs must be at least 1");
      return std::nullopt;
    }
    options.jobs = static_cast<std::size_t>(*jobs);
  }
  if (auto timeout = program.present<int>("--timeout")) {
    if (*timeout < 0) {
      slotest::driver::PrintError("--timeout must not be negative");
      return std::nullopt;
    }
    options.timeout = std::chrono::seconds(*timeout);
  }
  if (auto names =
          program.present<std::vector<std::string>>("--expect-error")) {
    options.expected_errors.insert(
        options.expected_errors.end(), names->begin(), names->end());
  }
  if (program.get<bool>("--record-golden")) {
    options.record_golden = true;
  }
  if (auto report = program.present<std::string>("--report")) {
    options.report_path = fs::path(*report);
  }

  if (auto valid = slotest::config::ValidateOptions(options); !valid) {
    slotest::driver::PrintDiagnostic(valid.error());
    return std::nullopt;
  }
  return options;
}

auto ResolveLogLevel(int verbosity, bool quiet) -> slotest::common::LogLevel {
  if (quiet) {
    return slotest::common::LogLevel::kWarning;
  }
  if (verbosity >= 2) {
    return slotest::common::LogLevel::kDebug;
  }
  if (verbosity == 1) {
    return slotest::common::LogLevel::kVerbose;
  }
  return slotest::common::LogLevel::kInfo;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("slotest", "0.1.0");
  program.add_description(
      "Run every .slo script under a directory through the cslo interpreter "
      "and report which ones pass.");

  program.add_argument("root").nargs(0, 1).help(
      "Directory to scan for scripts (default: tests/slo or slotest.toml)");
  program.add_argument("-i", "--interpreter")
      .help("Interpreter binary under test (default: build/cslo)")
      .metavar("PATH");
  program.add_argument("-c", "--check-output")
      .default_value(false)
      .implicit_value(true)
      .help("Compare stdout against sibling .out golden files");
  program.add_argument("-p", "--parallel")
      .default_value(false)
      .implicit_value(true)
      .help("Run scripts on a worker pool");
  program.add_argument("--sequential")
      .default_value(false)
      .implicit_value(true)
      .help("Run scripts one at a time (overrides slotest.toml)");
  program.add_argument("-j", "--jobs")
      .scan<'i', int>()
      .help("Worker count for --parallel (default: 4)")
      .metavar("N");
  program.add_argument("--expect-error")
      .append()
      .help("Script file name expected to fail (repeatable)")
      .metavar("NAME");
  program.add_argument("--timeout")
      .scan<'i', int>()
      .help("Kill a script after this many seconds (default: no limit)")
      .metavar("SECONDS");
  program.add_argument("--record-golden")
      .default_value(false)
      .implicit_value(true)
      .help("Write missing .out files from the captured output");
  program.add_argument("--report")
      .help("Write a JSON summary to this path")
      .metavar("PATH");
  program.add_argument("--config")
      .help("Use this slotest.toml instead of searching for one")
      .metavar("PATH");
  program.add_argument("--no-config")
      .default_value(false)
      .implicit_value(true)
      .help("Ignore slotest.toml");

  int verbosity = 0;
  program.add_argument("-v", "--verbose")
      .action([&](const auto&) { ++verbosity; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0)
      .help("Increase log verbosity (repeatable)");
  program.add_argument("-q", "--quiet")
      .default_value(false)
      .implicit_value(true)
      .help("Only log warnings and errors");

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    slotest::driver::PrintError(err.what());
    std::cerr << program;
    return slotest::driver::kExitConfigError;
  }

  auto options = BuildOptions(program);
  if (!options) {
    return slotest::driver::kExitConfigError;
  }

  return slotest::driver::RunHarness(
      *options, ResolveLogLevel(verbosity, program.get<bool>("--quiet")));
}
