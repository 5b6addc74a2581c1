#include "slotest/config/harness_options.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <toml++/toml.hpp>

#include "slotest/common/diagnostic.hpp"

namespace slotest::config {

namespace fs = std::filesystem;

namespace {

auto ResolveAgainst(const fs::path& base, const std::string& value)
    -> fs::path {
  fs::path path = value;
  if (path.is_relative()) {
    path = base / path;
  }
  return path.lexically_normal();
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  std::error_code ec;
  fs::path dir = fs::absolute(start_dir, ec);
  if (ec) {
    return std::nullopt;
  }

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    // Unreadable ancestors are skipped, not fatal
    if (fs::exists(config_path, ec)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path, HarnessOptions base)
    -> Result<HarnessOptions> {
  HarnessOptions options = std::move(base);
  std::error_code ec;
  const fs::path config_dir = fs::absolute(config_path, ec).parent_path();
  if (ec) {
    return std::unexpected(
        Diagnostic::ConfigError(
            fmt::format(
                "cannot resolve {}: {}", config_path.string(), ec.message())));
  }
  options.config_dir = config_dir;

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::ConfigError(
            fmt::format(
                "failed to parse {}: {}", config_path.string(),
                e.description())));
  }

  // [harness] section (optional)
  if (auto harness = tbl["harness"]) {
    if (auto root = harness["root"].value<std::string>()) {
      options.root_directory = ResolveAgainst(config_dir, *root);
    }
    if (auto interpreter = harness["interpreter"].value<std::string>()) {
      options.interpreter = ResolveAgainst(config_dir, *interpreter);
    }
    if (auto parallel = harness["parallel"].value<bool>()) {
      options.parallel = *parallel;
    }
    if (auto check_output = harness["check_output"].value<bool>()) {
      options.verify_output = *check_output;
    }
    if (auto jobs = harness["jobs"].value<int64_t>()) {
      if (*jobs < 1) {
        return std::unexpected(
            Diagnostic::ConfigError(
                fmt::format(
                    "{}: 'harness.jobs' must be at least 1, got {}",
                    config_path.string(), *jobs)));
      }
      options.jobs = static_cast<std::size_t>(*jobs);
    }
    if (auto timeout = harness["timeout"].value<int64_t>()) {
      if (*timeout < 0 || *timeout > kMaxTimeout.count()) {
        return std::unexpected(
            Diagnostic::ConfigError(
                fmt::format(
                    "{}: 'harness.timeout' must be between 0 and {}, got {}",
                    config_path.string(), kMaxTimeout.count(), *timeout)));
      }
      options.timeout = std::chrono::seconds(*timeout);
    }
  }

  // [files] section (optional)
  if (auto files = tbl["files"]) {
    if (auto ext = files["script_extension"].value<std::string>()) {
      options.script_extension = *ext;
    }
    if (auto ext = files["golden_extension"].value<std::string>()) {
      options.golden_extension = *ext;
    }
    if (auto marker = files["marker"].value<std::string>()) {
      options.expected_error_marker = *marker;
    }
    if (auto* errors = files["expected_errors"].as_array()) {
      for (const auto& elem : *errors) {
        auto name = elem.value<std::string>();
        if (!name) {
          return std::unexpected(
              Diagnostic::ConfigError(
                  fmt::format(
                      "{}: 'files.expected_errors' must contain only strings",
                      config_path.string())));
        }
        options.expected_errors.push_back(*name);
      }
    }
  }

  // [report] section (optional)
  if (auto report = tbl["report"]) {
    if (auto json = report["json"].value<std::string>()) {
      options.report_path = ResolveAgainst(config_dir, *json);
    }
  }

  return options;
}

auto ValidateOptions(const HarnessOptions& options) -> Result<void> {
  if (options.jobs == 0) {
    return std::unexpected(
        Diagnostic::ConfigError("worker count must be at least 1"));
  }
  if (options.timeout.count() < 0 || options.timeout > kMaxTimeout) {
    return std::unexpected(
        Diagnostic::ConfigError(
            fmt::format(
                "timeout must be between 0 and {} seconds, got {}",
                kMaxTimeout.count(), options.timeout.count())));
  }
  if (options.script_extension.size() < 2 ||
      options.script_extension.front() != '.') {
    return std::unexpected(
        Diagnostic::ConfigError(
            fmt::format(
                "script extension must look like '.slo', got '{}'",
                options.script_extension)));
  }
  if (options.golden_extension.size() < 2 ||
      options.golden_extension.front() != '.') {
    return std::unexpected(
        Diagnostic::ConfigError(
            fmt::format(
                "golden extension must look like '.out', got '{}'",
                options.golden_extension)));
  }
  if (options.golden_extension == options.script_extension) {
    return std::unexpected(
        Diagnostic::ConfigError(
            "golden and script extensions must differ"));
  }
  if (options.expected_error_marker.empty() ||
      options.expected_error_marker.find('\n') != std::string::npos) {
    return std::unexpected(
        Diagnostic::ConfigError(
            "expected-error marker must be a single non-empty line"));
  }
  return {};
}

}  // namespace slotest::config
