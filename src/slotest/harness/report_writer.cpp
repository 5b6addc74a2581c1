#include "slotest/harness/report_writer.hpp"

#include <expected>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "slotest/common/diagnostic.hpp"
#include "slotest/harness/case_result.hpp"

namespace slotest::harness {

namespace fs = std::filesystem;

namespace {

auto PathList(const std::vector<fs::path>& paths) -> nlohmann::json {
  auto list = nlohmann::json::array();
  for (const auto& path : paths) {
    list.push_back(path.generic_string());
  }
  return list;
}

}  // namespace

auto FormatJsonReport(const RunReport& report) -> std::string {
  nlohmann::json j;
  j["discovered"] = report.discovered;
  j["passed"] = report.passed.size();
  j["failed"] = report.failed.size();
  j["interrupted"] = report.interrupted;
  j["passed_files"] = PathList(report.passed);
  j["failed_files"] = PathList(report.failed);

  auto failures = nlohmann::json::array();
  for (const auto& result : report.results) {
    if (result.Passed()) {
      continue;
    }
    failures.push_back({
        {"file", result.script.generic_string()},
        {"rule", std::string(CaseRuleName(result.rule))},
        {"expected_error", result.expected_error},
        {"detail", result.detail},
    });
  }
  j["failures"] = std::move(failures);

  return j.dump(2);
}

auto WriteJsonReport(const fs::path& destination, const RunReport& report)
    -> Result<void> {
  std::error_code ec;
  if (destination.has_parent_path()) {
    fs::create_directories(destination.parent_path(), ec);
    if (ec) {
      return std::unexpected(
          Diagnostic::IoError(
              destination,
              fmt::format("cannot create report directory: {}", ec.message())));
    }
  }

  std::ofstream out(destination);
  out << FormatJsonReport(report) << '\n';
  out.close();
  if (!out) {
    return std::unexpected(
        Diagnostic::IoError(destination, "failed to write report"));
  }
  return {};
}

}  // namespace slotest::harness
