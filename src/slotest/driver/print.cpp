#include "print.hpp"

#include <cstddef>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

#include "slotest/common/diagnostic.hpp"
#include "slotest/harness/case_result.hpp"
#include "slotest/harness/runner.hpp"

namespace slotest::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;
constexpr auto kPassStyle =
    fmt::fg(fmt::terminal_color::bright_green) | fmt::emphasis::bold;
constexpr auto kFailStyle =
    fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kConfig:
      return "config error:";
    case DiagKind::kIo:
      return "error:";
  }
  return "error:";
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("slotest", kToolStyle),
      fmt::styled("error:", kFailStyle),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintDiagnostic(const Diagnostic& diag) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("slotest", kToolStyle),
      fmt::styled(DiagKindToString(diag.kind), kFailStyle),
      fmt::styled(diag.Format(), fmt::emphasis::bold));
}

void PrintSummary(const harness::RunReport& report) {
  std::size_t completed = report.passed.size() + report.failed.size();
  fmt::print(
      "\n{} script(s): {} passed, {} failed", completed,
      fmt::styled(report.passed.size(), kPassStyle),
      fmt::styled(
          report.failed.size(),
          report.failed.empty() ? fmt::text_style{} : kFailStyle));
  if (report.interrupted) {
    fmt::print(", {} not run (interrupted)", report.discovered - completed);
  }
  fmt::print("\n");

  if (!report.failed.empty()) {
    fmt::print("\nSome files failed to execute:\n");
    for (const auto& result : report.results) {
      if (result.Passed()) {
        continue;
      }
      fmt::print(
          "- {} [{}]\n", result.script.string(),
          harness::CaseRuleName(result.rule));
    }
  } else if (!report.interrupted) {
    fmt::print(
        "{}\n", fmt::styled("All files executed successfully.", kPassStyle));
  }
}

}  // namespace slotest::driver
