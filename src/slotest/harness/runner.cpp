#include "slotest/harness/runner.hpp"

#include <algorithm>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <future>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "slotest/common/diagnostic.hpp"
#include "slotest/harness/case_result.hpp"
#include "slotest/harness/worker_pool.hpp"

namespace slotest::harness {

namespace fs = std::filesystem;

namespace {

void Record(RunReport& report, CaseResult result) {
  if (result.WasInterrupted()) {
    report.interrupted = true;
    return;
  }
  if (result.Passed()) {
    report.passed.push_back(result.script);
  } else {
    report.failed.push_back(result.script);
  }
  report.results.push_back(std::move(result));
}

}  // namespace

Runner::Runner(
    config::HarnessOptions options, common::Logger& logger,
    const common::InterruptFlag* interrupt)
    : options_(std::move(options)),
      logger_(logger),
      interrupt_(interrupt),
      classifier_(options_.expected_error_marker, options_.expected_errors),
      process_runner_(
          ProcessRunner::Config{
              .interpreter = options_.interpreter,
              .timeout = options_.timeout,
              .interrupt = interrupt_,
          }),
      verifier_(options_.golden_extension),
      executor_(
          classifier_, process_runner_, verifier_, logger_,
          options_.record_golden) {
}

auto Runner::Discover(const fs::path& root) const
    -> Result<std::vector<fs::path>> {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return std::unexpected(
        Diagnostic::ConfigError(
            fmt::format("test directory not found: {}", root.string())));
  }

  std::vector<fs::path> scripts;
  fs::recursive_directory_iterator it(
      root, fs::directory_options::skip_permission_denied, ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    const auto& entry = *it;
    std::error_code type_ec;
    if (!entry.is_regular_file(type_ec)) {
      continue;
    }
    if (entry.path().extension() == options_.script_extension) {
      scripts.push_back(entry.path());
    }
  }
  if (ec) {
    return std::unexpected(
        Diagnostic::IoError(
            root, fmt::format("failed to scan directory: {}", ec.message())));
  }

  // Directory iteration order is unspecified; sort for a stable run order
  std::ranges::sort(scripts);
  return scripts;
}

auto Runner::RunAll(const fs::path& root, bool verify_output, bool parallel)
    const -> Result<RunReport> {
  auto scripts = Discover(root);
  if (!scripts) {
    return std::unexpected(std::move(scripts.error()));
  }
  logger_.Debug(
      "Discovered {} script(s) under {}", scripts->size(), root.string());

  RunReport report = parallel ? RunParallel(*scripts, verify_output)
                              : RunSequential(*scripts, verify_output);
  report.discovered = scripts->size();

  if (report.interrupted) {
    logger_.Warning(
        "Run aborted: {} of {} script(s) completed",
        report.passed.size() + report.failed.size(), report.discovered);
  }
  return report;
}

auto Runner::RunSequential(
    const std::vector<fs::path>& scripts, bool verify_output) const
    -> RunReport {
  RunReport report;
  for (const auto& script : scripts) {
    if (InterruptRequested()) {
      report.interrupted = true;
      break;
    }
    auto result = executor_.Execute(script, verify_output);
    bool stop = result.WasInterrupted();
    Record(report, std::move(result));
    if (stop) {
      break;
    }
  }
  return report;
}

auto Runner::RunParallel(
    const std::vector<fs::path>& scripts, bool verify_output) const
    -> RunReport {
  std::vector<std::future<CaseResult>> pending;
  pending.reserve(scripts.size());

  {
    WorkerPool pool(options_.jobs);
    logger_.Debug("Dispatching to {} worker(s)", pool.Size());
    for (const auto& script : scripts) {
      pending.push_back(pool.Submit([this, &script, verify_output] {
        // Once interrupted, queued cases are dropped without launching
        if (InterruptRequested()) {
          return CaseResult{
              .script = script,
              .verdict = Verdict::kInterrupted,
              .rule = CaseRule::kInterrupted,
              .detail = "not started",
          };
        }
        return executor_.Execute(script, verify_output);
      }));
    }
    // Pool destruction waits for every submitted task
  }

  // Assemble in submission order, independent of completion order
  RunReport report;
  for (auto& future : pending) {
    Record(report, future.get());
  }
  return report;
}

auto Runner::InterruptRequested() const -> bool {
  return interrupt_ != nullptr && interrupt_->Requested();
}

}  // namespace slotest::harness
