#include "run.hpp"

#include <filesystem>

#include "print.hpp"
#include "slotest/common/interrupt.hpp"
#include "slotest/common/logger.hpp"
#include "slotest/config/harness_options.hpp"
#include "slotest/harness/report_writer.hpp"
#include "slotest/harness/runner.hpp"

namespace slotest::driver {

auto RunHarness(
    const config::HarnessOptions& options, common::LogLevel log_level) -> int {
  auto logger = common::SpdlogLogger::CreateConsole("slotest", log_level);

  if (!common::InstallInterruptHandlers()) {
    logger->Warning("Could not install SIGINT/SIGTERM handlers");
  }
  auto& interrupt = common::ProcessInterruptFlag();

  harness::Runner runner(options, *logger, &interrupt);

  logger->Info("Running tests in: {}", options.root_directory.string());
  logger->Debug("Binary path is: {}", options.interpreter.string());

  auto report = runner.RunAll(
      options.root_directory, options.verify_output, options.parallel);
  if (!report) {
    PrintDiagnostic(report.error());
    return kExitConfigError;
  }

  PrintSummary(*report);

  if (options.report_path) {
    if (auto written = harness::WriteJsonReport(*options.report_path, *report);
        !written) {
      PrintDiagnostic(written.error());
      return kExitConfigError;
    }
    logger->Verbose("Wrote report to {}", options.report_path->string());
  }

  if (report->interrupted) {
    return kExitInterrupted;
  }
  return report->failed.empty() ? kExitAllPassed : kExitSomeFailed;
}

}  // namespace slotest::driver
