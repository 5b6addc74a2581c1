#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

#include "slotest/common/diagnostic.hpp"
#include "slotest/common/interrupt.hpp"
#include "slotest/common/logger.hpp"
#include "slotest/config/harness_options.hpp"
#include "slotest/harness/case_executor.hpp"
#include "slotest/harness/case_result.hpp"
#include "slotest/harness/error_classifier.hpp"
#include "slotest/harness/output_verifier.hpp"
#include "slotest/harness/process_runner.hpp"

namespace slotest::harness {

// Outcome of one RunAll() call. `passed` and `failed` partition the cases
// that completed; when `interrupted` is set, cases cut short by the interrupt
// appear in neither.
struct RunReport {
  std::vector<std::filesystem::path> passed;
  std::vector<std::filesystem::path> failed;

  // Completed cases, in discovery order
  std::vector<CaseResult> results;

  std::size_t discovered = 0;
  bool interrupted = false;

  [[nodiscard]] auto AllPassed() const -> bool {
    return failed.empty() && !interrupted;
  }
};

// Discovers scripts under a root directory and drives CaseExecutor over
// them, either one at a time or on a WorkerPool of `options.jobs` workers.
class Runner {
 public:
  // `interrupt` may be null; the logger must outlive the runner.
  Runner(
      config::HarnessOptions options, common::Logger& logger,
      const common::InterruptFlag* interrupt = nullptr);

  // The executor refers to sibling members
  Runner(const Runner&) = delete;
  auto operator=(const Runner&) -> Runner& = delete;
  Runner(Runner&&) = delete;
  auto operator=(Runner&&) -> Runner& = delete;

  // Every regular file under `root` with the script extension, sorted.
  [[nodiscard]] auto Discover(const std::filesystem::path& root) const
      -> Result<std::vector<std::filesystem::path>>;

  // Only configuration problems (a missing root directory) are returned as
  // errors; every per-case problem ends up in the report.
  [[nodiscard]] auto RunAll(
      const std::filesystem::path& root, bool verify_output = false,
      bool parallel = false) const -> Result<RunReport>;

 private:
  [[nodiscard]] auto RunSequential(
      const std::vector<std::filesystem::path>& scripts,
      bool verify_output) const -> RunReport;
  [[nodiscard]] auto RunParallel(
      const std::vector<std::filesystem::path>& scripts,
      bool verify_output) const -> RunReport;

  [[nodiscard]] auto InterruptRequested() const -> bool;

  config::HarnessOptions options_;
  common::Logger& logger_;
  const common::InterruptFlag* interrupt_;

  ErrorClassifier classifier_;
  ProcessRunner process_runner_;
  OutputVerifier verifier_;
  CaseExecutor executor_;
};

}  // namespace slotest::harness
