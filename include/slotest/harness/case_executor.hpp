#pragma once

#include <filesystem>
#include <string>

#include "slotest/common/logger.hpp"
#include "slotest/harness/case_result.hpp"
#include "slotest/harness/error_classifier.hpp"
#include "slotest/harness/output_verifier.hpp"
#include "slotest/harness/process_runner.hpp"

namespace slotest::harness {

// Runs one script and reconciles the outcome against its expectation:
//
//   expected to fail | interpreter         | output check | verdict
//   -----------------+---------------------+--------------+--------
//   yes              | failed              | -            | pass
//   yes              | exit 0              | -            | FAIL
//   no               | failed              | -            | FAIL
//   no               | exit 0              | off          | pass
//   no               | exit 0              | on, matches  | pass
//   no               | exit 0              | on, differs  | FAIL
//
// A missing or non-executable interpreter, a timeout, or an unreadable script
// always fails the case. An operator interrupt yields Verdict::kInterrupted
// and the caller is expected to stop dispatching.
//
// Holds references only; the collaborators must outlive the executor. Safe to
// share between worker threads as long as the logger is.
class CaseExecutor {
 public:
  CaseExecutor(
      const ErrorClassifier& classifier, const ProcessRunner& runner,
      const OutputVerifier& verifier, common::Logger& logger,
      bool record_golden = false);

  [[nodiscard]] auto Execute(
      const std::filesystem::path& script, bool verify_output) const
      -> CaseResult;

 private:
  auto OnSuccess(CaseResult result, const std::string& output,
                 bool verify_output) const -> CaseResult;

  const ErrorClassifier& classifier_;
  const ProcessRunner& runner_;
  const OutputVerifier& verifier_;
  common::Logger& logger_;
  bool record_golden_;
};

}  // namespace slotest::harness
