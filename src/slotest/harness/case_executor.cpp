#include "slotest/harness/case_executor.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "slotest/common/logger.hpp"
#include "slotest/harness/case_result.hpp"
#include "slotest/harness/execution_outcome.hpp"

namespace slotest::harness {

namespace fs = std::filesystem;

auto VerdictName(Verdict verdict) -> std::string_view {
  switch (verdict) {
    case Verdict::kPass:
      return "pass";
    case Verdict::kFail:
      return "fail";
    case Verdict::kInterrupted:
      return "interrupted";
  }
  return "unknown";
}

auto CaseRuleName(CaseRule rule) -> std::string_view {
  switch (rule) {
    case CaseRule::kSucceeded:
      return "succeeded";
    case CaseRule::kOutputMatched:
      return "output-matched";
    case CaseRule::kGoldenRecorded:
      return "golden-recorded";
    case CaseRule::kExpectedFailure:
      return "expected-failure";
    case CaseRule::kUnexpectedSuccess:
      return "unexpected-success";
    case CaseRule::kUnexpectedFailure:
      return "unexpected-failure";
    case CaseRule::kOutputMismatch:
      return "output-mismatch";
    case CaseRule::kPrecondition:
      return "precondition";
    case CaseRule::kTimedOut:
      return "timed-out";
    case CaseRule::kClassificationError:
      return "classification-error";
    case CaseRule::kInterrupted:
      return "interrupted";
  }
  return "unknown";
}

CaseExecutor::CaseExecutor(
    const ErrorClassifier& classifier, const ProcessRunner& runner,
    const OutputVerifier& verifier, common::Logger& logger, bool record_golden)
    : classifier_(classifier),
      runner_(runner),
      verifier_(verifier),
      logger_(logger),
      record_golden_(record_golden) {
}

auto CaseExecutor::Execute(const fs::path& script, bool verify_output) const
    -> CaseResult {
  logger_.Verbose("Found SLO file: {}", script.string());

  CaseResult result{.script = script};

  auto expected = classifier_.IsExpectedError(script);
  if (!expected) {
    logger_.Error(
        "Could not classify {}: {}", script.string(), expected.error().message);
    result.verdict = Verdict::kFail;
    result.rule = CaseRule::kClassificationError;
    result.detail = expected.error().Format();
    return result;
  }
  result.expected_error = *expected;
  logger_.Verbose(
      "'{}' exp error status: {}", script.string(), result.expected_error);

  auto outcome = runner_.Run(script);

  return std::visit(
      Overloaded{
          [&](Succeeded& success) {
            return OnSuccess(std::move(result), success.output, verify_output);
          },
          [&](ExitFailure& failure) {
            result.detail = std::move(failure.detail);
            if (result.expected_error) {
              logger_.Warning(
                  "Expected error for {}: {}", script.string(), result.detail);
              result.verdict = Verdict::kPass;
              result.rule = CaseRule::kExpectedFailure;
              return result;
            }
            logger_.Exception(
                result.detail, "Unexpected error for {}", script.string());
            result.verdict = Verdict::kFail;
            result.rule = CaseRule::kUnexpectedFailure;
            return result;
          },
          [&](LaunchFailure& failure) {
            result.detail = std::move(failure.detail);
            result.verdict = Verdict::kFail;
            if (failure.IsPrecondition()) {
              logger_.Error(
                  "Cannot run {}: {} ({})", script.string(), result.detail,
                  LaunchFailureKindName(failure.kind));
              result.rule = CaseRule::kPrecondition;
              return result;
            }
            if (failure.kind == LaunchFailureKind::kTimedOut) {
              logger_.Error("Timed out: {}", script.string());
              result.rule = CaseRule::kTimedOut;
              return result;
            }
            // Spawn failures reconcile like an exit failure
            if (result.expected_error) {
              logger_.Warning(
                  "Expected error for {}: {}", script.string(), result.detail);
              result.verdict = Verdict::kPass;
              result.rule = CaseRule::kExpectedFailure;
              return result;
            }
            logger_.Exception(
                result.detail, "Unexpected error for {}", script.string());
            result.rule = CaseRule::kUnexpectedFailure;
            return result;
          },
          [&](Interrupted&) {
            logger_.Warning("Execution interrupted by user.");
            logger_.Debug("Last file was: {}", script.string());
            result.verdict = Verdict::kInterrupted;
            result.rule = CaseRule::kInterrupted;
            return result;
          },
      },
      outcome);
}

auto CaseExecutor::OnSuccess(
    CaseResult result, const std::string& output, bool verify_output) const
    -> CaseResult {
  const auto& script = result.script;

  if (result.expected_error) {
    logger_.Error("File DIDN'T error when expected to: {}", script.string());
    result.verdict = Verdict::kFail;
    result.rule = CaseRule::kUnexpectedSuccess;
    result.detail = "exited with status 0 but was expected to fail";
    return result;
  }

  result.verdict = Verdict::kPass;
  result.rule = CaseRule::kSucceeded;

  if (verify_output) {
    auto matches = verifier_.MatchesExpected(script, output);
    if (!matches) {
      logger_.Error(
          "Could not verify output for {}: {}", script.string(),
          matches.error().message);
      result.verdict = Verdict::kFail;
      result.rule = CaseRule::kClassificationError;
      result.detail = matches.error().Format();
      return result;
    }
    if (!*matches) {
      logger_.Error(
          "Output didn't match expected output for {}.", script.string());
      result.verdict = Verdict::kFail;
      result.rule = CaseRule::kOutputMismatch;
      result.detail = "output differs from " +
                      verifier_.GoldenPathFor(script).string();
      return result;
    }
    result.rule = CaseRule::kOutputMatched;
  }

  if (record_golden_) {
    auto recorded = verifier_.RecordGolden(script, output);
    if (!recorded) {
      logger_.Warning(
          "Could not record golden output for {}: {}", script.string(),
          recorded.error().message);
    } else if (*recorded) {
      logger_.Info(
          "Recorded golden output: {}",
          verifier_.GoldenPathFor(script).string());
      result.rule = CaseRule::kGoldenRecorded;
    }
  }

  logger_.Verbose("Executed: {}", script.string());
  return result;
}

}  // namespace slotest::harness
