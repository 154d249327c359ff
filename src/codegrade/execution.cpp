#include <codegrade/execution.h>

#include <spdlog/spdlog.h>

#include "utils.h"

namespace {

std::string ErrorText(ErrorKind kind, const std::string& message) {
  std::string desc = ErrorKindDesc(kind);
  if (message.empty()) return desc;
  return desc + ": " + message;
}

ComparisonDiagnostic NotCompared(const std::string& actual, const nlohmann::json& expected,
                                 const std::string& message) {
  ComparisonDiagnostic ret;
  ret.type = MatchType::NOT_COMPARED;
  ret.actual = Trim(actual);
  ret.expected = Trim(ExpectedText(expected));
  ret.message = message;
  return ret;
}

} // namespace

TestCaseResult MakeResult(size_t index, const TestCase& test_case, RunOutcome&& outcome) {
  TestCaseResult ret;
  ret.test_index = index;
  ret.input = test_case.input;
  ret.expected_output = test_case.expected_output;
  ret.actual_output = TrimRight(outcome.output);
  ret.execution_time_ms = outcome.time_ms;
  ret.memory_used_mb = outcome.memory_mb;
  ret.details = std::move(outcome.details);
  if (outcome.kind == ErrorKind::NONE) {
    ret.diagnostic = Compare(ret.actual_output, test_case.expected_output);
    ret.passed = ret.diagnostic.Matched();
    if (!ret.passed) ret.error_kind = ErrorKind::COMPARISON_MISMATCH;
  } else {
    ret.error_kind = outcome.kind;
    ret.error = ErrorText(outcome.kind, outcome.message);
    ret.diagnostic = NotCompared(ret.actual_output, test_case.expected_output, *ret.error);
  }
  spdlog::debug("Test {}: {} {}", index, ret.passed ? "passed" : "failed",
      ret.passed ? MatchTypeName(ret.diagnostic.type) : ErrorKindName(ret.error_kind));
  return ret;
}

TestCaseResult MakeFailedResult(size_t index, const TestCase& test_case, ErrorKind kind,
                                const std::string& error) {
  RunOutcome outcome;
  outcome.kind = kind;
  outcome.message = error;
  return MakeResult(index, test_case, std::move(outcome));
}
