#ifndef INCLUDE_CODEGRADE_EXECUTION_H_
#define INCLUDE_CODEGRADE_EXECUTION_H_

#include <string>
#include <vector>
#include <optional>

#include <nlohmann/json.hpp>

#include "grader.h"

// Why a test case failed; NONE for passed (and ungraded) results
#define ENUM_ERROR_KIND_ \
  X(NONE, "", "none", "") \
  X(COMPILATION_ERROR, "CE", "compilation_error", "Compilation Error") \
  X(RUNTIME_ERROR, "RE", "runtime_error", "Runtime Error") \
  X(TIME_LIMIT_EXCEEDED, "TLE", "time_limit_exceeded", "Time Limit Exceeded") \
  X(MEMORY_LIMIT_EXCEEDED, "MLE", "memory_limit_exceeded", "Memory Limit Exceeded") \
  X(COMPARISON_MISMATCH, "WA", "comparison_mismatch", "Wrong Answer") \
  X(EXECUTION_ERROR, "EE", "execution_error", "Execution Error") \
  X(NO_RESULT, "NR", "no_result", "No Result") \
  X(PROVIDER_UNAVAILABLE, "PU", "provider_unavailable", "Provider Unavailable") \
  X(MALFORMED_PROVIDER_RESPONSE, "MPR", "malformed_provider_response", "Malformed Provider Response") \
  X(UNSUPPORTED_LANGUAGE, "UL", "unsupported_language", "Unsupported Language") \
  X(CONFIGURATION_ERROR, "CFG", "configuration_error", "Configuration Error")
enum class ErrorKind {
#define X(name, abr, str, desc) name,
  ENUM_ERROR_KIND_
#undef X
};

#define ENUM_BACKEND_ \
  X(LOCAL, "local") \
  X(JUDGE0, "judge0") \
  X(HACKEREARTH, "hackerearth")
enum class Backend {
#define X(name, str) name,
  ENUM_BACKEND_
#undef X
};

struct TestCase {
  nlohmann::json input;
  nlohmann::json expected_output;
};

struct ExecutionRequest {
  std::string language;
  std::string source_code;
  std::vector<TestCase> test_cases;
  // 0 for the language default
  long time_limit_ms = 0;
  long memory_limit_mb = 0;
  // overrides the function lookup heuristic of generated harnesses
  std::string entry_point;
  // overrides the configured backend
  std::optional<Backend> backend;
};

struct ExecutionDetails {
  std::string status; // backend status text, e.g. "Accepted", "exited", "SIGSEGV"
  std::string stderr_output;
  std::string compile_output;
  int exit_code = 0;
  int signal = 0;
};

struct TestCaseResult {
  size_t test_index = 0;
  nlohmann::json input;
  nlohmann::json expected_output;
  std::string actual_output;
  bool passed = false;
  double execution_time_ms = 0;
  double memory_used_mb = 0;
  ErrorKind error_kind = ErrorKind::NONE;
  std::optional<std::string> error;
  ComparisonDiagnostic diagnostic;
  ExecutionDetails details;
};

struct ExecutionSummary {
  bool overall_passed = false;
  std::vector<TestCaseResult> results;
  double total_execution_time_ms = 0;
  double peak_memory_mb = 0;
  std::optional<std::string> error_message;
  size_t passed_count = 0;
  size_t total_count = 0;
  double success_rate = 0; // percentage
  std::string backend;
};

// What a backend observed for one test case before grading.
struct RunOutcome {
  ErrorKind kind = ErrorKind::NONE; // NONE: ran to completion, output should be graded
  std::string message; // detail following the kind in the error text
  std::string output;
  double time_ms = 0;
  double memory_mb = 0;
  ExecutionDetails details;
};

// Builds the result of one test case: failed outcomes carry a typed error,
//   completed ones go through Compare.
TestCaseResult MakeResult(size_t index, const TestCase&, RunOutcome&&);
// A failed result for a test case that never ran
TestCaseResult MakeFailedResult(size_t index, const TestCase&, ErrorKind, const std::string& error);

const char* ErrorKindName(ErrorKind);
const char* ErrorKindAbr(ErrorKind);
const char* ErrorKindDesc(ErrorKind);
const char* BackendName(Backend);
std::optional<Backend> GetBackend(const std::string&);

#endif  // INCLUDE_CODEGRADE_EXECUTION_H_
