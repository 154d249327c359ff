#include <codegrade/aggregator.h>

#include <optional>
#include <algorithm>

#include <spdlog/spdlog.h>

ExecutionSummary Aggregate(std::vector<TestCaseResult>&& results) {
  ExecutionSummary ret;
  ret.results = std::move(results);
  ret.total_count = ret.results.size();
  if (ret.results.empty()) {
    ret.overall_passed = false;
    ret.error_message = "No test results were produced";
    return ret;
  }
  ret.overall_passed = true;
  for (auto& i : ret.results) {
    if (i.passed) {
      ret.passed_count++;
    } else {
      ret.overall_passed = false;
    }
    ret.total_execution_time_ms += i.execution_time_ms;
    ret.peak_memory_mb = std::max(ret.peak_memory_mb, i.memory_used_mb);
  }
  ret.success_rate = 100.0 * ret.passed_count / ret.total_count;
  return ret;
}

std::vector<TestCaseResult> CompleteResults(const std::vector<TestCase>& test_cases,
                                            std::vector<TestCaseResult>&& results,
                                            const std::string& missing_reason) {
  std::vector<std::optional<TestCaseResult>> slots(test_cases.size());
  for (auto& i : results) {
    if (i.test_index >= slots.size()) {
      spdlog::warn("Dropping result for nonexistent test case {}", i.test_index);
      continue;
    }
    if (slots[i.test_index]) {
      spdlog::warn("Dropping duplicate result for test case {}", i.test_index);
      continue;
    }
    slots[i.test_index] = std::move(i);
  }
  std::vector<TestCaseResult> ret;
  ret.reserve(slots.size());
  for (size_t i = 0; i < slots.size(); i++) {
    if (slots[i]) {
      ret.push_back(std::move(*slots[i]));
    } else {
      spdlog::warn("No result for test case {}", i);
      ret.push_back(MakeFailedResult(i, test_cases[i], ErrorKind::NO_RESULT, missing_reason));
    }
  }
  return ret;
}
