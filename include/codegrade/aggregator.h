#ifndef INCLUDE_CODEGRADE_AGGREGATOR_H_
#define INCLUDE_CODEGRADE_AGGREGATOR_H_

#include <string>
#include <vector>

#include "execution.h"

// overall_passed iff every result passed (and there is at least one);
//   times are summed, memory is the peak.
ExecutionSummary Aggregate(std::vector<TestCaseResult>&& results);

// Lines results up 1:1 with the test cases in test case order; test cases
//   without a result get a failed one carrying missing_reason.
std::vector<TestCaseResult> CompleteResults(const std::vector<TestCase>&, std::vector<TestCaseResult>&& results,
                                            const std::string& missing_reason);

#endif  // INCLUDE_CODEGRADE_AGGREGATOR_H_
