#ifndef INCLUDE_CODEGRADE_EXECUTOR_H_
#define INCLUDE_CODEGRADE_EXECUTOR_H_

#include <vector>

#include "language.h"
#include "execution.h"

// A backend that turns a request into per-test-case results.
class Executor {
 public:
  virtual ~Executor() = default;
  virtual Backend GetBackend() const = 0;
  // Returns exactly one result per test case, in test case order.
  //   Per-test-case faults are reported as failed results, never thrown.
  virtual std::vector<TestCaseResult> RunTests(const ExecutionRequest&, const LanguageSpec&) = 0;
};

#endif  // INCLUDE_CODEGRADE_EXECUTOR_H_
