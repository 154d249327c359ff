#ifndef CODEGRADE_LOCAL_EXECUTOR_H_
#define CODEGRADE_LOCAL_EXECUTOR_H_

#include <memory>
#include <string>

#include <codegrade/config.h>
#include <codegrade/executor.h>

#include "harness.h"

// A prepared (and, for compiled languages, compiled) program in its own
//   scratch directory; removed on destruction.
class BuildDirectory;

class LocalExecutor : public Executor {
  const LocalConfig& config_;

  std::unique_ptr<BuildDirectory> Build(const LanguageSpec&, const std::string& source,
                                        const std::string& entry_point, RunOutcome& failure) const;
  RunOutcome Run(const LanguageSpec&, const BuildDirectory&, const std::string& input,
                 long time_limit_ms, long memory_limit_mb) const;
 public:
  explicit LocalExecutor(const LocalConfig& config) : config_(config) {}

  Backend GetBackend() const override { return Backend::LOCAL; }

  // Compiles once, then runs every test case in a private copy of the build
  //   with at most config.max_parallel processes at a time.
  std::vector<TestCaseResult> RunTests(const ExecutionRequest&, const LanguageSpec&) override;

  // One test case from scratch: prepare, compile, run, grade.
  TestCaseResult Execute(const LanguageSpec&, const std::string& source, const TestCase&,
                         long time_limit_ms = 0, long memory_limit_mb = 0,
                         const std::string& entry_point = "") const;

  // Runs the program once without grading; passed iff it exited cleanly.
  TestCaseResult RunProgram(const LanguageSpec&, const std::string& source,
                            const nlohmann::json& input = nullptr,
                            long time_limit_ms = 0, long memory_limit_mb = 0,
                            const std::string& entry_point = "") const;
};

#endif  // CODEGRADE_LOCAL_EXECUTOR_H_
