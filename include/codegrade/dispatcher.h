#ifndef INCLUDE_CODEGRADE_DISPATCHER_H_
#define INCLUDE_CODEGRADE_DISPATCHER_H_

#include <memory>

#include "config.h"
#include "executor.h"

// Entry point of the engine: picks a backend for a request, runs every test
//   case on it and aggregates the results. Holds no per-request state, so one
//   engine may serve concurrent requests.
class ExecutionEngine {
  const EngineConfig& config_;

  std::unique_ptr<Executor> MakeExecutor(Backend) const;
  ExecutionSummary FailRequest(const ExecutionRequest&, Backend, ErrorKind, const std::string& error) const;
 public:
  explicit ExecutionEngine(const EngineConfig& config) : config_(config) {}

  // Always returns one result per test case; never throws.
  ExecutionSummary ExecuteRequest(const ExecutionRequest&) const;
  // Runs the program once on the local backend without grading
  TestCaseResult RunProgram(const ExecutionRequest&, const nlohmann::json& input = nullptr) const;
};

#endif  // INCLUDE_CODEGRADE_DISPATCHER_H_
