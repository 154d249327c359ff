#include <codegrade/dispatcher.h>

#include <spdlog/spdlog.h>
#include <codegrade/aggregator.h>

#include "local_executor.h"
#include "judge0.h"
#include "hackerearth.h"

std::unique_ptr<Executor> ExecutionEngine::MakeExecutor(Backend backend) const {
  switch (backend) {
    case Backend::LOCAL: return std::make_unique<LocalExecutor>(config_.local);
    case Backend::JUDGE0: return std::make_unique<Judge0Client>(config_.judge0);
    case Backend::HACKEREARTH: return std::make_unique<HackerEarthClient>(config_.hackerearth);
  }
  __builtin_unreachable();
}

ExecutionSummary ExecutionEngine::FailRequest(const ExecutionRequest& req, Backend backend, ErrorKind kind,
                                              const std::string& error) const {
  spdlog::warn("Request failed before execution: {}", error);
  std::vector<TestCaseResult> results;
  for (size_t i = 0; i < req.test_cases.size(); i++) {
    results.push_back(MakeFailedResult(i, req.test_cases[i], kind, error));
  }
  ExecutionSummary ret = Aggregate(std::move(results));
  ret.error_message = error;
  ret.backend = BackendName(backend);
  return ret;
}

ExecutionSummary ExecutionEngine::ExecuteRequest(const ExecutionRequest& req) const {
  Backend backend = req.backend.value_or(config_.backend);
  spdlog::info("Execute request: language={} backend={} test_cases={}",
      req.language, BackendName(backend), req.test_cases.size());

  const LanguageSpec* spec = config_.languages.Find(req.language);
  if (!spec) {
    return FailRequest(req, backend, ErrorKind::UNSUPPORTED_LANGUAGE, "Unsupported language: " + req.language);
  }
  auto executor = MakeExecutor(backend);
  if (auto remote = dynamic_cast<RemoteJudgeClient*>(executor.get())) {
    if (auto err = remote->ConfigurationError()) {
      if (!config_.fallback || *config_.fallback == backend) {
        return FailRequest(req, backend, ErrorKind::CONFIGURATION_ERROR, *err);
      }
      spdlog::warn("{}; falling back to {}", *err, BackendName(*config_.fallback));
      backend = *config_.fallback;
      executor = MakeExecutor(backend);
      remote = dynamic_cast<RemoteJudgeClient*>(executor.get());
      if (remote) {
        if (auto fallback_err = remote->ConfigurationError()) {
          return FailRequest(req, backend, ErrorKind::CONFIGURATION_ERROR, *err + "; " + *fallback_err);
        }
      }
    }
    if (remote && !remote->SupportsLanguage(spec->language)) {
      return FailRequest(req, backend, ErrorKind::UNSUPPORTED_LANGUAGE,
          spec->name + " is not supported by " + BackendName(backend));
    }
  }
  if (backend == Backend::LOCAL && !spec->IsLocallySupported()) {
    return FailRequest(req, backend, ErrorKind::UNSUPPORTED_LANGUAGE, spec->name + " cannot be executed locally");
  }

  std::vector<TestCaseResult> results;
  try {
    results = executor->RunTests(req, *spec);
  } catch (const std::exception& e) {
    spdlog::error("Backend {} failed: {}", BackendName(backend), e.what());
    return FailRequest(req, backend, ErrorKind::EXECUTION_ERROR, std::string("Backend failure: ") + e.what());
  }
  ExecutionSummary ret = Aggregate(CompleteResults(req.test_cases, std::move(results), "No result received"));
  ret.backend = BackendName(backend);
  spdlog::info("Request finished: {}/{} passed, {:.1f} ms, peak {:.1f} MB", ret.passed_count, ret.total_count,
      ret.total_execution_time_ms, ret.peak_memory_mb);
  return ret;
}

TestCaseResult ExecutionEngine::RunProgram(const ExecutionRequest& req, const nlohmann::json& input) const {
  const LanguageSpec* spec = config_.languages.Find(req.language);
  if (!spec) {
    return MakeFailedResult(0, TestCase{input, nullptr}, ErrorKind::UNSUPPORTED_LANGUAGE,
        "Unsupported language: " + req.language);
  }
  LocalExecutor executor(config_.local);
  return executor.RunProgram(*spec, req.source_code, input, req.time_limit_ms, req.memory_limit_mb,
      req.entry_point);
}
