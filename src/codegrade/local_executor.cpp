#include "local_executor.h"

#include <cstdlib>
#include <cstring>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "sandbox.h"
#include "utils.h"

class BuildDirectory {
 public:
  TempDirectory dir;
  PreparedProgram program;

  explicit BuildDirectory(const fs::path& root) : dir(root) {}
};

namespace {

constexpr char kBinaryName[] = "main";

std::vector<std::string> Environment(const fs::path& dir) {
  const char* path = getenv("PATH");
  return {
    std::string("PATH=") + (path ? path : "/usr/local/bin:/usr/bin:/bin"),
    "HOME=" + dir.string(),
    "TMPDIR=" + dir.string(),
    "LANG=C.UTF-8",
    "PYTHONIOENCODING=utf-8",
    "PYTHONDONTWRITEBYTECODE=1",
    "GOCACHE=" + (dir / ".cache" / "go-build").string(),
    "GOPATH=" + (dir / "go").string(),
  };
}

// Templates are split before substitution so that paths may contain spaces
std::vector<std::string> ExpandCommand(const std::string& tmpl, const fs::path& dir,
                                       const PreparedProgram& program) {
  const std::vector<std::pair<std::string, std::string>> vars = {
    {"source", (dir / program.file_name).string()},
    {"binary", (dir / kBinaryName).string()},
    {"dir", dir.string()},
    {"main_class", program.main_class},
  };
  std::vector<std::string> ret;
  for (auto& i : SplitCommand(tmpl)) ret.push_back(FormatTemplate(i, vars));
  return ret;
}

std::string FormatSeconds(long ms) {
  return fmt::format("{:g}", ms / 1000.0);
}

long ChooseLimit(long requested, long fallback) {
  return requested > 0 ? requested : fallback;
}

} // namespace

std::unique_ptr<BuildDirectory> LocalExecutor::Build(
    const LanguageSpec& spec, const std::string& source, const std::string& entry_point,
    RunOutcome& failure) const {
  auto build = std::make_unique<BuildDirectory>(config_.scratch_root);
  if (!build->dir.Valid()) {
    failure.kind = ErrorKind::EXECUTION_ERROR;
    failure.message = "Failed to create scratch directory under " + config_.scratch_root;
    return nullptr;
  }
  build->program = PrepareProgram(spec, source, entry_point);
  const fs::path& path = build->dir.Path();
  if (!WriteFile(path / build->program.file_name, build->program.content)) {
    failure.kind = ErrorKind::EXECUTION_ERROR;
    failure.message = "Failed to write source file";
    return nullptr;
  }
  if (!spec.IsCompiled()) return build;

  SandboxOptions opt;
  opt.command = ExpandCommand(spec.compile_command, path, build->program);
  opt.envs = Environment(path);
  opt.workdir = path.string();
  opt.wall_time = config_.compile_time_limit_ms * 1000;
  opt.max_output = config_.max_output;
  opt.sample_interval = config_.memory_sample_ms * 1000;
  spdlog::info("Compiling {} source in {}", spec.name, path.c_str());
  SandboxResult res = SandboxExec(opt);
  if (res.spawn_error) {
    failure.kind = ErrorKind::EXECUTION_ERROR;
    failure.message = fmt::format("Failed to start {}: {}", opt.command[0], strerror(res.spawn_error));
    failure.details.status = "spawn_failed";
    return nullptr;
  }
  std::string message = TruncateMessage(
      Trim(SanitizeUtf8(res.error.empty() ? res.output : res.error)), config_.max_message);
  if (res.timekill) {
    failure.kind = ErrorKind::COMPILATION_ERROR;
    failure.message = "Compilation timed out after " + FormatSeconds(config_.compile_time_limit_ms) + " seconds";
    failure.details.status = "compile_timeout";
    return nullptr;
  }
  if (res.signaled || res.exit_code != 0) {
    failure.kind = ErrorKind::COMPILATION_ERROR;
    failure.message = message;
    failure.details.status = "compilation_failed";
    failure.details.compile_output = message;
    failure.details.exit_code = res.exit_code;
    failure.details.signal = res.signal;
    spdlog::info("Compilation failed: {}", message);
    return nullptr;
  }
  return build;
}

RunOutcome LocalExecutor::Run(const LanguageSpec& spec, const BuildDirectory& build,
                              const std::string& input, long time_limit_ms, long memory_limit_mb) const {
  RunOutcome ret;
  TempDirectory workdir(config_.scratch_root);
  if (!workdir.Valid()) {
    ret.kind = ErrorKind::EXECUTION_ERROR;
    ret.message = "Failed to create scratch directory under " + config_.scratch_root;
    return ret;
  }
  std::error_code ec;
  fs::copy(build.dir.Path(), workdir.Path(),
           fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
  if (ec) {
    ret.kind = ErrorKind::EXECUTION_ERROR;
    ret.message = "Failed to copy program files: " + ec.message();
    return ret;
  }

  SandboxOptions opt;
  opt.command = ExpandCommand(spec.run_command, workdir.Path(), build.program);
  opt.envs = Environment(workdir.Path());
  opt.workdir = workdir.Path().string();
  opt.input = input;
  opt.wall_time = time_limit_ms * 1000;
  opt.rss = memory_limit_mb * 1024;
  opt.fsize = std::max(config_.max_output / 1024, 1L);
  opt.max_output = config_.max_output;
  opt.sample_interval = config_.memory_sample_ms * 1000;
  SandboxResult res = SandboxExec(opt);

  ret.time_ms = res.time / 1000.0;
  ret.memory_mb = res.max_rss / 1024.0;
  ret.output = SanitizeUtf8(res.output);
  ret.details.stderr_output = SanitizeUtf8(res.error);
  ret.details.exit_code = res.exit_code;
  ret.details.signal = res.signal;
  if (res.output_truncated) {
    spdlog::warn("Output of {} truncated to {} bytes", opt.command[0], config_.max_output);
  }
  const std::string stderr_message = TruncateMessage(TrimRight(ret.details.stderr_output), config_.max_message);
  if (res.spawn_error) {
    ret.kind = ErrorKind::EXECUTION_ERROR;
    ret.message = fmt::format("Failed to start {}: {}", opt.command[0], strerror(res.spawn_error));
    ret.details.status = "spawn_failed";
  } else if (res.timekill) {
    ret.kind = ErrorKind::TIME_LIMIT_EXCEEDED;
    ret.message = "Execution timed out after " + FormatSeconds(time_limit_ms) + " seconds";
    ret.details.status = "timeout";
  } else if (res.oomkill) {
    ret.kind = ErrorKind::MEMORY_LIMIT_EXCEEDED;
    ret.message = fmt::format("Memory usage exceeded {} MB", memory_limit_mb);
    ret.details.status = "memory_limit";
  } else if (res.signaled) {
    ret.kind = ErrorKind::RUNTIME_ERROR;
    ret.message = stderr_message.empty() ?
        fmt::format("Process killed by signal {} ({})", res.signal, strsignal(res.signal)) : stderr_message;
    ret.details.status = "signaled";
  } else if (res.exit_code != 0) {
    ret.kind = ErrorKind::RUNTIME_ERROR;
    ret.message = stderr_message.empty() ?
        fmt::format("Process exited with code {}", res.exit_code) : stderr_message;
    ret.details.status = "exited";
  } else {
    ret.details.status = "exited";
  }
  return ret;
}

std::vector<TestCaseResult> LocalExecutor::RunTests(const ExecutionRequest& req, const LanguageSpec& spec) {
  const size_t n = req.test_cases.size();
  std::vector<TestCaseResult> results;
  for (size_t i = 0; i < n; i++) {
    results.push_back(MakeFailedResult(i, req.test_cases[i], ErrorKind::EXECUTION_ERROR, "Test case was not run"));
  }
  if (!n) return results;
  if (!spec.IsLocallySupported()) {
    for (size_t i = 0; i < n; i++) {
      results[i] = MakeFailedResult(i, req.test_cases[i], ErrorKind::UNSUPPORTED_LANGUAGE,
          spec.name + " cannot be executed locally");
    }
    return results;
  }
  const long time_limit = ChooseLimit(req.time_limit_ms, spec.default_time_limit_ms);
  const long memory_limit = ChooseLimit(req.memory_limit_mb, spec.default_memory_limit_mb);
  spdlog::info("Running {} test cases of {} locally (time={}ms memory={}MB)", n, spec.name,
      time_limit, memory_limit);

  RunOutcome failure;
  auto build = Build(spec, req.source_code, req.entry_point, failure);
  if (!build) {
    for (size_t i = 0; i < n; i++) results[i] = MakeResult(i, req.test_cases[i], RunOutcome(failure));
    return results;
  }
  ParallelFor(n, config_.max_parallel, [&](size_t i) {
    const TestCase& test_case = req.test_cases[i];
    results[i] = MakeResult(i, test_case,
        Run(spec, *build, StdinPayload(spec, test_case.input), time_limit, memory_limit));
  });
  return results;
}

TestCaseResult LocalExecutor::Execute(
    const LanguageSpec& spec, const std::string& source, const TestCase& test_case,
    long time_limit_ms, long memory_limit_mb, const std::string& entry_point) const {
  if (!spec.IsLocallySupported()) {
    return MakeFailedResult(0, test_case, ErrorKind::UNSUPPORTED_LANGUAGE,
        spec.name + " cannot be executed locally");
  }
  RunOutcome failure;
  auto build = Build(spec, source, entry_point, failure);
  if (!build) return MakeResult(0, test_case, std::move(failure));
  return MakeResult(0, test_case,
      Run(spec, *build, StdinPayload(spec, test_case.input),
          ChooseLimit(time_limit_ms, spec.default_time_limit_ms),
          ChooseLimit(memory_limit_mb, spec.default_memory_limit_mb)));
}

TestCaseResult LocalExecutor::RunProgram(
    const LanguageSpec& spec, const std::string& source, const nlohmann::json& input,
    long time_limit_ms, long memory_limit_mb, const std::string& entry_point) const {
  TestCase test_case{input, nullptr};
  if (!spec.IsLocallySupported()) {
    return MakeFailedResult(0, test_case, ErrorKind::UNSUPPORTED_LANGUAGE,
        spec.name + " cannot be executed locally");
  }
  RunOutcome outcome;
  auto build = Build(spec, source, entry_point, outcome);
  if (build) {
    outcome = Run(spec, *build, StdinPayload(spec, input),
        ChooseLimit(time_limit_ms, spec.default_time_limit_ms),
        ChooseLimit(memory_limit_mb, spec.default_memory_limit_mb));
  }
  const bool clean = outcome.kind == ErrorKind::NONE;
  TestCaseResult ret = MakeResult(0, test_case, std::move(outcome));
  if (clean) {
    ret.passed = true;
    ret.error_kind = ErrorKind::NONE;
    ret.diagnostic.type = MatchType::NOT_COMPARED;
    ret.diagnostic.message = MatchTypeDesc(MatchType::NOT_COMPARED);
    ret.diagnostic.line_analysis.reset();
  }
  return ret;
}
