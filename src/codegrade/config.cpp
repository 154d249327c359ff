#include <codegrade/config.h>

#include <cstdlib>
#include <fstream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>

namespace {

std::optional<std::string> GetEnv(const char* name) {
  const char* val = getenv(name);
  if (!val || !*val) return std::nullopt;
  return std::string(val);
}

void ParseRemote(tortellini::ini& ini, const std::string& section, RemoteJudgeConfig& conf) {
  conf.url = ini[section]["url"] | conf.url;
  conf.poll_interval_ms = ini[section]["poll_interval_ms"] | conf.poll_interval_ms;
  conf.poll_attempts = ini[section]["poll_attempts"] | conf.poll_attempts;
  conf.submit_retries = ini[section]["submit_retries"] | conf.submit_retries;
  conf.retry_interval_ms = ini[section]["retry_interval_ms"] | conf.retry_interval_ms;
  conf.timeout_s = ini[section]["timeout_s"] | conf.timeout_s;
  conf.max_parallel = ini[section]["parallel"] | conf.max_parallel;
}

} // namespace

Judge0Config::Judge0Config() {
  url = "https://" + api_host;
  language_ids = {
    {Language::PYTHON, 71},
    {Language::JAVA, 62},
    {Language::CPP, 54},
    {Language::C, 50},
    {Language::JAVASCRIPT, 63},
    {Language::GO, 60},
    {Language::RUST, 73},
    {Language::RUBY, 72},
    {Language::PHP, 68},
    {Language::CSHARP, 51},
  };
}

HackerEarthConfig::HackerEarthConfig() {
  url = "https://api.hackerearth.com";
  language_names = {
    {Language::PYTHON, "PYTHON"},
    {Language::JAVA, "JAVA"},
    {Language::CPP, "C++"},
    {Language::C, "C"},
    {Language::JAVASCRIPT, "JAVASCRIPT"},
    {Language::GO, "GO"},
    {Language::RUST, "RUST"},
    {Language::RUBY, "RUBY"},
    {Language::PHP, "PHP"},
    {Language::CSHARP, "C#"},
  };
}

bool ParseConfig(std::istream& fin, EngineConfig& conf) {
  tortellini::ini ini;
  fin >> ini;

  std::string backend = ini[""]["backend"] | std::string(BackendName(conf.backend));
  if (auto val = GetBackend(backend)) {
    conf.backend = *val;
  } else {
    spdlog::error("Unknown backend {}", backend);
    return false;
  }
  std::string fallback = ini[""]["fallback"] | "none";
  if (fallback == "none" || fallback.empty()) {
    conf.fallback = std::nullopt;
  } else if (auto val = GetBackend(fallback)) {
    conf.fallback = *val;
  } else {
    spdlog::error("Unknown fallback backend {}", fallback);
    return false;
  }

  LocalConfig& local = conf.local;
  local.max_parallel = ini[""]["parallel"] | local.max_parallel;
  local.scratch_root = ini[""]["scratch_root"] | local.scratch_root;
  local.max_output = ini[""]["max_output"] | local.max_output;
  local.max_message = ini[""]["max_message"] | local.max_message;
  local.memory_sample_ms = ini[""]["memory_sample_ms"] | local.memory_sample_ms;
  local.compile_time_limit_ms = ini[""]["compile_time_limit_ms"] | local.compile_time_limit_ms;
  if (local.max_parallel <= 0 || local.max_output <= 0 || local.memory_sample_ms <= 0) {
    spdlog::error("parallel, max_output and memory_sample_ms must be positive");
    return false;
  }

  Judge0Config& judge0 = conf.judge0;
  judge0.api_host = ini["judge0"]["host"] | judge0.api_host;
  judge0.url = "https://" + judge0.api_host;
  ParseRemote(ini, "judge0", judge0);
  judge0.api_key = ini["judge0"]["key"] | judge0.api_key;
  for (auto& [lang, id] : judge0.language_ids) {
    id = ini["judge0.languages"][LanguageName(lang)] | id;
  }

  HackerEarthConfig& hackerearth = conf.hackerearth;
  ParseRemote(ini, "hackerearth", hackerearth);
  hackerearth.path = ini["hackerearth"]["path"] | hackerearth.path;
  hackerearth.client_secret = ini["hackerearth"]["client_secret"] | hackerearth.client_secret;
  hackerearth.time_limit_s = ini["hackerearth"]["time_limit_s"] | hackerearth.time_limit_s;
  hackerearth.memory_limit_kb = ini["hackerearth"]["memory_limit_kb"] | hackerearth.memory_limit_kb;
  for (auto& [lang, name] : hackerearth.language_names) {
    name = ini["hackerearth.languages"][LanguageName(lang)] | name;
  }

  for (auto* remote : {(RemoteJudgeConfig*)&judge0, (RemoteJudgeConfig*)&hackerearth}) {
    if (remote->poll_attempts <= 0 || remote->poll_interval_ms < 0 ||
        remote->submit_retries <= 0 || remote->max_parallel <= 0) {
      spdlog::error("Remote judge poll_attempts, submit_retries and parallel must be positive");
      return false;
    }
  }

  std::vector<LanguageSpec> specs = conf.languages.Specs();
  for (auto& spec : specs) {
    const std::string section = "language." + spec.name;
    spec.compile_command = ini[section]["compile"] | spec.compile_command;
    spec.run_command = ini[section]["run"] | spec.run_command;
    spec.default_time_limit_ms = ini[section]["time_limit_ms"] | spec.default_time_limit_ms;
    spec.default_memory_limit_mb = ini[section]["memory_limit_mb"] | spec.default_memory_limit_mb;
  }
  conf.languages = LanguageTable(std::move(specs));
  return true;
}

bool ParseConfig(const std::filesystem::path& conf_path, EngineConfig& conf) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  return ParseConfig(fin, conf);
}

void ApplyEnvironment(EngineConfig& conf) {
  if (auto val = GetEnv("RAPIDAPI_KEY")) conf.judge0.api_key = *val;
  if (auto val = GetEnv("JUDGE0_API_KEY")) conf.judge0.api_key = *val;
  if (auto val = GetEnv("JUDGE0_API_HOST")) {
    conf.judge0.api_host = *val;
    conf.judge0.url = "https://" + *val;
  }
  if (auto val = GetEnv("JUDGE0_API_URL")) conf.judge0.url = *val;
  if (auto val = GetEnv("HACKEREARTH_CLIENT_SECRET")) conf.hackerearth.client_secret = *val;
}
