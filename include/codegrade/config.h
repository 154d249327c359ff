#ifndef INCLUDE_CODEGRADE_CONFIG_H_
#define INCLUDE_CODEGRADE_CONFIG_H_

#include <map>
#include <string>
#include <istream>
#include <optional>
#include <filesystem>

#include "language.h"
#include "execution.h"

struct LocalConfig {
  int max_parallel = 4;
  std::string scratch_root = "/tmp/codegrade";
  long max_output = 1 << 20; // bytes kept of stdout/stderr
  long max_message = 4000; // bytes kept of compiler messages
  long memory_sample_ms = 100;
  long compile_time_limit_ms = 30000;
};

struct RemoteJudgeConfig {
  std::string url;
  long poll_interval_ms = 1000;
  int poll_attempts = 20;
  int submit_retries = 3;
  long retry_interval_ms = 1000;
  long timeout_s = 30; // connection & read timeout of one request
  int max_parallel = 4;
};

struct Judge0Config : RemoteJudgeConfig {
  std::string api_key;
  std::string api_host = "judge0-ce.p.rapidapi.com";
  std::map<Language, int> language_ids;

  Judge0Config();
};

struct HackerEarthConfig : RemoteJudgeConfig {
  std::string client_secret;
  std::string path = "/v4/partner/code-evaluation/submissions/";
  long time_limit_s = 5;
  long memory_limit_kb = 262144;
  std::map<Language, std::string> language_names;

  HackerEarthConfig();
};

// Loaded once at startup and never modified afterwards
struct EngineConfig {
  Backend backend = Backend::LOCAL;
  // used instead of a remote backend whose credentials are missing
  std::optional<Backend> fallback;
  LocalConfig local;
  Judge0Config judge0;
  HackerEarthConfig hackerearth;
  LanguageTable languages;
};

// Returns false if the file cannot be read or holds invalid values
bool ParseConfig(const std::filesystem::path&, EngineConfig&);
bool ParseConfig(std::istream&, EngineConfig&);
// Credentials and endpoints from the environment override the file
void ApplyEnvironment(EngineConfig&);

#endif  // INCLUDE_CODEGRADE_CONFIG_H_
