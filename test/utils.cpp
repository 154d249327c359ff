#include "utils.h"

#include <chrono>

const fs::path kTestScratchRoot = fs::temp_directory_path() / "codegrade-test";

EngineConfig TestConfig() {
  EngineConfig conf;
  conf.local.scratch_root = kTestScratchRoot.string();
  conf.local.max_parallel = 2;
  conf.local.memory_sample_ms = 20;
  for (RemoteJudgeConfig* remote : {(RemoteJudgeConfig*)&conf.judge0, (RemoteJudgeConfig*)&conf.hackerearth}) {
    remote->poll_interval_ms = 20;
    remote->poll_attempts = 5;
    remote->submit_retries = 2;
    remote->retry_interval_ms = 10;
    remote->timeout_s = 5;
  }
  return conf;
}

ExecutionRequest MakeRequest(const std::string& language, const std::string& source,
                             std::vector<TestCase>&& test_cases) {
  ExecutionRequest req;
  req.language = language;
  req.source_code = source;
  req.test_cases = std::move(test_cases);
  return req;
}

void MockServer::Start() {
  port_ = server_.bind_to_any_port("127.0.0.1");
  ASSERT_GT(port_, 0);
  thread_ = std::thread([this]() { server_.listen_after_bind(); });
  while (!server_.is_running()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
}

void MockServer::Stop() {
  if (!thread_.joinable()) return;
  server_.stop();
  thread_.join();
}

std::string Base64(const std::string& str) {
  return httplib::detail::base64_encode(str);
}
