#include "remote_judge.h"

#include <chrono>
#include <thread>

#include <spdlog/spdlog.h>

#include "utils.h"

RetryPolicy RemoteJudgeClient::SubmitPolicy() const {
  return {config_.submit_retries, std::chrono::milliseconds(config_.retry_interval_ms)};
}

std::unique_ptr<httplib::Client> RemoteJudgeClient::MakeClient(const std::string& origin) const {
  auto cli = std::make_unique<httplib::Client>(origin);
  cli->set_connection_timeout(config_.timeout_s);
  cli->set_read_timeout(config_.timeout_s);
  cli->set_write_timeout(config_.timeout_s);
  cli->set_follow_location(true);
  return cli;
}

bool RemoteJudgeClient::PollUntilDone(const std::function<bool(int)>& poll) const {
  for (int attempt = 0; attempt < config_.poll_attempts; attempt++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(config_.poll_interval_ms));
    spdlog::debug("Poll attempt {}/{}", attempt + 1, config_.poll_attempts);
    if (poll(attempt)) return true;
  }
  return false;
}

bool RemoteJudgeClient::ResolveContent(const std::string& value, std::string& content,
                                       std::string& error) const {
  if (!http_utils::IsUrl(value)) {
    content = value;
    return true;
  }
  std::string origin, path;
  if (!http_utils::SplitUrl(value, origin, path)) {
    error = "Invalid URL " + value;
    return false;
  }
  auto cli = MakeClient(origin);
  auto res = RequestRetry<HTTPGet>(SubmitPolicy(), *cli, path);
  if (!http_utils::IsSuccess(res)) {
    error = "Failed to fetch " + value + ": " + http_utils::DescribeFailure(res);
    spdlog::warn("{}", error);
    return false;
  }
  content = res->body;
  return true;
}

std::vector<TestCaseResult> RemoteJudgeClient::FailAll(const ExecutionRequest& req, ErrorKind kind,
                                                       const std::string& error) {
  std::vector<TestCaseResult> ret;
  for (size_t i = 0; i < req.test_cases.size(); i++) {
    ret.push_back(MakeFailedResult(i, req.test_cases[i], kind, error));
  }
  return ret;
}

double NumberField(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end()) return 0;
  if (it->is_number()) return it->get<double>();
  if (it->is_string()) {
    try {
      return std::stod(it->get<std::string>());
    } catch (const std::logic_error&) {
      spdlog::warn("Non-numeric {} field: {}", key, it->get<std::string>());
    }
  }
  return 0;
}

std::string StringField(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return "";
  if (it->is_string()) return it->get<std::string>();
  return it->dump();
}
