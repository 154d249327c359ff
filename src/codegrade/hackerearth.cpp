#include "hackerearth.h"

#include <random>
#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "harness.h"
#include "utils.h"

namespace {

using nlohmann::json;

// correlation tag sent with each submission
std::string RandomId() {
  thread_local std::mt19937_64 gen(std::random_device{}());
  return fmt::format("{:016x}{:016x}", gen(), gen());
}

std::string UpperCase(std::string str) {
  for (auto& c : str) {
    if (c >= 'a' && c <= 'z') c = c - 'a' + 'A';
  }
  return str;
}

// compile_status is either text or an object carrying message/status
std::string CompileStatus(const json& result) {
  auto it = result.find("compile_status");
  if (it == result.end() || !it->is_object()) return StringField(result, "compile_status");
  std::string text = StringField(*it, "message");
  return text.empty() ? StringField(*it, "status") : text;
}

bool StatusIs(const std::string& status, const char* abr, const char* full) {
  return status == abr || StartsWith(status, full);
}

} // namespace

std::string HackerEarthRequestStatus(const json& body) {
  auto it = body.find("request_status");
  if (it == body.end()) return "";
  if (it->is_string()) return it->get<std::string>();
  if (it->is_object()) {
    if (std::string code = StringField(*it, "code"); !code.empty()) return code;
    if (std::string message = StringField(*it, "message"); !message.empty()) return message;
    return StringField(*it, "status");
  }
  return "";
}

bool IsHackerEarthPending(const std::string& request_status) {
  return request_status == "REQUEST_QUEUED" || request_status == "REQUEST_INITIATED" ||
      request_status == "CODE_COMPILED";
}

std::optional<std::string> HackerEarthClient::ConfigurationError() const {
  if (he_.client_secret.empty()) {
    return "HackerEarth client secret is not configured (set HACKEREARTH_CLIENT_SECRET)";
  }
  if (he_.url.empty()) return "HackerEarth URL is not configured";
  return std::nullopt;
}

bool HackerEarthClient::SupportsLanguage(Language lang) const {
  return he_.language_names.count(lang) > 0;
}

RunOutcome HackerEarthClient::DecodeResult(const json& body) const {
  RunOutcome ret;
  const std::string request_status = HackerEarthRequestStatus(body);
  if (request_status == "REQUEST_FAILED") {
    ret.kind = ErrorKind::EXECUTION_ERROR;
    ret.message = "HackerEarth request failed";
    if (auto it = body.find("request_status"); it != body.end() && it->is_object()) {
      if (std::string msg = StringField(*it, "message"); !msg.empty()) ret.message += ": " + msg;
    }
    ret.details.status = request_status;
    return ret;
  }
  const json& result = body.at("result");
  std::string error;

  std::string compile_status = CompileStatus(result);
  if (!compile_status.empty() && UpperCase(compile_status) != "OK") {
    std::string message;
    if (!ResolveContent(compile_status, message, error)) {
      ret.kind = ErrorKind::PROVIDER_UNAVAILABLE;
      ret.message = error;
      return ret;
    }
    ret.kind = ErrorKind::COMPILATION_ERROR;
    ret.message = TrimRight(SanitizeUtf8(message));
    ret.details.compile_output = ret.message;
    ret.details.status = "COMPILATION_ERROR";
    return ret;
  }

  const json& run_status = result.at("run_status");
  const std::string status = UpperCase(StringField(run_status, "status"));
  const std::string status_detail = StringField(run_status, "status_detail");
  ret.details.status = status;
  ret.time_ms = NumberField(run_status, "time_used") * 1000;
  ret.memory_mb = NumberField(run_status, "memory_used") / 1024;
  if (run_status.contains("exit_code")) ret.details.exit_code = (int)NumberField(run_status, "exit_code");
  if (!ResolveContent(StringField(run_status, "output"), ret.output, error) ||
      !ResolveContent(StringField(run_status, "stderr"), ret.details.stderr_output, error)) {
    ret.kind = ErrorKind::PROVIDER_UNAVAILABLE;
    ret.message = error;
    return ret;
  }
  ret.output = SanitizeUtf8(ret.output);
  ret.details.stderr_output = SanitizeUtf8(ret.details.stderr_output);

  auto detail = [&]() {
    std::string text = TrimRight(ret.details.stderr_output);
    if (text.empty()) text = status_detail;
    return text.empty() ? status : text;
  };
  if (StatusIs(status, "RE", "RUNTIME_ERROR")) {
    ret.kind = ErrorKind::RUNTIME_ERROR;
    ret.message = detail();
  } else if (StatusIs(status, "TLE", "TIME_LIMIT_EXCEEDED")) {
    ret.kind = ErrorKind::TIME_LIMIT_EXCEEDED;
    ret.message = status_detail.empty() ? status : status_detail;
  } else if (StatusIs(status, "MLE", "MEMORY_LIMIT_EXCEEDED")) {
    ret.kind = ErrorKind::MEMORY_LIMIT_EXCEEDED;
    ret.message = status_detail.empty() ? status : status_detail;
  } else if (StatusIs(status, "CE", "COMPILATION_ERROR")) {
    ret.kind = ErrorKind::COMPILATION_ERROR;
    ret.message = detail();
  }
  return ret;
}

TestCaseResult HackerEarthClient::RunOne(size_t index, const ExecutionRequest& req, const LanguageSpec& spec,
                                         const std::string& source, const std::string& lang) const {
  const TestCase& test_case = req.test_cases[index];
  std::string origin, base_path;
  if (!http_utils::SplitUrl(he_.url, origin, base_path)) {
    return MakeFailedResult(index, test_case, ErrorKind::CONFIGURATION_ERROR, "Invalid HackerEarth URL " + he_.url);
  }
  auto cli = MakeClient(origin);
  const httplib::Headers headers = {{"client-secret", he_.client_secret}};
  const long time_limit_s = req.time_limit_ms > 0 ? std::max(1L, (req.time_limit_ms + 999) / 1000) : he_.time_limit_s;
  const long memory_limit_kb = req.memory_limit_mb > 0 ? req.memory_limit_mb * 1024 : he_.memory_limit_kb;
  json payload = {
    {"source", source},
    {"lang", lang},
    {"time_limit", time_limit_s},
    {"memory_limit", memory_limit_kb},
    {"input", StdinPayload(spec, test_case.input)},
    {"id", RandomId()},
  };
  auto res = RequestRetry<HTTPPost>(SubmitPolicy(), *cli, he_.path, headers,
      payload.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
  if (!http_utils::IsSuccess(res)) {
    return MakeFailedResult(index, test_case, ErrorKind::PROVIDER_UNAVAILABLE, http_utils::DescribeFailure(res));
  }

  try {
    json body = json::parse(res->body);
    std::string he_id = StringField(body, "he_id");
    std::string status = HackerEarthRequestStatus(body);
    spdlog::debug("HackerEarth test {} submitted: he_id={} status={}", index, he_id, status);
    bool terminal = !IsHackerEarthPending(status) && body.contains("result");
    if (!terminal && he_id.empty()) {
      return MakeFailedResult(index, test_case, ErrorKind::MALFORMED_PROVIDER_RESPONSE,
          "HackerEarth response has neither a result nor an he_id: " + TruncateMessage(res->body, 500));
    }
    std::string last_error;
    if (!terminal) {
      const std::string endpoint = he_.path + he_id + "/";
      terminal = PollUntilDone([&](int) {
        auto poll_res = HTTPRequest<HTTPGet>(*cli, endpoint, headers);
        if (!http_utils::IsSuccess(poll_res)) {
          last_error = http_utils::DescribeFailure(poll_res);
          spdlog::warn("HackerEarth poll of {} failed: {}", he_id, last_error);
          return false;
        }
        json polled = json::parse(poll_res->body, nullptr, false);
        if (polled.is_discarded()) {
          last_error = "Malformed HackerEarth response: " + TruncateMessage(poll_res->body, 200);
          spdlog::warn("{}", last_error);
          return false;
        }
        std::string polled_status = HackerEarthRequestStatus(polled);
        if (IsHackerEarthPending(polled_status) || (!polled.contains("result") && polled_status != "REQUEST_FAILED")) {
          return false;
        }
        body = std::move(polled);
        return true;
      });
    }
    if (!terminal) {
      std::string error = fmt::format("Timed out waiting for HackerEarth after {} polls", config_.poll_attempts);
      if (!last_error.empty()) error += " (last error: " + last_error + ")";
      return MakeFailedResult(index, test_case, ErrorKind::NO_RESULT, error);
    }
    return MakeResult(index, test_case, DecodeResult(body));
  } catch (json::exception& err) {
    spdlog::warn("Malformed HackerEarth response: {}", err.what());
    return MakeFailedResult(index, test_case, ErrorKind::MALFORMED_PROVIDER_RESPONSE,
        std::string("Malformed HackerEarth response: ") + err.what());
  }
}

std::vector<TestCaseResult> HackerEarthClient::RunTests(const ExecutionRequest& req, const LanguageSpec& spec) {
  const size_t n = req.test_cases.size();
  if (!n) return {};
  if (auto err = ConfigurationError()) return FailAll(req, ErrorKind::CONFIGURATION_ERROR, *err);
  auto lang_it = he_.language_names.find(spec.language);
  if (lang_it == he_.language_names.end()) {
    return FailAll(req, ErrorKind::UNSUPPORTED_LANGUAGE, spec.name + " is not supported by HackerEarth");
  }
  const std::string source = PrepareProgram(spec, req.source_code, req.entry_point).content;
  spdlog::info("Submitting {} test cases of {} to HackerEarth", n, spec.name);
  std::vector<TestCaseResult> results = FailAll(req, ErrorKind::NO_RESULT, "Test case was not submitted");
  ParallelFor(n, config_.max_parallel, [&](size_t i) {
    results[i] = RunOne(i, req, spec, source, lang_it->second);
  });
  return results;
}
