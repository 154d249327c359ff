#include "judge0.h"

#include <unordered_map>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "harness.h"
#include "utils.h"

namespace {

using nlohmann::json;

constexpr char kSubmitEndpoint[] = "/submissions/batch?base64_encoded=true";

// Judge0 status ids
constexpr int kStatusProcessing = 2;
constexpr int kStatusAccepted = 3;
constexpr int kStatusWrongAnswer = 4;
constexpr int kStatusTimeLimit = 5;
constexpr int kStatusCompileError = 6;
constexpr int kStatusRuntimeFirst = 7;
constexpr int kStatusRuntimeLast = 12;
constexpr int kStatusInternalError = 13;
constexpr int kStatusExecFormatError = 14;

// httplib::detail is not a stable API; keep every use behind this helper
std::string Encode(const std::string& str) {
  return httplib::detail::base64_encode(str);
}

std::string PollEndpoint(const std::vector<std::string>& tokens) {
  std::string joined;
  for (auto& i : tokens) {
    if (!joined.empty()) joined += ',';
    joined += i;
  }
  return "/submissions/batch?tokens=" + joined + "&base64_encoded=true&fields=*";
}

} // namespace

std::optional<std::string> Judge0Client::ConfigurationError() const {
  if (judge0_.api_key.empty()) return "Judge0 API key is not configured (set JUDGE0_API_KEY)";
  if (judge0_.url.empty()) return "Judge0 URL is not configured";
  return std::nullopt;
}

bool Judge0Client::SupportsLanguage(Language lang) const {
  return judge0_.language_ids.count(lang) > 0;
}

httplib::Headers Judge0Client::Headers() const {
  return {
    {"X-RapidAPI-Key", judge0_.api_key},
    {"X-RapidAPI-Host", judge0_.api_host},
  };
}

bool Judge0Client::DecodeField(const json& item, const char* key, std::string& out, std::string& error) const {
  std::string raw = StringField(item, key);
  if (http_utils::IsUrl(raw)) {
    if (!ResolveContent(raw, out, error)) return false;
  } else {
    out = Base64Decode(raw);
  }
  out = SanitizeUtf8(out);
  return true;
}

RunOutcome Judge0Client::DecodeSubmission(const json& item) const {
  RunOutcome ret;
  const json& status = item.at("status");
  const int status_id = status.at("id").get<int>();
  const std::string description = StringField(status, "description");
  ret.details.status = description;
  ret.time_ms = NumberField(item, "time") * 1000;
  ret.memory_mb = NumberField(item, "memory") / 1024;
  if (auto it = item.find("exit_code"); it != item.end() && it->is_number_integer()) {
    ret.details.exit_code = it->get<int>();
  }
  if (auto it = item.find("exit_signal"); it != item.end() && it->is_number_integer()) {
    ret.details.signal = it->get<int>();
  }

  std::string error;
  std::string& stderr_output = ret.details.stderr_output;
  std::string& compile_output = ret.details.compile_output;
  if (!DecodeField(item, "stdout", ret.output, error) ||
      !DecodeField(item, "stderr", stderr_output, error) ||
      !DecodeField(item, "compile_output", compile_output, error)) {
    ret.kind = ErrorKind::PROVIDER_UNAVAILABLE;
    ret.message = error;
    return ret;
  }
  auto or_description = [&description](const std::string& text) {
    std::string trimmed = TrimRight(text);
    return trimmed.empty() ? description : trimmed;
  };
  if (status_id == kStatusAccepted || status_id == kStatusWrongAnswer) {
    // graded here rather than trusting the provider's exact comparison
  } else if (status_id == kStatusTimeLimit) {
    ret.kind = ErrorKind::TIME_LIMIT_EXCEEDED;
    ret.message = description;
  } else if (status_id == kStatusCompileError) {
    ret.kind = ErrorKind::COMPILATION_ERROR;
    ret.message = or_description(compile_output);
  } else if (status_id >= kStatusRuntimeFirst && status_id <= kStatusRuntimeLast) {
    ret.kind = ErrorKind::RUNTIME_ERROR;
    ret.message = or_description(stderr_output);
    if (ret.message != description) ret.message = description + "\n" + ret.message;
  } else if (status_id == kStatusInternalError) {
    ret.kind = ErrorKind::EXECUTION_ERROR;
    ret.message = description;
    if (std::string msg = StringField(item, "message"); !msg.empty()) ret.message += ": " + Base64Decode(msg);
  } else if (status_id == kStatusExecFormatError) {
    ret.kind = ErrorKind::RUNTIME_ERROR;
    ret.message = description;
  } else {
    ret.kind = ErrorKind::MALFORMED_PROVIDER_RESPONSE;
    ret.message = fmt::format("Unknown Judge0 status {} {}", status_id, description);
  }
  return ret;
}

std::vector<TestCaseResult> Judge0Client::RunTests(const ExecutionRequest& req, const LanguageSpec& spec) {
  const size_t n = req.test_cases.size();
  if (!n) return {};
  if (auto err = ConfigurationError()) return FailAll(req, ErrorKind::CONFIGURATION_ERROR, *err);
  auto lang_it = judge0_.language_ids.find(spec.language);
  if (lang_it == judge0_.language_ids.end()) {
    return FailAll(req, ErrorKind::UNSUPPORTED_LANGUAGE, spec.name + " is not supported by Judge0");
  }

  PreparedProgram program = PrepareProgram(spec, req.source_code, req.entry_point);
  const std::string encoded_source = Encode(program.content);
  std::vector<std::string> stdins;
  json submissions = json::array();
  for (auto& test_case : req.test_cases) {
    stdins.push_back(StdinPayload(spec, test_case.input));
    json item = {
      {"language_id", lang_it->second},
      {"source_code", encoded_source},
      {"stdin", Encode(stdins.back())},
      {"expected_output", Encode(ExpectedText(test_case.expected_output))},
    };
    if (req.time_limit_ms > 0) item["cpu_time_limit"] = req.time_limit_ms / 1000.0;
    if (req.memory_limit_mb > 0) item["memory_limit"] = req.memory_limit_mb * 1024;
    submissions.push_back(std::move(item));
  }

  std::string origin, base_path;
  if (!http_utils::SplitUrl(judge0_.url, origin, base_path)) {
    return FailAll(req, ErrorKind::CONFIGURATION_ERROR, "Invalid Judge0 URL " + judge0_.url);
  }
  if (base_path == "/") base_path.clear();
  auto cli = MakeClient(origin);
  const httplib::Headers headers = Headers();
  spdlog::info("Submitting {} test cases of {} to Judge0", n, spec.name);
  auto res = RequestRetry<HTTPPost>(SubmitPolicy(), *cli, base_path + kSubmitEndpoint, headers,
      json{{"submissions", submissions}}.dump(), "application/json");
  if (!http_utils::IsSuccess(res)) {
    return FailAll(req, ErrorKind::PROVIDER_UNAVAILABLE, http_utils::DescribeFailure(res));
  }

  std::vector<TestCaseResult> results(n);
  std::vector<bool> done(n);
  std::vector<std::string> tokens(n);
  std::unordered_map<std::string, size_t> token_index;
  try {
    json body = json::parse(res->body);
    if (!body.is_array() || body.size() != n) {
      return FailAll(req, ErrorKind::MALFORMED_PROVIDER_RESPONSE,
          "Unexpected Judge0 batch response: " + TruncateMessage(res->body, 500));
    }
    for (size_t i = 0; i < n; i++) {
      tokens[i] = StringField(body[i], "token");
      if (tokens[i].empty()) {
        results[i] = MakeFailedResult(i, req.test_cases[i], ErrorKind::MALFORMED_PROVIDER_RESPONSE,
            "Submission rejected by Judge0: " + body[i].dump());
        done[i] = true;
      } else {
        token_index[tokens[i]] = i;
      }
    }
  } catch (json::exception& err) {
    spdlog::warn("Malformed Judge0 response: {}", err.what());
    return FailAll(req, ErrorKind::MALFORMED_PROVIDER_RESPONSE, std::string("Malformed Judge0 response: ") + err.what());
  }

  auto pending = [&]() {
    std::vector<size_t> ret;
    for (size_t i = 0; i < n; i++) {
      if (!done[i]) ret.push_back(i);
    }
    return ret;
  };
  // Finds the test case a polled item belongs to: by token, then by the
  //   echoed stdin, then the first unmatched pending one.
  auto match = [&](const json& item, const std::vector<size_t>& waiting, std::vector<bool>& used) -> std::optional<size_t> {
    if (auto it = token_index.find(StringField(item, "token")); it != token_index.end()) {
      return it->second;
    }
    std::string echoed = Base64Decode(StringField(item, "stdin"));
    for (size_t k = 0; k < waiting.size(); k++) {
      if (!used[k] && stdins[waiting[k]] == echoed) return waiting[k];
    }
    for (size_t k = 0; k < waiting.size(); k++) {
      if (!used[k]) {
        spdlog::warn("Judge0 result matched to test case {} by position", waiting[k]);
        return waiting[k];
      }
    }
    return std::nullopt;
  };

  std::string last_error;
  PollUntilDone([&](int) {
    std::vector<size_t> waiting = pending();
    std::vector<std::string> waiting_tokens;
    for (size_t i : waiting) waiting_tokens.push_back(tokens[i]);
    auto poll_res = HTTPRequest<HTTPGet>(*cli, base_path + PollEndpoint(waiting_tokens), headers);
    if (!http_utils::IsSuccess(poll_res)) {
      last_error = http_utils::DescribeFailure(poll_res);
      spdlog::warn("Judge0 poll failed: {}", last_error);
      return false;
    }
    try {
      json body = json::parse(poll_res->body);
      const json& items = body.at("submissions");
      std::vector<bool> used(waiting.size());
      for (const json& item : items) {
        if (!item.is_object()) continue;
        auto idx = match(item, waiting, used);
        if (!idx) continue;
        for (size_t k = 0; k < waiting.size(); k++) {
          if (waiting[k] == *idx) used[k] = true;
        }
        if (done[*idx]) continue;
        if (item.at("status").at("id").get<int>() <= kStatusProcessing) continue;
        results[*idx] = MakeResult(*idx, req.test_cases[*idx], DecodeSubmission(item));
        done[*idx] = true;
      }
    } catch (json::exception& err) {
      last_error = std::string("Malformed Judge0 response: ") + err.what();
      spdlog::warn("{}", last_error);
      return false;
    }
    return pending().empty();
  });

  for (size_t i : pending()) {
    std::string error = fmt::format("Timed out waiting for Judge0 after {} polls", config_.poll_attempts);
    if (!last_error.empty()) error += " (last error: " + last_error + ")";
    results[i] = MakeFailedResult(i, req.test_cases[i], ErrorKind::NO_RESULT, error);
  }
  return results;
}
