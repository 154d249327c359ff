#include <map>
#include <mutex>
#include <functional>

#include <gtest/gtest.h>

#include "codegrade/hackerearth.h"
#include "utils.h"

using nlohmann::json;

namespace {

constexpr char kSubmitPath[] = "/v4/partner/code-evaluation/submissions/";
constexpr char kSumSource[] = "def solve(nums):\n    return sum(nums)\n";

json Status(const std::string& code) {
  return {{"code", code}, {"message", code}, {"status", "OK"}};
}

json Completed(const std::string& run_status, const std::string& output, const std::string& stderr_text = "") {
  return {
    {"request_status", Status("REQUEST_COMPLETED")},
    {"result", {
      {"compile_status", "OK"},
      {"run_status", {
        {"status", run_status},
        {"status_detail", "NA"},
        {"time_used", "0.1"},
        {"memory_used", "2048"},
        {"output", output},
        {"stderr", stderr_text},
        {"exit_code", "0"},
      }},
    }},
  };
}

} // namespace

class HackerEarthTest : public testing::Test {
 protected:
  EngineConfig conf = TestConfig();
  MockServer server;
  std::mutex mtx;
  std::vector<json> payloads; // as received
  std::map<std::string, int> polls;
  json submit_override; // returned instead of a queued status
  // polled body of submission i
  std::function<json(size_t i, const json& payload, int poll)> respond;
  std::map<std::string, std::string> files;

  void SetUp() override {
    auto& http = server.Http();
    http.Post(kSubmitPath, [this](const httplib::Request& req, httplib::Response& res) {
      if (req.get_header_value("client-secret") != "test-secret") {
        res.status = 401;
        res.set_content(R"({"message":"Invalid client secret"})", "application/json");
        return;
      }
      std::lock_guard<std::mutex> lck(mtx);
      std::string he_id = "he" + std::to_string(payloads.size());
      payloads.push_back(json::parse(req.body));
      json body = submit_override.is_null() ?
          json{{"he_id", he_id}, {"request_status", Status("REQUEST_QUEUED")}} : submit_override;
      res.set_content(body.dump(), "application/json");
    });
    http.Get(std::string(kSubmitPath) + R"((\w+)/)", [this](const httplib::Request& req, httplib::Response& res) {
      std::lock_guard<std::mutex> lck(mtx);
      std::string he_id = req.matches[1];
      size_t i = std::stoul(he_id.substr(2));
      json body = respond(i, payloads.at(i), ++polls[he_id]);
      body["he_id"] = he_id;
      res.set_content(body.dump(), "application/json");
    });
    http.Get(R"(/files/(\w+))", [this](const httplib::Request& req, httplib::Response& res) {
      std::lock_guard<std::mutex> lck(mtx);
      auto it = files.find(req.matches[1]);
      if (it == files.end()) {
        res.status = 404;
        return;
      }
      res.set_content(it->second, "text/plain");
    });
    server.Start();
    conf.hackerearth.url = server.Url();
    conf.hackerearth.client_secret = "test-secret";
    // queued once, then the output of the summing program behind a URL
    respond = [this](size_t i, const json& payload, int poll) {
      if (poll == 1) return json{{"request_status", Status("REQUEST_INITIATED")}};
      int sum = 0;
      for (auto& k : json::parse(payload.at("input").get<std::string>())) sum += k.get<int>();
      files["out" + std::to_string(i)] = std::to_string(sum) + "\n";
      return Completed("AC", server.Url() + "/files/out" + std::to_string(i));
    };
  }

  void TearDown() override {
    server.Stop();
  }

  std::vector<TestCaseResult> Run(const ExecutionRequest& req) {
    HackerEarthClient client(conf.hackerearth);
    auto results = client.RunTests(req, *conf.languages.Find(req.language));
    EXPECT_EQ(results.size(), req.test_cases.size());
    for (size_t i = 0; i < results.size(); i++) EXPECT_EQ(results[i].test_index, i);
    return results;
  }
};

TEST_F(HackerEarthTest, Completed) {
  ExecutionRequest req = MakeRequest("python", kSumSource,
      {{json::array({1, 2, 3, 4, 5}), "15"}, {json::array({1}), "2"}});
  req.time_limit_ms = 2500;
  auto results = Run(req);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_TRUE(results[0].passed) << results[0].error.value_or("");
  EXPECT_EQ(results[0].actual_output, "15");
  EXPECT_DOUBLE_EQ(results[0].execution_time_ms, 100);
  EXPECT_DOUBLE_EQ(results[0].memory_used_mb, 2);
  EXPECT_EQ(results[0].details.status, "AC");
  EXPECT_FALSE(results[1].passed);
  EXPECT_EQ(results[1].error_kind, ErrorKind::COMPARISON_MISMATCH);

  ASSERT_EQ(payloads.size(), 2u);
  for (auto& payload : payloads) {
    EXPECT_EQ(payload.at("lang"), "PYTHON");
    EXPECT_EQ(payload.at("time_limit"), 3);
    EXPECT_EQ(payload.at("memory_limit"), 262144);
    EXPECT_NE(payload.at("source").get<std::string>().find("return sum(nums)"), std::string::npos);
    EXPECT_FALSE(payload.at("id").get<std::string>().empty());
  }
  EXPECT_NE(payloads[0].at("id"), payloads[1].at("id"));
}

TEST_F(HackerEarthTest, ResultInSubmitResponse) {
  submit_override = Completed("AC", "42");
  submit_override["he_id"] = "he0";
  respond = [](size_t, const json&, int) -> json {
    ADD_FAILURE() << "polled a finished submission";
    return nullptr;
  };
  auto results = Run(MakeRequest("python", kSumSource, {{nullptr, 42}}));
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0].passed);
  EXPECT_TRUE(polls.empty());
}

TEST_F(HackerEarthTest, Failures) {
  files["ce"] = "main.py:1: SyntaxError: invalid syntax\n";
  std::string ce_url = server.Url() + "/files/ce";
  std::string missing_url = server.Url() + "/files/missing";
  respond = [ce_url, missing_url](size_t i, const json&, int) {
    json body;
    switch (i) {
      case 0:
        body = Completed("AC", "");
        body["result"]["compile_status"] = ce_url;
        return body;
      case 1: return Completed("RE", "", "ZeroDivisionError: division by zero");
      case 2: return Completed("TLE", "");
      case 3: return Completed("MLE", "");
      case 4:
        return json{{"request_status", {{"code", "REQUEST_FAILED"}, {"message", "Language not supported"}}}};
      default: return Completed("AC", missing_url);
    }
  };
  std::vector<TestCase> test_cases(6, TestCase{nullptr, "1"});
  auto results = Run(MakeRequest("python", kSumSource, std::move(test_cases)));
  ASSERT_EQ(results.size(), 6u);
  for (auto& res : results) EXPECT_FALSE(res.passed);
  EXPECT_EQ(results[0].error_kind, ErrorKind::COMPILATION_ERROR);
  EXPECT_EQ(results[0].error, "Compilation Error: main.py:1: SyntaxError: invalid syntax");
  EXPECT_EQ(results[1].error_kind, ErrorKind::RUNTIME_ERROR);
  EXPECT_EQ(results[1].error, "Runtime Error: ZeroDivisionError: division by zero");
  EXPECT_EQ(results[2].error_kind, ErrorKind::TIME_LIMIT_EXCEEDED);
  EXPECT_EQ(results[3].error_kind, ErrorKind::MEMORY_LIMIT_EXCEEDED);
  EXPECT_EQ(results[4].error_kind, ErrorKind::EXECUTION_ERROR);
  ASSERT_TRUE(results[4].error);
  EXPECT_NE(results[4].error->find("Language not supported"), std::string::npos);
  EXPECT_EQ(results[5].error_kind, ErrorKind::PROVIDER_UNAVAILABLE);
}

TEST_F(HackerEarthTest, CompileStatusForms) {
  respond = [](size_t i, const json&, int) {
    json body = Completed("AC", "1");
    switch (i) {
      case 0: body["result"]["compile_status"] = "ok"; break;
      case 1: body["result"]["compile_status"] = {{"status", "OK"}, {"message", "OK"}}; break;
      default: body["result"]["compile_status"] = {{"status", "FAILED"}, {"message", "line 1: expected ';'"}};
    }
    return body;
  };
  std::vector<TestCase> test_cases(3, TestCase{nullptr, "1"});
  auto results = Run(MakeRequest("python", kSumSource, std::move(test_cases)));
  ASSERT_EQ(results.size(), 3u);
  EXPECT_TRUE(results[0].passed) << results[0].error.value_or("");
  EXPECT_TRUE(results[1].passed) << results[1].error.value_or("");
  EXPECT_FALSE(results[2].passed);
  EXPECT_EQ(results[2].error_kind, ErrorKind::COMPILATION_ERROR);
  EXPECT_EQ(results[2].error, "Compilation Error: line 1: expected ';'");
}

TEST_F(HackerEarthTest, NeverFinishes) {
  respond = [](size_t, const json&, int) {
    return json{{"request_status", Status("REQUEST_QUEUED")}};
  };
  auto results = Run(MakeRequest("python", kSumSource, {{json::array({1}), "1"}, {json::array({2}), "2"}}));
  ASSERT_EQ(results.size(), 2u);
  for (auto& res : results) {
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.error_kind, ErrorKind::NO_RESULT);
    EXPECT_EQ(res.error, "No Result: Timed out waiting for HackerEarth after 5 polls");
  }
  for (auto& [he_id, count] : polls) EXPECT_EQ(count, conf.hackerearth.poll_attempts) << he_id;
}

TEST_F(HackerEarthTest, MalformedPoll) {
  respond = [](size_t, const json&, int) {
    return json{{"request_status", Status("REQUEST_COMPLETED")}, {"result", {{"compile_status", "OK"}}}};
  };
  auto results = Run(MakeRequest("python", kSumSource, {{nullptr, "1"}}));
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].error_kind, ErrorKind::MALFORMED_PROVIDER_RESPONSE);
}

TEST_F(HackerEarthTest, BadSecret) {
  conf.hackerearth.client_secret = "nope";
  auto results = Run(MakeRequest("python", kSumSource, {{nullptr, "1"}, {nullptr, "1"}}));
  for (auto& res : results) {
    EXPECT_EQ(res.error_kind, ErrorKind::PROVIDER_UNAVAILABLE);
    ASSERT_TRUE(res.error);
    EXPECT_NE(res.error->find("Invalid client secret"), std::string::npos);
  }
}

TEST_F(HackerEarthTest, MissingSecret) {
  conf.hackerearth.client_secret.clear();
  auto results = Run(MakeRequest("python", kSumSource, {{nullptr, "1"}}));
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].error_kind, ErrorKind::CONFIGURATION_ERROR);
  EXPECT_TRUE(payloads.empty());
}

TEST(HackerEarth, RequestStatus) {
  EXPECT_EQ(HackerEarthRequestStatus(json{{"request_status", "REQUEST_QUEUED"}}), "REQUEST_QUEUED");
  EXPECT_EQ(HackerEarthRequestStatus(json{{"request_status", {{"code", "CODE_COMPILED"}}}}), "CODE_COMPILED");
  EXPECT_EQ(HackerEarthRequestStatus(json{{"request_status", {{"message", "REQUEST_FAILED"}}}}), "REQUEST_FAILED");
  EXPECT_EQ(HackerEarthRequestStatus(json::object()), "");
  EXPECT_TRUE(IsHackerEarthPending("REQUEST_QUEUED"));
  EXPECT_TRUE(IsHackerEarthPending("REQUEST_INITIATED"));
  EXPECT_TRUE(IsHackerEarthPending("CODE_COMPILED"));
  EXPECT_FALSE(IsHackerEarthPending("REQUEST_COMPLETED"));
  EXPECT_FALSE(IsHackerEarthPending("REQUEST_FAILED"));
}
