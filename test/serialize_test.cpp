#include <stdexcept>

#include <gtest/gtest.h>
#include <codegrade/serialize.h>

using nlohmann::json;

TEST(Serialize, Request) {
  ExecutionRequest req = RequestFromJSON(json::parse(R"({
    "language": "python",
    "code": "def solve(n): return n",
    "test_cases": [
      {"input": [1, 2], "output": "3"},
      {"input": "x", "expected_output": {"a": 1}},
      {"output": 0}
    ],
    "time_limit_ms": 1500,
    "entry_point": "solve",
    "backend": "judge0"
  })"));
  EXPECT_EQ(req.language, "python");
  EXPECT_EQ(req.source_code, "def solve(n): return n");
  ASSERT_EQ(req.test_cases.size(), 3u);
  EXPECT_EQ(req.test_cases[0].input, json::array({1, 2}));
  EXPECT_EQ(req.test_cases[0].expected_output, "3");
  EXPECT_EQ(req.test_cases[1].expected_output, json({{"a", 1}}));
  EXPECT_TRUE(req.test_cases[2].input.is_null());
  EXPECT_EQ(req.time_limit_ms, 1500);
  EXPECT_EQ(req.memory_limit_mb, 0);
  EXPECT_EQ(req.entry_point, "solve");
  EXPECT_EQ(req.backend, Backend::JUDGE0);
}

TEST(Serialize, RequestSourceCodeKey) {
  ExecutionRequest req = RequestFromJSON({{"language", "cpp"}, {"source_code", "int main(){}"}});
  EXPECT_EQ(req.source_code, "int main(){}");
  EXPECT_TRUE(req.test_cases.empty());
  EXPECT_FALSE(req.backend);
}

TEST(Serialize, BadRequest) {
  EXPECT_THROW(RequestFromJSON({{"code", "x"}}), json::exception);
  EXPECT_THROW(RequestFromJSON({{"language", "python"}}), json::exception);
  EXPECT_THROW(RequestFromJSON({{"language", 3}, {"code", "x"}}), json::exception);
  EXPECT_THROW(RequestFromJSON({{"language", "python"}, {"code", "x"}, {"test_cases", {{{"input", 1}}}}}),
               json::exception);
  EXPECT_THROW(RequestFromJSON({{"language", "python"}, {"code", "x"}, {"backend", "mars"}}),
               std::invalid_argument);
}

TEST(Serialize, Result) {
  RunOutcome outcome;
  outcome.output = "1\n3\n";
  outcome.time_ms = 12.5;
  outcome.memory_mb = 4;
  outcome.details.status = "exited";
  TestCaseResult res = MakeResult(2, TestCase{"in", "1\n2"}, std::move(outcome));
  json data = ToJSON(res);
  EXPECT_EQ(data["test_index"], 2);
  EXPECT_EQ(data["actual_output"], "1\n3");
  EXPECT_EQ(data["passed"], false);
  EXPECT_EQ(data["error_kind"], "comparison_mismatch");
  EXPECT_TRUE(data["error"].is_null());
  EXPECT_EQ(data["execution_time_ms"], 12.5);
  EXPECT_EQ(data["details"]["status"], "exited");
  const json& diag = data["diagnostic"];
  EXPECT_EQ(diag["type"], "different");
  EXPECT_EQ(diag["matched"], false);
  EXPECT_EQ(diag["line_analysis"]["first_difference"]["line_number"], 2);
  EXPECT_EQ(diag["line_analysis"]["first_difference"]["actual_line"], "3");
  EXPECT_EQ(diag["line_analysis"]["first_difference"]["expected_line"], "2");
}

TEST(Serialize, Summary) {
  std::vector<TestCaseResult> results;
  results.push_back(MakeFailedResult(0, TestCase{nullptr, "x"}, ErrorKind::TIME_LIMIT_EXCEEDED, "slow"));
  ExecutionSummary summary;
  summary.results = std::move(results);
  summary.total_count = 1;
  summary.backend = "local";
  summary.error_message = "boom";
  json data = ToJSON(summary);
  EXPECT_EQ(data["overall_passed"], false);
  EXPECT_EQ(data["results"].size(), 1u);
  EXPECT_EQ(data["results"][0]["error"], "Time Limit Exceeded: slow");
  EXPECT_EQ(data["results"][0]["diagnostic"]["type"], "not_compared");
  EXPECT_FALSE(data["results"][0]["diagnostic"].contains("line_analysis"));
  EXPECT_EQ(data["error_message"], "boom");
  EXPECT_EQ(data["total_count"], 1);
  EXPECT_EQ(data["backend"], "local");
}

TEST(Serialize, Language) {
  LanguageTable table;
  json data = ToJSON(*table.Find(Language::CPP));
  EXPECT_EQ(data["name"], "cpp");
  EXPECT_EQ(data["extension"], ".cpp");
  EXPECT_EQ(data["local"], true);
  EXPECT_EQ(ToJSON(*table.Find(Language::CSHARP))["local"], false);
}
