#include <gtest/gtest.h>
#include <codegrade/aggregator.h>

#include "codegrade/local_executor.h"
#include "utils.h"

using nlohmann::json;

namespace {

constexpr char kSumSource[] = R"(def solve(nums):
    return sum(nums)
)";

class LocalExecutorTest : public testing::Test {
 protected:
  EngineConfig conf = TestConfig();
  LocalExecutor executor{conf.local};

  std::vector<TestCaseResult> Run(const ExecutionRequest& req) {
    const LanguageSpec* spec = conf.languages.Find(req.language);
    EXPECT_TRUE(spec);
    if (!spec) return {};
    auto results = executor.RunTests(req, *spec);
    EXPECT_EQ(results.size(), req.test_cases.size());
    for (size_t i = 0; i < results.size(); i++) EXPECT_EQ(results[i].test_index, i);
    return results;
  }
};

struct PythonParam {
  std::string name;
  std::string source;
  json input;
  json expected;
  std::string entry_point;
};

std::string ParamName(const ::testing::TestParamInfo<PythonParam>& info) {
  return info.param.name;
}

} // namespace

TEST_F(LocalExecutorTest, SumArray) {
  auto results = Run(MakeRequest("python", kSumSource, {{json::array({1, 2, 3, 4, 5}), "15"}}));
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0].passed) << results[0].details.stderr_output;
  EXPECT_EQ(results[0].actual_output, "15");
  EXPECT_EQ(results[0].error_kind, ErrorKind::NONE);
  EXPECT_FALSE(results[0].error);
  EXPECT_GT(results[0].execution_time_ms, 0);
  EXPECT_GT(results[0].memory_used_mb, 0);
}

TEST_F(LocalExecutorTest, SumEmptyArray) {
  auto results = Run(MakeRequest("python", kSumSource, {{json::array(), "0"}}));
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0].passed);
  EXPECT_EQ(results[0].actual_output, "0");
  EXPECT_TRUE(results[0].diagnostic.type == MatchType::EXACT || results[0].diagnostic.type == MatchType::NUMERIC);
}

class PythonHarness : public LocalExecutorTest, public testing::WithParamInterface<PythonParam> {};
TEST_P(PythonHarness, Passes) {
  auto& param = GetParam();
  ExecutionRequest req = MakeRequest("python", param.source, {{param.input, param.expected}});
  req.entry_point = param.entry_point;
  auto results = Run(req);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0].passed) << results[0].actual_output << "\n" << results[0].details.stderr_output;
}
INSTANTIATE_TEST_SUITE_P(LocalExecutor, PythonHarness,
    testing::Values(
      (PythonParam){"spread_args", "def solve(a, b):\n    return a + b\n", json::array({3, 4}), "7", ""},
      (PythonParam){"keyword_args", "def solve(x, y):\n    return x - y\n", json{{"x", 5}, {"y", 2}}, 3, ""},
      (PythonParam){"scalar", "def solve(n):\n    return n * n\n", 9, 81, ""},
      (PythonParam){"string", "def solve(s):\n    return s[::-1]\n", "abc", "cba", ""},
      (PythonParam){"list_result", "def solve(n):\n    return list(range(n))\n", 3, json::array({0, 1, 2}), ""},
      (PythonParam){"no_input", "def main():\n    return 'hi'\n", nullptr, "hi", ""},
      (PythonParam){"any_function", "import math\ndef hypot(a, b):\n    return math.hypot(a, b)\n",
                    json::array({3, 4}), 5, ""},
      (PythonParam){"entry_point", "def solve(n):\n    return 0\ndef twice(n):\n    return 2 * n\n", 21, 42, "twice"},
      (PythonParam){"prints", "print('x y')\n", nullptr, "x y", ""},
      (PythonParam){"unserializable_result", "def solve(n):\n    return {n}\n", 7, "{7}", ""}
    ),
    ParamName);

TEST_F(LocalExecutorTest, WrongAnswer) {
  auto results = Run(MakeRequest("python", "def solve(n):\n    return n + 1\n", {{1, 1}}));
  ASSERT_EQ(results.size(), 1u);
  EXPECT_FALSE(results[0].passed);
  EXPECT_EQ(results[0].error_kind, ErrorKind::COMPARISON_MISMATCH);
  EXPECT_EQ(results[0].actual_output, "2");
  EXPECT_EQ(results[0].diagnostic.type, MatchType::DIFFERENT);
}

TEST_F(LocalExecutorTest, RuntimeError) {
  auto results = Run(MakeRequest("python", "def solve(n):\n    raise ValueError('bad value')\n", {{1, 1}}));
  ASSERT_EQ(results.size(), 1u);
  EXPECT_FALSE(results[0].passed);
  EXPECT_EQ(results[0].error_kind, ErrorKind::RUNTIME_ERROR);
  ASSERT_TRUE(results[0].error);
  EXPECT_NE(results[0].error->find("ValueError: bad value"), std::string::npos) << *results[0].error;
  EXPECT_EQ(results[0].diagnostic.type, MatchType::NOT_COMPARED);
  EXPECT_EQ(results[0].details.exit_code, 1);
}

TEST_F(LocalExecutorTest, Timeout) {
  ExecutionRequest req = MakeRequest("python", "import time\ndef solve(n):\n    time.sleep(30)\n", {{1, 1}, {2, 2}});
  req.time_limit_ms = 500;
  auto start = std::chrono::steady_clock::now();
  auto results = Run(req);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
  for (auto& res : results) {
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.error_kind, ErrorKind::TIME_LIMIT_EXCEEDED);
    ASSERT_TRUE(res.error);
    EXPECT_NE(res.error->find("timed out"), std::string::npos) << *res.error;
    EXPECT_LT(res.execution_time_ms, 3000);
  }
}

TEST_F(LocalExecutorTest, MemoryLimit) {
  ExecutionRequest req = MakeRequest("python",
      "import time\ndef solve(n):\n    x = b'x' * (n << 20)\n    time.sleep(2)\n    return len(x)\n",
      {{512, 0}});
  req.memory_limit_mb = 64;
  auto results = Run(req);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].error_kind, ErrorKind::MEMORY_LIMIT_EXCEEDED);
  ASSERT_TRUE(results[0].error);
  EXPECT_NE(results[0].error->find("64 MB"), std::string::npos);
}

TEST_F(LocalExecutorTest, ManyTestCases) {
  std::vector<TestCase> test_cases;
  for (int i = 0; i < 7; i++) test_cases.push_back({json::array({i, i}), std::to_string(2 * i)});
  test_cases[3].expected_output = "-1";
  auto results = Run(MakeRequest("python", "def solve(a, b):\n    return a + b\n", std::move(test_cases)));
  ASSERT_EQ(results.size(), 7u);
  ExecutionSummary summary = Aggregate(std::move(results));
  EXPECT_FALSE(summary.overall_passed);
  EXPECT_EQ(summary.passed_count, 6u);
  EXPECT_FALSE(summary.results[3].passed);
  EXPECT_EQ(summary.results[6].actual_output, "12");
}

TEST_F(LocalExecutorTest, CppStdin) {
  auto results = Run(MakeRequest("cpp", R"(#include <cstdio>
int main() { long a, b; if (scanf("%ld %ld", &a, &b) != 2) return 1; printf("%ld\n", a + b); })",
      {{"3 4", "7"}, {"10 -3", "7"}, {"1 1", "3"}}));
  ASSERT_EQ(results.size(), 3u);
  EXPECT_TRUE(results[0].passed) << results[0].error.value_or("");
  EXPECT_TRUE(results[1].passed);
  EXPECT_FALSE(results[2].passed);
  EXPECT_EQ(results[2].error_kind, ErrorKind::COMPARISON_MISMATCH);
}

TEST_F(LocalExecutorTest, CompilationErrorFailsEveryTest) {
  auto results = Run(MakeRequest("cpp", "int main() { return undeclared_name; }", {{1, 1}, {2, 2}, {3, 3}}));
  ASSERT_EQ(results.size(), 3u);
  for (auto& res : results) {
    EXPECT_FALSE(res.passed);
    EXPECT_EQ(res.error_kind, ErrorKind::COMPILATION_ERROR);
    ASSERT_TRUE(res.error);
    EXPECT_EQ(res.error->rfind("Compilation Error", 0), 0u);
    EXPECT_NE(res.error->find("undeclared_name"), std::string::npos);
    EXPECT_DOUBLE_EQ(res.execution_time_ms, 0);
    EXPECT_TRUE(res.actual_output.empty());
  }
}

TEST_F(LocalExecutorTest, CppCrash) {
  auto results = Run(MakeRequest("cpp", "int* p; int main() { *p = 1; return 0; }", {{nullptr, ""}}));
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].error_kind, ErrorKind::RUNTIME_ERROR);
  ASSERT_TRUE(results[0].error);
  EXPECT_NE(results[0].error->find("signal"), std::string::npos) << *results[0].error;
  EXPECT_NE(results[0].details.signal, 0);
}

TEST_F(LocalExecutorTest, CExitCode) {
  auto results = Run(MakeRequest("c", "#include <stdio.h>\nint main(void) { puts(\"x\"); return 4; }", {{nullptr, "x"}}));
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].error_kind, ErrorKind::RUNTIME_ERROR);
  EXPECT_EQ(results[0].error, "Runtime Error: Process exited with code 4");
  EXPECT_EQ(results[0].actual_output, "x");
}

TEST_F(LocalExecutorTest, JavaScript) {
  auto results = Run(MakeRequest("javascript", "function solve(nums) { return nums.reduce((a, b) => a + b, 0); }",
      {{json::array({1, 2, 3, 4, 5}), "15"}, {json::array({2, 2}), 4}}));
  ASSERT_EQ(results.size(), 2u);
  EXPECT_TRUE(results[0].passed) << results[0].details.stderr_output;
  EXPECT_TRUE(results[1].passed) << results[1].details.stderr_output;
}

TEST_F(LocalExecutorTest, RemoteOnlyLanguage) {
  auto results = Run(MakeRequest("csharp", "class A {}", {{1, 1}, {2, 2}}));
  ASSERT_EQ(results.size(), 2u);
  for (auto& res : results) EXPECT_EQ(res.error_kind, ErrorKind::UNSUPPORTED_LANGUAGE);
}

TEST_F(LocalExecutorTest, MissingInterpreter) {
  std::vector<LanguageSpec> specs = {
    {Language::RUBY, "ruby", ".rb", "", "/nonexistent/ruby {source}", 1000, 64, HarnessType::RAW_STDIN}};
  LanguageTable table(std::move(specs));
  auto results = executor.RunTests(MakeRequest("ruby", "puts 1", {{nullptr, "1"}}), *table.Find(Language::RUBY));
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].error_kind, ErrorKind::EXECUTION_ERROR);
}

TEST_F(LocalExecutorTest, Execute) {
  TestCaseResult res = executor.Execute(*conf.languages.Find(Language::PYTHON), kSumSource,
      {json::array({4, 5}), 9});
  EXPECT_TRUE(res.passed);
  EXPECT_EQ(res.test_index, 0u);
}

TEST_F(LocalExecutorTest, RunProgram) {
  const LanguageSpec& python = *conf.languages.Find(Language::PYTHON);
  TestCaseResult res = executor.RunProgram(python, "def solve(s):\n    return s.upper()\n", "shout");
  EXPECT_TRUE(res.passed);
  EXPECT_EQ(res.actual_output, "SHOUT");
  EXPECT_EQ(res.diagnostic.type, MatchType::NOT_COMPARED);

  TestCaseResult failed = executor.RunProgram(python, "def solve():\n    raise KeyError('k')\n");
  EXPECT_FALSE(failed.passed);
  EXPECT_EQ(failed.error_kind, ErrorKind::RUNTIME_ERROR);
}
