#include <codegrade/serialize.h>

#include <stdexcept>

using nlohmann::json;

namespace {

json OptionalString(const std::optional<std::string>& str) {
  if (!str) return nullptr;
  return *str;
}

} // namespace

json ToJSON(const ComparisonDiagnostic& diag) {
  json ret = {
    {"type", MatchTypeName(diag.type)},
    {"matched", diag.Matched()},
    {"message", diag.message},
    {"actual", diag.actual},
    {"expected", diag.expected},
  };
  if (diag.line_analysis) {
    json analysis = {
      {"actual_lines", diag.line_analysis->actual_lines},
      {"expected_lines", diag.line_analysis->expected_lines},
      {"first_difference", nullptr},
    };
    if (auto& diff = diag.line_analysis->first_difference) {
      analysis["first_difference"] = {
        {"line_number", diff->line_number},
        {"actual_line", OptionalString(diff->actual_line)},
        {"expected_line", OptionalString(diff->expected_line)},
        {"message", diff->message},
      };
    }
    ret["line_analysis"] = std::move(analysis);
  }
  return ret;
}

json ToJSON(const TestCaseResult& res) {
  return {
    {"test_index", res.test_index},
    {"input", res.input},
    {"expected_output", res.expected_output},
    {"actual_output", res.actual_output},
    {"passed", res.passed},
    {"execution_time_ms", res.execution_time_ms},
    {"memory_used_mb", res.memory_used_mb},
    {"error_kind", ErrorKindName(res.error_kind)},
    {"error", OptionalString(res.error)},
    {"diagnostic", ToJSON(res.diagnostic)},
    {"details", {
      {"status", res.details.status},
      {"stderr", res.details.stderr_output},
      {"compile_output", res.details.compile_output},
      {"exit_code", res.details.exit_code},
      {"signal", res.details.signal},
    }},
  };
}

json ToJSON(const ExecutionSummary& summary) {
  json results = json::array();
  for (auto& i : summary.results) results.push_back(ToJSON(i));
  return {
    {"overall_passed", summary.overall_passed},
    {"results", std::move(results)},
    {"total_execution_time_ms", summary.total_execution_time_ms},
    {"peak_memory_mb", summary.peak_memory_mb},
    {"error_message", OptionalString(summary.error_message)},
    {"passed_count", summary.passed_count},
    {"total_count", summary.total_count},
    {"success_rate", summary.success_rate},
    {"backend", summary.backend},
  };
}

json ToJSON(const LanguageSpec& spec) {
  return {
    {"name", spec.name},
    {"extension", spec.extension},
    {"compile_command", spec.compile_command},
    {"run_command", spec.run_command},
    {"default_time_limit_ms", spec.default_time_limit_ms},
    {"default_memory_limit_mb", spec.default_memory_limit_mb},
    {"local", spec.IsLocallySupported()},
  };
}

ExecutionRequest RequestFromJSON(const json& data) {
  ExecutionRequest req;
  req.language = data.at("language").get<std::string>();
  if (data.contains("source_code")) {
    req.source_code = data["source_code"].get<std::string>();
  } else {
    req.source_code = data.at("code").get<std::string>();
  }
  if (auto it = data.find("test_cases"); it != data.end() && !it->is_null()) {
    for (auto& i : it->get_ref<const json::array_t&>()) {
      TestCase test_case;
      test_case.input = i.value("input", json(nullptr));
      if (i.contains("expected_output")) {
        test_case.expected_output = i["expected_output"];
      } else {
        test_case.expected_output = i.at("output");
      }
      req.test_cases.push_back(std::move(test_case));
    }
  }
  req.time_limit_ms = data.value("time_limit_ms", 0L);
  req.memory_limit_mb = data.value("memory_limit_mb", 0L);
  req.entry_point = data.value("entry_point", std::string());
  if (auto it = data.find("backend"); it != data.end() && !it->is_null()) {
    std::string name = it->get<std::string>();
    req.backend = GetBackend(name);
    if (!req.backend) throw std::invalid_argument("Unknown backend " + name);
  }
  return req;
}
