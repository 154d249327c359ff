#include <codegrade/grader.h>

#include <cmath>
#include <algorithm>

#include "utils.h"

namespace {

constexpr double kNumericTolerance = 1e-9;

// Whole-string decimal parse; hex and partial parses are rejected
std::optional<double> ParseNumber(const std::string& str) {
  if (str.empty()) return std::nullopt;
  if (str.find_first_of("xXpP") != std::string::npos) return std::nullopt;
  try {
    size_t pos = 0;
    double val = std::stod(str, &pos);
    if (pos != str.size()) return std::nullopt;
    return val;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

std::string RemoveWhitespace(const std::string& str) {
  std::string ret;
  ret.reserve(str.size());
  for (char c : str) {
    if (!IsWhitespace(c)) ret.push_back(c);
  }
  return ret;
}

std::string ToLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
    return c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c;
  });
  return str;
}

bool DiffersByOneTrailingNewline(const std::string& a, const std::string& b) {
  if (a.size() == b.size() + 1) return a.back() == '\n' && a.compare(0, b.size(), b) == 0;
  if (b.size() == a.size() + 1) return b.back() == '\n' && b.compare(0, a.size(), a) == 0;
  return false;
}

std::vector<std::string> SplitLines(const std::string& str) {
  std::vector<std::string> ret;
  size_t start = 0;
  while (true) {
    size_t end = str.find('\n', start);
    if (end == std::string::npos) {
      ret.push_back(str.substr(start));
      break;
    }
    ret.push_back(str.substr(start, end - start));
    start = end + 1;
  }
  return ret;
}

LineAnalysis AnalyzeLines(const std::string& actual, const std::string& expected) {
  auto actual_lines = SplitLines(actual);
  auto expected_lines = SplitLines(expected);
  LineAnalysis ret;
  ret.actual_lines = actual_lines.size();
  ret.expected_lines = expected_lines.size();
  size_t common = std::min(actual_lines.size(), expected_lines.size());
  for (size_t i = 0; i < common; i++) {
    if (actual_lines[i] != expected_lines[i]) {
      ret.first_difference = LineDifference{
        i + 1, actual_lines[i], expected_lines[i], "Line " + std::to_string(i + 1) + " differs"};
      return ret;
    }
  }
  if (actual_lines.size() > common) {
    ret.first_difference = LineDifference{
      common + 1, actual_lines[common], std::nullopt, "Extra line in actual output"};
  } else if (expected_lines.size() > common) {
    ret.first_difference = LineDifference{
      common + 1, std::nullopt, expected_lines[common], "Missing line in actual output"};
  }
  return ret;
}

// Shows at most 80 characters around the first differing position
std::string Excerpt(const std::string& str, size_t pos) {
  if (pos <= 40 || str.size() <= 80) return str;
  std::string ret = "..." + str.substr(pos - 40, 80);
  if (str.size() > pos + 40) ret += "...";
  return ret;
}

std::string DifferMessage(const std::string& expected, const std::string& actual) {
  size_t pos = 0;
  for (; pos < expected.size() && pos < actual.size() && expected[pos] == actual[pos]; pos++);
  return "Expected: " + Excerpt(expected, pos) + "\nGot: " + Excerpt(actual, pos);
}

} // namespace

std::string ExpectedText(const nlohmann::json& expected) {
  if (expected.is_string()) return expected.get<std::string>();
  return expected.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

ComparisonDiagnostic Compare(const std::string& actual, const nlohmann::json& expected) {
  const std::string expected_raw = ExpectedText(expected);
  ComparisonDiagnostic ret;
  ret.actual = Trim(actual);
  ret.expected = Trim(expected_raw);
  const std::string& act = ret.actual;
  const std::string& exp = ret.expected;
  auto matched = [&ret](MatchType type) {
    ret.type = type;
    ret.message = MatchTypeDesc(type);
    return ret;
  };

  // a non-string expected value is never compared textually as-is
  if (expected.is_string() && act == exp) {
    if (DiffersByOneTrailingNewline(actual, expected_raw)) return matched(MatchType::TRAILING_NEWLINE);
    return matched(MatchType::EXACT);
  }

  auto num_actual = ParseNumber(act), num_expected = ParseNumber(exp);
  if (num_actual && num_expected) {
    if (std::fabs(*num_actual - *num_expected) < kNumericTolerance) return matched(MatchType::NUMERIC);
    if (std::isfinite(*num_actual) && std::isfinite(*num_expected) &&
        std::trunc(*num_actual) == std::trunc(*num_expected)) {
      return matched(MatchType::INTEGER);
    }
  }

  if (auto json_actual = nlohmann::json::parse(act, nullptr, false); !json_actual.is_discarded()) {
    nlohmann::json json_expected = expected.is_string() ?
        nlohmann::json::parse(exp, nullptr, false) : expected;
    if (!json_expected.is_discarded() && json_actual == json_expected) {
      return matched(MatchType::JSON_STRUCTURAL);
    }
  }

  if (RemoveWhitespace(act) == RemoveWhitespace(exp)) return matched(MatchType::WHITESPACE_INSENSITIVE);
  if (ToLower(act) == ToLower(exp)) return matched(MatchType::CASE_INSENSITIVE);
  if (DiffersByOneTrailingNewline(actual, expected_raw)) return matched(MatchType::TRAILING_NEWLINE);

  ret.type = MatchType::DIFFERENT;
  ret.line_analysis = AnalyzeLines(act, exp);
  ret.message = "Output differs - Got " + std::to_string(ret.line_analysis->actual_lines) +
      " lines, expected " + std::to_string(ret.line_analysis->expected_lines) + " lines";
  return ret;
}

std::string ComparisonDiagnostic::Explain() const {
  if (type != MatchType::DIFFERENT) return message;
  std::string ret = message;
  if (line_analysis && line_analysis->first_difference) {
    const LineDifference& diff = *line_analysis->first_difference;
    ret += "\n" + diff.message + " (line " + std::to_string(diff.line_number) + ")";
    if (diff.actual_line && diff.expected_line) {
      ret += "\n" + DifferMessage(*diff.expected_line, *diff.actual_line);
      return ret;
    }
  }
  ret += "\n" + DifferMessage(expected, actual);
  return ret;
}
