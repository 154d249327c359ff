#ifndef INCLUDE_CODEGRADE_GRADER_H_
#define INCLUDE_CODEGRADE_GRADER_H_

#include <string>
#include <optional>

#include <nlohmann/json.hpp>

// Comparison cascade, tried in this order; the first match wins
#define ENUM_MATCH_TYPE_ \
  X(EXACT, "exact", "Exact match") \
  X(NUMERIC, "numeric", "Numeric match") \
  X(INTEGER, "integer", "Integer match") \
  X(JSON_STRUCTURAL, "json", "JSON structure match") \
  X(WHITESPACE_INSENSITIVE, "whitespace", "Match after removing whitespace") \
  X(CASE_INSENSITIVE, "case_insensitive", "Case-insensitive match") \
  X(TRAILING_NEWLINE, "trailing_newline", "Match ignoring a trailing newline") \
  X(DIFFERENT, "different", "Output differs") \
  X(NOT_COMPARED, "not_compared", "Output not compared")
enum class MatchType {
#define X(name, str, desc) name,
  ENUM_MATCH_TYPE_
#undef X
};

struct LineDifference {
  size_t line_number; // 1-based
  std::optional<std::string> actual_line;
  std::optional<std::string> expected_line;
  std::string message;
};

struct LineAnalysis {
  size_t actual_lines = 0;
  size_t expected_lines = 0;
  std::optional<LineDifference> first_difference;
};

struct ComparisonDiagnostic {
  MatchType type = MatchType::NOT_COMPARED;
  // trimmed text forms of both sides, as compared
  std::string actual;
  std::string expected;
  std::string message;
  // only for DIFFERENT
  std::optional<LineAnalysis> line_analysis;

  bool Matched() const {
    return type != MatchType::DIFFERENT && type != MatchType::NOT_COMPARED;
  }
  // human readable "expected vs got"
  std::string Explain() const;
};

// Text form of an expected value: strings as-is, everything else as compact JSON
std::string ExpectedText(const nlohmann::json& expected);

// Pure; the same arguments always give the same diagnostic.
ComparisonDiagnostic Compare(const std::string& actual, const nlohmann::json& expected);

const char* MatchTypeName(MatchType);
const char* MatchTypeDesc(MatchType);

#endif  // INCLUDE_CODEGRADE_GRADER_H_
