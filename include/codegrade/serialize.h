#ifndef INCLUDE_CODEGRADE_SERIALIZE_H_
#define INCLUDE_CODEGRADE_SERIALIZE_H_

#include <nlohmann/json.hpp>

#include "execution.h"
#include "language.h"

nlohmann::json ToJSON(const ComparisonDiagnostic&);
nlohmann::json ToJSON(const TestCaseResult&);
nlohmann::json ToJSON(const ExecutionSummary&);
nlohmann::json ToJSON(const LanguageSpec&);

// {language, source_code|code, test_cases: [{input, output|expected_output}],
//   time_limit_ms?, memory_limit_mb?, entry_point?, backend?}
// Throws nlohmann::json::exception on missing or mistyped fields and
//   std::invalid_argument on an unknown backend.
ExecutionRequest RequestFromJSON(const nlohmann::json&);

#endif  // INCLUDE_CODEGRADE_SERIALIZE_H_
