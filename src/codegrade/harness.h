#ifndef CODEGRADE_HARNESS_H_
#define CODEGRADE_HARNESS_H_

#include <string>

#include <nlohmann/json.hpp>
#include <codegrade/language.h>

// A submission turned into the single file a backend compiles or runs
struct PreparedProgram {
  std::string file_name;
  std::string content;
  std::string main_class; // java only
};

// Function-call languages get a generated runner embedding the user source;
//   raw-stdin languages get the usual boilerplate fixes (missing includes, main, class).
// The function lookup of generated runners is heuristic: entry_point (if non-empty)
//   names the function explicitly.
PreparedProgram PrepareProgram(const LanguageSpec&, const std::string& source,
                               const std::string& entry_point = "");

// What the program reads on stdin for a test input
std::string StdinPayload(const LanguageSpec&, const nlohmann::json& input);

#endif  // CODEGRADE_HARNESS_H_
