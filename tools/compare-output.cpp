#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <codegrade/grader.h>
#include <codegrade/serialize.h>

// compare-output ACTUAL_FILE EXPECTED_FILE [--json] [--verbose]
//   prints the diagnostic as JSON; exit status 0 on a match, 1 otherwise

static bool ReadFile(const char* path, std::string& out) {
  if (!std::filesystem::is_regular_file(path)) return false;
  std::ifstream fin(path, std::ios::binary);
  std::stringstream buf;
  buf << fin.rdbuf();
  out = buf.str();
  return static_cast<bool>(fin);
}

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "Usage: " << (argc ? argv[0] : "compare-output")
        << " ACTUAL_FILE EXPECTED_FILE [--json] [--verbose]" << std::endl;
    return 2;
  }
  bool expected_json = false, verbose = false;
  for (int i = 3; i < argc; i++) {
    std::string str(argv[i]);
    if (str == "json" || str == "--json") expected_json = true;
    if (str == "verbose" || str == "--verbose") verbose = true;
  }

  std::string actual, expected_text;
  if (!ReadFile(argv[1], actual) || !ReadFile(argv[2], expected_text)) {
    std::cerr << "Cannot read " << argv[1] << " or " << argv[2] << std::endl;
    return 2;
  }
  nlohmann::json expected = expected_text;
  if (expected_json) {
    expected = nlohmann::json::parse(expected_text, nullptr, false);
    if (expected.is_discarded()) {
      std::cerr << "Expected output is not valid JSON" << std::endl;
      return 2;
    }
  }

  ComparisonDiagnostic diag = Compare(actual, expected);
  nlohmann::json res = ToJSON(diag);
  if (verbose) res["explanation"] = diag.Explain();
  std::cout << res.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  return diag.Matched() ? 0 : 1;
}
