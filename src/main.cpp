#include <fstream>
#include <optional>
#include <algorithm>
#include <iostream>
#include <iterator>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>
#include <codegrade/config.h>
#include <codegrade/dispatcher.h>
#include <codegrade/logger.h>
#include <codegrade/serialize.h>

namespace fs = std::filesystem;

namespace {

constexpr char kDefaultConfig[] = "/etc/codegrade.conf";

enum ExitCode {
  kAllPassed = 0,
  kSomeFailed = 1,
  kBadInput = 2,
};

struct Options {
  std::string request_file;
  bool list_languages = false;
  bool run_once = false;
  std::optional<std::string> run_input;
};

bool ReadAll(const std::string& path, std::string& out) {
  if (path.empty() || path == "-") {
    out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return true;
  }
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return false;
  out.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  return true;
}

Options ParseArgs(int argc, char** argv, EngineConfig& config) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "codegrade");
  parser.add_argument("request")
    .default_value(std::string("-"))
    .help("Request JSON file, or - for stdin");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file (default " + std::string(kDefaultConfig) + ")");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-b", "--backend")
    .help("Backend to use: local, judge0 or hackerearth");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of maximum parallel local test cases");
  parser.add_argument("--run")
    .default_value(false)
    .implicit_value(true)
    .help("Run the program once without grading");
  parser.add_argument("--input")
    .help("JSON input for --run");
  parser.add_argument("--list-languages")
    .default_value(false)
    .implicit_value(true)
    .help("Print the language table and exit");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(kBadInput);
  }

  InitLogger(verbosity);
  if (auto config_file = parser.present("--config")) {
    if (!ParseConfig(fs::path(*config_file), config)) {
      spdlog::error("Failed to parse configuration file {}", *config_file);
      exit(kBadInput);
    }
  } else if (fs::exists(kDefaultConfig) && !ParseConfig(fs::path(kDefaultConfig), config)) {
    spdlog::error("Failed to parse configuration file {}", kDefaultConfig);
    exit(kBadInput);
  }
  ApplyEnvironment(config);
  if (auto val = parser.present("--backend")) {
    if (auto backend = GetBackend(*val)) {
      config.backend = *backend;
    } else {
      spdlog::error("Unknown backend {}", *val);
      exit(kBadInput);
    }
  }
  if (auto val = parser.present<int>("--parallel")) {
    config.local.max_parallel = std::max(val.value(), 1);
  }

  Options ret;
  ret.request_file = parser.get<std::string>("request");
  ret.list_languages = parser["--list-languages"] == true;
  ret.run_once = parser["--run"] == true;
  ret.run_input = parser.present("--input");
  return ret;
}

void ListLanguages(const EngineConfig& config) {
  nlohmann::json ret = nlohmann::json::array();
  for (auto& spec : config.languages.Specs()) {
    nlohmann::json item = ToJSON(spec);
    item["judge0"] = config.judge0.language_ids.count(spec.language) > 0;
    item["hackerearth"] = config.hackerearth.language_names.count(spec.language) > 0;
    ret.push_back(std::move(item));
  }
  std::cout << ret.dump(2) << std::endl;
}

} // namespace

int main(int argc, char** argv) {
  EngineConfig config;
  Options opts = ParseArgs(argc, argv, config);
  if (opts.list_languages) {
    ListLanguages(config);
    return kAllPassed;
  }

  std::string content;
  if (!ReadAll(opts.request_file, content)) {
    spdlog::error("Cannot read request file {}", opts.request_file);
    return kBadInput;
  }
  ExecutionRequest req;
  nlohmann::json input = nullptr;
  try {
    req = RequestFromJSON(nlohmann::json::parse(content));
    if (opts.run_input) input = nlohmann::json::parse(*opts.run_input);
  } catch (nlohmann::json::exception& err) {
    spdlog::error("Invalid request: {}", err.what());
    return kBadInput;
  } catch (std::invalid_argument& err) {
    spdlog::error("Invalid request: {}", err.what());
    return kBadInput;
  }

  ExecutionEngine engine(config);
  if (opts.run_once) {
    TestCaseResult res = engine.RunProgram(req, input);
    std::cout << ToJSON(res).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return res.passed ? kAllPassed : kSomeFailed;
  }
  ExecutionSummary summary = engine.ExecuteRequest(req);
  std::cout << ToJSON(summary).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  return summary.overall_passed ? kAllPassed : kSomeFailed;
}
