#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <thread>
#include <vector>
#include <filesystem>

#include <httplib.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <codegrade/config.h>
#include <codegrade/execution.h>

namespace fs = std::filesystem;

extern const fs::path kTestScratchRoot;

// Local scratch under kTestScratchRoot; remote judges tuned for a local
//   mock server (short poll interval, few attempts)
EngineConfig TestConfig();

ExecutionRequest MakeRequest(const std::string& language, const std::string& source,
                             std::vector<TestCase>&& test_cases);

// An HTTP judge on 127.0.0.1 serving whatever handlers the test installs
class MockServer {
  httplib::Server server_;
  std::thread thread_;
  int port_;
 public:
  MockServer() : port_(-1) {}
  ~MockServer() { Stop(); }

  httplib::Server& Http() { return server_; }
  // install handlers before starting
  void Start();
  void Stop();
  std::string Url() const { return "http://127.0.0.1:" + std::to_string(port_); }
};

std::string Base64(const std::string&);

#endif // TEST_UTILS_H_
