#ifndef CODEGRADE_HACKEREARTH_H_
#define CODEGRADE_HACKEREARTH_H_

#include "remote_judge.h"

// HackerEarth code evaluation API v4: one submission per test case,
//   polled by he_id. Outputs come back as URLs to fetch.
class HackerEarthClient : public RemoteJudgeClient {
  const HackerEarthConfig& he_;

  TestCaseResult RunOne(size_t index, const ExecutionRequest&, const LanguageSpec&,
                        const std::string& source, const std::string& lang) const;
  RunOutcome DecodeResult(const nlohmann::json& body) const;
 public:
  explicit HackerEarthClient(const HackerEarthConfig& config) : RemoteJudgeClient(config), he_(config) {}

  Backend GetBackend() const override { return Backend::HACKEREARTH; }
  std::optional<std::string> ConfigurationError() const override;
  bool SupportsLanguage(Language) const override;
  std::vector<TestCaseResult> RunTests(const ExecutionRequest&, const LanguageSpec&) override;
};

// request_status is either a plain string or an object with a code/message
std::string HackerEarthRequestStatus(const nlohmann::json& body);
bool IsHackerEarthPending(const std::string& request_status);

#endif  // CODEGRADE_HACKEREARTH_H_
