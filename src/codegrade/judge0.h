#ifndef CODEGRADE_JUDGE0_H_
#define CODEGRADE_JUDGE0_H_

#include "remote_judge.h"

// Judge0 (RapidAPI or self-hosted): one batch submission per request,
//   polled by token.
class Judge0Client : public RemoteJudgeClient {
  const Judge0Config& judge0_;

  httplib::Headers Headers() const;
  RunOutcome DecodeSubmission(const nlohmann::json& item) const;
  bool DecodeField(const nlohmann::json& item, const char* key, std::string& out, std::string& error) const;
 public:
  explicit Judge0Client(const Judge0Config& config) : RemoteJudgeClient(config), judge0_(config) {}

  Backend GetBackend() const override { return Backend::JUDGE0; }
  std::optional<std::string> ConfigurationError() const override;
  bool SupportsLanguage(Language) const override;
  std::vector<TestCaseResult> RunTests(const ExecutionRequest&, const LanguageSpec&) override;
};

#endif  // CODEGRADE_JUDGE0_H_
