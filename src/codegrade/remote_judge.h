#ifndef CODEGRADE_REMOTE_JUDGE_H_
#define CODEGRADE_REMOTE_JUDGE_H_

#include <memory>
#include <string>
#include <optional>
#include <functional>

#include <nlohmann/json.hpp>
#include <codegrade/config.h>
#include <codegrade/executor.h>

#include "http_utils.h"

// Shared plumbing of the HTTP judges: submission retries, the bounded poll
//   loop and resolution of URL-valued result fields.
class RemoteJudgeClient : public Executor {
 protected:
  const RemoteJudgeConfig& config_;

  RetryPolicy SubmitPolicy() const;
  std::unique_ptr<httplib::Client> MakeClient(const std::string& origin) const;

  // Calls poll(attempt) once per interval until it reports a terminal state
  //   or the attempt budget is spent; returns whether a terminal state was seen.
  //   The remote job is never cancelled, polling just stops.
  bool PollUntilDone(const std::function<bool(int attempt)>& poll) const;

  // Inline text is returned as-is; a URL is replaced by the body behind it.
  bool ResolveContent(const std::string& value, std::string& content, std::string& error) const;

  // Fails every test case with the same error
  static std::vector<TestCaseResult> FailAll(const ExecutionRequest&, ErrorKind, const std::string& error);
 public:
  explicit RemoteJudgeClient(const RemoteJudgeConfig& config) : config_(config) {}

  // Why this client cannot be used (missing credentials); nullopt if usable
  virtual std::optional<std::string> ConfigurationError() const = 0;
  virtual bool SupportsLanguage(Language) const = 0;
};

// Numbers that providers send either as JSON numbers or as strings; 0 if absent
double NumberField(const nlohmann::json& obj, const char* key);
// String fields that may be null or absent
std::string StringField(const nlohmann::json& obj, const char* key);

#endif  // CODEGRADE_REMOTE_JUDGE_H_
