#ifndef CODEGRADE_HTTP_UTILS_H_
#define CODEGRADE_HTTP_UTILS_H_

/// Log HTTP requests

#include <chrono>
#include <memory>
#include <thread>
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace http_utils {

std::string FormatOneParam(const char*);
std::string FormatOneParam(const std::string&);
std::string FormatOneParam(const httplib::Params&);
std::string FormatOneParam(const httplib::Headers&);
template <class T>
std::string FormatOneParam(const T&) { return "(unknown)"; }

std::string FormatParam();
template <class T, class... U>
std::string FormatParam(T&& head, U&&... tail) {
  return FormatOneParam(std::forward<T>(head)) + ' ' + FormatParam(std::forward<U>(tail)...);
}

bool IsSuccess(int code);
bool IsSuccess(const httplib::Result&);
// Transport errors, throttling and server errors are worth another attempt
bool IsRetryable(const httplib::Result&);
// Transport error or HTTP status with the start of the body
std::string DescribeFailure(const httplib::Result&);

bool IsUrl(const std::string&);
// "https://host:port/a/b?c" -> "https://host:port", "/a/b?c"
bool SplitUrl(const std::string& url, std::string& origin, std::string& path);

} // namespace http_utils

struct RetryPolicy {
  int attempts;
  std::chrono::milliseconds interval;
};

struct HTTPGet {
  constexpr static char method_name[] = "GET";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Get(endpoint, std::forward<T>(params)...);
  }
};
struct HTTPPost {
  constexpr static char method_name[] = "POST";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Post(endpoint, std::forward<T>(params)...);
  }
};

template <class Method, class... T>
httplib::Result HTTPRequest(httplib::Client& cli, const std::string& endpoint, T&&... params) {
  spdlog::debug("{} {} params {}", Method::method_name, endpoint, http_utils::FormatParam(params...));
  return Method()(cli, endpoint, std::forward<T>(params)...);
}

// params are passed again on every attempt, so they must not be moved from
template <class Method, class Func, class... T>
httplib::Result RequestRetryInit(
    Func&& init, const RetryPolicy& policy, httplib::Client& cli, const std::string& endpoint,
    const T&... params) {
  std::unique_ptr<httplib::Result> last_res;
  for (int i = 0; i < policy.attempts; i++) {
    if (i) std::this_thread::sleep_for(policy.interval);
    init();
    last_res = std::make_unique<httplib::Result>(HTTPRequest<Method>(cli, endpoint, params...));
    if (http_utils::IsSuccess(*last_res) || !http_utils::IsRetryable(*last_res)) {
      return std::move(*last_res);
    }
    spdlog::debug("Error code={} status={}", (int)last_res->error(), *last_res ? (*last_res)->status : -1);
  }
  spdlog::warn("Request {} {} failed after {} attempts: {}", Method::method_name, endpoint,
      policy.attempts, last_res ? http_utils::DescribeFailure(*last_res) : "not attempted");
  if (!last_res) return httplib::Result(nullptr, httplib::Error::Unknown);
  return std::move(*last_res);
}

template <class Method, class... T>
httplib::Result RequestRetry(const RetryPolicy& policy, httplib::Client& cli,
                             const std::string& endpoint, const T&... params) {
  return RequestRetryInit<Method>([](){}, policy, cli, endpoint, params...);
}

#endif  // CODEGRADE_HTTP_UTILS_H_
