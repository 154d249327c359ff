#include "http_utils.h"
#include <fmt/ranges.h>

namespace http_utils {

std::string FormatOneParam(const char* str) {
  return str;
}
std::string FormatOneParam(const std::string& str) {
  return str.size() > 200 ? str.substr(0, 200) + "..." : str;
}
std::string FormatOneParam(const httplib::Params& params) {
  return fmt::format("{}", params);
}
std::string FormatOneParam(const httplib::Headers&) {
  // may carry credentials
  return "";
}

std::string FormatParam() {
  return "(none)";
}

bool IsSuccess(int code) {
  return code >= 200 && code < 300;
}

bool IsSuccess(const httplib::Result& res) {
  return res && IsSuccess(res->status);
}

bool IsRetryable(const httplib::Result& res) {
  return !res || res->status == 429 || res->status >= 500;
}

std::string DescribeFailure(const httplib::Result& res) {
  if (!res) return "HTTP request failed: " + httplib::to_string(res.error());
  std::string body = res->body.size() > 500 ? res->body.substr(0, 500) + "..." : res->body;
  return fmt::format("HTTP {}: {}", res->status, body);
}

bool IsUrl(const std::string& str) {
  return str.compare(0, 7, "http://") == 0 || str.compare(0, 8, "https://") == 0;
}

bool SplitUrl(const std::string& url, std::string& origin, std::string& path) {
  if (!IsUrl(url)) return false;
  size_t host_start = url.find("://") + 3;
  size_t path_start = url.find_first_of("/?#", host_start);
  if (path_start == host_start) return false;
  if (path_start == std::string::npos) {
    origin = url;
    path = "/";
  } else {
    origin = url.substr(0, path_start);
    path = url.substr(path_start);
    if (path[0] != '/') path = "/" + path;
    // fragments are never sent
    if (size_t frag = path.find('#'); frag != std::string::npos) path.erase(frag);
  }
  return true;
}

} // namespace http_utils
