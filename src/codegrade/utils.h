#ifndef CODEGRADE_UTILS_H_
#define CODEGRADE_UTILS_H_

#include <string>
#include <vector>
#include <utility>
#include <filesystem>
#include <functional>

namespace fs = std::filesystem;

long GetUniqueRunId();

inline bool IsWhitespace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}
std::string Trim(const std::string&);
std::string TrimRight(const std::string&);
bool StartsWith(const std::string& str, const std::string& prefix);
// Split on runs of spaces
std::vector<std::string> SplitCommand(const std::string&);
// Replace every occurrence of each {key}
std::string FormatTemplate(std::string str, const std::vector<std::pair<std::string, std::string>>& vars);

// Undecodable bytes become U+FFFD
std::string SanitizeUtf8(const std::string&);
// Keep at most max_len bytes and note the truncation
std::string TruncateMessage(const std::string&, size_t max_len);

// Accepts both the standard and the URL-safe alphabet
std::string Base64Decode(const std::string&);

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);

class TempDirectory { // RAII tempdir
  fs::path path_;
 public:
  explicit TempDirectory(const fs::path& root);
  ~TempDirectory();
  TempDirectory(const TempDirectory&) = delete;
  TempDirectory& operator=(const TempDirectory&) = delete;

  const fs::path& Path() const { return path_; }
  bool Valid() const { return !path_.empty(); }
};

// Runs func(0..n-1) on at most max_parallel threads and returns when all are done.
//   func must not throw; exceptions are logged and the index is left unfinished.
void ParallelFor(size_t n, int max_parallel, const std::function<void(size_t)>& func);

#endif  // CODEGRADE_UTILS_H_
