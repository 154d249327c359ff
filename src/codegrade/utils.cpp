#include "utils.h"

#include <stdlib.h>
#include <cstring>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>
#include <fstream>

#include <spdlog/spdlog.h>
#include <codegrade/language.h>
#include <codegrade/execution.h>

namespace {

std::atomic_long run_id_seq = 0;

unsigned char Base64CharToValue(const unsigned char chr) {
  if      (chr >= 'A' && chr <= 'Z') return chr - 'A';
  else if (chr >= 'a' && chr <= 'z') return chr - 'a' + ('Z' - 'A')               + 1;
  else if (chr >= '0' && chr <= '9') return chr - '0' + ('Z' - 'A') + ('z' - 'a') + 2;
  else if (chr == '+' || chr == '-') return 62;
  else if (chr == '/' || chr == '_') return 63;
  return 0;
}

bool IsBase64Char(const unsigned char chr) {
  return (chr >= 'A' && chr <= 'Z') || (chr >= 'a' && chr <= 'z') || (chr >= '0' && chr <= '9') ||
      chr == '+' || chr == '-' || chr == '/' || chr == '_';
}

// Length of the valid UTF-8 sequence starting at str[i], 0 if invalid
size_t Utf8SequenceLength(const std::string& str, size_t i) {
  auto byte = [&](size_t k) { return static_cast<unsigned char>(str[k]); };
  auto cont = [&](size_t k) { return k < str.size() && (byte(k) & 0xc0) == 0x80; };
  unsigned char c = byte(i);
  if (c < 0x80) return 1;
  if (c >= 0xc2 && c <= 0xdf) return cont(i + 1) ? 2 : 0;
  if (c >= 0xe0 && c <= 0xef) {
    if (!cont(i + 1) || !cont(i + 2)) return 0;
    if (c == 0xe0 && byte(i + 1) < 0xa0) return 0; // overlong
    if (c == 0xed && byte(i + 1) >= 0xa0) return 0; // surrogates
    return 3;
  }
  if (c >= 0xf0 && c <= 0xf4) {
    if (!cont(i + 1) || !cont(i + 2) || !cont(i + 3)) return 0;
    if (c == 0xf0 && byte(i + 1) < 0x90) return 0;
    if (c == 0xf4 && byte(i + 1) >= 0x90) return 0;
    return 4;
  }
  return 0;
}

} // namespace

long GetUniqueRunId() {
  return ++run_id_seq;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;
#define X_RETURN_ARG4(cls, x, y, z, w, ...) case cls::x: return w;

#define X(...) X_RETURN_ARG2(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageName, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG2(ErrorKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ErrorKindAbr, ErrorKind, ENUM_ERROR_KIND_)
#undef X

#define X(...) X_RETURN_ARG3(ErrorKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ErrorKindName, ErrorKind, ENUM_ERROR_KIND_)
#undef X

#define X(...) X_RETURN_ARG4(ErrorKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ErrorKindDesc, ErrorKind, ENUM_ERROR_KIND_)
#undef X

#define X(...) X_RETURN_ARG2(MatchType, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* MatchTypeName, MatchType, ENUM_MATCH_TYPE_)
#undef X

#define X(...) X_RETURN_ARG3(MatchType, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* MatchTypeDesc, MatchType, ENUM_MATCH_TYPE_)
#undef X

static const char* kBackendNameTable[] = {
#define X(name, str) str,
  ENUM_BACKEND_
#undef X
};

const char* BackendName(Backend backend) {
  return kBackendNameTable[(int)backend];
}

std::optional<Backend> GetBackend(const std::string& str) {
  for (size_t i = 0; i < sizeof(kBackendNameTable) / sizeof(kBackendNameTable[0]); i++) {
    if (str == kBackendNameTable[i]) return (Backend)i;
  }
  return std::nullopt;
}

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3
#undef X_RETURN_ARG4

std::string Trim(const std::string& str) {
  size_t start = 0, end = str.size();
  while (start < end && IsWhitespace(str[start])) start++;
  while (end > start && IsWhitespace(str[end - 1])) end--;
  return str.substr(start, end - start);
}

std::string TrimRight(const std::string& str) {
  size_t end = str.size();
  while (end > 0 && IsWhitespace(str[end - 1])) end--;
  return str.substr(0, end);
}

bool StartsWith(const std::string& str, const std::string& prefix) {
  return str.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> SplitCommand(const std::string& str) {
  std::vector<std::string> ret;
  size_t pos = 0;
  while (true) {
    pos = str.find_first_not_of(' ', pos);
    if (pos == std::string::npos) break;
    size_t end = str.find(' ', pos);
    if (end == std::string::npos) end = str.size();
    ret.push_back(str.substr(pos, end - pos));
    pos = end;
  }
  return ret;
}

std::string FormatTemplate(std::string str, const std::vector<std::pair<std::string, std::string>>& vars) {
  for (auto& [key, value] : vars) {
    const std::string pattern = "{" + key + "}";
    for (size_t pos = 0; (pos = str.find(pattern, pos)) != std::string::npos; pos += value.size()) {
      str.replace(pos, pattern.size(), value);
    }
  }
  return str;
}

std::string SanitizeUtf8(const std::string& str) {
  std::string ret;
  ret.reserve(str.size());
  for (size_t i = 0; i < str.size();) {
    size_t len = Utf8SequenceLength(str, i);
    if (len) {
      ret.append(str, i, len);
      i += len;
    } else {
      ret += "\xef\xbf\xbd";
      i++;
    }
  }
  return ret;
}

std::string TruncateMessage(const std::string& str, size_t max_len) {
  if (str.size() <= max_len) return str;
  return str.substr(0, max_len) + "\n[message truncated after " + std::to_string(max_len) + " bytes]";
}

std::string Base64Decode(const std::string& str) {
  std::string in;
  in.reserve(str.size());
  for (char c : str) {
    if (IsBase64Char(c)) in.push_back(c);
  }
  std::string ret;
  ret.reserve(in.size() / 4 * 3 + 2);
  size_t i = 0;
  for (; i + 4 <= in.size(); i += 4) {
    unsigned char v[4] = {
      Base64CharToValue(in[i]),
      Base64CharToValue(in[i+1]),
      Base64CharToValue(in[i+2]),
      Base64CharToValue(in[i+3])
    };
    ret.push_back(static_cast<char>((v[0] << 2) | (v[1] & 0x30) >> 4));
    ret.push_back(static_cast<char>((v[1] & 0x0f) << 4 | (v[2] & 0x3c) >> 2));
    ret.push_back(static_cast<char>((v[2] & 0x03) << 6 | v[3]));
  }
  // padding was stripped above
  if (i + 1 >= in.size()) return ret;
  unsigned char v[3] = {Base64CharToValue(in[i]), Base64CharToValue(in[i+1])};
  ret.push_back(static_cast<char>((v[0] << 2) | (v[1] & 0x30) >> 4));
  if (i + 2 >= in.size()) return ret;
  v[2] = Base64CharToValue(in[i+2]);
  ret.push_back(static_cast<char>((v[1] & 0x0f) << 4 | (v[2] & 0x3c) >> 2));
  return ret;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  {
    std::ofstream fout(path, std::ios::binary);
    if (!fout || !fout.write(content.data(), content.size())) {
      spdlog::warn("Failed writing {}", path.c_str());
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  std::error_code ec;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permission of {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

TempDirectory::TempDirectory(const fs::path& root) {
  if (!CreateDirs(root)) return;
  std::string tmpl = (root / ("run" + std::to_string(GetUniqueRunId()) + ".XXXXXX")).string();
  char* res = mkdtemp(tmpl.data());
  if (res) {
    path_ = res;
  } else {
    spdlog::warn("Failed creating temporary directory under {}: {}", root.c_str(), strerror(errno));
  }
}

TempDirectory::~TempDirectory() {
  if (!path_.empty()) RemoveAll(path_);
}

void ParallelFor(size_t n, int max_parallel, const std::function<void(size_t)>& func) {
  if (n == 0) return;
  size_t workers = std::min(n, (size_t)std::max(max_parallel, 1));
  std::mutex mtx;
  size_t next = 0;
  auto worker = [&]() {
    while (true) {
      size_t idx;
      {
        std::lock_guard<std::mutex> lck(mtx);
        if (next >= n) return;
        idx = next++;
      }
      try {
        func(idx);
      } catch (const std::exception& e) {
        spdlog::error("Work unit {} aborted: {}", idx, e.what());
      }
    }
  };
  if (workers == 1) {
    worker();
    return;
  }
  std::vector<std::thread> threads;
  for (size_t i = 0; i < workers; i++) threads.emplace_back(worker);
  for (auto& i : threads) i.join();
}
