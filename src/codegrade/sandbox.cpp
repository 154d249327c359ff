#include "sandbox.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <chrono>
#include <cstring>
#include <thread>
#include <mutex>
#include <fstream>
#include <algorithm>
#include <condition_variable>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kPollSliceMs = 10; // exit polling when pidfd is unavailable
constexpr int kDrainTimeoutMs = 200;
constexpr int kMaxReadsPerRound = 16;

class Fd { // RAII file descriptor
  int fd_;
 public:
  explicit Fd(int fd = -1) : fd_(fd) {}
  ~Fd() { Close(); }
  Fd(const Fd&) = delete;
  Fd& operator=(const Fd&) = delete;

  int Get() const { return fd_; }
  bool Valid() const { return fd_ >= 0; }
  void Reset(int fd) {
    Close();
    fd_ = fd;
  }
  void Close() {
    if (fd_ >= 0) close(fd_);
    fd_ = -1;
  }
};

bool MakePipe(Fd& read_end, Fd& write_end) {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) return false;
  read_end.Reset(fds[0]);
  write_end.Reset(fds[1]);
  return true;
}

void SetNonBlock(const Fd& fd) {
  if (!fd.Valid()) return;
  int flags = fcntl(fd.Get(), F_GETFL);
  if (flags >= 0) fcntl(fd.Get(), F_SETFL, flags | O_NONBLOCK);
}

int PidfdOpen(pid_t pid) {
#ifdef SYS_pidfd_open
  return static_cast<int>(syscall(SYS_pidfd_open, pid, 0));
#else
  errno = ENOSYS;
  return -1;
#endif
}

[[noreturn]] void ChildFail(int fd) {
  int err = errno;
  if (write(fd, &err, sizeof(err)) < 0) {}
  _exit(127);
}

// Larger of VmRSS and VmHWM in KiB; 0 once the process is a zombie
long ReadProcessRss(pid_t pid) {
  std::ifstream fin("/proc/" + std::to_string(pid) + "/status");
  std::string line;
  long ret = 0;
  while (std::getline(fin, line)) {
    if (line.compare(0, 6, "VmRSS:") == 0 || line.compare(0, 6, "VmHWM:") == 0) {
      ret = std::max(ret, std::strtol(line.c_str() + 6, nullptr, 10));
    }
  }
  return ret;
}

// Samples the resident memory of an exec'ed process until stopped, killing
//   its process group once the limit is crossed.
class MemoryMonitor {
  pid_t pid_;
  long limit_; // KiB
  std::chrono::microseconds interval_;
  std::mutex mtx_;
  std::condition_variable cv_;
  bool stop_ = false;
  bool exceeded_ = false;
  long peak_ = 0;
  std::thread thread_;

  void Record(long rss) {
    peak_ = std::max(peak_, rss);
    if (limit_ && rss > limit_ && !exceeded_) {
      exceeded_ = true;
      spdlog::debug("Process {} exceeded memory limit: {} > {} KiB", pid_, rss, limit_);
      kill(-pid_, SIGKILL);
    }
  }
  void Run() {
    std::unique_lock<std::mutex> lck(mtx_);
    while (!stop_) {
      lck.unlock();
      long rss = ReadProcessRss(pid_);
      lck.lock();
      Record(rss);
      cv_.wait_for(lck, interval_, [this]() { return stop_; });
    }
  }
 public:
  MemoryMonitor(pid_t pid, long limit, long interval_us) :
      pid_(pid), limit_(limit), interval_(std::max(interval_us, 1000L)),
      thread_(&MemoryMonitor::Run, this) {}
  ~MemoryMonitor() { Stop(); }

  // must be called before the process is reaped; takes a last sample
  void Stop() {
    if (!thread_.joinable()) return;
    long rss = ReadProcessRss(pid_);
    {
      std::lock_guard<std::mutex> lck(mtx_);
      if (!stop_) Record(rss);
      stop_ = true;
    }
    cv_.notify_all();
    thread_.join();
  }
  long Peak() {
    std::lock_guard<std::mutex> lck(mtx_);
    return peak_;
  }
  bool Exceeded() {
    std::lock_guard<std::mutex> lck(mtx_);
    return exceeded_;
  }
};

// Reads what is available; closes fd and returns false at EOF
bool ReadAvailable(Fd& fd, std::string& buf, size_t limit, bool& truncated) {
  char tmp[65536];
  for (int i = 0; i < kMaxReadsPerRound; i++) {
    ssize_t n = read(fd.Get(), tmp, sizeof(tmp));
    if (n > 0) {
      size_t keep = std::min((size_t)n, limit - std::min(limit, buf.size()));
      buf.append(tmp, keep);
      if (keep < (size_t)n) truncated = true;
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && errno == EAGAIN) return true;
    fd.Close();
    return false;
  }
  return true;
}

bool HasExited(pid_t pid) {
  siginfo_t info{};
  if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) < 0) return errno == ECHILD;
  return info.si_pid != 0;
}

} // namespace

SandboxResult SandboxExec(const SandboxOptions& opt) {
  static std::once_flag sigpipe_flag;
  std::call_once(sigpipe_flag, []() { signal(SIGPIPE, SIG_IGN); });

  SandboxResult ret;
  if (opt.command.empty()) {
    ret.spawn_error = EINVAL;
    return ret;
  }
  // everything the child touches is prepared before fork
  std::vector<char*> argv, envp;
  for (auto& i : opt.command) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  for (auto& i : opt.envs) envp.push_back(const_cast<char*>(i.c_str()));
  envp.push_back(nullptr);
  char* const* env = opt.preserve_env ? environ : envp.data();

  Fd in_r, in_w, out_r, out_w, err_r, err_w, exec_r, exec_w;
  if (!MakePipe(in_r, in_w) || !MakePipe(out_r, out_w) ||
      !MakePipe(err_r, err_w) || !MakePipe(exec_r, exec_w)) {
    ret.spawn_error = errno;
    spdlog::warn("SandboxExec error: errno={} {}", errno, strerror(errno));
    return ret;
  }

  spdlog::debug("Sandbox exec workdir={} command={}", opt.workdir, fmt::format("{}", opt.command));
  auto start = Clock::now();
  pid_t pid = fork();
  if (pid < 0) {
    ret.spawn_error = errno;
    spdlog::warn("SandboxExec error: errno={} {}", errno, strerror(errno));
    return ret;
  }
  if (pid == 0) {
    // async-signal-safe calls only
    setpgid(0, 0);
    signal(SIGPIPE, SIG_DFL);
    if (!opt.workdir.empty() && chdir(opt.workdir.c_str()) < 0) ChildFail(exec_w.Get());
    if (dup2(in_r.Get(), 0) < 0 || dup2(out_w.Get(), 1) < 0 || dup2(err_w.Get(), 2) < 0) {
      ChildFail(exec_w.Get());
    }
    struct rlimit no_core = {0, 0};
    setrlimit(RLIMIT_CORE, &no_core);
    if (opt.fsize) {
      struct rlimit fsize = {(rlim_t)opt.fsize * 1024, (rlim_t)opt.fsize * 1024};
      setrlimit(RLIMIT_FSIZE, &fsize);
    }
    execvpe(argv[0], argv.data(), env);
    ChildFail(exec_w.Get());
  }

  setpgid(pid, pid);
  in_r.Close();
  out_w.Close();
  err_w.Close();
  exec_w.Close();
  {
    int child_errno = 0;
    ssize_t n;
    while ((n = read(exec_r.Get(), &child_errno, sizeof(child_errno))) < 0 && errno == EINTR);
    if (n == sizeof(child_errno)) {
      waitpid(pid, nullptr, 0);
      ret.spawn_error = child_errno;
      ret.time = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count();
      spdlog::warn("Failed to execute {}: {}", opt.command[0], strerror(child_errno));
      return ret;
    }
  }

  MemoryMonitor monitor(pid, opt.rss, opt.sample_interval);
  Fd pidfd(PidfdOpen(pid));
  SetNonBlock(in_w);
  SetNonBlock(out_r);
  SetNonBlock(err_r);
  size_t in_pos = 0;
  if (opt.input.empty()) in_w.Close();

  const auto deadline = start + std::chrono::microseconds(opt.wall_time);
  for (bool exited = false; !exited;) {
    int timeout = pidfd.Valid() ? -1 : kPollSliceMs;
    if (opt.wall_time) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
      if (remaining <= 0) {
        spdlog::debug("Process {} exceeded wall time limit", pid);
        ret.timekill = true;
        kill(-pid, SIGKILL);
        break;
      }
      long wait_ms = std::min<long>(remaining + 1, INT_MAX);
      timeout = timeout < 0 ? (int)wait_ms : std::min(timeout, (int)wait_ms);
    }
    struct pollfd fds[4];
    int nfds = 0, in_idx = -1, out_idx = -1, err_idx = -1, pid_idx = -1;
    if (in_w.Valid()) fds[in_idx = nfds++] = {in_w.Get(), POLLOUT, 0};
    if (out_r.Valid()) fds[out_idx = nfds++] = {out_r.Get(), POLLIN, 0};
    if (err_r.Valid()) fds[err_idx = nfds++] = {err_r.Get(), POLLIN, 0};
    if (pidfd.Valid()) fds[pid_idx = nfds++] = {pidfd.Get(), POLLIN, 0};
    if (poll(fds, nfds, timeout) < 0 && errno != EINTR) {
      spdlog::warn("poll error: errno={} {}", errno, strerror(errno));
      kill(-pid, SIGKILL);
      break;
    }
    if (in_idx >= 0 && fds[in_idx].revents) {
      ssize_t n = write(in_w.Get(), opt.input.data() + in_pos, opt.input.size() - in_pos);
      if (n > 0) in_pos += n;
      if (in_pos == opt.input.size() || (n < 0 && errno != EAGAIN && errno != EINTR)) in_w.Close();
    }
    if (out_idx >= 0 && fds[out_idx].revents) {
      ReadAvailable(out_r, ret.output, opt.max_output, ret.output_truncated);
    }
    if (err_idx >= 0 && fds[err_idx].revents) {
      ReadAvailable(err_r, ret.error, opt.max_output, ret.output_truncated);
    }
    if (pid_idx >= 0) {
      exited = fds[pid_idx].revents != 0;
    } else {
      exited = HasExited(pid);
    }
  }
  auto end = Clock::now();
  in_w.Close();
  // leftovers of the process group
  kill(-pid, SIGKILL);

  for (int rounds = 0; (out_r.Valid() || err_r.Valid()) && rounds < 5; rounds++) {
    struct pollfd fds[2];
    int nfds = 0;
    if (out_r.Valid()) fds[nfds++] = {out_r.Get(), POLLIN, 0};
    if (err_r.Valid()) fds[nfds++] = {err_r.Get(), POLLIN, 0};
    if (poll(fds, nfds, kDrainTimeoutMs) <= 0) break;
    if (out_r.Valid()) ReadAvailable(out_r, ret.output, opt.max_output, ret.output_truncated);
    if (err_r.Valid()) ReadAvailable(err_r, ret.error, opt.max_output, ret.output_truncated);
  }

  monitor.Stop();
  int status = 0;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR);

  ret.time = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
  // ru_maxrss would include the pre-exec copy of this process
  ret.max_rss = monitor.Peak();
  ret.oomkill = monitor.Exceeded();
  if (WIFEXITED(status)) {
    ret.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    ret.signaled = true;
    ret.signal = WTERMSIG(status);
  }
  spdlog::debug("Sandbox result pid={} time={}us rss={}KiB exit={} signal={} tle={} mle={}",
      pid, ret.time, ret.max_rss, ret.exit_code, ret.signal, ret.timekill, ret.oomkill);
  return ret;
}
