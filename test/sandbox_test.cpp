#include <signal.h>
#include <cerrno>
#include <chrono>
#include <vector>

#include <gtest/gtest.h>

#include "codegrade/sandbox.h"

namespace {

SandboxOptions Shell(const std::string& script) {
  SandboxOptions opt;
  opt.command = {"sh", "-c", script};
  opt.preserve_env = true;
  opt.sample_interval = 20'000;
  return opt;
}

} // namespace

TEST(Sandbox, Output) {
  SandboxResult res = SandboxExec(Shell("echo hello; echo oops >&2; sleep 0.1"));
  EXPECT_EQ(res.spawn_error, 0);
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_FALSE(res.signaled);
  EXPECT_FALSE(res.timekill);
  EXPECT_FALSE(res.oomkill);
  EXPECT_EQ(res.output, "hello\n");
  EXPECT_EQ(res.error, "oops\n");
  EXPECT_GT(res.max_rss, 0);
}

TEST(Sandbox, Input) {
  SandboxOptions opt;
  opt.command = {"cat"};
  opt.input = std::string(200000, 'x') + "\nend";
  SandboxResult res = SandboxExec(opt);
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_EQ(res.output, opt.input);
}

TEST(Sandbox, ExitCode) {
  SandboxResult res = SandboxExec(Shell("exit 3"));
  EXPECT_EQ(res.exit_code, 3);
  EXPECT_FALSE(res.signaled);
}

TEST(Sandbox, Signal) {
  SandboxResult res = SandboxExec(Shell("kill -SEGV $$"));
  EXPECT_TRUE(res.signaled);
  EXPECT_EQ(res.signal, SIGSEGV);
}

TEST(Sandbox, Workdir) {
  SandboxOptions opt = Shell("pwd");
  opt.workdir = "/";
  EXPECT_EQ(SandboxExec(opt).output, "/\n");
}

TEST(Sandbox, Timeout) {
  SandboxOptions opt = Shell("sleep 10");
  opt.wall_time = 300'000;
  SandboxResult res = SandboxExec(opt);
  EXPECT_TRUE(res.timekill);
  EXPECT_TRUE(res.signaled);
  EXPECT_GE(res.time, 300'000);
  EXPECT_LT(res.time, 2'000'000);
}

TEST(Sandbox, TimeoutKillsProcessGroup) {
  // the background sleep keeps stdout open; it must die with the group
  SandboxOptions opt = Shell("sleep 10 & sleep 10");
  opt.wall_time = 300'000;
  auto start = std::chrono::steady_clock::now();
  SandboxResult res = SandboxExec(opt);
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_TRUE(res.timekill);
  EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST(Sandbox, SpawnError) {
  SandboxOptions opt;
  opt.command = {"/nonexistent/codegrade-binary"};
  SandboxResult res = SandboxExec(opt);
  EXPECT_EQ(res.spawn_error, ENOENT);

  SandboxOptions workdir = Shell("true");
  workdir.workdir = "/nonexistent/codegrade-dir";
  EXPECT_EQ(SandboxExec(workdir).spawn_error, ENOENT);

  EXPECT_EQ(SandboxExec(SandboxOptions()).spawn_error, EINVAL);
}

TEST(Sandbox, OutputLimit) {
  SandboxOptions opt = Shell("head -c 100000 /dev/zero");
  opt.max_output = 1000;
  SandboxResult res = SandboxExec(opt);
  EXPECT_EQ(res.output.size(), 1000u);
  EXPECT_TRUE(res.output_truncated);
}

TEST(Sandbox, MemoryLimit) {
  SandboxOptions opt;
  opt.command = {"python3", "-c", "import time\nx = b'x' * (400 << 20)\ntime.sleep(5)"};
  opt.preserve_env = true;
  opt.rss = 64 * 1024;
  opt.wall_time = 10'000'000;
  opt.sample_interval = 20'000;
  SandboxResult res = SandboxExec(opt);
  EXPECT_TRUE(res.oomkill);
  EXPECT_FALSE(res.timekill);
  EXPECT_GT(res.max_rss, 64 * 1024);
}

TEST(Sandbox, HostMemoryNotCounted) {
  std::vector<char> host(200 << 20);
  for (size_t i = 0; i < host.size(); i += 4096) host[i] = 1;
  SandboxOptions opt = Shell("sleep 0.1");
  opt.rss = 64 * 1024;
  SandboxResult res = SandboxExec(opt);
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_FALSE(res.oomkill);
  EXPECT_LT(res.max_rss, 32 * 1024);
  EXPECT_EQ(host[4096], 1);
}
