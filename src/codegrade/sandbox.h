#ifndef CODEGRADE_SANDBOX_H_
#define CODEGRADE_SANDBOX_H_

#include <string>
#include <vector>

class SandboxOptions {
 public:
  std::vector<std::string> command; // argv; command[0] is searched in PATH
  bool preserve_env; // otherwise only envs
  std::vector<std::string> envs;
  std::string workdir;
  std::string input; // fed to stdin
  long wall_time; // us; 0 for unlimited
  long rss; // KiB; 0 for unlimited
  long fsize; // KiB; 0 for unlimited
  size_t max_output; // bytes kept of stdout and of stderr
  long sample_interval; // us between two resident memory samples

  SandboxOptions() :
      preserve_env(false),
      wall_time(0),
      rss(0),
      fsize(0),
      max_output(1 << 20),
      sample_interval(100'000) {}
};

struct SandboxResult {
  // spawn_error != 0 (an errno value) means the command never ran;
  //   no other field except time is meaningful then
  int spawn_error = 0;
  bool timekill = false;
  bool oomkill = false;
  bool signaled = false;
  int exit_code = 0;
  int signal = 0;
  long time = 0; // us, from fork to exit
  long max_rss = 0; // KiB
  std::string output, error;
  bool output_truncated = false;
};

// Runs the command in its own process group, killing the whole group on
//   wall-time or resident-memory overrun. Never throws.
SandboxResult SandboxExec(const SandboxOptions&);

#endif  // CODEGRADE_SANDBOX_H_
