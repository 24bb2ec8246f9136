#pragma once
#include <sys/types.h>

#include <chrono>
#include <string>
#include <vector>

struct ProcessResult {
  int exit_code{-1};    // 127 when the program could not be executed
  int term_signal{0};   // non-zero when killed by a signal
  std::string error;    // set when fork/wait itself failed

  bool ok() const { return error.empty() && term_signal == 0 && exit_code == 0; }
  std::string describe() const;
};

// Runs argv[0] with the given arguments and waits for it. stdout/stderr are inherited
// unless `quiet` is set, in which case they go to /dev/null.
ProcessResult run_process(const std::vector<std::string>& argv, bool quiet = false);

// Long-running child (camera preview). Terminated on destruction.
class ChildProcess {
public:
  ChildProcess() = default;
  ~ChildProcess();
  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  // Throws std::runtime_error if fork fails.
  void spawn(const std::vector<std::string>& argv);
  bool running();
  // SIGTERM, wait up to `grace`, then SIGKILL. Returns true if it exited within `grace`.
  bool terminate(std::chrono::milliseconds grace);
  pid_t pid() const { return pid_; }

private:
  bool reap(bool block);

  pid_t pid_{-1};
};
