#include "subprocess.hpp"

#include <fcntl.h>
#include <signal.h>
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>

namespace {

pid_t spawn_child(const std::vector<std::string>& argv, bool quiet) {
  if (argv.empty()) return -1;

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
  args.push_back(nullptr);

  pid_t pid = fork();
  if (pid == 0) {
    if (quiet) {
      int devnull = ::open("/dev/null", O_WRONLY);
      if (devnull >= 0) {
        ::dup2(devnull, STDOUT_FILENO);
        ::dup2(devnull, STDERR_FILENO);
        ::close(devnull);
      }
    }
    execvp(args[0], args.data());
    _exit(127);
  }
  return pid;
}

void fill_status(ProcessResult& r, int status) {
  if (WIFEXITED(status)) {
    r.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    r.term_signal = WTERMSIG(status);
  }
}

}  // namespace

std::string ProcessResult::describe() const {
  if (!error.empty()) return error;
  if (term_signal != 0) return "killed by signal " + std::to_string(term_signal);
  if (exit_code == 127) return "command could not be executed (exit code 127)";
  return "exit code " + std::to_string(exit_code);
}

ProcessResult run_process(const std::vector<std::string>& argv, bool quiet) {
  ProcessResult r;
  if (argv.empty()) {
    r.error = "empty command line";
    return r;
  }
  pid_t pid = spawn_child(argv, quiet);
  if (pid < 0) {
    r.error = std::string("fork failed: ") + std::strerror(errno);
    return r;
  }
  int status = 0;
  pid_t w;
  do {
    w = ::waitpid(pid, &status, 0);
  } while (w < 0 && errno == EINTR);
  if (w < 0) {
    r.error = std::string("waitpid failed: ") + std::strerror(errno);
    return r;
  }
  fill_status(r, status);
  return r;
}

ChildProcess::~ChildProcess() {
  if (pid_ > 0) terminate(std::chrono::milliseconds(2000));
}

void ChildProcess::spawn(const std::vector<std::string>& argv) {
  if (running()) return;
  pid_t pid = spawn_child(argv, false);
  if (pid < 0) {
    throw std::runtime_error(std::string("Failed to start ") +
                             (argv.empty() ? "<empty>" : argv.front()) + ": " +
                             std::strerror(errno));
  }
  pid_ = pid;
}

bool ChildProcess::reap(bool block) {
  if (pid_ <= 0) return true;
  int status = 0;
  pid_t w = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
  if (w == pid_ || (w < 0 && errno == ECHILD)) {
    pid_ = -1;
    return true;
  }
  return false;
}

bool ChildProcess::running() { return pid_ > 0 && !reap(false); }

bool ChildProcess::terminate(std::chrono::milliseconds grace) {
  if (!running()) return true;

  ::kill(pid_, SIGTERM);
  const auto deadline = std::chrono::steady_clock::now() + grace;
  while (std::chrono::steady_clock::now() < deadline) {
    if (reap(false)) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  spdlog::warn("Process {} did not exit within {}ms, sending SIGKILL", pid_, grace.count());
  ::kill(pid_, SIGKILL);
  reap(true);
  return false;
}
