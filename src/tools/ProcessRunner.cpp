// Repository: MediaMirror
// Component: Process Runner Implementation
// Purpose: fork/exec of external tools with a bounded tail of their output.
// Copyright (c) 2026 MediaMirror

#include "mediamirror/tools/ProcessRunner.hpp"

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace mediamirror::tools {

ProcessRunner::ProcessRunner(size_t tail_bytes) : tail_bytes_(tail_bytes) {}

ProcessResult ProcessRunner::Run(const std::vector<std::string>& argv,
                                 const LineFn& on_line) const {
  ProcessResult result;
  if (argv.empty()) {
    result.error = "empty command line";
    return result;
  }

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    cargv.push_back(const_cast<char*>(arg.c_str()));
  }
  cargv.push_back(nullptr);

  int fds[2];
  if (pipe2(fds, O_CLOEXEC) != 0) {
    result.error = std::string("pipe2 failed: ") + std::strerror(errno);
    return result;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    result.error = std::string("fork failed: ") + std::strerror(errno);
    close(fds[0]);
    close(fds[1]);
    return result;
  }

  if (pid == 0) {
    // Child: only async-signal-safe calls until exec.
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) dup2(devnull, STDIN_FILENO);
    dup2(fds[1], STDOUT_FILENO);
    dup2(fds[1], STDERR_FILENO);
    execvp(cargv[0], cargv.data());
    const char msg[] = "exec failed\n";
    ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    _exit(kExecFailedExitCode);
  }

  result.started = true;
  close(fds[1]);

  std::string line;
  char buf[4096];
  while (true) {
    const ssize_t n = read(fds[0], buf, sizeof(buf));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;

    result.output_tail.append(buf, static_cast<size_t>(n));
    if (result.output_tail.size() > tail_bytes_) {
      result.output_tail.erase(0, result.output_tail.size() - tail_bytes_);
    }
    for (ssize_t i = 0; i < n; ++i) {
      const char c = buf[i];
      if (c == '\r' || c == '\n') {
        if (!line.empty() && on_line) on_line(line);
        line.clear();
      } else {
        line.push_back(c);
      }
    }
  }
  if (!line.empty() && on_line) on_line(line);
  close(fds[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      result.error = std::string("waitpid failed: ") + std::strerror(errno);
      return result;
    }
  }
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
  }
  return result;
}

std::string DescribeProcessResult(const ProcessResult& result) {
  if (!result.started) return "not started: " + result.error;
  if (!result.error.empty()) return result.error;
  if (result.term_signal != 0) return "signal=" + std::to_string(result.term_signal);
  if (result.exit_code == kExecFailedExitCode) return "exec failed (exit=127)";
  return "exit=" + std::to_string(result.exit_code);
}

}  // namespace mediamirror::tools
