// Repository: MediaMirror
// Component: Process Runner
// Purpose: fork/exec of an external tool with its output captured.
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_TOOLS_PROCESS_RUNNER_HPP_
#define MEDIAMIRROR_TOOLS_PROCESS_RUNNER_HPP_

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace mediamirror::tools {

struct ProcessResult {
  bool started = false;     // fork succeeded
  int exit_code = -1;       // valid when the child exited normally
  int term_signal = 0;      // non-zero when the child was killed by a signal
  std::string output_tail;  // last bytes of combined stdout+stderr
  std::string error;        // runner-side failure (pipe, fork)

  bool Succeeded() const { return started && term_signal == 0 && exit_code == 0; }
};

// Exit status the child reports when execvp() fails.
inline constexpr int kExecFailedExitCode = 127;

// ProcessRunner runs one child to completion on the calling thread.
//
// stdout and stderr are merged into one pipe. Output is split on '\r' and
// '\n' (progress meters rewrite their line with '\r') and every non-empty
// line is handed to `on_line`. The pipe is close-on-exec, so children
// spawned concurrently by other workers never inherit it; without that a
// sibling holding the write end would keep this read from ever seeing EOF.
//
// stdin of the child is /dev/null.
class ProcessRunner {
 public:
  using LineFn = std::function<void(const std::string&)>;

  static constexpr size_t kDefaultTailBytes = 4096;

  explicit ProcessRunner(size_t tail_bytes = kDefaultTailBytes);

  ProcessResult Run(const std::vector<std::string>& argv, const LineFn& on_line) const;

 private:
  size_t tail_bytes_;
};

// Human-readable "exit=1" / "signal=9" / "exec failed" summary.
std::string DescribeProcessResult(const ProcessResult& result);

}  // namespace mediamirror::tools

#endif  // MEDIAMIRROR_TOOLS_PROCESS_RUNNER_HPP_
