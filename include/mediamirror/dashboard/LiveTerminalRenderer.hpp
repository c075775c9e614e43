// Repository: MediaMirror
// Component: Live Terminal Renderer
// Purpose: Full-screen, scrollable live view of the run.
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_DASHBOARD_LIVE_TERMINAL_RENDERER_HPP_
#define MEDIAMIRROR_DASHBOARD_LIVE_TERMINAL_RENDERER_HPP_

#include <termios.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "mediamirror/dashboard/IDashboardRenderer.hpp"
#include "mediamirror/dashboard/KeyDecoder.hpp"
#include "mediamirror/dashboard/ScrollViewport.hpp"
#include "mediamirror/util/Logger.hpp"

namespace mediamirror::dashboard {

// LiveTerminalRenderer owns the terminal for the duration of the run:
//
//   - alternate screen, hidden cursor, stdin in non-canonical no-echo mode
//   - Present() only swaps the view into a back buffer under the mutex;
//     the render thread copies it out and draws, so the producer never
//     waits on terminal writes
//   - Logger output is redirected into a bounded log pane below the
//     worker rows, so log lines never tear the screen
//   - arrow keys, PgUp/PgDn, Home/End (and k/j, b/space, g/G) scroll
//
// Log lines captured while the view was up are replayed to the console
// once the terminal is restored, whether by Finish() or by the destructor
// (a run that stops at setup never reaches Finish()).
//
// The terminal is restored in Finish(), in the destructor, and on SIGINT /
// SIGTERM (the handler restores and then re-raises with the default action).
class LiveTerminalRenderer : public IDashboardRenderer {
 public:
  static constexpr size_t kMaxLogLines = 500;
  static constexpr std::chrono::milliseconds kFrameInterval{50};

  struct LogEntry {
    util::LogLevel level;
    std::string text;
  };

  LiveTerminalRenderer(int input_fd, int output_fd);
  ~LiveTerminalRenderer() override;

  LiveTerminalRenderer(const LiveTerminalRenderer&) = delete;
  LiveTerminalRenderer& operator=(const LiveTerminalRenderer&) = delete;

  void Present(const DashboardView& view) override;
  void Finish(const DashboardView& final_view) override;

  // Both fds are terminals.
  static bool IsInteractive(int input_fd, int output_fd);

  // Lines of one frame, before viewport slicing. Exposed for tests.
  static std::vector<std::string> ComposeLines(const DashboardView& view,
                                               const std::deque<LogEntry>& log_lines);

 private:
  void EnterTerminal();
  void RestoreTerminal();
  void StopAndRestore();
  void ReplayLog();
  void RenderLoop();
  void Draw(const std::vector<std::string>& lines, size_t rows, size_t cols);
  void WriteAll(const std::string& data);
  void AppendLog(util::LogLevel level, const std::string& line);

  const int input_fd_;
  const int output_fd_;

  std::mutex mutex_;
  DashboardView back_;               // guarded by mutex_
  std::deque<LogEntry> log_lines_;   // guarded by mutex_
  bool dirty_ = false;               // guarded by mutex_

  // Render-thread state.
  ScrollViewport viewport_;
  KeyDecoder decoder_;

  termios saved_termios_{};
  bool terminal_active_ = false;
  std::atomic<bool> stop_{false};
  std::thread thread_;
};

}  // namespace mediamirror::dashboard

#endif  // MEDIAMIRROR_DASHBOARD_LIVE_TERMINAL_RENDERER_HPP_
