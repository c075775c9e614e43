// Repository: MediaMirror
// Component: Live Terminal Renderer Implementation
// Purpose: Full-screen refresh loop on an interactive terminal.
// Copyright (c) 2026 MediaMirror

#include "mediamirror/dashboard/LiveTerminalRenderer.hpp"

#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>

namespace mediamirror::dashboard {

using mediamirror::util::Logger;
using mediamirror::util::LogLevel;

namespace {

constexpr const char kEnterScreen[] = "\x1b[?1049h\x1b[?25l";
constexpr const char kLeaveScreen[] = "\x1b[?25h\x1b[?1049l";

// =============================================================================
// Signal-time restore. One live view per process.
// =============================================================================

termios g_signal_termios;
int g_signal_tty_fd = -1;
int g_signal_out_fd = -1;
volatile sig_atomic_t g_signal_armed = 0;
struct sigaction g_prev_sigint;
struct sigaction g_prev_sigterm;

void RestoreOnSignal(int signum) {
  if (g_signal_armed) {
    tcsetattr(g_signal_tty_fd, TCSANOW, &g_signal_termios);
    ssize_t ignored = write(g_signal_out_fd, kLeaveScreen, sizeof(kLeaveScreen) - 1);
    (void)ignored;
    g_signal_armed = 0;
  }
  signal(signum, SIG_DFL);
  raise(signum);
}

void ArmSignalRestore(int tty_fd, int out_fd, const termios& saved) {
  g_signal_termios = saved;
  g_signal_tty_fd = tty_fd;
  g_signal_out_fd = out_fd;
  g_signal_armed = 1;

  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = RestoreOnSignal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, &g_prev_sigint);
  sigaction(SIGTERM, &sa, &g_prev_sigterm);
}

void DisarmSignalRestore() {
  g_signal_armed = 0;
  sigaction(SIGINT, &g_prev_sigint, nullptr);
  sigaction(SIGTERM, &g_prev_sigterm, nullptr);
}

// Cuts to `cols` bytes without splitting a UTF-8 sequence.
std::string Truncate(const std::string& line, size_t cols) {
  if (line.size() <= cols) return line;
  size_t cut = cols;
  while (cut > 0 && (static_cast<unsigned char>(line[cut]) & 0xC0) == 0x80) --cut;
  return line.substr(0, cut);
}

}  // namespace

LiveTerminalRenderer::LiveTerminalRenderer(int input_fd, int output_fd)
    : input_fd_(input_fd), output_fd_(output_fd) {
  EnterTerminal();
  thread_ = std::thread(&LiveTerminalRenderer::RenderLoop, this);
}

LiveTerminalRenderer::~LiveTerminalRenderer() {
  StopAndRestore();
  ReplayLog();
}

bool LiveTerminalRenderer::IsInteractive(int input_fd, int output_fd) {
  return isatty(input_fd) == 1 && isatty(output_fd) == 1;
}

// =============================================================================
// Terminal ownership
// =============================================================================

void LiveTerminalRenderer::EnterTerminal() {
  if (tcgetattr(input_fd_, &saved_termios_) != 0) {
    throw std::runtime_error(std::string("LiveTerminalRenderer: tcgetattr failed: ") +
                             std::strerror(errno));
  }
  termios raw = saved_termios_;
  raw.c_lflag &= ~(ICANON | ECHO);
  raw.c_cc[VMIN] = 0;
  raw.c_cc[VTIME] = 0;
  if (tcsetattr(input_fd_, TCSANOW, &raw) != 0) {
    throw std::runtime_error(std::string("LiveTerminalRenderer: tcsetattr failed: ") +
                             std::strerror(errno));
  }
  terminal_active_ = true;
  ArmSignalRestore(input_fd_, output_fd_, saved_termios_);
  WriteAll(kEnterScreen);

  Logger::SetRedirect([this](LogLevel level, const std::string& line) {
    AppendLog(level, line);
  });
}

void LiveTerminalRenderer::RestoreTerminal() {
  if (!terminal_active_) return;
  Logger::SetRedirect(nullptr);
  DisarmSignalRestore();
  WriteAll(kLeaveScreen);
  tcsetattr(input_fd_, TCSANOW, &saved_termios_);
  terminal_active_ = false;
}

void LiveTerminalRenderer::WriteAll(const std::string& data) {
  size_t off = 0;
  while (off < data.size()) {
    const ssize_t n = write(output_fd_, data.data() + off, data.size() - off);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return;  // terminal gone; nothing left to draw on
    off += static_cast<size_t>(n);
  }
}

// =============================================================================
// Producer side
// =============================================================================

void LiveTerminalRenderer::Present(const DashboardView& view) {
  std::lock_guard<std::mutex> lock(mutex_);
  back_ = view;
  dirty_ = true;
}

void LiveTerminalRenderer::AppendLog(LogLevel level, const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  log_lines_.push_back({level, line});
  while (log_lines_.size() > kMaxLogLines) log_lines_.pop_front();
  dirty_ = true;
}

void LiveTerminalRenderer::Finish(const DashboardView& final_view) {
  Present(final_view);
  StopAndRestore();
  ReplayLog();
  Logger::Info("[Progress] FINISHED " + FormatProgressLine(final_view));
}

void LiveTerminalRenderer::StopAndRestore() {
  stop_.store(true);
  if (thread_.joinable()) thread_.join();
  RestoreTerminal();
}

// Runs with the redirect removed, so each line reaches the console once.
void LiveTerminalRenderer::ReplayLog() {
  std::deque<LogEntry> replay;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    replay.swap(log_lines_);
  }
  for (const auto& entry : replay) {
    switch (entry.level) {
      case LogLevel::kDebug:
        Logger::Debug(entry.text);
        break;
      case LogLevel::kInfo:
        Logger::Info(entry.text);
        break;
      case LogLevel::kWarn:
        Logger::Warn(entry.text);
        break;
      case LogLevel::kError:
        Logger::Error(entry.text);
        break;
    }
  }
}

// =============================================================================
// Render thread
// =============================================================================

std::vector<std::string> LiveTerminalRenderer::ComposeLines(
    const DashboardView& view, const std::deque<LogEntry>& log_lines) {
  std::vector<std::string> lines;
  lines.reserve(view.workers.size() + log_lines.size() + 4);
  lines.push_back("MediaMirror " + FormatProgressLine(view));
  lines.emplace_back();
  for (auto& w : FormatWorkerLines(view)) lines.push_back(std::move(w));
  if (!log_lines.empty()) {
    lines.emplace_back();
    lines.push_back("Log:");
    for (const auto& entry : log_lines) lines.push_back("  " + entry.text);
  }
  return lines;
}

void LiveTerminalRenderer::RenderLoop() {
  std::vector<std::string> lines;
  size_t rows = 24;
  size_t cols = 80;
  bool input_open = true;
  bool need_draw = true;

  while (!stop_.load()) {
    if (input_open) {
      pollfd pfd{input_fd_, POLLIN, 0};
      const int r = poll(&pfd, 1, static_cast<int>(kFrameInterval.count()));
      if (r > 0 && (pfd.revents & POLLIN)) {
        char buf[64];
        const ssize_t n = read(input_fd_, buf, sizeof(buf));
        if (n > 0) {
          for (ScrollKey key : decoder_.Feed(buf, static_cast<size_t>(n))) {
            viewport_.Apply(key);
          }
          need_draw = true;
        }
      } else if (r > 0 && (pfd.revents & (POLLHUP | POLLERR | POLLNVAL))) {
        input_open = false;
      }
    } else {
      std::this_thread::sleep_for(kFrameInterval);
    }

    winsize ws{};
    if (ioctl(output_fd_, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 1 && ws.ws_col > 0) {
      if (ws.ws_row != rows || ws.ws_col != cols) {
        rows = ws.ws_row;
        cols = ws.ws_col;
        need_draw = true;
      }
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (dirty_) {
        lines = ComposeLines(back_, log_lines_);
        dirty_ = false;
        need_draw = true;
      }
    }

    if (need_draw) {
      viewport_.SetViewHeight(rows - 1);
      viewport_.SetContentHeight(lines.size());
      Draw(lines, rows, cols);
      need_draw = false;
    }
  }
}

void LiveTerminalRenderer::Draw(const std::vector<std::string>& lines, size_t rows,
                                size_t cols) {
  std::string frame = "\x1b[H";
  const size_t body_rows = rows - 1;
  size_t drawn = 0;
  for (size_t i = viewport_.Offset(); i < viewport_.End(); ++i, ++drawn) {
    frame += Truncate(lines[i], cols);
    frame += "\x1b[K\r\n";
  }
  for (; drawn < body_rows; ++drawn) frame += "\x1b[K\r\n";

  std::string status = " lines " + std::to_string(lines.empty() ? 0 : viewport_.Offset() + 1) +
                       "-" + std::to_string(viewport_.End()) + " of " +
                       std::to_string(lines.size()) +
                       " | up/down k/j  pgup/pgdn  home/end" +
                       (viewport_.FollowingTail() ? "  [follow]" : "");
  frame += "\x1b[7m" + Truncate(status, cols) + "\x1b[K\x1b[0m";
  WriteAll(frame);
}

}  // namespace mediamirror::dashboard
