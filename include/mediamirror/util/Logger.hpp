// Repository: MediaMirror
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission with no multi-thread interleave.
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_UTIL_LOGGER_HPP_
#define MEDIAMIRROR_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace mediamirror::util {

enum class LogLevel { kDebug, kInfo, kWarn, kError };

const char* LogLevelToString(LogLevel level);

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from concurrent threads never interleave
// (producer loop, worker threads, live-view render thread).
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when MEDIAMIRROR_DEBUG env is set
// Warn  → stderr (degraded but recoverable conditions)
// Error → stderr (failed files, setup errors)
//
// SetRedirect installs a sink that receives every line INSTEAD of the
// console. The live terminal view uses it so log output lands in its log
// pane rather than tearing the screen. Call with nullptr to restore.
//
// Test-only: SetErrorSink installs a callback invoked for every Error() line
// (in addition to console or redirect).
class Logger {
 public:
  using Sink = std::function<void(LogLevel, const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static bool DebugEnabled();

  static void SetRedirect(Sink sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static void Emit(LogLevel level, const std::string& line);

  static std::mutex mutex_;
  static Sink redirect_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace mediamirror::util

#endif  // MEDIAMIRROR_UTIL_LOGGER_HPP_
