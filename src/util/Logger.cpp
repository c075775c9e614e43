// Repository: MediaMirror
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission with no multi-thread interleave.
// Copyright (c) 2026 MediaMirror

#include "mediamirror/util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace mediamirror::util {

std::mutex Logger::mutex_;
Logger::Sink Logger::redirect_;
std::function<void(const std::string&)> Logger::error_sink_;

const char* LogLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

bool Logger::DebugEnabled() {
  return std::getenv("MEDIAMIRROR_DEBUG") != nullptr;
}

void Logger::SetRedirect(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  redirect_ = std::move(sink);
}

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::Info(const std::string& line) { Emit(LogLevel::kInfo, line); }

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  Emit(LogLevel::kDebug, line);
}

void Logger::Warn(const std::string& line) { Emit(LogLevel::kWarn, line); }

void Logger::Error(const std::string& line) { Emit(LogLevel::kError, line); }

void Logger::Emit(LogLevel level, const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (level == LogLevel::kError && error_sink_) {
    error_sink_(line);
  }
  if (redirect_) {
    redirect_(level, line);
    return;
  }
  std::ostream& out =
      (level == LogLevel::kWarn || level == LogLevel::kError) ? std::cerr : std::cout;
  out << line << '\n';
  out.flush();
}

}  // namespace mediamirror::util
