// Repository: MediaMirror
// Component: Pipeline Types Implementation
// Purpose: String names for pipeline enums and value types.
// Copyright (c) 2026 MediaMirror

#include "mediamirror/pipeline/PipelineTypes.hpp"

#include <sstream>
#include <type_traits>

namespace mediamirror::pipeline {

const char* ErrorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kTranscodeFailure:
      return "TRANSCODE_FAILURE";
    case ErrorKind::kUnhandledFault:
      return "UNHANDLED_FAULT";
  }
  return "UNKNOWN_ERROR";
}

const char* SetupErrorToString(SetupError error) {
  switch (error) {
    case SetupError::kNone:
      return "NONE";
    case SetupError::kInputMissing:
      return "INPUT_MISSING";
    case SetupError::kInputNotDirectory:
      return "INPUT_NOT_DIRECTORY";
    case SetupError::kSameRoots:
      return "SAME_ROOTS";
    case SetupError::kOutputInsideInput:
      return "OUTPUT_INSIDE_INPUT";
    case SetupError::kInputInsideOutput:
      return "INPUT_INSIDE_OUTPUT";
    case SetupError::kOutputNotDirectory:
      return "OUTPUT_NOT_DIRECTORY";
    case SetupError::kFilesystemError:
      return "FILESYSTEM_ERROR";
  }
  return "UNKNOWN_ERROR";
}

std::string FormatErrorRecord(const ErrorRecord& record) {
  std::ostringstream oss;
  oss << ErrorKindToString(record.kind) << "\n"
      << "  input:  " << record.input_path.string() << "\n"
      << "  output: " << record.output_path.string();
  if (!record.details.empty()) {
    std::istringstream lines(record.details);
    std::string line;
    while (std::getline(lines, line)) {
      if (!line.empty()) oss << "\n    " << line;
    }
  }
  return oss.str();
}

WorkerCounters& operator+=(WorkerCounters& lhs, const WorkerCounters& rhs) {
  lhs.transcoded += rhs.transcoded;
  lhs.copied += rhs.copied;
  lhs.skipped_complete += rhs.skipped_complete;
  lhs.stale_removed += rhs.stale_removed;
  lhs.ignored += rhs.ignored;
  lhs.failed += rhs.failed;
  lhs.planned += rhs.planned;
  return lhs;
}

const char* EventTag(const FileEvent& event) {
  return std::visit(
      [](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, IdleEvent>) return "idle";
        if constexpr (std::is_same_v<T, MakeDirEvent>) return "mkdir";
        if constexpr (std::is_same_v<T, RemoveStaleFileEvent>) return "rm-stale";
        if constexpr (std::is_same_v<T, CopyEvent>) return "copy";
        if constexpr (std::is_same_v<T, DemuxEvent>) return "demux";
        if constexpr (std::is_same_v<T, TranscodeEvent>) return "transcode";
        if constexpr (std::is_same_v<T, ErrorBatchEvent>) return "errors";
        return "unknown";
      },
      event);
}

std::string FormatEvent(const FileEvent& event) {
  std::ostringstream oss;
  oss << EventTag(event);
  std::visit(
      [&oss](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, MakeDirEvent>) {
          oss << " " << e.directory.string();
        } else if constexpr (std::is_same_v<T, RemoveStaleFileEvent>) {
          oss << " " << e.path.string();
        } else if constexpr (std::is_same_v<T, CopyEvent>) {
          oss << " " << e.input_path.string() << " -> " << e.output_path.string();
        } else if constexpr (std::is_same_v<T, DemuxEvent>) {
          oss << " " << e.input_path.string() << " -> "
              << e.intermediate_path.string();
          if (e.progress) oss << " [" << *e.progress << "]";
        } else if constexpr (std::is_same_v<T, TranscodeEvent>) {
          oss << " " << e.input_path.string() << " -> " << e.output_path.string();
          if (e.progress) oss << " [" << *e.progress << "]";
        } else if constexpr (std::is_same_v<T, ErrorBatchEvent>) {
          oss << " count=" << e.records.size();
        }
      },
      event);
  return oss.str();
}

}  // namespace mediamirror::pipeline
