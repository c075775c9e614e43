// Repository: MediaMirror
// Component: Pipeline Types
// Purpose: Data structures shared by enumerator, queue, workers and dashboard
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_PIPELINE_TYPES_HPP_
#define MEDIAMIRROR_PIPELINE_TYPES_HPP_

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mediamirror::pipeline {

namespace fs = std::filesystem;

// =============================================================================
// Work Units
// =============================================================================

struct FilePair {
  fs::path input_path;
  fs::path output_path;
};

// All files destined for one output directory. Produced once per non-empty
// input directory and owned exclusively by the worker that dequeues it.
struct WorkBatch {
  fs::path output_directory;
  std::vector<FilePair> pairs;
};

// Sentinel terminating one worker's consumption loop.
struct EndOfWork {};

using WorkItem = std::variant<WorkBatch, EndOfWork>;

inline bool IsEndOfWork(const WorkItem& item) {
  return std::holds_alternative<EndOfWork>(item);
}

// =============================================================================
// Error Records
// =============================================================================

enum class ErrorKind {
  // External tool signaled failure, or reported success without output
  kTranscodeFailure,

  // Unexpected exception or I/O error while handling one file
  kUnhandledFault,
};

const char* ErrorKindToString(ErrorKind kind);

struct ErrorRecord {
  ErrorKind kind = ErrorKind::kTranscodeFailure;
  fs::path input_path;
  fs::path output_path;
  std::string details;
};

// Multi-line report block: kind, input, output, then the details text.
std::string FormatErrorRecord(const ErrorRecord& record);

// =============================================================================
// Worker Events
// One tagged variant describes what a worker is doing right now. The same
// event values feed the live view, the plain-text log and the verbose log.
// =============================================================================

struct MakeDirEvent {
  fs::path directory;
};

struct RemoveStaleFileEvent {
  fs::path path;
};

struct CopyEvent {
  fs::path input_path;
  fs::path output_path;
};

struct DemuxEvent {
  fs::path input_path;
  fs::path intermediate_path;
  std::optional<std::string> progress;
};

struct TranscodeEvent {
  fs::path input_path;
  fs::path output_path;
  std::optional<std::string> progress;
};

struct ErrorBatchEvent {
  std::vector<ErrorRecord> records;
};

struct IdleEvent {};

using FileEvent = std::variant<IdleEvent, MakeDirEvent, RemoveStaleFileEvent,
                               CopyEvent, DemuxEvent, TranscodeEvent,
                               ErrorBatchEvent>;

// Short tag for the event kind ("copy", "transcode", ...).
const char* EventTag(const FileEvent& event);

// One-line human description, shared by every sink.
std::string FormatEvent(const FileEvent& event);

// =============================================================================
// Status Snapshots
// =============================================================================

struct WorkerCounters {
  uint64_t transcoded = 0;        // transcodes (incl. demux path) performed now
  uint64_t copied = 0;            // passthrough copies performed now
  uint64_t skipped_complete = 0;  // final output already existed
  uint64_t stale_removed = 0;     // stale temp artifacts / intermediates deleted
  uint64_t ignored = 0;           // unrecognized extension
  uint64_t failed = 0;            // error records produced
  uint64_t planned = 0;           // dry-run: actions that would have run
};

WorkerCounters& operator+=(WorkerCounters& lhs, const WorkerCounters& rhs);

// Latest known state of one worker. Lives only until the next Send() on the
// same mailbox replaces it.
struct StatusSnapshot {
  int worker_id = -1;
  // Transcodable files that reached a terminal outcome (done now, already
  // complete, or failed). Progress numerator.
  uint64_t transcodes_done = 0;
  bool finished = false;
  FileEvent detail = IdleEvent{};
  WorkerCounters counters;
};

// =============================================================================
// Setup Results
// =============================================================================

enum class SetupError {
  kNone = 0,
  kInputMissing,
  kInputNotDirectory,
  kSameRoots,
  kOutputInsideInput,
  kInputInsideOutput,
  kOutputNotDirectory,
  kFilesystemError,
};

const char* SetupErrorToString(SetupError error);

struct SetupResult {
  bool ok;
  SetupError error;
  std::string message;

  static SetupResult Success() { return {true, SetupError::kNone, ""}; }
  static SetupResult Failure(SetupError e, std::string msg) {
    return {false, e, std::move(msg)};
  }
};

}  // namespace mediamirror::pipeline

#endif  // MEDIAMIRROR_PIPELINE_TYPES_HPP_
