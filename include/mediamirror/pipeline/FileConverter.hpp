// Repository: MediaMirror
// Component: File Converter
// Purpose: Crash-safe per-file protocol. Check complete, clean stale
//          artifacts, produce into a temp name, atomically promote.
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_PIPELINE_FILE_CONVERTER_HPP_
#define MEDIAMIRROR_PIPELINE_FILE_CONVERTER_HPP_

#include <cstdint>
#include <functional>
#include <optional>

#include "mediamirror/config/MirrorConfig.hpp"
#include "mediamirror/pipeline/ArtifactPaths.hpp"
#include "mediamirror/pipeline/MediaClassifier.hpp"
#include "mediamirror/pipeline/PipelineTypes.hpp"
#include "mediamirror/tools/ITranscodeTool.hpp"

namespace mediamirror::pipeline {

enum class OutcomeKind {
  kTranscoded,
  kCopied,
  kSkippedComplete,
  kIgnored,
  kCleaned,  // clean mode: stale artifacts handled, nothing produced
  kPlanned,  // dry run: action reported, nothing written
  kFailed,
};

const char* OutcomeKindToString(OutcomeKind kind);

// Exactly one FileOutcome per FilePair, success or not.
struct FileOutcome {
  OutcomeKind kind = OutcomeKind::kIgnored;
  FileClass file_class = FileClass::kIgnored;
  uint32_t stale_removed = 0;
  std::optional<ErrorRecord> error;

  static FileOutcome Of(OutcomeKind kind, FileClass file_class, uint32_t stale_removed = 0) {
    FileOutcome o;
    o.kind = kind;
    o.file_class = file_class;
    o.stale_removed = stale_removed;
    return o;
  }

  static FileOutcome Failed(FileClass file_class, ErrorRecord record,
                            uint32_t stale_removed = 0) {
    FileOutcome o = Of(OutcomeKind::kFailed, file_class, stale_removed);
    o.error = std::move(record);
    return o;
  }

  bool Transcodable() const { return IsTranscodable(file_class); }
};

// FileConverter drives one FilePair through its state machine:
//
//   CHECK_COMPLETE   final exists            -> kSkippedComplete
//   CLEAN_STALE      temp / intermediate     -> removed, RemoveStaleFileEvent
//   DEMUX            container inputs only   -> intermediate
//   PRODUCE          transcode or copy       -> temp
//   FINALIZE         tool ok AND temp exists -> rename(temp, final)
//
// The final name is written only by the rename, so a crash at any point
// leaves either no final file or a complete one. Tool success without a temp
// file is a kTranscodeFailure; it is never trusted.
//
// Convert() never throws: I/O errors and exceptions become a kFailed
// outcome naming the file. The tools are borrowed and must outlive the
// converter; one converter is shared read-only by all workers.
class FileConverter {
 public:
  using EventFn = std::function<void(const FileEvent&)>;

  struct Tools {
    tools::ITranscodeTool* transcoder = nullptr;  // required in convert mode
    tools::ITranscodeTool* extractor = nullptr;   // container demux
  };

  FileConverter(Tools tools, config::RunMode mode);

  FileOutcome Convert(const FilePair& pair, const EventFn& on_event) const;

  config::RunMode Mode() const { return mode_; }

 private:
  FileOutcome ConvertOne(const FilePair& pair, FileClass cls, const EventFn& on_event) const;
  FileOutcome Plan(const FilePair& pair, FileClass cls, const ArtifactPaths& paths,
                   const EventFn& on_event) const;
  FileOutcome Produce(const FilePair& pair, FileClass cls, const ArtifactPaths& paths,
                      uint32_t stale_removed, const EventFn& on_event) const;

  // Deletes leftover temp and intermediate. Returns how many were removed.
  // Throws std::filesystem::filesystem_error when one cannot be deleted.
  uint32_t CleanStale(const ArtifactPaths& paths, const EventFn& on_event) const;

  Tools tools_;
  config::RunMode mode_;
};

}  // namespace mediamirror::pipeline

#endif  // MEDIAMIRROR_PIPELINE_FILE_CONVERTER_HPP_
