// Repository: MediaMirror
// Component: File Converter Implementation
// Purpose: Crash-safe per-file protocol: temp artifact, then rename into place.
// Copyright (c) 2026 MediaMirror

#include "mediamirror/pipeline/FileConverter.hpp"

#include <stdexcept>
#include <system_error>

#include "mediamirror/util/Logger.hpp"

namespace mediamirror::pipeline {

using config::RunMode;
using mediamirror::util::Logger;

namespace {

ErrorRecord MakeRecord(ErrorKind kind, const FilePair& pair, std::string details) {
  ErrorRecord r;
  r.kind = kind;
  r.input_path = pair.input_path;
  r.output_path = pair.output_path;
  r.details = std::move(details);
  return r;
}

// Best-effort delete of a file this run created and is abandoning.
void Discard(const fs::path& path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    Logger::Warn("[FileConverter] DISCARD_FAILED path=" + path.string() +
                 " reason=" + ec.message());
  }
}

std::string ToolFailureDetails(const tools::ITranscodeTool& tool,
                               const tools::ToolResult& result) {
  std::string details = tool.Name() + " failed (code=" + std::to_string(result.exit_code) + ")";
  if (!result.diagnostics.empty()) details += "\n" + result.diagnostics;
  return details;
}

}  // namespace

const char* OutcomeKindToString(OutcomeKind kind) {
  switch (kind) {
    case OutcomeKind::kTranscoded:
      return "TRANSCODED";
    case OutcomeKind::kCopied:
      return "COPIED";
    case OutcomeKind::kSkippedComplete:
      return "SKIPPED_COMPLETE";
    case OutcomeKind::kIgnored:
      return "IGNORED";
    case OutcomeKind::kCleaned:
      return "CLEANED";
    case OutcomeKind::kPlanned:
      return "PLANNED";
    case OutcomeKind::kFailed:
      return "FAILED";
  }
  return "UNKNOWN";
}

FileConverter::FileConverter(Tools tools, RunMode mode) : tools_(tools), mode_(mode) {
  if (mode_ == RunMode::kConvert && tools_.transcoder == nullptr) {
    throw std::invalid_argument("FileConverter: convert mode requires a transcoder");
  }
}

FileOutcome FileConverter::Convert(const FilePair& pair, const EventFn& on_event) const {
  const FileClass cls = Classify(pair.input_path);
  try {
    return ConvertOne(pair, cls, on_event);
  } catch (const std::exception& e) {
    return FileOutcome::Failed(cls, MakeRecord(ErrorKind::kUnhandledFault, pair, e.what()));
  }
}

FileOutcome FileConverter::ConvertOne(const FilePair& pair, FileClass cls,
                                      const EventFn& on_event) const {
  if (cls == FileClass::kIgnored) {
    Logger::Debug("[FileConverter] IGNORED path=" + pair.input_path.string());
    return FileOutcome::Of(OutcomeKind::kIgnored, cls);
  }

  const ArtifactPaths paths = ArtifactPaths::For(pair.output_path);
  if (mode_ != RunMode::kClean && paths.FinalBlocked()) {
    return FileOutcome::Failed(
        cls, MakeRecord(ErrorKind::kUnhandledFault, pair,
                        "output path exists and is not a regular file"));
  }

  switch (mode_) {
    case RunMode::kDryRun:
      return Plan(pair, cls, paths, on_event);
    case RunMode::kClean:
      return FileOutcome::Of(OutcomeKind::kCleaned, cls, CleanStale(paths, on_event));
    case RunMode::kConvert:
      break;
  }

  // CHECK_COMPLETE
  if (paths.State() == ArtifactState::kComplete) {
    return FileOutcome::Of(OutcomeKind::kSkippedComplete, cls);
  }

  // CLEAN_STALE
  const uint32_t removed = CleanStale(paths, on_event);
  return Produce(pair, cls, paths, removed, on_event);
}

// =============================================================================
// CleanStale: recovery from an interrupted earlier run
// =============================================================================

uint32_t FileConverter::CleanStale(const ArtifactPaths& paths, const EventFn& on_event) const {
  uint32_t removed = 0;
  for (const fs::path& stale : {paths.temp_path, paths.intermediate_path}) {
    if (!fs::exists(fs::symlink_status(stale))) continue;
    on_event(RemoveStaleFileEvent{stale});
    fs::remove(stale);  // throws filesystem_error on failure
    Logger::Info("[FileConverter] STALE_ARTIFACT_REMOVED path=" + stale.string());
    ++removed;
  }
  return removed;
}

// =============================================================================
// Plan: dry run reports, never writes
// =============================================================================

FileOutcome FileConverter::Plan(const FilePair& pair, FileClass cls,
                                const ArtifactPaths& paths, const EventFn& on_event) const {
  if (paths.State() == ArtifactState::kComplete) {
    return FileOutcome::Of(OutcomeKind::kSkippedComplete, cls);
  }
  for (const fs::path& stale : {paths.temp_path, paths.intermediate_path}) {
    if (fs::exists(fs::symlink_status(stale))) {
      on_event(RemoveStaleFileEvent{stale});
      Logger::Info("[FileConverter] DRY_RUN would remove " + stale.string());
    }
  }
  FileEvent planned;
  switch (cls) {
    case FileClass::kPassthrough:
      planned = CopyEvent{pair.input_path, pair.output_path};
      break;
    case FileClass::kDemuxThenTranscode:
      on_event(DemuxEvent{pair.input_path, paths.intermediate_path, std::nullopt});
      planned = TranscodeEvent{paths.intermediate_path, pair.output_path, std::nullopt};
      break;
    default:
      planned = TranscodeEvent{pair.input_path, pair.output_path, std::nullopt};
      break;
  }
  on_event(planned);
  Logger::Info("[FileConverter] DRY_RUN would " + FormatEvent(planned));
  return FileOutcome::Of(OutcomeKind::kPlanned, cls);
}

// =============================================================================
// Produce: DEMUX, PRODUCE, FINALIZE
// =============================================================================

FileOutcome FileConverter::Produce(const FilePair& pair, FileClass cls,
                                   const ArtifactPaths& paths, uint32_t stale_removed,
                                   const EventFn& on_event) const {
  auto fail = [&](ErrorKind kind, std::string details) {
    return FileOutcome::Failed(cls, MakeRecord(kind, pair, std::move(details)), stale_removed);
  };

  if (cls == FileClass::kPassthrough) {
    on_event(CopyEvent{pair.input_path, pair.output_path});
    std::error_code ec;
    CopyWithMetadata(pair.input_path, paths.temp_path, ec);
    if (ec) {
      Discard(paths.temp_path);
      return fail(ErrorKind::kUnhandledFault, "copy failed: " + ec.message());
    }
    PromoteToFinal(paths, ec);
    if (ec) {
      Discard(paths.temp_path);
      return fail(ErrorKind::kUnhandledFault, "rename failed: " + ec.message());
    }
    return FileOutcome::Of(OutcomeKind::kCopied, cls, stale_removed);
  }

  fs::path source = pair.input_path;
  if (cls == FileClass::kDemuxThenTranscode) {
    if (tools_.extractor == nullptr) {
      return fail(ErrorKind::kTranscodeFailure, "no demux tool configured");
    }
    on_event(DemuxEvent{pair.input_path, paths.intermediate_path, std::nullopt});
    const tools::ToolResult demux = tools_.extractor->Run(
        pair.input_path, paths.intermediate_path, [&](const std::string& progress) {
          on_event(DemuxEvent{pair.input_path, paths.intermediate_path, progress});
        });
    if (!demux.success) {
      Discard(paths.intermediate_path);
      return fail(ErrorKind::kTranscodeFailure, ToolFailureDetails(*tools_.extractor, demux));
    }
    if (!fs::exists(paths.intermediate_path)) {
      return fail(ErrorKind::kTranscodeFailure,
                  tools_.extractor->Name() + " reported success but wrote no intermediate");
    }
    source = paths.intermediate_path;
  }

  on_event(TranscodeEvent{source, pair.output_path, std::nullopt});
  const tools::ToolResult result = tools_.transcoder->Run(
      source, paths.temp_path, [&](const std::string& progress) {
        on_event(TranscodeEvent{source, pair.output_path, progress});
      });

  if (cls == FileClass::kDemuxThenTranscode) Discard(paths.intermediate_path);

  if (!result.success) {
    if (fs::exists(fs::symlink_status(paths.temp_path))) Discard(paths.temp_path);
    return fail(ErrorKind::kTranscodeFailure, ToolFailureDetails(*tools_.transcoder, result));
  }

  // FINALIZE: only a present temp file is ever promoted.
  if (!fs::exists(paths.temp_path)) {
    return fail(ErrorKind::kTranscodeFailure,
                tools_.transcoder->Name() + " reported success but produced no output");
  }
  std::error_code ec;
  PromoteToFinal(paths, ec);
  if (ec) {
    Discard(paths.temp_path);
    return fail(ErrorKind::kUnhandledFault, "rename failed: " + ec.message());
  }
  return FileOutcome::Of(OutcomeKind::kTranscoded, cls, stale_removed);
}

}  // namespace mediamirror::pipeline
