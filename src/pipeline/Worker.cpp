// Repository: MediaMirror
// Component: Worker Implementation
// Purpose: Worker thread loop and per-file fault isolation.
// Copyright (c) 2026 MediaMirror

#include "mediamirror/pipeline/Worker.hpp"

#include <stdexcept>
#include <system_error>

#include "mediamirror/pipeline/MediaClassifier.hpp"
#include "mediamirror/util/Logger.hpp"

namespace mediamirror::pipeline {

using mediamirror::util::Logger;

namespace {

// Progress updates are frequent; verbose mode logs only the start of a step.
bool IsLoggable(const FileEvent& event) {
  if (std::holds_alternative<IdleEvent>(event)) return false;
  if (std::holds_alternative<ErrorBatchEvent>(event)) return false;
  if (const auto* t = std::get_if<TranscodeEvent>(&event)) return !t->progress;
  if (const auto* d = std::get_if<DemuxEvent>(&event)) return !d->progress;
  return true;
}

}  // namespace

Worker::Worker(int id, WorkQueue& queue, StatusMailbox& mailbox,
               const FileConverter& converter, Options options)
    : id_(id), queue_(queue), mailbox_(mailbox), converter_(converter), options_(options) {}

Worker::~Worker() { Join(); }

void Worker::Start() {
  if (thread_.joinable()) {
    throw std::logic_error("Worker " + std::to_string(id_) + " already started");
  }
  thread_ = std::thread(&Worker::Run, this);
}

void Worker::Join() {
  if (thread_.joinable()) thread_.join();
}

void Worker::Run() {
  Logger::Debug("[Worker " + std::to_string(id_) + "] START");
  Report(IdleEvent{});

  while (true) {
    WorkItem item = queue_.Get();
    if (IsEndOfWork(item)) break;
    ProcessBatch(std::get<WorkBatch>(item));
    ++batches_processed_;
    Report(IdleEvent{});
  }

  Logger::Debug("[Worker " + std::to_string(id_) + "] END_OF_WORK batches=" +
                std::to_string(batches_processed_) +
                " errors=" + std::to_string(errors_.size()));
  Report(ErrorBatchEvent{errors_}, /*finished=*/true);
}

void Worker::ProcessBatch(const WorkBatch& batch) {
  if (converter_.Mode() == config::RunMode::kConvert) {
    Report(MakeDirEvent{batch.output_directory});
    std::error_code ec;
    fs::create_directories(batch.output_directory, ec);
    if (ec) {
      for (const auto& pair : batch.pairs) {
        ErrorRecord r;
        r.kind = ErrorKind::kUnhandledFault;
        r.input_path = pair.input_path;
        r.output_path = pair.output_path;
        r.details = "cannot create output directory " + batch.output_directory.string() +
                    ": " + ec.message();
        Apply(FileOutcome::Failed(Classify(pair.input_path), std::move(r)));
      }
      return;
    }
  }

  for (const auto& pair : batch.pairs) {
    Apply(ProcessFile(pair));
  }
}

FileOutcome Worker::ProcessFile(const FilePair& pair) {
  auto fault = [&pair](std::string details) {
    ErrorRecord r;
    r.kind = ErrorKind::kUnhandledFault;
    r.input_path = pair.input_path;
    r.output_path = pair.output_path;
    r.details = std::move(details);
    return FileOutcome::Failed(Classify(pair.input_path), std::move(r));
  };

  // Convert() reports its own failures; this boundary keeps one bad file
  // (or a throwing event sink) from ending the worker.
  try {
    return converter_.Convert(pair, [this](const FileEvent& e) { Report(e); });
  } catch (const std::exception& e) {
    return fault(e.what());
  } catch (...) {
    return fault("unknown exception");
  }
}

void Worker::Apply(const FileOutcome& outcome) {
  counters_.stale_removed += outcome.stale_removed;
  switch (outcome.kind) {
    case OutcomeKind::kTranscoded:
      ++counters_.transcoded;
      break;
    case OutcomeKind::kCopied:
      ++counters_.copied;
      break;
    case OutcomeKind::kSkippedComplete:
      ++counters_.skipped_complete;
      break;
    case OutcomeKind::kIgnored:
      ++counters_.ignored;
      break;
    case OutcomeKind::kPlanned:
      ++counters_.planned;
      break;
    case OutcomeKind::kCleaned:
      break;
    case OutcomeKind::kFailed:
      ++counters_.failed;
      break;
  }
  if (outcome.error) {
    Logger::Debug("[Worker " + std::to_string(id_) + "] FILE_FAILED " +
                  ErrorKindToString(outcome.error->kind) +
                  " input=" + outcome.error->input_path.string());
    errors_.push_back(*outcome.error);
  }
  // Every transcodable file reaches exactly one terminal outcome.
  if (outcome.Transcodable()) ++transcodes_done_;
}

void Worker::Report(FileEvent event, bool finished) {
  if (options_.verbose && IsLoggable(event)) {
    Logger::Info("[Worker " + std::to_string(id_) + "] " + FormatEvent(event));
  }
  StatusSnapshot snapshot;
  snapshot.worker_id = id_;
  snapshot.transcodes_done = transcodes_done_;
  snapshot.finished = finished;
  snapshot.detail = std::move(event);
  snapshot.counters = counters_;
  mailbox_.Send(std::move(snapshot));
}

}  // namespace mediamirror::pipeline
