// Repository: MediaMirror
// Component: Mirror Pipeline
// Purpose: Producer/aggregator loop. Validates roots, streams batches into
//          the bounded queue, refreshes the dashboard and collects results.
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_PIPELINE_MIRROR_PIPELINE_HPP_
#define MEDIAMIRROR_PIPELINE_MIRROR_PIPELINE_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "mediamirror/config/MirrorConfig.hpp"
#include "mediamirror/dashboard/IDashboardRenderer.hpp"
#include "mediamirror/pipeline/FileConverter.hpp"
#include "mediamirror/pipeline/PipelineTypes.hpp"

namespace mediamirror::pipeline {

struct RunSummary {
  SetupResult setup = SetupResult::Success();
  WorkerCounters totals;
  uint64_t transcodes_done = 0;
  uint64_t total_transcodable = 0;
  size_t batches = 0;
  size_t files = 0;
  size_t queue_high_water = 0;
  std::vector<ErrorRecord> errors;

  // 0 success, 1 some files failed, 2 setup error.
  int ExitCode() const;
};

// MirrorPipeline runs one mirror pass on the calling thread:
//
//   Validate -> Scan -> PrepareOutputTree -> start N workers
//   loop Next(): TryPut with refresh timeout; on timeout Poll + Present
//   Poll + Present until every worker reported finished
//   Join -> renderer Finish -> error report, printed once
//
// The calling thread is both producer and aggregator. Every worker receives
// exactly one EndOfWork, so the wait for completion always terminates.
class MirrorPipeline {
 public:
  // Tools and renderer are borrowed for the duration of Run().
  MirrorPipeline(config::MirrorConfig config, FileConverter::Tools tools,
                 dashboard::IDashboardRenderer& renderer);

  RunSummary Run();

 private:
  config::MirrorConfig config_;
  FileConverter::Tools tools_;
  dashboard::IDashboardRenderer& renderer_;
};

class WorkQueue;
class Worker;

// Starts every worker in order. If a Start() throws, each worker already
// running is sent one EndOfWork so it can be joined, and the exception
// propagates.
void StartWorkers(const std::vector<std::unique_ptr<Worker>>& workers, WorkQueue& queue);

// Logs the end-of-run error report through the Logger.
void PrintErrorReport(const std::vector<ErrorRecord>& errors);

}  // namespace mediamirror::pipeline

#endif  // MEDIAMIRROR_PIPELINE_MIRROR_PIPELINE_HPP_
