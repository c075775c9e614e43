// Repository: MediaMirror
// Component: Mirror Pipeline Implementation
// Purpose: Wires enumerator, queue, workers and aggregator into one run.
// Copyright (c) 2026 MediaMirror

#include "mediamirror/pipeline/MirrorPipeline.hpp"

#include <chrono>
#include <exception>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "mediamirror/dashboard/StatusAggregator.hpp"
#include "mediamirror/pipeline/StatusMailbox.hpp"
#include "mediamirror/pipeline/WorkEnumerator.hpp"
#include "mediamirror/pipeline/WorkQueue.hpp"
#include "mediamirror/pipeline/Worker.hpp"
#include "mediamirror/util/Logger.hpp"

namespace mediamirror::pipeline {

using config::RunMode;
using dashboard::StatusAggregator;
using mediamirror::util::Logger;

int RunSummary::ExitCode() const {
  if (!setup.ok) return 2;
  if (!errors.empty()) return 1;
  return 0;
}

void StartWorkers(const std::vector<std::unique_ptr<Worker>>& workers, WorkQueue& queue) {
  size_t started = 0;
  try {
    for (const auto& w : workers) {
      w->Start();
      ++started;
    }
  } catch (const std::exception& e) {
    Logger::Error(std::string("[MirrorPipeline] WORKER_START_FAILED started=") +
                  std::to_string(started) + " reason=" + e.what());
    for (size_t i = 0; i < started; ++i) {
      WorkItem marker = EndOfWork{};
      while (!queue.TryPut(marker, std::chrono::milliseconds(100))) {
      }
    }
    throw;
  }
}

void PrintErrorReport(const std::vector<ErrorRecord>& errors) {
  if (errors.empty()) return;
  Logger::Error("[MirrorPipeline] " + std::to_string(errors.size()) +
                " file(s) failed:");
  for (const auto& record : errors) {
    Logger::Error(FormatErrorRecord(record));
  }
}

MirrorPipeline::MirrorPipeline(config::MirrorConfig config, FileConverter::Tools tools,
                               dashboard::IDashboardRenderer& renderer)
    : config_(std::move(config)), tools_(tools), renderer_(renderer) {}

RunSummary MirrorPipeline::Run() {
  RunSummary summary;
  const int num_workers = config_.num_workers;

  // ===========================================================================
  // Setup: fatal errors surface before any worker starts
  // ===========================================================================
  WorkEnumerator enumerator(config_.input_root, config_.output_root, num_workers);
  summary.setup = enumerator.Validate();
  if (!summary.setup.ok) {
    Logger::Error(std::string("[MirrorPipeline] SETUP_ERROR ") +
                  SetupErrorToString(summary.setup.error) + ": " + summary.setup.message);
    return summary;
  }

  enumerator.Scan();
  summary.total_transcodable = enumerator.TranscodableCount();
  summary.batches = enumerator.BatchCount();
  summary.files = enumerator.FileCount();

  if (config_.mode == RunMode::kConvert) {
    summary.setup = enumerator.PrepareOutputTree();
    if (!summary.setup.ok) {
      Logger::Error(std::string("[MirrorPipeline] SETUP_ERROR ") +
                    SetupErrorToString(summary.setup.error) + ": " + summary.setup.message);
      return summary;
    }
  }

  {
    std::ostringstream oss;
    oss << "[MirrorPipeline] START mode=" << config::RunModeToString(config_.mode)
        << " input=" << enumerator.InputRoot().string()
        << " output=" << enumerator.OutputRoot().string() << " workers=" << num_workers
        << " files=" << summary.files << " transcodable=" << summary.total_transcodable
        << " batches=" << summary.batches;
    Logger::Info(oss.str());
  }

  // ===========================================================================
  // Workers
  // ===========================================================================
  const FileConverter converter(tools_, config_.mode);
  WorkQueue queue(config_.EffectiveQueueCapacity());

  std::vector<std::unique_ptr<StatusMailbox>> mailboxes;
  std::vector<StatusMailbox*> mailbox_ptrs;
  std::vector<std::unique_ptr<Worker>> workers;
  Worker::Options worker_options;
  worker_options.verbose = config_.verbose;
  for (int i = 0; i < num_workers; ++i) {
    mailboxes.push_back(std::make_unique<StatusMailbox>());
    mailbox_ptrs.push_back(mailboxes.back().get());
    workers.push_back(
        std::make_unique<Worker>(i, queue, *mailboxes.back(), converter, worker_options));
  }
  StartWorkers(workers, queue);

  StatusAggregator aggregator(mailbox_ptrs, summary.total_transcodable);
  const auto refresh = config_.refresh_interval;
  auto last_refresh = std::chrono::steady_clock::now() - refresh;
  auto maybe_refresh = [&]() {
    const auto now = std::chrono::steady_clock::now();
    if (now - last_refresh < refresh) return;
    aggregator.Poll();
    renderer_.Present(aggregator.BuildView());
    last_refresh = now;
  };

  // ===========================================================================
  // Producer: stream batches, then one EndOfWork per worker
  // ===========================================================================
  while (auto item = enumerator.Next()) {
    while (!queue.TryPut(*item, refresh)) {
      maybe_refresh();
    }
    maybe_refresh();
  }

  // ===========================================================================
  // Drain: aggregate until every worker has reported its final snapshot
  // ===========================================================================
  while (true) {
    aggregator.Poll();
    if (aggregator.AllFinished()) break;
    renderer_.Present(aggregator.BuildView());
    std::this_thread::sleep_for(refresh);
  }

  for (auto& w : workers) w->Join();
  aggregator.Poll();

  const auto final_view = aggregator.BuildView();
  renderer_.Finish(final_view);

  summary.totals = aggregator.Totals();
  summary.transcodes_done = aggregator.TranscodesDone();
  summary.errors = aggregator.CollectedErrors();
  summary.queue_high_water = queue.HighWaterMark();

  PrintErrorReport(summary.errors);
  {
    std::ostringstream oss;
    oss << "[MirrorPipeline] DONE transcoded=" << summary.totals.transcoded
        << " copied=" << summary.totals.copied
        << " skipped=" << summary.totals.skipped_complete
        << " stale_removed=" << summary.totals.stale_removed
        << " ignored=" << summary.totals.ignored << " failed=" << summary.totals.failed;
    if (config_.mode == RunMode::kDryRun) oss << " planned=" << summary.totals.planned;
    oss << " queue_high_water=" << summary.queue_high_water;
    Logger::Info(oss.str());
  }
  return summary;
}

}  // namespace mediamirror::pipeline
