// Repository: MediaMirror
// Component: Status Aggregator
// Purpose: Drains worker mailboxes into the run-wide view; detects completion.
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_DASHBOARD_STATUS_AGGREGATOR_HPP_
#define MEDIAMIRROR_DASHBOARD_STATUS_AGGREGATOR_HPP_

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

#include "mediamirror/dashboard/DashboardView.hpp"
#include "mediamirror/pipeline/PipelineTypes.hpp"
#include "mediamirror/pipeline/StatusMailbox.hpp"

namespace mediamirror::dashboard {

// StatusAggregator keeps the latest snapshot of every worker. Poll() never
// blocks; it is called from the producer loop between queue attempts and
// while waiting for workers to finish.
//
// Not thread-safe: one owning thread.
class StatusAggregator {
 public:
  // Mailbox i belongs to worker i. Mailboxes are borrowed.
  StatusAggregator(std::vector<pipeline::StatusMailbox*> mailboxes,
                   uint64_t total_transcodable);

  // Returns how many new snapshots were merged.
  size_t Poll();

  // True once every worker has sent its final snapshot.
  bool AllFinished() const;

  uint64_t TranscodesDone() const;
  uint64_t TotalTranscodable() const { return total_transcodable_; }
  pipeline::WorkerCounters Totals() const;

  // Errors from finished workers, in worker order.
  std::vector<pipeline::ErrorRecord> CollectedErrors() const;

  DashboardView BuildView() const;

 private:
  std::vector<pipeline::StatusMailbox*> mailboxes_;
  uint64_t total_transcodable_;
  std::vector<std::optional<pipeline::StatusSnapshot>> latest_;
  std::vector<std::vector<pipeline::ErrorRecord>> errors_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace mediamirror::dashboard

#endif  // MEDIAMIRROR_DASHBOARD_STATUS_AGGREGATOR_HPP_
