// Repository: MediaMirror
// Component: Status Aggregator Implementation
// Purpose: Folds worker snapshots into run totals and the error report.
// Copyright (c) 2026 MediaMirror

#include "mediamirror/dashboard/StatusAggregator.hpp"

namespace mediamirror::dashboard {

using pipeline::ErrorBatchEvent;
using pipeline::ErrorRecord;
using pipeline::WorkerCounters;

StatusAggregator::StatusAggregator(std::vector<pipeline::StatusMailbox*> mailboxes,
                                   uint64_t total_transcodable)
    : mailboxes_(std::move(mailboxes)),
      total_transcodable_(total_transcodable),
      latest_(mailboxes_.size()),
      errors_(mailboxes_.size()),
      start_(std::chrono::steady_clock::now()) {}

size_t StatusAggregator::Poll() {
  size_t merged = 0;
  for (size_t i = 0; i < mailboxes_.size(); ++i) {
    auto snapshot = mailboxes_[i]->TryReceive();
    if (!snapshot) continue;
    if (snapshot->finished) {
      if (const auto* batch = std::get_if<ErrorBatchEvent>(&snapshot->detail)) {
        errors_[i] = batch->records;
      }
    }
    latest_[i] = std::move(*snapshot);
    ++merged;
  }
  return merged;
}

bool StatusAggregator::AllFinished() const {
  for (const auto& s : latest_) {
    if (!s || !s->finished) return false;
  }
  return true;
}

uint64_t StatusAggregator::TranscodesDone() const {
  uint64_t done = 0;
  for (const auto& s : latest_) {
    if (s) done += s->transcodes_done;
  }
  return done;
}

WorkerCounters StatusAggregator::Totals() const {
  WorkerCounters totals;
  for (const auto& s : latest_) {
    if (s) totals += s->counters;
  }
  return totals;
}

std::vector<ErrorRecord> StatusAggregator::CollectedErrors() const {
  std::vector<ErrorRecord> all;
  for (const auto& batch : errors_) {
    all.insert(all.end(), batch.begin(), batch.end());
  }
  return all;
}

DashboardView StatusAggregator::BuildView() const {
  DashboardView view;
  view.transcodes_done = TranscodesDone();
  view.total_transcodable = total_transcodable_;
  view.workers_total = latest_.size();
  view.totals = Totals();
  view.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start_);

  view.workers.reserve(latest_.size());
  for (size_t i = 0; i < latest_.size(); ++i) {
    WorkerRow row;
    row.worker_id = static_cast<int>(i);
    if (latest_[i]) {
      const auto& s = *latest_[i];
      row.reporting = true;
      row.finished = s.finished;
      row.transcodes_done = s.transcodes_done;
      row.activity = pipeline::FormatEvent(s.detail);
      if (s.finished) ++view.workers_finished;
    }
    view.workers.push_back(std::move(row));
  }
  return view;
}

}  // namespace mediamirror::dashboard
