// Repository: MediaMirror
// Component: Dashboard View
// Purpose: Immutable, renderer-independent picture of the run at one instant.
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_DASHBOARD_DASHBOARD_VIEW_HPP_
#define MEDIAMIRROR_DASHBOARD_DASHBOARD_VIEW_HPP_

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "mediamirror/pipeline/PipelineTypes.hpp"

namespace mediamirror::dashboard {

struct WorkerRow {
  int worker_id = -1;
  bool reporting = false;  // at least one snapshot received
  bool finished = false;
  uint64_t transcodes_done = 0;
  std::string activity;    // FormatEvent() of the latest event
};

struct DashboardView {
  uint64_t transcodes_done = 0;
  uint64_t total_transcodable = 0;
  size_t workers_total = 0;
  size_t workers_finished = 0;
  pipeline::WorkerCounters totals;
  std::chrono::milliseconds elapsed{0};
  std::vector<WorkerRow> workers;
};

// "[  3/10  30%] 4/4 workers | transcoded=2 copied=1 ... | 00:01:12"
std::string FormatProgressLine(const DashboardView& view);

// One line per worker: "w2  transcode a/1.wav -> out/a/1.mp3 [ 45%]".
std::vector<std::string> FormatWorkerLines(const DashboardView& view);

// HH:MM:SS
std::string FormatElapsed(std::chrono::milliseconds elapsed);

}  // namespace mediamirror::dashboard

#endif  // MEDIAMIRROR_DASHBOARD_DASHBOARD_VIEW_HPP_
