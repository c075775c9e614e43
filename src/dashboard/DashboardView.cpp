// Repository: MediaMirror
// Component: Dashboard View Implementation
// Purpose: Composes the dashboard text from aggregator state.
// Copyright (c) 2026 MediaMirror

#include "mediamirror/dashboard/DashboardView.hpp"

#include <iomanip>
#include <sstream>

namespace mediamirror::dashboard {

std::string FormatElapsed(std::chrono::milliseconds elapsed) {
  const long long total_s = elapsed.count() / 1000;
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << total_s / 3600 << ":" << std::setw(2)
      << (total_s / 60) % 60 << ":" << std::setw(2) << total_s % 60;
  return oss.str();
}

std::string FormatProgressLine(const DashboardView& view) {
  const int percent =
      view.total_transcodable == 0
          ? 100
          : static_cast<int>(view.transcodes_done * 100 / view.total_transcodable);
  const auto& t = view.totals;

  std::ostringstream oss;
  oss << "[" << std::setw(5) << view.transcodes_done << "/" << view.total_transcodable << " "
      << std::setw(3) << percent << "%] "
      << (view.workers_total - view.workers_finished) << "/" << view.workers_total
      << " workers | transcoded=" << t.transcoded << " copied=" << t.copied
      << " skipped=" << t.skipped_complete << " stale=" << t.stale_removed
      << " failed=" << t.failed;
  if (t.planned > 0) oss << " planned=" << t.planned;
  oss << " | " << FormatElapsed(view.elapsed);
  return oss.str();
}

std::vector<std::string> FormatWorkerLines(const DashboardView& view) {
  std::vector<std::string> lines;
  lines.reserve(view.workers.size());
  for (const auto& row : view.workers) {
    std::ostringstream oss;
    oss << "w" << std::left << std::setw(3) << row.worker_id << " ";
    if (!row.reporting) {
      oss << "starting";
    } else if (row.finished) {
      oss << "done (" << row.transcodes_done << " transcodes)";
    } else {
      oss << row.activity;
    }
    lines.push_back(oss.str());
  }
  return lines;
}

}  // namespace mediamirror::dashboard
