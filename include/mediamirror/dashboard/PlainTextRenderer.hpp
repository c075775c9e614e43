// Repository: MediaMirror
// Component: Plain Text Renderer
// Purpose: Periodic progress lines through the Logger, for pipes, logs and
//          --verbose runs.
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_DASHBOARD_PLAIN_TEXT_RENDERER_HPP_
#define MEDIAMIRROR_DASHBOARD_PLAIN_TEXT_RENDERER_HPP_

#include <chrono>
#include <cstdint>
#include <optional>

#include "mediamirror/dashboard/IDashboardRenderer.hpp"

namespace mediamirror::dashboard {

class PlainTextRenderer : public IDashboardRenderer {
 public:
  static constexpr std::chrono::milliseconds kDefaultInterval{2000};

  // A line is logged at most once per `interval`, and only when the
  // transcode count or totals moved.
  explicit PlainTextRenderer(std::chrono::milliseconds interval = kDefaultInterval);

  void Present(const DashboardView& view) override;
  void Finish(const DashboardView& final_view) override;

  uint64_t LinesEmitted() const { return lines_emitted_; }

 private:
  bool Changed(const DashboardView& view) const;

  std::chrono::milliseconds interval_;
  std::optional<std::chrono::steady_clock::time_point> last_emit_;
  uint64_t last_done_ = 0;
  pipeline::WorkerCounters last_totals_;
  uint64_t lines_emitted_ = 0;
};

}  // namespace mediamirror::dashboard

#endif  // MEDIAMIRROR_DASHBOARD_PLAIN_TEXT_RENDERER_HPP_
