// Repository: MediaMirror
// Component: Plain Text Renderer Implementation
// Purpose: Line-oriented progress output for non-interactive runs.
// Copyright (c) 2026 MediaMirror

#include "mediamirror/dashboard/PlainTextRenderer.hpp"

#include "mediamirror/util/Logger.hpp"

namespace mediamirror::dashboard {

using mediamirror::util::Logger;

PlainTextRenderer::PlainTextRenderer(std::chrono::milliseconds interval)
    : interval_(interval) {}

bool PlainTextRenderer::Changed(const DashboardView& view) const {
  const auto& a = view.totals;
  const auto& b = last_totals_;
  return view.transcodes_done != last_done_ || a.transcoded != b.transcoded ||
         a.copied != b.copied || a.skipped_complete != b.skipped_complete ||
         a.failed != b.failed || a.planned != b.planned;
}

void PlainTextRenderer::Present(const DashboardView& view) {
  const auto now = std::chrono::steady_clock::now();
  if (last_emit_ && now - *last_emit_ < interval_) return;
  if (last_emit_ && !Changed(view)) return;

  Logger::Info("[Progress] " + FormatProgressLine(view));
  last_emit_ = now;
  last_done_ = view.transcodes_done;
  last_totals_ = view.totals;
  ++lines_emitted_;
}

void PlainTextRenderer::Finish(const DashboardView& final_view) {
  Logger::Info("[Progress] FINISHED " + FormatProgressLine(final_view));
  ++lines_emitted_;
}

}  // namespace mediamirror::dashboard
