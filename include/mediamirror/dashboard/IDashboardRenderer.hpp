// Repository: MediaMirror
// Component: Dashboard Renderer Interface
// Purpose: Presents aggregated run state to the user.
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_DASHBOARD_I_DASHBOARD_RENDERER_HPP_
#define MEDIAMIRROR_DASHBOARD_I_DASHBOARD_RENDERER_HPP_

#include "mediamirror/dashboard/DashboardView.hpp"

namespace mediamirror::dashboard {

// Present() is called from the producer loop at the refresh interval and
// must not block on terminal I/O for long. Finish() is called exactly once,
// after every worker has been joined; the renderer releases the terminal
// there, before the error report is printed.
class IDashboardRenderer {
 public:
  virtual ~IDashboardRenderer() = default;

  virtual void Present(const DashboardView& view) = 0;
  virtual void Finish(const DashboardView& final_view) = 0;
};

}  // namespace mediamirror::dashboard

#endif  // MEDIAMIRROR_DASHBOARD_I_DASHBOARD_RENDERER_HPP_
