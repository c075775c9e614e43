// Repository: MediaMirror
// Component: Scroll Viewport
// Purpose: Scroll position over a line buffer taller than the terminal.
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_DASHBOARD_SCROLL_VIEWPORT_HPP_
#define MEDIAMIRROR_DASHBOARD_SCROLL_VIEWPORT_HPP_

#include <cstddef>

namespace mediamirror::dashboard {

enum class ScrollKey { kNone, kLineUp, kLineDown, kPageUp, kPageDown, kTop, kBottom };

// ScrollViewport clamps its offset to [0, content - view] after every
// change. Once scrolled to the bottom it follows the tail as content grows,
// until the user scrolls up again.
class ScrollViewport {
 public:
  void SetContentHeight(size_t lines);
  void SetViewHeight(size_t rows);

  void LineUp();
  void LineDown();
  void PageUp();
  void PageDown();
  void Top();
  void Bottom();
  void Apply(ScrollKey key);

  size_t Offset() const { return offset_; }
  size_t MaxOffset() const;
  size_t ViewHeight() const { return view_height_; }
  size_t ContentHeight() const { return content_height_; }
  bool FollowingTail() const { return follow_tail_; }

  // Index one past the last visible line.
  size_t End() const;

 private:
  void Clamp();

  size_t content_height_ = 0;
  size_t view_height_ = 1;
  size_t offset_ = 0;
  bool follow_tail_ = false;
};

}  // namespace mediamirror::dashboard

#endif  // MEDIAMIRROR_DASHBOARD_SCROLL_VIEWPORT_HPP_
