// Repository: MediaMirror
// Component: Scroll Viewport Implementation
// Purpose: Offset clamping and tail following for the scrollable view.
// Copyright (c) 2026 MediaMirror

#include "mediamirror/dashboard/ScrollViewport.hpp"

#include <algorithm>

namespace mediamirror::dashboard {

void ScrollViewport::SetContentHeight(size_t lines) {
  content_height_ = lines;
  if (follow_tail_) offset_ = MaxOffset();
  Clamp();
}

void ScrollViewport::SetViewHeight(size_t rows) {
  view_height_ = std::max<size_t>(rows, 1);
  if (follow_tail_) offset_ = MaxOffset();
  Clamp();
}

size_t ScrollViewport::MaxOffset() const {
  return content_height_ > view_height_ ? content_height_ - view_height_ : 0;
}

size_t ScrollViewport::End() const {
  return std::min(content_height_, offset_ + view_height_);
}

void ScrollViewport::LineUp() {
  if (offset_ > 0) --offset_;
  follow_tail_ = false;
}

void ScrollViewport::LineDown() {
  ++offset_;
  Clamp();
  follow_tail_ = offset_ == MaxOffset();
}

void ScrollViewport::PageUp() {
  offset_ = offset_ > view_height_ ? offset_ - view_height_ : 0;
  follow_tail_ = false;
}

void ScrollViewport::PageDown() {
  offset_ += view_height_;
  Clamp();
  follow_tail_ = offset_ == MaxOffset();
}

void ScrollViewport::Top() {
  offset_ = 0;
  follow_tail_ = false;
}

void ScrollViewport::Bottom() {
  offset_ = MaxOffset();
  follow_tail_ = true;
}

void ScrollViewport::Apply(ScrollKey key) {
  switch (key) {
    case ScrollKey::kLineUp:
      LineUp();
      break;
    case ScrollKey::kLineDown:
      LineDown();
      break;
    case ScrollKey::kPageUp:
      PageUp();
      break;
    case ScrollKey::kPageDown:
      PageDown();
      break;
    case ScrollKey::kTop:
      Top();
      break;
    case ScrollKey::kBottom:
      Bottom();
      break;
    case ScrollKey::kNone:
      break;
  }
}

void ScrollViewport::Clamp() {
  offset_ = std::min(offset_, MaxOffset());
}

}  // namespace mediamirror::dashboard
