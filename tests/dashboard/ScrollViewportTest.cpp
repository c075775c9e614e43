// Repository: MediaMirror
// Component: ScrollViewport / KeyDecoder Tests
// Purpose: Scrolling, key decoding and line composition.
// Copyright (c) 2026 MediaMirror

#include <gtest/gtest.h>

#include "mediamirror/dashboard/KeyDecoder.hpp"
#include "mediamirror/dashboard/LiveTerminalRenderer.hpp"
#include "mediamirror/dashboard/ScrollViewport.hpp"

namespace mediamirror::dashboard::testing {
namespace {

ScrollViewport Make(size_t content, size_t view) {
  ScrollViewport v;
  v.SetViewHeight(view);
  v.SetContentHeight(content);
  return v;
}

TEST(ScrollViewportTest, StartsAtTopAndClamps) {
  auto v = Make(100, 10);
  EXPECT_EQ(v.Offset(), 0u);
  EXPECT_EQ(v.End(), 10u);
  v.LineUp();
  EXPECT_EQ(v.Offset(), 0u);
  v.LineDown();
  EXPECT_EQ(v.Offset(), 1u);
}

TEST(ScrollViewportTest, PagingAndEnds) {
  auto v = Make(100, 10);
  v.PageDown();
  EXPECT_EQ(v.Offset(), 10u);
  v.PageUp();
  EXPECT_EQ(v.Offset(), 0u);
  v.Bottom();
  EXPECT_EQ(v.Offset(), 90u);
  EXPECT_EQ(v.End(), 100u);
  v.PageDown();
  EXPECT_EQ(v.Offset(), 90u);
  v.Top();
  EXPECT_EQ(v.Offset(), 0u);
}

TEST(ScrollViewportTest, ShortContentNeverScrolls) {
  auto v = Make(3, 10);
  v.PageDown();
  v.LineDown();
  EXPECT_EQ(v.Offset(), 0u);
  EXPECT_EQ(v.End(), 3u);
  EXPECT_EQ(v.MaxOffset(), 0u);
}

TEST(ScrollViewportTest, FollowsTailAfterBottom) {
  auto v = Make(20, 10);
  v.Bottom();
  v.SetContentHeight(25);
  EXPECT_EQ(v.Offset(), 15u);
  v.LineUp();
  v.SetContentHeight(30);
  EXPECT_EQ(v.Offset(), 14u);
  EXPECT_FALSE(v.FollowingTail());
}

TEST(ScrollViewportTest, ShrinkingContentClampsOffset) {
  auto v = Make(50, 10);
  v.PageDown();
  v.PageDown();
  v.SetContentHeight(12);
  EXPECT_EQ(v.Offset(), 2u);
}

TEST(KeyDecoderTest, ArrowsAndPaging) {
  KeyDecoder d;
  const auto keys = d.Feed("\x1b[A\x1b[B\x1b[5~\x1b[6~\x1b[H\x1b[F");
  const std::vector<ScrollKey> expected = {ScrollKey::kLineUp,   ScrollKey::kLineDown,
                                           ScrollKey::kPageUp,   ScrollKey::kPageDown,
                                           ScrollKey::kTop,      ScrollKey::kBottom};
  EXPECT_EQ(keys, expected);
}

TEST(KeyDecoderTest, VimStyleLetters) {
  KeyDecoder d;
  const auto keys = d.Feed("kjb gGx");
  const std::vector<ScrollKey> expected = {ScrollKey::kLineUp, ScrollKey::kLineDown,
                                           ScrollKey::kPageUp, ScrollKey::kPageDown,
                                           ScrollKey::kTop,    ScrollKey::kBottom};
  EXPECT_EQ(keys, expected);
}

TEST(KeyDecoderTest, SequenceSplitAcrossReads) {
  KeyDecoder d;
  EXPECT_TRUE(d.Feed("\x1b").empty());
  EXPECT_TRUE(d.Feed("[6").empty());
  const auto keys = d.Feed("~j");
  const std::vector<ScrollKey> expected = {ScrollKey::kPageDown, ScrollKey::kLineDown};
  EXPECT_EQ(keys, expected);
}

TEST(KeyDecoderTest, AlternateHomeEndForms) {
  KeyDecoder d;
  const auto keys = d.Feed("\x1bOH\x1bOF\x1b[1~\x1b[4~");
  const std::vector<ScrollKey> expected = {ScrollKey::kTop, ScrollKey::kBottom, ScrollKey::kTop,
                                           ScrollKey::kBottom};
  EXPECT_EQ(keys, expected);
}

TEST(KeyDecoderTest, UnknownSequencesDropped) {
  KeyDecoder d;
  EXPECT_TRUE(d.Feed("\x1b[2~\x1b[C").empty());
}

TEST(LiveTerminalRendererComposeTest, ComposeLinesPlacesLogBelowWorkers) {
  DashboardView view;
  view.total_transcodable = 2;
  view.workers_total = 2;
  view.workers.resize(2);
  view.workers[0].worker_id = 0;
  view.workers[1].worker_id = 1;
  std::deque<LiveTerminalRenderer::LogEntry> log;
  log.push_back({util::LogLevel::kInfo, "stale artifact removed"});

  const auto lines = LiveTerminalRenderer::ComposeLines(view, log);
  ASSERT_EQ(lines.size(), 1u + 1u + 2u + 1u + 1u + 1u);
  EXPECT_NE(lines[0].find("0/2"), std::string::npos);
  EXPECT_EQ(lines[4], "");
  EXPECT_EQ(lines[5], "Log:");
  EXPECT_NE(lines[6].find("stale artifact removed"), std::string::npos);
}

}  // namespace
}  // namespace mediamirror::dashboard::testing
