// Repository: MediaMirror
// Component: PlainTextRenderer Tests
// Purpose: Plain progress lines and logger redirection.
// Copyright (c) 2026 MediaMirror

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "mediamirror/dashboard/PlainTextRenderer.hpp"
#include "mediamirror/util/Logger.hpp"

namespace mediamirror::dashboard::testing {
namespace {

using mediamirror::util::Logger;
using mediamirror::util::LogLevel;

class PlainTextRendererTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Logger::SetRedirect([this](LogLevel, const std::string& line) { lines_.push_back(line); });
  }
  void TearDown() override { Logger::SetRedirect(nullptr); }

  static DashboardView View(uint64_t done) {
    DashboardView view;
    view.transcodes_done = done;
    view.total_transcodable = 10;
    view.totals.transcoded = done;
    return view;
  }

  std::vector<std::string> lines_;
};

TEST_F(PlainTextRendererTest, FirstPresentAlwaysLogs) {
  PlainTextRenderer renderer(std::chrono::milliseconds(0));
  renderer.Present(View(0));
  ASSERT_EQ(lines_.size(), 1u);
  EXPECT_EQ(lines_[0].rfind("[Progress] ", 0), 0u);
}

TEST_F(PlainTextRendererTest, UnchangedViewIsNotRepeated) {
  PlainTextRenderer renderer(std::chrono::milliseconds(0));
  renderer.Present(View(1));
  renderer.Present(View(1));
  renderer.Present(View(2));
  EXPECT_EQ(renderer.LinesEmitted(), 2u);
  EXPECT_EQ(lines_.size(), 2u);
}

TEST_F(PlainTextRendererTest, RateLimited) {
  PlainTextRenderer renderer(std::chrono::hours(1));
  renderer.Present(View(1));
  renderer.Present(View(2));
  renderer.Present(View(3));
  EXPECT_EQ(renderer.LinesEmitted(), 1u);
}

TEST_F(PlainTextRendererTest, FinishAlwaysLogs) {
  PlainTextRenderer renderer(std::chrono::hours(1));
  renderer.Present(View(1));
  renderer.Finish(View(10));
  ASSERT_EQ(lines_.size(), 2u);
  EXPECT_NE(lines_[1].find("FINISHED"), std::string::npos);
  EXPECT_NE(lines_[1].find("10/10"), std::string::npos);
}

TEST(LoggerTest, ErrorSinkSeesErrorsOnly) {
  std::vector<std::string> errors;
  std::vector<LogLevel> levels;
  Logger::SetRedirect([&levels](LogLevel level, const std::string&) { levels.push_back(level); });
  Logger::SetErrorSink([&errors](const std::string& line) { errors.push_back(line); });
  Logger::Info("info");
  Logger::Warn("warn");
  Logger::Error("error");
  Logger::SetErrorSink(nullptr);
  Logger::SetRedirect(nullptr);

  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0], "error");
  const std::vector<LogLevel> expected = {LogLevel::kInfo, LogLevel::kWarn, LogLevel::kError};
  EXPECT_EQ(levels, expected);
}

}  // namespace
}  // namespace mediamirror::dashboard::testing
