// Repository: MediaMirror
// Component: ProcessRunner Tests
// Purpose: Exit codes, output tail and exec failures.
// Copyright (c) 2026 MediaMirror

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "mediamirror/tools/ProcessRunner.hpp"

namespace mediamirror::tools::testing {
namespace {

TEST(ProcessRunnerTest, SplitsOutputOnCarriageReturnAndNewline) {
  ProcessRunner runner;
  std::vector<std::string> lines;
  const auto result = runner.Run({"/bin/sh", "-c", "printf '10%%\\r20%%\\rdone\\n'"},
                                 [&lines](const std::string& l) { lines.push_back(l); });
  ASSERT_TRUE(result.Succeeded()) << DescribeProcessResult(result);
  const std::vector<std::string> expected = {"10%", "20%", "done"};
  EXPECT_EQ(lines, expected);
}

TEST(ProcessRunnerTest, StderrIsMergedIntoTail) {
  ProcessRunner runner;
  const auto result = runner.Run({"/bin/sh", "-c", "echo oops 1>&2; exit 3"}, nullptr);
  EXPECT_TRUE(result.started);
  EXPECT_FALSE(result.Succeeded());
  EXPECT_EQ(result.exit_code, 3);
  EXPECT_NE(result.output_tail.find("oops"), std::string::npos);
  EXPECT_EQ(DescribeProcessResult(result), "exit=3");
}

TEST(ProcessRunnerTest, MissingExecutableReportsExecFailure) {
  ProcessRunner runner;
  const auto result = runner.Run({"/nonexistent/mediamirror-no-such-tool"}, nullptr);
  EXPECT_TRUE(result.started);
  EXPECT_EQ(result.exit_code, kExecFailedExitCode);
  EXPECT_FALSE(result.Succeeded());
}

TEST(ProcessRunnerTest, SignalledChild) {
  ProcessRunner runner;
  const auto result = runner.Run({"/bin/sh", "-c", "kill -9 $$"}, nullptr);
  EXPECT_TRUE(result.started);
  EXPECT_EQ(result.term_signal, 9);
  EXPECT_FALSE(result.Succeeded());
  EXPECT_EQ(DescribeProcessResult(result), "signal=9");
}

TEST(ProcessRunnerTest, TailIsBounded) {
  ProcessRunner runner(16);
  const auto result = runner.Run(
      {"/bin/sh", "-c", "i=0; while [ $i -lt 100 ]; do echo line$i; i=$((i+1)); done"},
      nullptr);
  ASSERT_TRUE(result.Succeeded());
  EXPECT_EQ(result.output_tail.size(), 16u);
  EXPECT_NE(result.output_tail.find("line99"), std::string::npos);
}

TEST(ProcessRunnerTest, EmptyCommandLineNeverStarts) {
  ProcessRunner runner;
  const auto result = runner.Run({}, nullptr);
  EXPECT_FALSE(result.started);
  EXPECT_FALSE(result.error.empty());
}

}  // namespace
}  // namespace mediamirror::tools::testing
