// Repository: MediaMirror
// Component: MirrorConfig Tests
// Purpose: Flag parsing, defaults and rejected values.
// Copyright (c) 2026 MediaMirror

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "mediamirror/config/MirrorConfig.hpp"

namespace mediamirror::config::testing {
namespace {

CliArgs Parse(std::vector<std::string> args) {
  args.insert(args.begin(), "mediamirror");
  return ParseArgs(args);
}

TEST(MirrorConfigTest, Defaults) {
  const auto args = Parse({"in", "out"});
  ASSERT_TRUE(args.valid) << args.error;
  const auto& cfg = args.config;
  EXPECT_EQ(cfg.input_root, "in");
  EXPECT_EQ(cfg.output_root, "out");
  EXPECT_GE(cfg.num_workers, 1);
  EXPECT_EQ(cfg.mode, RunMode::kConvert);
  EXPECT_EQ(cfg.lame_executable, "lame");
  const std::vector<std::string> lame_args = {"-V", "7"};
  EXPECT_EQ(cfg.lame_args, lame_args);
  EXPECT_EQ(cfg.demux_backend, DemuxBackend::kFFmpeg);
  EXPECT_EQ(cfg.refresh_interval.count(), MirrorConfig::kDefaultRefreshMs);
  EXPECT_EQ(cfg.EffectiveQueueCapacity(), static_cast<size_t>(cfg.num_workers) * 2);
  EXPECT_FALSE(cfg.verbose);
  EXPECT_FALSE(cfg.plain);
}

TEST(MirrorConfigTest, AllOptions) {
  const auto args =
      Parse({"--num-workers", "3", "--queue-capacity", "5", "--refresh-ms", "250", "--lame",
             "/opt/lame", "--lame-args", "-b 192  --cbr", "--demux", "faad", "--faad",
             "/opt/faad", "--verbose", "--plain", "/music", "/mirror"});
  ASSERT_TRUE(args.valid) << args.error;
  const auto& cfg = args.config;
  EXPECT_EQ(cfg.num_workers, 3);
  EXPECT_EQ(cfg.EffectiveQueueCapacity(), 5u);
  EXPECT_EQ(cfg.refresh_interval.count(), 250);
  EXPECT_EQ(cfg.lame_executable, "/opt/lame");
  const std::vector<std::string> lame_args = {"-b", "192", "--cbr"};
  EXPECT_EQ(cfg.lame_args, lame_args);
  EXPECT_EQ(cfg.demux_backend, DemuxBackend::kFaad);
  EXPECT_EQ(cfg.faad_executable, "/opt/faad");
  EXPECT_TRUE(cfg.verbose);
  EXPECT_TRUE(cfg.plain);
  EXPECT_EQ(cfg.input_root, "/music");
  EXPECT_EQ(cfg.output_root, "/mirror");
}

TEST(MirrorConfigTest, Modes) {
  EXPECT_EQ(Parse({"--dry-run", "a", "b"}).config.mode, RunMode::kDryRun);
  EXPECT_EQ(Parse({"a", "--clean", "b"}).config.mode, RunMode::kClean);

  const auto both = Parse({"--dry-run", "--clean", "a", "b"});
  EXPECT_FALSE(both.valid);
  EXPECT_NE(both.error.find("mutually exclusive"), std::string::npos);
}

TEST(MirrorConfigTest, Rejections) {
  EXPECT_FALSE(Parse({"a"}).valid);
  EXPECT_FALSE(Parse({"a", "b", "c"}).valid);
  EXPECT_FALSE(Parse({"--num-workers", "0", "a", "b"}).valid);
  EXPECT_FALSE(Parse({"--num-workers", "4x", "a", "b"}).valid);
  EXPECT_FALSE(Parse({"--num-workers"}).valid);
  EXPECT_FALSE(Parse({"--num-workers", "4294967297", "a", "b"}).valid);
  EXPECT_FALSE(Parse({"--num-workers", "99999999999999999999", "a", "b"}).valid);
  EXPECT_FALSE(Parse({"--refresh-ms", "4294967297", "a", "b"}).valid);
  EXPECT_TRUE(Parse({"--num-workers", "2147483647", "a", "b"}).valid);
  EXPECT_FALSE(Parse({"--refresh-ms", "0", "a", "b"}).valid);
  EXPECT_FALSE(Parse({"--demux", "gstreamer", "a", "b"}).valid);

  const auto unknown = Parse({"--fast", "a", "b"});
  EXPECT_FALSE(unknown.valid);
  EXPECT_NE(unknown.error.find("--fast"), std::string::npos);
}

TEST(MirrorConfigTest, HelpStopsParsing) {
  const auto args = Parse({"--bogus", "--help"});
  // --bogus is rejected before --help is seen.
  EXPECT_FALSE(args.valid);

  const auto help = Parse({"-h", "--bogus"});
  EXPECT_TRUE(help.valid);
  EXPECT_TRUE(help.help);
}

TEST(MirrorConfigTest, UsageMentionsExitStatus) {
  std::ostringstream oss;
  PrintUsage(oss, "mediamirror");
  EXPECT_NE(oss.str().find("Usage: mediamirror"), std::string::npos);
  EXPECT_NE(oss.str().find("--dry-run"), std::string::npos);
  EXPECT_NE(oss.str().find("Exit status"), std::string::npos);
}

TEST(MirrorConfigTest, QueueCapacityZeroMeansDefault) {
  MirrorConfig cfg;
  cfg.num_workers = 4;
  cfg.queue_capacity = 0;
  EXPECT_EQ(cfg.EffectiveQueueCapacity(), 8u);
}

TEST(MirrorConfigTest, SplitArgs) {
  const std::vector<std::string> expected = {"-V", "2", "--preset", "x"};
  EXPECT_EQ(SplitArgs("  -V 2\t--preset x "), expected);
  EXPECT_TRUE(SplitArgs("   ").empty());
}

}  // namespace
}  // namespace mediamirror::config::testing
