// Repository: MediaMirror
// Component: Mirror Configuration
// Purpose: Run configuration and command-line parsing for the mirror tool.
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_CONFIG_MIRROR_CONFIG_HPP_
#define MEDIAMIRROR_CONFIG_MIRROR_CONFIG_HPP_

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace mediamirror::config {

enum class RunMode {
  kConvert,  // normal mirror
  kDryRun,   // report planned actions, write nothing
  kClean,    // only remove stale temp artifacts and intermediates
};

const char* RunModeToString(RunMode mode);

enum class DemuxBackend { kFFmpeg, kFaad };

const char* DemuxBackendToString(DemuxBackend backend);

struct MirrorConfig {
  static constexpr int kDefaultRefreshMs = 100;

  std::filesystem::path input_root;
  std::filesystem::path output_root;

  int num_workers = DefaultWorkerCount();
  size_t queue_capacity = 0;  // 0: 2 * num_workers
  std::chrono::milliseconds refresh_interval{kDefaultRefreshMs};

  std::string lame_executable = "lame";
  std::vector<std::string> lame_args = {"-V", "7"};
  DemuxBackend demux_backend = DemuxBackend::kFFmpeg;
  std::string faad_executable = "faad";

  RunMode mode = RunMode::kConvert;
  bool verbose = false;
  bool plain = false;

  size_t EffectiveQueueCapacity() const;

  // Hardware concurrency, or 1 when unknown.
  static int DefaultWorkerCount();
};

struct CliArgs {
  MirrorConfig config;
  bool help = false;
  bool valid = false;
  std::string error;
};

// argv[0] is the program name and is skipped.
CliArgs ParseArgs(const std::vector<std::string>& argv);
CliArgs ParseArgs(int argc, char* argv[]);

void PrintUsage(std::ostream& os, const std::string& program);

// Whitespace split for --lame-args.
std::vector<std::string> SplitArgs(const std::string& text);

}  // namespace mediamirror::config

#endif  // MEDIAMIRROR_CONFIG_MIRROR_CONFIG_HPP_
