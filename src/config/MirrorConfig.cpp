// Repository: MediaMirror
// Component: Mirror Configuration Implementation
// Purpose: Command-line parsing and validation for a mirror run.
// Copyright (c) 2026 MediaMirror

#include "mediamirror/config/MirrorConfig.hpp"

#include <cctype>
#include <climits>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace mediamirror::config {

namespace {

// Strict non-negative integer parse; rejects trailing junk.
bool ParseCount(const std::string& text, long long& out) {
  if (text.empty()) return false;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  try {
    out = std::stoll(text);
  } catch (const std::out_of_range&) {
    return false;
  }
  return true;
}

CliArgs Invalid(CliArgs args, std::string message) {
  args.valid = false;
  args.error = std::move(message);
  return args;
}

}  // namespace

const char* RunModeToString(RunMode mode) {
  switch (mode) {
    case RunMode::kConvert:
      return "CONVERT";
    case RunMode::kDryRun:
      return "DRY_RUN";
    case RunMode::kClean:
      return "CLEAN";
  }
  return "UNKNOWN";
}

const char* DemuxBackendToString(DemuxBackend backend) {
  switch (backend) {
    case DemuxBackend::kFFmpeg:
      return "ffmpeg";
    case DemuxBackend::kFaad:
      return "faad";
  }
  return "unknown";
}

size_t MirrorConfig::EffectiveQueueCapacity() const {
  if (queue_capacity > 0) return queue_capacity;
  return static_cast<size_t>(num_workers > 0 ? num_workers : 1) * 2;
}

int MirrorConfig::DefaultWorkerCount() {
  const unsigned n = std::thread::hardware_concurrency();
  return n == 0 ? 1 : static_cast<int>(n);
}

std::vector<std::string> SplitArgs(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream iss(text);
  std::string word;
  while (iss >> word) out.push_back(word);
  return out;
}

void PrintUsage(std::ostream& os, const std::string& program) {
  os << "Usage: " << program << " [OPTIONS] INPUT_DIR OUTPUT_DIR\n"
     << "\n"
     << "Mirror INPUT_DIR into OUTPUT_DIR: audio is transcoded to MP3, artwork and\n"
     << "documents are copied, everything else is ignored. Interrupted runs resume.\n"
     << "\n"
     << "Options:\n"
     << "  --num-workers N      Parallel workers (default: CPU count)\n"
     << "  --queue-capacity N   Work queue bound (default: 2 x workers)\n"
     << "  --refresh-ms MS      Dashboard refresh interval (default: 100)\n"
     << "  --lame PATH          Encoder executable (default: lame)\n"
     << "  --lame-args ARGS     Encoder arguments (default: \"-V 7\")\n"
     << "  --demux BACKEND      Container demux: ffmpeg | faad (default: ffmpeg)\n"
     << "  --faad PATH          faad executable for --demux faad (default: faad)\n"
     << "  --dry-run            Report planned actions without writing anything\n"
     << "  --clean              Only remove stale partial outputs\n"
     << "  --verbose            Log every worker event as a plain line\n"
     << "  --plain              Periodic progress lines instead of the live view\n"
     << "  --help               Show this help message\n"
     << "\n"
     << "Exit status: 0 success, 1 some files failed, 2 usage or setup error\n";
}

CliArgs ParseArgs(const std::vector<std::string>& argv) {
  CliArgs args;
  MirrorConfig& cfg = args.config;
  std::vector<std::string> positional;
  bool dry_run = false;
  bool clean = false;

  for (size_t i = 1; i < argv.size(); ++i) {
    const std::string& arg = argv[i];
    const bool has_value = i + 1 < argv.size();
    long long n = 0;

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--num-workers") {
      if (!has_value || !ParseCount(argv[++i], n) || n < 1 || n > INT_MAX) {
        return Invalid(std::move(args), "--num-workers needs a positive integer");
      }
      cfg.num_workers = static_cast<int>(n);
    } else if (arg == "--queue-capacity") {
      if (!has_value || !ParseCount(argv[++i], n)) {
        return Invalid(std::move(args), "--queue-capacity needs a non-negative integer");
      }
      cfg.queue_capacity = static_cast<size_t>(n);
    } else if (arg == "--refresh-ms") {
      if (!has_value || !ParseCount(argv[++i], n) || n < 1 || n > INT_MAX) {
        return Invalid(std::move(args), "--refresh-ms needs a positive integer");
      }
      cfg.refresh_interval = std::chrono::milliseconds(n);
    } else if (arg == "--lame") {
      if (!has_value) return Invalid(std::move(args), "--lame needs a path");
      cfg.lame_executable = argv[++i];
    } else if (arg == "--lame-args") {
      if (!has_value) return Invalid(std::move(args), "--lame-args needs a value");
      cfg.lame_args = SplitArgs(argv[++i]);
    } else if (arg == "--demux") {
      if (!has_value) return Invalid(std::move(args), "--demux needs ffmpeg or faad");
      const std::string& backend = argv[++i];
      if (backend == "ffmpeg") {
        cfg.demux_backend = DemuxBackend::kFFmpeg;
      } else if (backend == "faad") {
        cfg.demux_backend = DemuxBackend::kFaad;
      } else {
        return Invalid(std::move(args), "unknown demux backend: " + backend);
      }
    } else if (arg == "--faad") {
      if (!has_value) return Invalid(std::move(args), "--faad needs a path");
      cfg.faad_executable = argv[++i];
    } else if (arg == "--dry-run") {
      dry_run = true;
    } else if (arg == "--clean") {
      clean = true;
    } else if (arg == "--verbose" || arg == "-v") {
      cfg.verbose = true;
    } else if (arg == "--plain") {
      cfg.plain = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      return Invalid(std::move(args), "unknown option: " + arg);
    } else {
      positional.push_back(arg);
    }
  }

  if (dry_run && clean) {
    return Invalid(std::move(args), "--dry-run and --clean are mutually exclusive");
  }
  if (positional.size() != 2) {
    return Invalid(std::move(args), "expected INPUT_DIR and OUTPUT_DIR");
  }
  cfg.mode = dry_run ? RunMode::kDryRun : (clean ? RunMode::kClean : RunMode::kConvert);
  cfg.input_root = positional[0];
  cfg.output_root = positional[1];
  args.valid = true;
  return args;
}

CliArgs ParseArgs(int argc, char* argv[]) {
  std::vector<std::string> args;
  args.reserve(static_cast<size_t>(argc));
  for (int i = 0; i < argc; ++i) args.emplace_back(argv[i]);
  return ParseArgs(args);
}

}  // namespace mediamirror::config
