// Repository: MediaMirror
// Component: Link Farm Executable
// Purpose: Builds a symlink input tree from a list of library directories.
// Copyright (c) 2026 MediaMirror

#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "mediamirror/prep/LinkFarm.hpp"
#include "mediamirror/util/Logger.hpp"

namespace {

using mediamirror::util::Logger;

struct CliArgs {
  std::string out_dir;
  std::string dirs_file;
  std::string library_root = "~/Music";
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [--root DIR] OUTPUT_DIR DIRS_FILE\n"
            << "\n"
            << "Creates OUTPUT_DIR/<path below root> -> <listed dir> symlinks for every\n"
            << "directory listed in DIRS_FILE (one per line, '#' comments allowed).\n"
            << "\n"
            << "Options:\n"
            << "  --root DIR   Library root the listed directories live under (default: ~/Music)\n"
            << "  --help       Show this help message\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--root" && i + 1 < argc) {
      args.library_root = argv[++i];
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option: " + arg;
      return args;
    } else {
      positional.push_back(arg);
    }
  }
  if (positional.size() != 2) {
    args.error = "expected OUTPUT_DIR and DIRS_FILE";
    return args;
  }
  args.out_dir = positional[0];
  args.dirs_file = positional[1];
  args.valid = true;
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 2;
  }

  try {
    const auto dirs = mediamirror::prep::ReadDirectoryList(args.dirs_file);
    const auto result =
        mediamirror::prep::BuildLinkFarm(args.out_dir, args.library_root, dirs);
    for (const auto& e : result.errors) {
      Logger::Error("[LinkFarm] " + e);
    }
    Logger::Info("[LinkFarm] DONE created=" + std::to_string(result.links_created) +
                 " skipped=" + std::to_string(result.links_skipped) +
                 " errors=" + std::to_string(result.errors.size()));
    return result.ok() ? 0 : 1;
  } catch (const std::exception& e) {
    Logger::Error(std::string("[LinkFarm] FATAL ") + e.what());
    return 2;
  }
}
