// Repository: MediaMirror
// Component: Link Farm
// Purpose: Assembles a mirror input tree out of symlinks to chosen library
//          directories.
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_PREP_LINK_FARM_HPP_
#define MEDIAMIRROR_PREP_LINK_FARM_HPP_

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace mediamirror::prep {

struct LinkFarmResult {
  size_t links_created = 0;
  size_t links_skipped = 0;  // link path already existed
  size_t directories_created = 0;
  std::vector<std::string> errors;

  bool ok() const { return errors.empty(); }
};

// One directory per line. Blank lines and lines starting with '#' are
// skipped; surrounding whitespace is trimmed. Throws std::runtime_error if
// the file cannot be read.
std::vector<std::filesystem::path> ReadDirectoryList(const std::filesystem::path& list_file);

// "~" and "~/..." expand against $HOME.
std::filesystem::path ExpandHome(const std::filesystem::path& path);

// For every listed directory D under `library_root`, creates
// out_dir/relative(D) as a symlink to D, creating the parents it needs.
// Existing link paths are left alone. Directories outside `library_root`
// are reported as errors and skipped; the rest still proceed.
LinkFarmResult BuildLinkFarm(const std::filesystem::path& out_dir,
                             const std::filesystem::path& library_root,
                             const std::vector<std::filesystem::path>& directories);

}  // namespace mediamirror::prep

#endif  // MEDIAMIRROR_PREP_LINK_FARM_HPP_
