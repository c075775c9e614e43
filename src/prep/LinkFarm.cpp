// Repository: MediaMirror
// Component: Link Farm Implementation
// Purpose: Builds the flat symlink tree that feeds a run.
// Copyright (c) 2026 MediaMirror

#include "mediamirror/prep/LinkFarm.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "mediamirror/pipeline/WorkEnumerator.hpp"
#include "mediamirror/util/Logger.hpp"

namespace mediamirror::prep {

namespace fs = std::filesystem;
using mediamirror::util::Logger;

namespace {

std::string Trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return "";
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

fs::path Normalize(const fs::path& p) {
  fs::path n = p.lexically_normal();
  if (n.has_relative_path() && n.filename().empty()) n = n.parent_path();
  return n;
}

}  // namespace

std::vector<fs::path> ReadDirectoryList(const fs::path& list_file) {
  std::ifstream in(list_file);
  if (!in) {
    throw std::runtime_error("cannot read directory list: " + list_file.string());
  }
  std::vector<fs::path> dirs;
  std::string line;
  while (std::getline(in, line)) {
    line = Trim(line);
    if (line.empty() || line[0] == '#') continue;
    dirs.emplace_back(line);
  }
  return dirs;
}

fs::path ExpandHome(const fs::path& path) {
  const std::string s = path.string();
  if (s.empty() || s[0] != '~') return path;
  if (s.size() > 1 && s[1] != '/') return path;  // ~user is not supported
  const char* home = std::getenv("HOME");
  if (home == nullptr) return path;
  if (s.size() <= 2) return fs::path(home);
  return fs::path(home) / s.substr(2);
}

LinkFarmResult BuildLinkFarm(const fs::path& out_dir, const fs::path& library_root,
                             const std::vector<fs::path>& directories) {
  LinkFarmResult result;
  const fs::path root = Normalize(ExpandHome(library_root));

  std::error_code ec;
  if (fs::create_directories(out_dir, ec)) ++result.directories_created;
  if (ec) {
    result.errors.push_back("cannot create " + out_dir.string() + ": " + ec.message());
    return result;
  }

  for (const auto& listed : directories) {
    const fs::path dir = Normalize(ExpandHome(listed));
    if (dir == root || !pipeline::IsSameOrWithin(dir, root)) {
      result.errors.push_back(dir.string() + " is not below " + root.string());
      continue;
    }
    const fs::path relative = dir.lexically_relative(root);
    const fs::path link = out_dir / relative;

    if (relative.has_parent_path()) {
      if (fs::create_directories(link.parent_path(), ec)) ++result.directories_created;
      if (ec) {
        result.errors.push_back("cannot create " + link.parent_path().string() + ": " +
                                ec.message());
        continue;
      }
    }

    if (fs::exists(fs::symlink_status(link))) {
      Logger::Debug("[LinkFarm] LINK_EXISTS path=" + link.string());
      ++result.links_skipped;
      continue;
    }
    fs::create_directory_symlink(dir, link, ec);
    if (ec) {
      result.errors.push_back("cannot link " + link.string() + ": " + ec.message());
      continue;
    }
    Logger::Info("[LinkFarm] LINK_CREATED " + link.string() + " -> " + dir.string());
    ++result.links_created;
  }
  return result;
}

}  // namespace mediamirror::prep
