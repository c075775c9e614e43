// Repository: MediaMirror
// Component: Artifact Paths Implementation
// Purpose: Final and temporary artifact paths and their on-disk state.
// Copyright (c) 2026 MediaMirror

#include "mediamirror/pipeline/ArtifactPaths.hpp"

#include <string>

namespace mediamirror::pipeline {

namespace fs = std::filesystem;

const char* const kWorkSuffix = ".mmpart";
const char* const kDemuxSuffix = ".demux.wav";

const char* ArtifactStateToString(ArtifactState state) {
  switch (state) {
    case ArtifactState::kAbsent:
      return "ABSENT";
    case ArtifactState::kWorkInProgress:
      return "WORK_IN_PROGRESS";
    case ArtifactState::kComplete:
      return "COMPLETE";
  }
  return "UNKNOWN";
}

ArtifactPaths ArtifactPaths::For(const fs::path& final_path) {
  ArtifactPaths paths;
  paths.final_path = final_path;
  paths.temp_path = final_path;
  paths.temp_path += kWorkSuffix;
  paths.intermediate_path = final_path;
  paths.intermediate_path += kDemuxSuffix;
  return paths;
}

ArtifactState ArtifactPaths::State() const {
  std::error_code ec;
  if (fs::is_regular_file(final_path, ec)) return ArtifactState::kComplete;
  if (fs::exists(temp_path, ec)) return ArtifactState::kWorkInProgress;
  return ArtifactState::kAbsent;
}

bool ArtifactPaths::FinalBlocked() const {
  std::error_code ec;
  const auto st = fs::status(final_path, ec);
  return fs::exists(st) && !fs::is_regular_file(st);
}

bool IsWorkArtifact(const fs::path& name) {
  const std::string n = name.filename().string();
  auto ends_with = [&n](const std::string& suffix) {
    return n.size() > suffix.size() &&
           n.compare(n.size() - suffix.size(), suffix.size(), suffix) == 0;
  };
  return ends_with(kWorkSuffix) || ends_with(kDemuxSuffix);
}

void PromoteToFinal(const ArtifactPaths& paths, std::error_code& ec) {
  fs::rename(paths.temp_path, paths.final_path, ec);
}

void CopyWithMetadata(const fs::path& from, const fs::path& to, std::error_code& ec) {
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) return;

  const auto status = fs::status(from, ec);
  if (ec) return;
  fs::permissions(to, status.permissions(), fs::perm_options::replace, ec);
  if (ec) return;

  const auto mtime = fs::last_write_time(from, ec);
  if (ec) return;
  fs::last_write_time(to, mtime, ec);
}

}  // namespace mediamirror::pipeline
