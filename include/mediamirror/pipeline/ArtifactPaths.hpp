// Repository: MediaMirror
// Component: Artifact Paths
// Purpose: Naming and state of the on-disk artifacts of one logical output.
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_PIPELINE_ARTIFACT_PATHS_HPP_
#define MEDIAMIRROR_PIPELINE_ARTIFACT_PATHS_HPP_

#include <filesystem>
#include <system_error>

namespace mediamirror::pipeline {

// Reserved suffix of in-progress outputs. Never part of a finished tree.
extern const char* const kWorkSuffix;

// Suffix of the container-demux intermediate.
extern const char* const kDemuxSuffix;

// Per-output artifact states. Exactly one holds at any instant:
//   kAbsent -> kWorkInProgress -> kComplete   (forward path)
//   kWorkInProgress -> kAbsent                (recovery: delete stale temp)
enum class ArtifactState { kAbsent, kWorkInProgress, kComplete };

const char* ArtifactStateToString(ArtifactState state);

struct ArtifactPaths {
  std::filesystem::path final_path;
  std::filesystem::path temp_path;          // final + kWorkSuffix
  std::filesystem::path intermediate_path;  // final + kDemuxSuffix

  static ArtifactPaths For(const std::filesystem::path& final_path);

  // kComplete only when the final path is a regular file.
  ArtifactState State() const;

  // Something other than a regular file (a directory, a socket) sits at the
  // final path; no output can ever be promoted there.
  bool FinalBlocked() const;
};

// True if `name` carries one of this tool's artifact suffixes.
bool IsWorkArtifact(const std::filesystem::path& name);

// Atomic temp -> final rename. Same directory, so rename(2) is atomic.
void PromoteToFinal(const ArtifactPaths& paths, std::error_code& ec);

// Copies content, permission bits and modification time.
void CopyWithMetadata(const std::filesystem::path& from,
                      const std::filesystem::path& to, std::error_code& ec);

}  // namespace mediamirror::pipeline

#endif  // MEDIAMIRROR_PIPELINE_ARTIFACT_PATHS_HPP_
