// Repository: MediaMirror
// Component: Work Enumerator
// Purpose: Walks the input tree once and turns it into a stream of
//          per-directory WorkBatches terminated by EndOfWork markers.
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_PIPELINE_WORK_ENUMERATOR_HPP_
#define MEDIAMIRROR_PIPELINE_WORK_ENUMERATOR_HPP_

#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

#include "mediamirror/pipeline/PipelineTypes.hpp"

namespace mediamirror::pipeline {

// WorkEnumerator owns the input-tree walk.
//
// Lifecycle:
//   1. Validate()         : fail fast on bad roots, before any worker exists
//   2. Scan()             : single walk; follows directory symlinks but
//                          never re-enters a directory on its own ancestor
//                          chain (canonical paths). A directory reachable
//                          through two links is mirrored under both paths.
//   3. PrepareOutputTree(): mkdir -p every mirrored directory
//   4. Next() until nullopt
//
// Next() yields one WorkBatch per input directory holding at least one file,
// then exactly num_workers EndOfWork markers, then nullopt. The sequence is
// not restartable: batches are moved out as they are handed over.
//
// Output paths are unique across the whole stream. Two inputs of one
// directory that would mirror to the same output (song.wav and song.flac
// both becoming song.mp3) are disambiguated, never merged.
class WorkEnumerator {
 public:
  WorkEnumerator(fs::path input_root, fs::path output_root, int num_workers);

  WorkEnumerator(const WorkEnumerator&) = delete;
  WorkEnumerator& operator=(const WorkEnumerator&) = delete;

  SetupResult Validate() const;

  void Scan();

  SetupResult PrepareOutputTree() const;

  std::optional<WorkItem> Next();

  // Populated by Scan().
  size_t TranscodableCount() const { return transcodable_count_; }
  size_t FileCount() const { return file_count_; }
  size_t BatchCount() const { return batch_count_; }
  size_t DirectoryCount() const { return directories_.size(); }

  const fs::path& InputRoot() const { return input_root_; }
  const fs::path& OutputRoot() const { return output_root_; }

 private:
  struct ScannedDirectory {
    fs::path relative;             // relative to input_root_ ("" for the root)
    std::vector<FilePair> pairs;   // empty if the directory holds no files
  };

  void ScanDirectory(const fs::path& absolute, const fs::path& relative,
                     std::vector<fs::path>& subdirs_out);

  fs::path input_root_;
  fs::path output_root_;
  int num_workers_;

  std::vector<ScannedDirectory> directories_;
  size_t cursor_ = 0;
  int markers_emitted_ = 0;
  size_t transcodable_count_ = 0;
  size_t file_count_ = 0;
  size_t batch_count_ = 0;
};

// True if `child` equals `parent` or lies beneath it. Both are compared
// lexically; callers pass canonical paths.
bool IsSameOrWithin(const fs::path& child, const fs::path& parent);

}  // namespace mediamirror::pipeline

#endif  // MEDIAMIRROR_PIPELINE_WORK_ENUMERATOR_HPP_
