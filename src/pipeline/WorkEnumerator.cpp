// Repository: MediaMirror
// Component: Work Enumerator Implementation
// Purpose: Walks the input tree and feeds one batch per directory to the queue.
// Copyright (c) 2026 MediaMirror

#include "mediamirror/pipeline/WorkEnumerator.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "mediamirror/pipeline/ArtifactPaths.hpp"
#include "mediamirror/pipeline/MediaClassifier.hpp"
#include "mediamirror/util/Logger.hpp"

namespace mediamirror::pipeline {

using mediamirror::util::Logger;

namespace {

fs::path StripTrailingSeparator(fs::path p) {
  p = p.lexically_normal();
  if (p.has_relative_path() && p.filename().empty()) {
    p = p.parent_path();
  }
  return p;
}

// Picks an output path that no earlier input of the same directory claimed.
fs::path DisambiguateOutput(const fs::path& candidate, const fs::path& input_name,
                            const std::set<fs::path>& used) {
  // song.wav -> song.wav.mp3
  fs::path alt = candidate.parent_path() /
                 (input_name.string() + candidate.extension().string());
  for (int n = 2; used.count(alt.filename()) != 0; ++n) {
    alt = candidate.parent_path() /
          (candidate.stem().string() + "~" + std::to_string(n) +
           candidate.extension().string());
  }
  return alt;
}

}  // namespace

bool IsSameOrWithin(const fs::path& child, const fs::path& parent) {
  const fs::path c = StripTrailingSeparator(child);
  const fs::path p = StripTrailingSeparator(parent);
  auto [p_it, c_it] = std::mismatch(p.begin(), p.end(), c.begin(), c.end());
  (void)c_it;
  return p_it == p.end();
}

WorkEnumerator::WorkEnumerator(fs::path input_root, fs::path output_root,
                               int num_workers)
    : input_root_(StripTrailingSeparator(std::move(input_root))),
      output_root_(StripTrailingSeparator(std::move(output_root))),
      num_workers_(num_workers) {
  if (num_workers_ < 1) {
    throw std::invalid_argument("WorkEnumerator: num_workers must be at least 1");
  }
}

// =============================================================================
// Validate: setup errors are fatal and precede any worker start
// =============================================================================

SetupResult WorkEnumerator::Validate() const {
  std::error_code ec;
  if (!fs::exists(input_root_, ec)) {
    return SetupResult::Failure(SetupError::kInputMissing,
                                "input directory does not exist: " + input_root_.string());
  }
  if (!fs::is_directory(input_root_, ec)) {
    return SetupResult::Failure(SetupError::kInputNotDirectory,
                                "input is not a directory: " + input_root_.string());
  }
  if (fs::exists(output_root_, ec) && !fs::is_directory(output_root_, ec)) {
    return SetupResult::Failure(SetupError::kOutputNotDirectory,
                                "output exists and is not a directory: " +
                                    output_root_.string());
  }

  const fs::path in_canon = fs::canonical(input_root_, ec);
  if (ec) {
    return SetupResult::Failure(SetupError::kFilesystemError,
                                "cannot resolve input directory: " + ec.message());
  }
  const fs::path out_canon = fs::weakly_canonical(output_root_, ec);
  if (ec) {
    return SetupResult::Failure(SetupError::kFilesystemError,
                                "cannot resolve output directory: " + ec.message());
  }

  if (in_canon == out_canon) {
    return SetupResult::Failure(SetupError::kSameRoots,
                                "output directory cannot be the same as input directory");
  }
  if (IsSameOrWithin(out_canon, in_canon)) {
    return SetupResult::Failure(SetupError::kOutputInsideInput,
                                "output directory cannot be inside the input directory");
  }
  if (IsSameOrWithin(in_canon, out_canon)) {
    return SetupResult::Failure(SetupError::kInputInsideOutput,
                                "input directory cannot be inside the output directory");
  }
  return SetupResult::Success();
}

// =============================================================================
// Scan: single walk of the input tree
// =============================================================================

void WorkEnumerator::Scan() {
  directories_.clear();
  cursor_ = 0;
  markers_emitted_ = 0;
  transcodable_count_ = 0;
  file_count_ = 0;
  batch_count_ = 0;

  struct Pending {
    fs::path absolute;
    fs::path relative;
    std::vector<fs::path> ancestors;  // canonical chain, for loop detection
  };

  std::vector<Pending> stack;
  stack.push_back({input_root_, fs::path(), {}});

  while (!stack.empty()) {
    Pending cur = std::move(stack.back());
    stack.pop_back();

    std::error_code ec;
    fs::path canonical = fs::canonical(cur.absolute, ec);
    if (ec) {
      Logger::Warn("[WorkEnumerator] SCAN_SKIP path=" + cur.absolute.string() +
                   " reason=" + ec.message());
      continue;
    }
    if (std::find(cur.ancestors.begin(), cur.ancestors.end(), canonical) !=
        cur.ancestors.end()) {
      Logger::Warn("[WorkEnumerator] SYMLINK_LOOP_SKIPPED path=" + cur.absolute.string() +
                   " target=" + canonical.string());
      continue;
    }

    std::vector<fs::path> subdirs;
    ScanDirectory(cur.absolute, cur.relative, subdirs);

    std::vector<fs::path> chain = cur.ancestors;
    chain.push_back(canonical);
    // Reverse push keeps the walk in sorted order.
    for (auto it = subdirs.rbegin(); it != subdirs.rend(); ++it) {
      stack.push_back({cur.absolute / *it, cur.relative / *it, chain});
    }
  }

  std::ostringstream oss;
  oss << "[WorkEnumerator] SCAN_COMPLETE root=" << input_root_.string()
      << " directories=" << directories_.size() << " files=" << file_count_
      << " transcodable=" << transcodable_count_ << " batches=" << BatchCount();
  Logger::Debug(oss.str());
}

void WorkEnumerator::ScanDirectory(const fs::path& absolute, const fs::path& relative,
                                   std::vector<fs::path>& subdirs_out) {
  std::vector<fs::path> files;
  std::error_code ec;
  for (fs::directory_iterator it(absolute, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_directory(type_ec)) {
      subdirs_out.push_back(it->path().filename());
    } else if (it->is_regular_file(type_ec)) {
      if (IsWorkArtifact(it->path())) {
        Logger::Debug("[WorkEnumerator] ARTIFACT_SKIPPED path=" + it->path().string());
        continue;
      }
      files.push_back(it->path().filename());
    }
  }
  if (ec) {
    Logger::Warn("[WorkEnumerator] SCAN_PARTIAL path=" + absolute.string() +
                 " reason=" + ec.message());
  }
  std::sort(subdirs_out.begin(), subdirs_out.end());
  std::sort(files.begin(), files.end());

  ScannedDirectory dir;
  dir.relative = relative;
  // Mirrored subdirectories occupy their names in the output directory too.
  std::set<fs::path> used_outputs(subdirs_out.begin(), subdirs_out.end());
  for (const auto& name : files) {
    const FileClass cls = Classify(name);
    fs::path out = MirrorOutputPath(output_root_, relative / name, cls);
    if (cls != FileClass::kIgnored) {
      if (used_outputs.count(out.filename()) != 0) {
        fs::path alt = DisambiguateOutput(out, name, used_outputs);
        Logger::Warn("[WorkEnumerator] OUTPUT_COLLISION input=" + (absolute / name).string() +
                     " wanted=" + out.string() + " using=" + alt.string());
        out = alt;
      }
      used_outputs.insert(out.filename());
    }
    if (IsTranscodable(cls)) ++transcodable_count_;
    ++file_count_;
    dir.pairs.push_back({absolute / name, std::move(out)});
  }
  if (!dir.pairs.empty()) ++batch_count_;
  directories_.push_back(std::move(dir));
}

// =============================================================================
// PrepareOutputTree: directories exist before streaming begins
// =============================================================================

SetupResult WorkEnumerator::PrepareOutputTree() const {
  for (const auto& dir : directories_) {
    const fs::path target =
        dir.relative.empty() ? output_root_ : output_root_ / dir.relative;
    std::error_code ec;
    fs::create_directories(target, ec);
    if (ec) {
      return SetupResult::Failure(SetupError::kFilesystemError,
                                  "cannot create " + target.string() + ": " + ec.message());
    }
  }
  if (directories_.empty()) {
    std::error_code ec;
    fs::create_directories(output_root_, ec);
    if (ec) {
      return SetupResult::Failure(SetupError::kFilesystemError,
                                  "cannot create " + output_root_.string() + ": " +
                                      ec.message());
    }
  }
  return SetupResult::Success();
}

// =============================================================================
// Next: batches, then one EndOfWork per worker
// =============================================================================

std::optional<WorkItem> WorkEnumerator::Next() {
  while (cursor_ < directories_.size()) {
    ScannedDirectory& dir = directories_[cursor_++];
    if (dir.pairs.empty()) continue;

    WorkBatch batch;
    batch.output_directory =
        dir.relative.empty() ? output_root_ : output_root_ / dir.relative;
    batch.pairs = std::move(dir.pairs);
    dir.pairs.clear();
    return WorkItem{std::move(batch)};
  }
  if (markers_emitted_ < num_workers_) {
    ++markers_emitted_;
    return WorkItem{EndOfWork{}};
  }
  return std::nullopt;
}

}  // namespace mediamirror::pipeline
