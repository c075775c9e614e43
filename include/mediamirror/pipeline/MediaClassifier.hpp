// Repository: MediaMirror
// Component: Media Classifier
// Purpose: Maps an input file's extension to the action taken for it and to
//          the extension its mirrored output carries.
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_PIPELINE_MEDIA_CLASSIFIER_HPP_
#define MEDIAMIRROR_PIPELINE_MEDIA_CLASSIFIER_HPP_

#include <filesystem>
#include <string>

namespace mediamirror::pipeline {

enum class FileClass {
  // Fed straight to the external transcoder
  kTranscode,

  // Container format: audio extracted to an intermediate, then transcoded
  kDemuxThenTranscode,

  // Copied with metadata, name unchanged
  kPassthrough,

  // Unrecognized extension: no output, no error
  kIgnored,
};

const char* FileClassToString(FileClass file_class);

// Extension of every transcoded output (".mp3").
extern const char* const kEncodedExtension;

// Case-insensitive classification by the input's extension.
FileClass Classify(const std::filesystem::path& input_path);

// True for kTranscode and kDemuxThenTranscode.
bool IsTranscodable(FileClass file_class);

// Output path for `relative` (relative to the input root) under
// `output_root`. Transcodable classes get kEncodedExtension.
std::filesystem::path MirrorOutputPath(const std::filesystem::path& output_root,
                                       const std::filesystem::path& relative,
                                       FileClass file_class);

}  // namespace mediamirror::pipeline

#endif  // MEDIAMIRROR_PIPELINE_MEDIA_CLASSIFIER_HPP_
