// Repository: MediaMirror
// Component: Media Classifier Implementation
// Purpose: Maps file extensions to transcode, extract, copy or ignore.
// Copyright (c) 2026 MediaMirror

#include "mediamirror/pipeline/MediaClassifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace mediamirror::pipeline {

const char* const kEncodedExtension = ".mp3";

namespace {

constexpr std::array<std::string_view, 3> kTranscodeExtensions = {
    ".mp3", ".wav", ".flac"};

constexpr std::array<std::string_view, 3> kContainerExtensions = {
    ".m4a", ".mp4", ".aac"};

constexpr std::array<std::string_view, 8> kPassthroughExtensions = {
    ".jpg", ".jpeg", ".png", ".gif", ".pdf", ".txt", ".cue", ".log"};

template <size_t N>
bool Contains(const std::array<std::string_view, N>& table, const std::string& ext) {
  return std::find(table.begin(), table.end(), ext) != table.end();
}

std::string LowerExtension(const std::filesystem::path& path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

}  // namespace

const char* FileClassToString(FileClass file_class) {
  switch (file_class) {
    case FileClass::kTranscode:
      return "TRANSCODE";
    case FileClass::kDemuxThenTranscode:
      return "DEMUX_THEN_TRANSCODE";
    case FileClass::kPassthrough:
      return "PASSTHROUGH";
    case FileClass::kIgnored:
      return "IGNORED";
  }
  return "UNKNOWN";
}

FileClass Classify(const std::filesystem::path& input_path) {
  const std::string ext = LowerExtension(input_path);
  if (ext.empty()) return FileClass::kIgnored;
  if (Contains(kTranscodeExtensions, ext)) return FileClass::kTranscode;
  if (Contains(kContainerExtensions, ext)) return FileClass::kDemuxThenTranscode;
  if (Contains(kPassthroughExtensions, ext)) return FileClass::kPassthrough;
  return FileClass::kIgnored;
}

bool IsTranscodable(FileClass file_class) {
  return file_class == FileClass::kTranscode ||
         file_class == FileClass::kDemuxThenTranscode;
}

std::filesystem::path MirrorOutputPath(const std::filesystem::path& output_root,
                                       const std::filesystem::path& relative,
                                       FileClass file_class) {
  std::filesystem::path out = output_root / relative;
  if (IsTranscodable(file_class)) {
    out.replace_extension(kEncodedExtension);
  }
  return out;
}

}  // namespace mediamirror::pipeline
