// Repository: MediaMirror
// Component: FFmpeg Audio Extractor
// Purpose: Demuxes the best audio stream of a container into a PCM WAV
//          intermediate the encoder can read.
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_TOOLS_FFMPEG_AUDIO_EXTRACTOR_HPP_
#define MEDIAMIRROR_TOOLS_FFMPEG_AUDIO_EXTRACTOR_HPP_

#include <string>

#include "mediamirror/tools/ITranscodeTool.hpp"

namespace mediamirror::tools {

// FFmpegAudioExtractor decodes in-process with libavformat/libavcodec,
// resamples to interleaved S16 at the source rate and channel layout, and
// writes a WAV file through the libavformat "wav" muxer.
//
// Every call owns its own contexts; one instance serves all workers.
// Progress is reported as whole percent ("37%") when the container
// declares a duration.
class FFmpegAudioExtractor : public ITranscodeTool {
 public:
  FFmpegAudioExtractor();

  ToolResult Run(const std::filesystem::path& input,
                 const std::filesystem::path& output,
                 const ProgressFn& progress) override;

  std::string Name() const override { return "ffmpeg-demux"; }
};

}  // namespace mediamirror::tools

#endif  // MEDIAMIRROR_TOOLS_FFMPEG_AUDIO_EXTRACTOR_HPP_
