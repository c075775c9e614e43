// Repository: MediaMirror
// Component: Mirror Executable
// Purpose: Command-line entry point: mirror INPUT_DIR into OUTPUT_DIR.
// Copyright (c) 2026 MediaMirror

#include <unistd.h>

#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "mediamirror/config/MirrorConfig.hpp"
#include "mediamirror/dashboard/LiveTerminalRenderer.hpp"
#include "mediamirror/dashboard/PlainTextRenderer.hpp"
#include "mediamirror/pipeline/MirrorPipeline.hpp"
#include "mediamirror/tools/ExternalToolTranscoder.hpp"
#include "mediamirror/tools/FFmpegAudioExtractor.hpp"
#include "mediamirror/util/Logger.hpp"

namespace {

using mediamirror::config::CliArgs;
using mediamirror::config::DemuxBackend;
using mediamirror::config::MirrorConfig;
using mediamirror::util::Logger;

namespace dashboard = mediamirror::dashboard;
namespace pipeline = mediamirror::pipeline;
namespace tools = mediamirror::tools;

std::unique_ptr<dashboard::IDashboardRenderer> MakeRenderer(const MirrorConfig& config) {
  if (!config.verbose && !config.plain &&
      dashboard::LiveTerminalRenderer::IsInteractive(STDIN_FILENO, STDOUT_FILENO)) {
    return std::make_unique<dashboard::LiveTerminalRenderer>(STDIN_FILENO, STDOUT_FILENO);
  }
  return std::make_unique<dashboard::PlainTextRenderer>();
}

int Run(const MirrorConfig& config) {
  std::unique_ptr<tools::ITranscodeTool> transcoder =
      tools::ExternalToolTranscoder::Lame(config.lame_executable, config.lame_args);
  std::unique_ptr<tools::ITranscodeTool> extractor;
  if (config.demux_backend == DemuxBackend::kFaad) {
    extractor = tools::ExternalToolTranscoder::Faad(config.faad_executable);
  } else {
    extractor = std::make_unique<tools::FFmpegAudioExtractor>();
  }

  pipeline::FileConverter::Tools converter_tools;
  converter_tools.transcoder = transcoder.get();
  converter_tools.extractor = extractor.get();

  auto renderer = MakeRenderer(config);
  pipeline::MirrorPipeline mirror(config, converter_tools, *renderer);
  const pipeline::RunSummary summary = mirror.Run();
  return summary.ExitCode();
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = mediamirror::config::ParseArgs(argc, argv);

  if (args.help) {
    mediamirror::config::PrintUsage(std::cout, argv[0]);
    return 0;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    mediamirror::config::PrintUsage(std::cerr, argv[0]);
    return 2;
  }

  try {
    return Run(args.config);
  } catch (const std::exception& e) {
    Logger::Error(std::string("[main] FATAL ") + e.what());
    return 2;
  }
}
