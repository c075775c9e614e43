// Repository: MediaMirror
// Component: External Tool Transcoder
// Purpose: ITranscodeTool backed by a command-line program (lame, faad).
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_TOOLS_EXTERNAL_TOOL_TRANSCODER_HPP_
#define MEDIAMIRROR_TOOLS_EXTERNAL_TOOL_TRANSCODER_HPP_

#include <memory>
#include <string>
#include <vector>

#include "mediamirror/tools/ITranscodeTool.hpp"
#include "mediamirror/tools/ProcessRunner.hpp"

namespace mediamirror::tools {

// Argument template placeholders, replaced per file.
inline constexpr const char* kInputPlaceholder = "{in}";
inline constexpr const char* kOutputPlaceholder = "{out}";

class ExternalToolTranscoder : public ITranscodeTool {
 public:
  // argv_template[0] is the executable. Throws std::invalid_argument unless
  // both placeholders appear somewhere in the template.
  ExternalToolTranscoder(std::string name, std::vector<std::string> argv_template);

  // lame [--nohist] <args...> {in} {out}
  static std::unique_ptr<ExternalToolTranscoder> Lame(const std::string& executable,
                                                      const std::vector<std::string>& args);

  // faad -o {out} {in}
  static std::unique_ptr<ExternalToolTranscoder> Faad(const std::string& executable);

  std::vector<std::string> BuildArgv(const std::filesystem::path& input,
                                     const std::filesystem::path& output) const;

  ToolResult Run(const std::filesystem::path& input,
                 const std::filesystem::path& output,
                 const ProgressFn& progress) override;

  std::string Name() const override { return name_; }

 private:
  std::string name_;
  std::vector<std::string> argv_template_;
  ProcessRunner runner_;
};

}  // namespace mediamirror::tools

#endif  // MEDIAMIRROR_TOOLS_EXTERNAL_TOOL_TRANSCODER_HPP_
