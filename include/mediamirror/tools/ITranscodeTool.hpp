// Repository: MediaMirror
// Component: Transcode Tool Interface
// Purpose: Opaque per-file media transformation: input path in, output path
//          written, success or failure reported.
// Copyright (c) 2026 MediaMirror

#ifndef MEDIAMIRROR_TOOLS_I_TRANSCODE_TOOL_HPP_
#define MEDIAMIRROR_TOOLS_I_TRANSCODE_TOOL_HPP_

#include <filesystem>
#include <functional>
#include <string>

namespace mediamirror::tools {

struct ToolResult {
  bool success;
  int exit_code;            // process exit status, or negative library error
  std::string diagnostics;  // tail of tool output / error text

  static ToolResult Success() { return {true, 0, ""}; }
  static ToolResult Failure(int code, std::string diag) {
    return {false, code, std::move(diag)};
  }
};

// Receives the tool's latest progress text. Called on the worker thread.
using ProgressFn = std::function<void(const std::string&)>;

// ITranscodeTool is shared by every worker: Run() must be safe to call
// concurrently for distinct output paths.
//
// Success means the tool claims to have written `output`. Callers verify the
// artifact exists before trusting it.
class ITranscodeTool {
 public:
  virtual ~ITranscodeTool() = default;

  virtual ToolResult Run(const std::filesystem::path& input,
                         const std::filesystem::path& output,
                         const ProgressFn& progress) = 0;

  virtual std::string Name() const = 0;
};

}  // namespace mediamirror::tools

#endif  // MEDIAMIRROR_TOOLS_I_TRANSCODE_TOOL_HPP_
