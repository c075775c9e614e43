// Repository: MediaMirror
// Component: External Tool Transcoder Implementation
// Purpose: Runs the configured external transcoder command.
// Copyright (c) 2026 MediaMirror

#include "mediamirror/tools/ExternalToolTranscoder.hpp"

#include <stdexcept>

#include "mediamirror/util/Logger.hpp"

namespace mediamirror::tools {

using mediamirror::util::Logger;

namespace {

// One left-to-right pass over the template argument; substituted text is
// never scanned again, so placeholder-like text inside a path survives.
std::string Substitute(const std::string& arg, const std::string& input,
                       const std::string& output) {
  const std::string in_token = kInputPlaceholder;
  const std::string out_token = kOutputPlaceholder;
  std::string out;
  size_t pos = 0;
  while (pos < arg.size()) {
    if (arg.compare(pos, in_token.size(), in_token) == 0) {
      out += input;
      pos += in_token.size();
    } else if (arg.compare(pos, out_token.size(), out_token) == 0) {
      out += output;
      pos += out_token.size();
    } else {
      out += arg[pos++];
    }
  }
  return out;
}

bool Mentions(const std::vector<std::string>& argv, const std::string& placeholder) {
  for (const auto& a : argv) {
    if (a.find(placeholder) != std::string::npos) return true;
  }
  return false;
}

}  // namespace

ExternalToolTranscoder::ExternalToolTranscoder(std::string name,
                                               std::vector<std::string> argv_template)
    : name_(std::move(name)), argv_template_(std::move(argv_template)) {
  if (argv_template_.empty() || argv_template_[0].empty()) {
    throw std::invalid_argument(name_ + ": empty command template");
  }
  if (!Mentions(argv_template_, kInputPlaceholder) ||
      !Mentions(argv_template_, kOutputPlaceholder)) {
    throw std::invalid_argument(name_ + ": command template needs " +
                                kInputPlaceholder + " and " + kOutputPlaceholder);
  }
}

std::unique_ptr<ExternalToolTranscoder> ExternalToolTranscoder::Lame(
    const std::string& executable, const std::vector<std::string>& args) {
  std::vector<std::string> argv{executable, "--nohist"};
  argv.insert(argv.end(), args.begin(), args.end());
  argv.push_back(kInputPlaceholder);
  argv.push_back(kOutputPlaceholder);
  return std::make_unique<ExternalToolTranscoder>("lame", std::move(argv));
}

std::unique_ptr<ExternalToolTranscoder> ExternalToolTranscoder::Faad(
    const std::string& executable) {
  return std::make_unique<ExternalToolTranscoder>(
      "faad", std::vector<std::string>{executable, "-o", kOutputPlaceholder,
                                       kInputPlaceholder});
}

std::vector<std::string> ExternalToolTranscoder::BuildArgv(
    const std::filesystem::path& input, const std::filesystem::path& output) const {
  std::vector<std::string> argv;
  argv.reserve(argv_template_.size());
  for (const auto& arg : argv_template_) {
    argv.push_back(Substitute(arg, input.string(), output.string()));
  }
  return argv;
}

ToolResult ExternalToolTranscoder::Run(const std::filesystem::path& input,
                                       const std::filesystem::path& output,
                                       const ProgressFn& progress) {
  const auto argv = BuildArgv(input, output);
  if (Logger::DebugEnabled()) {
    std::string cmd;
    for (const auto& a : argv) {
      if (!cmd.empty()) cmd += ' ';
      cmd += a;
    }
    Logger::Debug("[" + name_ + "] EXEC " + cmd);
  }

  const ProcessResult pr = runner_.Run(argv, [&progress](const std::string& line) {
    if (progress) progress(line);
  });
  if (pr.Succeeded()) return ToolResult::Success();

  std::string diag = DescribeProcessResult(pr);
  if (!pr.output_tail.empty()) diag += "\n" + pr.output_tail;
  const int code = pr.term_signal != 0 ? -pr.term_signal : pr.exit_code;
  return ToolResult::Failure(code, std::move(diag));
}

}  // namespace mediamirror::tools
