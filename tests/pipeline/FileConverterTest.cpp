// Repository: MediaMirror
// Component: FileConverter Tests
// Purpose: Per-file protocol: skip complete, stale recovery, finalize only a
//          present temp, one outcome per file in every mode.
// Copyright (c) 2026 MediaMirror

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "mediamirror/pipeline/FileConverter.hpp"
#include "../fixtures/FakeTranscodeTool.h"
#include "../support/TempTree.hpp"

namespace mediamirror::pipeline::testing {
namespace {

using config::RunMode;
using mediamirror::test_support::TempTree;
using mediamirror::tests::fixtures::FakeTranscodeTool;

class FileConverterTest : public ::testing::Test {
 protected:
  FileConverter Make(RunMode mode = RunMode::kConvert) {
    FileConverter::Tools tools;
    tools.transcoder = &transcoder_;
    tools.extractor = &extractor_;
    return FileConverter(tools, mode);
  }

  FilePair Pair(const std::string& in_rel, const std::string& out_rel) {
    return {tree_.Path(in_rel), tree_.Path(out_rel)};
  }

  FileOutcome Run(const FileConverter& c, const FilePair& pair) {
    return c.Convert(pair, [this](const FileEvent& e) { events_.push_back(e); });
  }

  size_t CountEvents(const char* tag) const {
    size_t n = 0;
    for (const auto& e : events_) {
      if (std::string(EventTag(e)) == tag) ++n;
    }
    return n;
  }

  TempTree tree_;
  FakeTranscodeTool transcoder_{"mp3:"};
  FakeTranscodeTool extractor_{"pcm:"};
  std::vector<FileEvent> events_;
};

TEST_F(FileConverterTest, ConvertModeRequiresTranscoder) {
  EXPECT_THROW(FileConverter(FileConverter::Tools{}, RunMode::kConvert), std::invalid_argument);
  EXPECT_NO_THROW(FileConverter(FileConverter::Tools{}, RunMode::kClean));
}

TEST_F(FileConverterTest, TranscodesIntoFinalViaTemp) {
  tree_.Write("in/1.wav", "audio");
  tree_.MakeDir("out");
  const auto c = Make();

  const auto o = Run(c, Pair("in/1.wav", "out/1.mp3"));
  EXPECT_EQ(o.kind, OutcomeKind::kTranscoded);
  EXPECT_TRUE(o.Transcodable());
  EXPECT_EQ(tree_.Read("out/1.mp3"), "mp3:audio");
  EXPECT_FALSE(tree_.Exists("out/1.mp3.mmpart"));

  // The tool writes only the temp name.
  ASSERT_EQ(transcoder_.Outputs().size(), 1u);
  EXPECT_EQ(transcoder_.Outputs()[0], tree_.Path("out/1.mp3.mmpart"));
  EXPECT_GE(CountEvents("transcode"), 1u);
}

TEST_F(FileConverterTest, CompleteOutputIsSkippedWithoutInvokingTool) {
  tree_.Write("in/1.wav", "audio");
  tree_.Write("out/1.mp3", "already");
  const auto c = Make();

  const auto o = Run(c, Pair("in/1.wav", "out/1.mp3"));
  EXPECT_EQ(o.kind, OutcomeKind::kSkippedComplete);
  EXPECT_EQ(transcoder_.Calls(), 0);
  EXPECT_EQ(tree_.Read("out/1.mp3"), "already");
}

TEST_F(FileConverterTest, DirectoryAtFinalPathIsFailureNotSkip) {
  tree_.Write("in/1.wav", "audio");
  tree_.MakeDir("out/1.mp3");
  const auto c = Make();

  const auto o = Run(c, Pair("in/1.wav", "out/1.mp3"));
  EXPECT_EQ(o.kind, OutcomeKind::kFailed);
  ASSERT_TRUE(o.error.has_value());
  EXPECT_EQ(o.error->kind, ErrorKind::kUnhandledFault);
  EXPECT_EQ(transcoder_.Calls(), 0);
  EXPECT_TRUE(fs::is_directory(tree_.Path("out/1.mp3")));

  const auto planned = Run(Make(RunMode::kDryRun), Pair("in/1.wav", "out/1.mp3"));
  EXPECT_EQ(planned.kind, OutcomeKind::kFailed);
}

TEST_F(FileConverterTest, StaleTempIsRemovedAndFileRedone) {
  tree_.Write("in/1.wav", "audio");
  tree_.Write("out/1.mp3.mmpart", "half-written");
  const auto c = Make();

  const auto o = Run(c, Pair("in/1.wav", "out/1.mp3"));
  EXPECT_EQ(o.kind, OutcomeKind::kTranscoded);
  EXPECT_EQ(o.stale_removed, 1u);
  EXPECT_EQ(transcoder_.Calls(), 1);
  EXPECT_EQ(tree_.Read("out/1.mp3"), "mp3:audio");
  EXPECT_FALSE(tree_.Exists("out/1.mp3.mmpart"));
  EXPECT_EQ(CountEvents("rm-stale"), 1u);
}

TEST_F(FileConverterTest, SuccessWithoutOutputIsTranscodeFailure) {
  tree_.Write("in/1.wav", "audio");
  tree_.MakeDir("out");
  transcoder_.SetBehavior(FakeTranscodeTool::Behavior::kSucceedWithoutOutput);
  const auto c = Make();

  const auto o = Run(c, Pair("in/1.wav", "out/1.mp3"));
  EXPECT_EQ(o.kind, OutcomeKind::kFailed);
  ASSERT_TRUE(o.error.has_value());
  EXPECT_EQ(o.error->kind, ErrorKind::kTranscodeFailure);
  EXPECT_EQ(o.error->input_path, tree_.Path("in/1.wav"));
  EXPECT_FALSE(tree_.Exists("out/1.mp3"));
}

TEST_F(FileConverterTest, FailedToolLeavesNoTempBehind) {
  tree_.Write("in/1.wav", "audio");
  tree_.MakeDir("out");
  transcoder_.SetBehavior(FakeTranscodeTool::Behavior::kFailAfterPartial);
  const auto c = Make();

  const auto o = Run(c, Pair("in/1.wav", "out/1.mp3"));
  EXPECT_EQ(o.kind, OutcomeKind::kFailed);
  EXPECT_EQ(o.error->kind, ErrorKind::kTranscodeFailure);
  EXPECT_NE(o.error->details.find("fake tool failed"), std::string::npos);
  EXPECT_FALSE(tree_.Exists("out/1.mp3"));
  EXPECT_FALSE(tree_.Exists("out/1.mp3.mmpart"));
}

TEST_F(FileConverterTest, ThrowingToolBecomesUnhandledFault) {
  tree_.Write("in/1.wav", "audio");
  tree_.MakeDir("out");
  transcoder_.SetBehavior(FakeTranscodeTool::Behavior::kThrow);
  const auto c = Make();

  const auto o = Run(c, Pair("in/1.wav", "out/1.mp3"));
  EXPECT_EQ(o.kind, OutcomeKind::kFailed);
  EXPECT_EQ(o.error->kind, ErrorKind::kUnhandledFault);
  EXPECT_NE(o.error->details.find("exploded"), std::string::npos);
  EXPECT_TRUE(o.Transcodable());
}

TEST_F(FileConverterTest, PassthroughCopiesWithSameName) {
  tree_.Write("in/cover.png", "png-bytes");
  tree_.MakeDir("out");
  const auto c = Make();

  const auto o = Run(c, Pair("in/cover.png", "out/cover.png"));
  EXPECT_EQ(o.kind, OutcomeKind::kCopied);
  EXPECT_FALSE(o.Transcodable());
  EXPECT_EQ(tree_.Read("out/cover.png"), "png-bytes");
  EXPECT_FALSE(tree_.Exists("out/cover.png.mmpart"));
  EXPECT_EQ(transcoder_.Calls(), 0);
  EXPECT_EQ(CountEvents("copy"), 1u);
}

TEST_F(FileConverterTest, UnreadablePassthroughIsFault) {
  tree_.MakeDir("out");
  const auto c = Make();
  const auto o = Run(c, Pair("in/gone.png", "out/gone.png"));
  EXPECT_EQ(o.kind, OutcomeKind::kFailed);
  EXPECT_EQ(o.error->kind, ErrorKind::kUnhandledFault);
  EXPECT_FALSE(tree_.Exists("out/gone.png"));
  EXPECT_FALSE(tree_.Exists("out/gone.png.mmpart"));
}

TEST_F(FileConverterTest, IgnoredFileProducesNothing) {
  tree_.Write("in/thumbs.db", "x");
  tree_.MakeDir("out");
  const auto c = Make();
  const auto o = Run(c, Pair("in/thumbs.db", "out/thumbs.db"));
  EXPECT_EQ(o.kind, OutcomeKind::kIgnored);
  EXPECT_FALSE(o.error.has_value());
  EXPECT_FALSE(tree_.Exists("out/thumbs.db"));
  EXPECT_TRUE(events_.empty());
}

TEST_F(FileConverterTest, ContainerIsDemuxedThenTranscodedAndIntermediateRemoved) {
  tree_.Write("in/1.m4a", "aac");
  tree_.MakeDir("out");
  const auto c = Make();

  const auto o = Run(c, Pair("in/1.m4a", "out/1.mp3"));
  EXPECT_EQ(o.kind, OutcomeKind::kTranscoded);
  EXPECT_EQ(extractor_.Calls(), 1);
  ASSERT_EQ(transcoder_.Inputs().size(), 1u);
  EXPECT_EQ(transcoder_.Inputs()[0], tree_.Path("out/1.mp3.demux.wav"));
  EXPECT_EQ(tree_.Read("out/1.mp3"), "mp3:pcm:aac");
  EXPECT_FALSE(tree_.Exists("out/1.mp3.demux.wav"));
  EXPECT_GE(CountEvents("demux"), 1u);
}

TEST_F(FileConverterTest, DemuxFailureSkipsTranscoder) {
  tree_.Write("in/1.m4a", "aac");
  tree_.MakeDir("out");
  extractor_.SetBehavior(FakeTranscodeTool::Behavior::kFailAfterPartial);
  const auto c = Make();

  const auto o = Run(c, Pair("in/1.m4a", "out/1.mp3"));
  EXPECT_EQ(o.kind, OutcomeKind::kFailed);
  EXPECT_EQ(o.error->kind, ErrorKind::kTranscodeFailure);
  EXPECT_EQ(transcoder_.Calls(), 0);
  EXPECT_FALSE(tree_.Exists("out/1.mp3.demux.wav"));
  EXPECT_FALSE(tree_.Exists("out/1.mp3"));
}

TEST_F(FileConverterTest, StaleIntermediateIsRemovedBeforeDemux) {
  tree_.Write("in/1.m4a", "aac");
  tree_.Write("out/1.mp3.demux.wav", "old");
  const auto c = Make();
  const auto o = Run(c, Pair("in/1.m4a", "out/1.mp3"));
  EXPECT_EQ(o.kind, OutcomeKind::kTranscoded);
  EXPECT_EQ(o.stale_removed, 1u);
  EXPECT_EQ(tree_.Read("out/1.mp3"), "mp3:pcm:aac");
}

TEST_F(FileConverterTest, DryRunWritesNothing) {
  tree_.Write("in/1.wav", "audio");
  tree_.Write("out/1.mp3.mmpart", "stale");
  const auto c = Make(RunMode::kDryRun);

  const auto o = Run(c, Pair("in/1.wav", "out/1.mp3"));
  EXPECT_EQ(o.kind, OutcomeKind::kPlanned);
  EXPECT_EQ(transcoder_.Calls(), 0);
  EXPECT_TRUE(tree_.Exists("out/1.mp3.mmpart"));
  EXPECT_FALSE(tree_.Exists("out/1.mp3"));
  EXPECT_EQ(CountEvents("rm-stale"), 1u);
  EXPECT_EQ(CountEvents("transcode"), 1u);
}

TEST_F(FileConverterTest, CleanModeOnlyRemovesArtifacts) {
  tree_.Write("in/1.wav", "audio");
  tree_.Write("out/1.mp3.mmpart", "stale");
  tree_.Write("out/1.mp3.demux.wav", "stale");
  const auto c = Make(RunMode::kClean);

  const auto o = Run(c, Pair("in/1.wav", "out/1.mp3"));
  EXPECT_EQ(o.kind, OutcomeKind::kCleaned);
  EXPECT_EQ(o.stale_removed, 2u);
  EXPECT_EQ(transcoder_.Calls(), 0);
  EXPECT_FALSE(tree_.Exists("out/1.mp3.mmpart"));
  EXPECT_FALSE(tree_.Exists("out/1.mp3.demux.wav"));
  EXPECT_FALSE(tree_.Exists("out/1.mp3"));
}

}  // namespace
}  // namespace mediamirror::pipeline::testing
