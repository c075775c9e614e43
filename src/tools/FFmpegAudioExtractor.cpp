// Repository: MediaMirror
// Component: FFmpeg Audio Extractor Implementation
// Purpose: Copies the first audio stream out of a video container with libavformat.
// Copyright (c) 2026 MediaMirror

#include "mediamirror/tools/FFmpegAudioExtractor.hpp"

#include <cstdint>
#include <cstring>
#include <memory>
#include <vector>

#include "mediamirror/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace {

struct InputCloser {
  void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};

struct OutputCloser {
  void operator()(AVFormatContext* ctx) const {
    if (!ctx) return;
    if (ctx->pb && !(ctx->oformat->flags & AVFMT_NOFILE)) avio_closep(&ctx->pb);
    avformat_free_context(ctx);
  }
};

struct CodecCloser {
  void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
};

void FreeAVFrame(AVFrame* f) { av_frame_free(&f); }
void FreeAVPacket(AVPacket* p) { av_packet_free(&p); }
void FreeSwr(::SwrContext* s) { swr_free(&s); }

using InputPtr = std::unique_ptr<AVFormatContext, InputCloser>;
using OutputPtr = std::unique_ptr<AVFormatContext, OutputCloser>;
using CodecPtr = std::unique_ptr<AVCodecContext, CodecCloser>;
using FramePtr = std::unique_ptr<AVFrame, void (*)(AVFrame*)>;
using PacketPtr = std::unique_ptr<AVPacket, void (*)(AVPacket*)>;
using SwrPtr = std::unique_ptr<::SwrContext, void (*)(::SwrContext*)>;

std::string AvError(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, errbuf, sizeof(errbuf));
  return errbuf;
}

mediamirror::tools::ToolResult Fail(const char* step, int err) {
  return mediamirror::tools::ToolResult::Failure(err, std::string(step) + ": " + AvError(err));
}

// Per-call conversion state.
struct Extraction {
  AVFormatContext* out_ctx = nullptr;
  AVStream* out_stream = nullptr;
  ::SwrContext* swr = nullptr;
  int channels = 0;
  int sample_rate = 0;
  int64_t samples_written = 0;
  std::vector<uint8_t> buffer;

  // Converts `in_count` samples (nullptr flushes the resampler) and writes
  // them as one PCM packet. Returns samples written or a negative AVERROR.
  int Write(const uint8_t** in, int in_count) {
    const int max_out = swr_get_out_samples(swr, in_count);
    if (max_out <= 0) return max_out;
    buffer.resize(static_cast<size_t>(max_out) * channels * 2);
    uint8_t* out[1] = {buffer.data()};
    const int got = swr_convert(swr, out, max_out, in, in_count);
    if (got <= 0) return got;

    PacketPtr pkt(av_packet_alloc(), FreeAVPacket);
    if (!pkt) return AVERROR(ENOMEM);
    const int bytes = got * channels * 2;
    int ret = av_new_packet(pkt.get(), bytes);
    if (ret < 0) return ret;
    std::memcpy(pkt->data, buffer.data(), static_cast<size_t>(bytes));
    pkt->stream_index = out_stream->index;
    pkt->pts = samples_written;
    pkt->dts = samples_written;
    pkt->duration = got;
    av_packet_rescale_ts(pkt.get(), AVRational{1, sample_rate}, out_stream->time_base);
    ret = av_interleaved_write_frame(out_ctx, pkt.get());
    if (ret < 0) return ret;
    samples_written += got;
    return got;
  }
};

}  // namespace

namespace mediamirror::tools {

using mediamirror::util::Logger;

FFmpegAudioExtractor::FFmpegAudioExtractor() {
  if (!Logger::DebugEnabled()) av_log_set_level(AV_LOG_ERROR);
}

ToolResult FFmpegAudioExtractor::Run(const std::filesystem::path& input,
                                     const std::filesystem::path& output,
                                     const ProgressFn& progress) {
  // =========================================================================
  // Input: best audio stream + decoder
  // =========================================================================
  AVFormatContext* raw_in = nullptr;
  int ret = avformat_open_input(&raw_in, input.c_str(), nullptr, nullptr);
  if (ret < 0) return Fail("avformat_open_input", ret);
  InputPtr in_ctx(raw_in);

  ret = avformat_find_stream_info(in_ctx.get(), nullptr);
  if (ret < 0) return Fail("avformat_find_stream_info", ret);

  const AVCodec* decoder = nullptr;
  const int stream_index =
      av_find_best_stream(in_ctx.get(), AVMEDIA_TYPE_AUDIO, -1, -1, &decoder, 0);
  if (stream_index < 0) return Fail("av_find_best_stream", stream_index);
  AVStream* in_stream = in_ctx->streams[stream_index];

  CodecPtr dec(avcodec_alloc_context3(decoder));
  if (!dec) return Fail("avcodec_alloc_context3", AVERROR(ENOMEM));
  ret = avcodec_parameters_to_context(dec.get(), in_stream->codecpar);
  if (ret < 0) return Fail("avcodec_parameters_to_context", ret);
  ret = avcodec_open2(dec.get(), decoder, nullptr);
  if (ret < 0) return Fail("avcodec_open2", ret);

  if (dec->ch_layout.nb_channels <= 0 || dec->sample_rate <= 0) {
    return ToolResult::Failure(AVERROR_INVALIDDATA, "audio stream has no channel layout or rate");
  }

  // =========================================================================
  // Output: WAV, PCM S16LE, source rate and layout
  // =========================================================================
  AVFormatContext* raw_out = nullptr;
  ret = avformat_alloc_output_context2(&raw_out, nullptr, "wav", output.c_str());
  if (ret < 0 || !raw_out) return Fail("avformat_alloc_output_context2", ret < 0 ? ret : AVERROR(ENOMEM));
  OutputPtr out_ctx(raw_out);

  AVStream* out_stream = avformat_new_stream(out_ctx.get(), nullptr);
  if (!out_stream) return Fail("avformat_new_stream", AVERROR(ENOMEM));

  const int channels = dec->ch_layout.nb_channels;
  const int sample_rate = dec->sample_rate;
  AVCodecParameters* par = out_stream->codecpar;
  par->codec_type = AVMEDIA_TYPE_AUDIO;
  par->codec_id = AV_CODEC_ID_PCM_S16LE;
  par->format = AV_SAMPLE_FMT_S16;
  par->sample_rate = sample_rate;
  ret = av_channel_layout_copy(&par->ch_layout, &dec->ch_layout);
  if (ret < 0) return Fail("av_channel_layout_copy", ret);
  par->bits_per_coded_sample = 16;
  par->block_align = channels * 2;
  par->bit_rate = static_cast<int64_t>(sample_rate) * channels * 16;
  out_stream->time_base = AVRational{1, sample_rate};

  ret = avio_open(&out_ctx->pb, output.c_str(), AVIO_FLAG_WRITE);
  if (ret < 0) return Fail("avio_open", ret);
  ret = avformat_write_header(out_ctx.get(), nullptr);
  if (ret < 0) return Fail("avformat_write_header", ret);

  ::SwrContext* raw_swr = nullptr;
  ret = swr_alloc_set_opts2(&raw_swr,
                            &dec->ch_layout, AV_SAMPLE_FMT_S16, sample_rate,
                            &dec->ch_layout, dec->sample_fmt, sample_rate,
                            0, nullptr);
  if (ret < 0 || !raw_swr) return Fail("swr_alloc_set_opts2", ret < 0 ? ret : AVERROR(ENOMEM));
  SwrPtr swr(raw_swr, FreeSwr);
  ret = swr_init(swr.get());
  if (ret < 0) return Fail("swr_init", ret);

  Extraction x;
  x.out_ctx = out_ctx.get();
  x.out_stream = out_stream;
  x.swr = swr.get();
  x.channels = channels;
  x.sample_rate = sample_rate;

  // =========================================================================
  // Decode loop
  // =========================================================================
  PacketPtr pkt(av_packet_alloc(), FreeAVPacket);
  FramePtr frame(av_frame_alloc(), FreeAVFrame);
  if (!pkt || !frame) return Fail("alloc", AVERROR(ENOMEM));

  const int64_t duration_us = in_ctx->duration;
  int last_percent = -1;
  auto report = [&](const AVFrame* f) {
    if (!progress || duration_us <= 0 || f->pts == AV_NOPTS_VALUE) return;
    const int64_t pos_us = av_rescale_q(f->pts, in_stream->time_base, AV_TIME_BASE_Q);
    int percent = static_cast<int>(pos_us * 100 / duration_us);
    if (percent < 0) percent = 0;
    if (percent > 100) percent = 100;
    if (percent != last_percent) {
      last_percent = percent;
      progress(std::to_string(percent) + "%");
    }
  };

  auto drain = [&]() -> int {
    while (true) {
      int r = avcodec_receive_frame(dec.get(), frame.get());
      if (r == AVERROR(EAGAIN) || r == AVERROR_EOF) return 0;
      if (r < 0) return r;
      report(frame.get());
      r = x.Write(const_cast<const uint8_t**>(frame->extended_data), frame->nb_samples);
      av_frame_unref(frame.get());
      if (r < 0) return r;
    }
  };

  while ((ret = av_read_frame(in_ctx.get(), pkt.get())) >= 0) {
    if (pkt->stream_index == stream_index) {
      ret = avcodec_send_packet(dec.get(), pkt.get());
      av_packet_unref(pkt.get());
      if (ret < 0 && ret != AVERROR(EAGAIN)) return Fail("avcodec_send_packet", ret);
      ret = drain();
      if (ret < 0) return Fail("decode", ret);
    } else {
      av_packet_unref(pkt.get());
    }
  }
  if (ret != AVERROR_EOF) return Fail("av_read_frame", ret);

  ret = avcodec_send_packet(dec.get(), nullptr);
  if (ret < 0 && ret != AVERROR_EOF) return Fail("avcodec_send_packet(flush)", ret);
  ret = drain();
  if (ret < 0) return Fail("decode(flush)", ret);

  while ((ret = x.Write(nullptr, 0)) > 0) {
  }
  if (ret < 0) return Fail("swr_convert(flush)", ret);

  ret = av_write_trailer(out_ctx.get());
  if (ret < 0) return Fail("av_write_trailer", ret);

  if (x.samples_written == 0) {
    return ToolResult::Failure(AVERROR_INVALIDDATA, "no audio samples decoded");
  }
  if (progress) progress("100%");
  return ToolResult::Success();
}

}  // namespace mediamirror::tools
