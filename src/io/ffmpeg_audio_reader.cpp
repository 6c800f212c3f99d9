/// @file
/// @brief FFmpeg (libavformat/libavcodec/libswresample) audio reader.

#include "io/ffmpeg_audio_reader.h"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libswresample/swresample.h>
}

#include <cstdint>
#include <filesystem>
#include <memory>
#include <utility>
#include <vector>

#include "core/run_log.h"

namespace trackkey {

namespace {

constexpr const char* kLogTag = "FFmpeg";

struct FormatCloser {
  void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};
struct CodecContextFreer {
  void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
};
struct PacketFreer {
  void operator()(AVPacket* packet) const { av_packet_free(&packet); }
};
struct FrameFreer {
  void operator()(AVFrame* frame) const { av_frame_free(&frame); }
};
struct ResamplerFreer {
  void operator()(SwrContext* swr) const { swr_free(&swr); }
};

using FormatPtr = std::unique_ptr<AVFormatContext, FormatCloser>;
using CodecContextPtr = std::unique_ptr<AVCodecContext, CodecContextFreer>;
using PacketPtr = std::unique_ptr<AVPacket, PacketFreer>;
using FramePtr = std::unique_ptr<AVFrame, FrameFreer>;
using ResamplerPtr = std::unique_ptr<SwrContext, ResamplerFreer>;

std::string avErrorText(int code) {
  char buffer[AV_ERROR_MAX_STRING_SIZE] = {};
  av_strerror(code, buffer, sizeof(buffer));
  return buffer;
}

std::string fileNameOf(const std::string& path) {
  return std::filesystem::path(path).filename().string();
}

/// @brief Open a container and read its stream info; nullptr on failure.
FormatPtr openInput(const std::string& path, std::string& error) {
  AVFormatContext* raw = nullptr;
  int ret = avformat_open_input(&raw, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    error = avErrorText(ret);
    return nullptr;
  }
  FormatPtr ctx(raw);
  ret = avformat_find_stream_info(ctx.get(), nullptr);
  if (ret < 0) {
    error = avErrorText(ret);
    return nullptr;
  }
  return ctx;
}

/// @brief Resampler from the decoder's layout and format to mono float.
ResamplerPtr makeMonoResampler(const AVCodecContext* codec, std::string& error) {
  AVChannelLayout in_layout;
  if (codec->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
    av_channel_layout_default(&in_layout, codec->ch_layout.nb_channels);
  } else if (av_channel_layout_copy(&in_layout, &codec->ch_layout) < 0) {
    error = "cannot copy channel layout";
    return nullptr;
  }
  AVChannelLayout mono;
  av_channel_layout_default(&mono, 1);

  SwrContext* raw = nullptr;
  int ret = swr_alloc_set_opts2(&raw, &mono, AV_SAMPLE_FMT_FLT, codec->sample_rate, &in_layout,
                                codec->sample_fmt, codec->sample_rate, 0, nullptr);
  av_channel_layout_uninit(&in_layout);
  ResamplerPtr swr(raw);
  if (ret < 0) {
    error = avErrorText(ret);
    return nullptr;
  }
  ret = swr_init(swr.get());
  if (ret < 0) {
    error = avErrorText(ret);
    return nullptr;
  }
  return swr;
}

/// @brief Accumulates resampled mono output up to a fixed sample budget.
class MonoSink {
 public:
  MonoSink(SwrContext* swr, size_t max_samples) : swr_(swr), max_samples_(max_samples) {}

  /// @brief Convert one decoded frame (nullptr flushes the resampler).
  /// @return False on a resampler error or once the budget is exceeded.
  bool push(const AVFrame* frame) {
    const int in_count = frame != nullptr ? frame->nb_samples : 0;
    const int capacity = swr_get_out_samples(swr_, in_count);
    if (capacity < 0) {
      error_ = avErrorText(capacity);
      return false;
    }
    if (capacity == 0) return true;
    if (samples_.size() + static_cast<size_t>(capacity) > max_samples_ + kSlack) {
      too_long_ = true;
      return false;
    }

    const size_t offset = samples_.size();
    samples_.resize(offset + static_cast<size_t>(capacity));
    uint8_t* out = reinterpret_cast<uint8_t*>(samples_.data() + offset);
    const uint8_t** in =
        frame != nullptr ? const_cast<const uint8_t**>(frame->extended_data) : nullptr;
    const int converted = swr_convert(swr_, &out, capacity, in, in_count);
    if (converted < 0) {
      samples_.resize(offset);
      error_ = avErrorText(converted);
      return false;
    }
    samples_.resize(offset + static_cast<size_t>(converted));
    return true;
  }

  bool tooLong() const { return too_long_; }
  const std::string& error() const { return error_; }
  std::vector<float>& samples() { return samples_; }

 private:
  // Resampler look-ahead may briefly report more output than the budget.
  static constexpr size_t kSlack = 4096;

  SwrContext* swr_;
  size_t max_samples_;
  std::vector<float> samples_;
  bool too_long_ = false;
  std::string error_;
};

}  // namespace

std::optional<AudioSignal> readAudioWithFfmpeg(const std::string& path, double max_seconds,
                                               RunLog& log) {
  const std::string name = fileNameOf(path);
  std::string error;
  FormatPtr format = openInput(path, error);
  if (!format) {
    log.warning(kLogTag, "Failed to open %s: %s", name.c_str(), error.c_str());
    return std::nullopt;
  }

  const AVCodec* decoder = nullptr;
  const int stream_index =
      av_find_best_stream(format.get(), AVMEDIA_TYPE_AUDIO, -1, -1, &decoder, 0);
  if (stream_index < 0 || decoder == nullptr) {
    log.warning(kLogTag, "No decodable audio stream in %s", name.c_str());
    return std::nullopt;
  }

  CodecContextPtr codec(avcodec_alloc_context3(decoder));
  if (!codec) {
    log.error(kLogTag, "Cannot allocate decoder for %s", name.c_str());
    return std::nullopt;
  }
  int ret = avcodec_parameters_to_context(codec.get(),
                                          format->streams[stream_index]->codecpar);
  if (ret >= 0) ret = avcodec_open2(codec.get(), decoder, nullptr);
  if (ret < 0) {
    log.warning(kLogTag, "Cannot open decoder for %s: %s", name.c_str(),
                avErrorText(ret).c_str());
    return std::nullopt;
  }
  if (codec->sample_rate <= 0 || codec->ch_layout.nb_channels <= 0) {
    log.warning(kLogTag, "Empty or invalid stream: %s", name.c_str());
    return std::nullopt;
  }

  ResamplerPtr swr = makeMonoResampler(codec.get(), error);
  if (!swr) {
    log.warning(kLogTag, "Cannot set up resampler for %s: %s", name.c_str(), error.c_str());
    return std::nullopt;
  }

  PacketPtr packet(av_packet_alloc());
  FramePtr frame(av_frame_alloc());
  if (!packet || !frame) {
    log.error(kLogTag, "Cannot allocate decode buffers for %s", name.c_str());
    return std::nullopt;
  }

  const size_t max_samples =
      static_cast<size_t>(max_seconds * static_cast<double>(codec->sample_rate));
  MonoSink sink(swr.get(), max_samples);

  // Pull every frame the decoder has ready; false stops the whole decode.
  auto drain = [&]() {
    for (;;) {
      int recv = avcodec_receive_frame(codec.get(), frame.get());
      if (recv == AVERROR(EAGAIN) || recv == AVERROR_EOF) return true;
      if (recv < 0) {
        log.debug(kLogTag, "Decode error in %s: %s", name.c_str(), avErrorText(recv).c_str());
        return true;
      }
      bool ok = sink.push(frame.get());
      av_frame_unref(frame.get());
      if (!ok) return false;
    }
  };

  bool running = true;
  while (running && av_read_frame(format.get(), packet.get()) >= 0) {
    if (packet->stream_index == stream_index) {
      int sent = avcodec_send_packet(codec.get(), packet.get());
      if (sent < 0 && sent != AVERROR(EAGAIN)) {
        log.debug(kLogTag, "Skipping bad packet in %s: %s", name.c_str(),
                  avErrorText(sent).c_str());
      }
    }
    av_packet_unref(packet.get());
    running = drain();
  }
  if (running) {
    // Enter draining mode, then flush what the resampler still buffers.
    ret = avcodec_send_packet(codec.get(), nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
      log.debug(kLogTag, "Decoder flush failed for %s: %s", name.c_str(),
                avErrorText(ret).c_str());
    }
    if (drain()) sink.push(nullptr);
  }

  if (sink.tooLong()) {
    log.warning(kLogTag, "Signal longer than %.0f s, skipped: %s", max_seconds, name.c_str());
    return std::nullopt;
  }
  if (!sink.error().empty()) {
    log.warning(kLogTag, "Resampling failed for %s: %s", name.c_str(), sink.error().c_str());
    return std::nullopt;
  }
  if (sink.samples().empty()) {
    log.warning(kLogTag, "No audio decoded from %s", name.c_str());
    return std::nullopt;
  }

  AudioSignal signal;
  signal.source_path = path;
  signal.sample_rate = static_cast<uint32_t>(codec->sample_rate);
  signal.samples = std::move(sink.samples());
  return signal;
}

std::optional<double> readDurationWithFfmpeg(const std::string& path) {
  std::string error;
  FormatPtr format = openInput(path, error);
  if (!format || format->duration == AV_NOPTS_VALUE || format->duration <= 0) {
    return std::nullopt;
  }
  return static_cast<double>(format->duration) / static_cast<double>(AV_TIME_BASE);
}

}  // namespace trackkey
