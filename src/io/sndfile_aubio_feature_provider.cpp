/// @file
/// @brief libsndfile/aubio Feature Provider with an FFmpeg decode path.

#include "io/sndfile_aubio_feature_provider.h"

#include <aubio/aubio.h>
#include <sndfile.hh>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <memory>
#include <vector>

#include "core/run_log.h"
#include "core/text_utils.h"
#include "io/ffmpeg_audio_reader.h"

namespace trackkey {

namespace {

constexpr const char* kLogTag = "Features";

using aubio_tempo_ptr = std::unique_ptr<aubio_tempo_t, decltype(&del_aubio_tempo)>;
using aubio_pvoc_ptr = std::unique_ptr<aubio_pvoc_t, decltype(&del_aubio_pvoc)>;
using fvec_ptr = std::unique_ptr<fvec_t, decltype(&del_fvec)>;
using cvec_ptr = std::unique_ptr<cvec_t, decltype(&del_cvec)>;

/// @brief Feed samples [begin, end) to a callback in hop-sized, zero-padded chunks.
template <typename Func>
void forEachChunk(const std::vector<float>& samples, size_t begin, size_t end, fvec_t* buffer,
                  Func&& func) {
  const size_t hop = buffer->length;
  for (size_t pos = begin; pos < end; pos += hop) {
    size_t count = std::min(hop, end - pos);
    std::copy(samples.begin() + static_cast<std::ptrdiff_t>(pos),
              samples.begin() + static_cast<std::ptrdiff_t>(pos + count), buffer->data);
    std::fill(buffer->data + count, buffer->data + hop, smpl_t(0));
    func(buffer);
  }
}

std::string fileNameOf(const std::string& path) {
  return std::filesystem::path(path).filename().string();
}

/// @brief Containers libsndfile has no decoder for go straight to FFmpeg.
bool prefersFfmpeg(const std::string& path) {
  std::string ext = text::toLower(std::filesystem::path(path).extension().string());
  return ext == ".m4a" || ext == ".aac";
}

/// Frames per libsndfile read call.
constexpr sf_count_t kReadBlockFrames = 8192;

/// libsndfile's own channel limit; anything above is a corrupt header.
constexpr int kMaxChannels = 1024;

}  // namespace

SndfileAubioFeatureProvider::SndfileAubioFeatureProvider(RunLog& log,
                                                         SndfileAubioSettings settings)
    : log_(log), settings_(settings) {}

std::optional<double> SndfileAubioFeatureProvider::readDuration(const std::string& path) {
  if (!prefersFfmpeg(path)) {
    SndfileHandle file(path);
    if (!file.error() && file.samplerate() > 0 && file.frames() > 0) {
      return static_cast<double>(file.frames()) / static_cast<double>(file.samplerate());
    }
  }
  return readDurationWithFfmpeg(path);
}

std::optional<AudioSignal> SndfileAubioFeatureProvider::loadSignal(const std::string& path) {
  std::optional<AudioSignal> signal;
  if (prefersFfmpeg(path)) {
    signal = readAudioWithFfmpeg(path, settings_.max_decode_seconds, log_);
  } else {
    SndfileHandle file(path);
    if (file.error()) {
      log_.debug(kLogTag, "libsndfile cannot open %s (%s), trying FFmpeg",
                 fileNameOf(path).c_str(), file.strError());
      signal = readAudioWithFfmpeg(path, settings_.max_decode_seconds, log_);
    } else {
      signal = readWithSndfile(file, path);
    }
  }
  if (!signal) return std::nullopt;

  float peak = 0.0f;
  for (float sample : signal->samples) {
    peak = std::max(peak, std::fabs(sample));
  }
  if (!(peak >= settings_.silence_peak)) {
    log_.warning(kLogTag, "Silent signal: %s", fileNameOf(path).c_str());
    return std::nullopt;
  }
  log_.debug(kLogTag, "Decoded %s: %zu frames at %u Hz", fileNameOf(path).c_str(),
             signal->samples.size(), signal->sample_rate);
  return signal;
}

std::optional<AudioSignal> SndfileAubioFeatureProvider::readWithSndfile(SndfileHandle& file,
                                                                       const std::string& path) {
  const int channels = file.channels();
  const int sample_rate = file.samplerate();
  const sf_count_t frames = file.frames();
  if (channels <= 0 || channels > kMaxChannels || sample_rate <= 0 || frames <= 0) {
    log_.warning(kLogTag, "Empty or invalid stream: %s", fileNameOf(path).c_str());
    return std::nullopt;
  }
  const double seconds = static_cast<double>(frames) / static_cast<double>(sample_rate);
  if (seconds > settings_.max_decode_seconds) {
    log_.warning(kLogTag, "Signal longer than %.0f s (%.0f s), skipped: %s",
                 settings_.max_decode_seconds, seconds, fileNameOf(path).c_str());
    return std::nullopt;
  }

  AudioSignal signal;
  signal.source_path = path;
  signal.sample_rate = static_cast<uint32_t>(sample_rate);
  signal.samples.reserve(static_cast<size_t>(frames));

  // Downmix block by block; the header frame count is only an upper bound.
  std::vector<float> block(static_cast<size_t>(kReadBlockFrames) * static_cast<size_t>(channels));
  for (;;) {
    const sf_count_t got = file.readf(block.data(), kReadBlockFrames);
    if (got <= 0) break;
    for (sf_count_t frame = 0; frame < got; ++frame) {
      const float* row = block.data() + static_cast<size_t>(frame) * static_cast<size_t>(channels);
      float sum = 0.0f;
      for (int chan = 0; chan < channels; ++chan) {
        sum += row[chan];
      }
      signal.samples.push_back(sum / static_cast<float>(channels));
    }
    if (signal.samples.size() >= static_cast<size_t>(frames)) break;
  }
  if (signal.samples.empty()) {
    log_.warning(kLogTag, "Failed to read audio data: %s", fileNameOf(path).c_str());
    return std::nullopt;
  }
  return signal;
}

std::optional<float> SndfileAubioFeatureProvider::rawTempo(const AudioSignal& signal) {
  if (signal.empty()) return std::nullopt;

  aubio_tempo_ptr tempo{new_aubio_tempo("default", settings_.tempo_window, settings_.tempo_hop,
                                        signal.sample_rate),
                        &del_aubio_tempo};
  fvec_ptr inbuf{new_fvec(settings_.tempo_hop), &del_fvec};
  fvec_ptr out{new_fvec(1), &del_fvec};
  if (!tempo || !inbuf || !out) {
    log_.error(kLogTag, "aubio: failed to create tempo tracker");
    return std::nullopt;
  }

  forEachChunk(signal.samples, 0, signal.samples.size(), inbuf.get(),
               [&](fvec_t* buffer) { aubio_tempo_do(tempo.get(), buffer, out.get()); });

  float bpm = aubio_tempo_get_bpm(tempo.get());
  if (!std::isfinite(bpm) || bpm <= 0.0f) {
    return std::nullopt;
  }
  return bpm;
}

std::optional<FeatureVector> SndfileAubioFeatureProvider::chromaVector(
    const AudioSignal& signal) {
  if (signal.empty()) return std::nullopt;

  const size_t total = signal.samples.size();
  const size_t excerpt = std::min(
      total, static_cast<size_t>(settings_.chroma_excerpt_seconds * signal.sample_rate));
  const size_t begin = (total - excerpt) / 2;
  const size_t end = begin + excerpt;

  aubio_pvoc_ptr pvoc{new_aubio_pvoc(settings_.chroma_window, settings_.chroma_hop),
                      &del_aubio_pvoc};
  fvec_ptr inbuf{new_fvec(settings_.chroma_hop), &del_fvec};
  cvec_ptr spectrum{new_cvec(settings_.chroma_window), &del_cvec};
  if (!pvoc || !inbuf || !spectrum) {
    log_.error(kLogTag, "aubio: failed to create phase vocoder");
    return std::nullopt;
  }

  // Pitch class of every spectrum bin inside the analysis band, -1 outside.
  const double bin_hz =
      static_cast<double>(signal.sample_rate) / static_cast<double>(settings_.chroma_window);
  std::vector<int> bin_pitch_class(spectrum->length, -1);
  for (uint_t bin = 1; bin < spectrum->length; ++bin) {
    double freq = bin * bin_hz;
    if (freq < settings_.chroma_min_hz || freq > settings_.chroma_max_hz) continue;
    double midi = 69.0 + 12.0 * std::log2(freq / 440.0);
    int pitch_class = static_cast<int>(std::lround(midi)) % kPitchClassCount;
    bin_pitch_class[bin] = pitch_class < 0 ? pitch_class + kPitchClassCount : pitch_class;
  }

  std::array<double, kPitchClassCount> energy{};
  size_t frame_count = 0;
  forEachChunk(signal.samples, begin, end, inbuf.get(), [&](fvec_t* buffer) {
    aubio_pvoc_do(pvoc.get(), buffer, spectrum.get());
    for (uint_t bin = 0; bin < spectrum->length; ++bin) {
      int pitch_class = bin_pitch_class[bin];
      if (pitch_class >= 0) {
        energy[static_cast<size_t>(pitch_class)] += spectrum->norm[bin];
      }
    }
    ++frame_count;
  });
  if (frame_count == 0) return std::nullopt;

  FeatureVector chroma{};
  for (size_t idx = 0; idx < chroma.size(); ++idx) {
    chroma[idx] = static_cast<float>(energy[idx] / static_cast<double>(frame_count));
  }
  if (!normalizeVector(chroma)) {
    log_.warning(kLogTag, "No tonal energy in %s", fileNameOf(signal.source_path).c_str());
    return std::nullopt;
  }
  return chroma;
}

}  // namespace trackkey
