// Feature Provider backed by libsndfile (decode) and aubio (beat tracking,
// phase vocoder). MP4/AAC, and anything else libsndfile cannot open, is
// decoded through FFmpeg instead.

#ifndef TRACKKEY_IO_SNDFILE_AUBIO_FEATURE_PROVIDER_H
#define TRACKKEY_IO_SNDFILE_AUBIO_FEATURE_PROVIDER_H

#include <cstdint>

#include <sndfile.hh>

#include "io/i_feature_provider.h"

namespace trackkey {

class RunLog;

/// @brief Analysis parameters of the libsndfile/aubio adapter.
struct SndfileAubioSettings {
  uint32_t tempo_window = 1024;
  uint32_t tempo_hop = 512;
  uint32_t chroma_window = 4096;
  uint32_t chroma_hop = 2048;
  double chroma_excerpt_seconds = 60.0;  ///< Centered excerpt used for chroma.
  double chroma_min_hz = 55.0;
  double chroma_max_hz = 5000.0;
  float silence_peak = 1e-6f;  ///< Signals quieter than this are rejected.
  double max_decode_seconds = 3600.0;  ///< Longer files are not decoded.
};

/// @brief IFeatureProvider over libsndfile and aubio.
///
/// Stateless apart from settings; every call allocates its own aubio objects,
/// so concurrent calls for different files are safe.
class SndfileAubioFeatureProvider : public IFeatureProvider {
 public:
  explicit SndfileAubioFeatureProvider(RunLog& log,
                                       SndfileAubioSettings settings = SndfileAubioSettings());

  std::optional<double> readDuration(const std::string& path) override;
  std::optional<AudioSignal> loadSignal(const std::string& path) override;
  std::optional<float> rawTempo(const AudioSignal& signal) override;
  std::optional<FeatureVector> chromaVector(const AudioSignal& signal) override;

 private:
  std::optional<AudioSignal> readWithSndfile(SndfileHandle& file, const std::string& path);

  RunLog& log_;
  SndfileAubioSettings settings_;
};

}  // namespace trackkey

#endif  // TRACKKEY_IO_SNDFILE_AUBIO_FEATURE_PROVIDER_H
