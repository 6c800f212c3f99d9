// Pure abstract interface for audio feature extraction.
// Concrete implementation: SndfileAubioFeatureProvider (libsndfile + aubio).

#ifndef TRACKKEY_IO_I_FEATURE_PROVIDER_H
#define TRACKKEY_IO_I_FEATURE_PROVIDER_H

#include <optional>
#include <string>

#include "core/basic_types.h"
#include "io/audio_signal.h"

namespace trackkey {

/// @brief Decodes audio and extracts the raw features the classifiers consume.
///
/// Every method reports failure as std::nullopt (decode error, silent or
/// empty signal, no detectable beat). Implementations must allow concurrent
/// calls for different files.
class IFeatureProvider {
 public:
  virtual ~IFeatureProvider() = default;

  /// @brief Playing time read from the container header, without decoding.
  virtual std::optional<double> readDuration(const std::string& path) = 0;

  /// @brief Decode a file to mono samples.
  virtual std::optional<AudioSignal> loadSignal(const std::string& path) = 0;

  /// @brief Raw tempo estimate in BPM (before octave correction).
  virtual std::optional<float> rawTempo(const AudioSignal& signal) = 0;

  /// @brief L2-normalized mean pitch-class profile.
  virtual std::optional<FeatureVector> chromaVector(const AudioSignal& signal) = 0;
};

}  // namespace trackkey

#endif  // TRACKKEY_IO_I_FEATURE_PROVIDER_H
