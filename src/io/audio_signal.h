// Decoded mono audio handed between Feature Provider stages.

#ifndef TRACKKEY_IO_AUDIO_SIGNAL_H
#define TRACKKEY_IO_AUDIO_SIGNAL_H

#include <cstdint>
#include <string>
#include <vector>

namespace trackkey {

/// @brief Mono float samples of one audio file.
struct AudioSignal {
  std::string source_path;
  std::vector<float> samples;  ///< Downmixed to mono, nominal range [-1, 1].
  uint32_t sample_rate = 0;

  bool empty() const { return samples.empty() || sample_rate == 0; }

  /// @brief Length in seconds (0 for an empty signal).
  double durationSeconds() const {
    if (sample_rate == 0) return 0.0;
    return static_cast<double>(samples.size()) / static_cast<double>(sample_rate);
  }
};

}  // namespace trackkey

#endif  // TRACKKEY_IO_AUDIO_SIGNAL_H
