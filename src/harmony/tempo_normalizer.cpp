/// @file
/// @brief Octave-error correction for raw tempo estimates.

#include "harmony/tempo_normalizer.h"

#include <cmath>
#include <limits>

namespace trackkey {

std::optional<int> normalizeTempo(double raw_bpm) {
  if (!std::isfinite(raw_bpm) || raw_bpm < 1.0 ||
      raw_bpm > static_cast<double>(std::numeric_limits<int>::max() / 2)) {
    return std::nullopt;
  }
  int truncated = static_cast<int>(raw_bpm);

  if (truncated < kTempoDoubleBelow) return truncated * 2;
  if (truncated > kTempoHalveAbove) return truncated / 2;
  return truncated;
}

}  // namespace trackkey
