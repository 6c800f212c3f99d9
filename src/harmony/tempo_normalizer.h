// Tempo normalization: folds beat-tracker octave errors into a musical range.
//
// Design values (fixed, not tunable at runtime):
//   - truncate the raw estimate (fraction discarded, not rounded)
//   - below 70 BPM:  double (half-time detection)
//   - above 200 BPM: halve, integer division (double-time detection)
// At most one correction is applied; the corrected value is not re-checked.

#ifndef TRACKKEY_HARMONY_TEMPO_NORMALIZER_H
#define TRACKKEY_HARMONY_TEMPO_NORMALIZER_H

#include <optional>

namespace trackkey {

/// Truncated tempos below this are doubled.
constexpr int kTempoDoubleBelow = 70;

/// Truncated tempos above this are halved.
constexpr int kTempoHalveAbove = 200;

/// @brief Normalize a raw tempo estimate to an integer BPM.
/// @param raw_bpm Tempo from the beat tracker.
/// @return Normalized BPM, or std::nullopt if raw_bpm is not finite or
///         truncates to a non-positive value.
std::optional<int> normalizeTempo(double raw_bpm);

}  // namespace trackkey

#endif  // TRACKKEY_HARMONY_TEMPO_NORMALIZER_H
