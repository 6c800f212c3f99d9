// Basic types shared by the key/tempo classifier and the rename pipeline.

#ifndef TRACKKEY_CORE_BASIC_TYPES_H
#define TRACKKEY_CORE_BASIC_TYPES_H

#include <array>
#include <cstdint>
#include <string>

namespace trackkey {

// ---------------------------------------------------------------------------
// Pitch classes
// ---------------------------------------------------------------------------

/// Number of pitch classes in an octave.
constexpr int kPitchClassCount = 12;

/// Pitch class of a tonal center (C = 0 ... B = 11).
enum class Key : uint8_t {
  C = 0, Cs, D, Ds, E, F, Fs, G, Gs, A, As, B
};

/// @brief Convert Key to its sharp spelling ("C", "C#", ... "B").
const char* keyToString(Key key);

/// @brief Build a Key from a pitch-class index, wrapping modulo 12.
/// @param pitch_class Any integer; negative values wrap upward.
Key keyFromPitchClass(int pitch_class);

/// @brief Transpose a key by a number of semitones (mod 12).
inline Key transposeKey(Key key, int semitones) {
  return keyFromPitchClass(static_cast<int>(key) + semitones);
}

// ---------------------------------------------------------------------------
// Feature vector
// ---------------------------------------------------------------------------

/// 12-dimensional pitch-class energy profile, C..B.
/// Producers L2-normalize it (magnitude 1).
using FeatureVector = std::array<float, kPitchClassCount>;

/// @brief Dot product of two feature vectors, accumulated in double.
double dotProduct(const FeatureVector& lhs, const FeatureVector& rhs);

/// @brief Euclidean norm of a feature vector.
float vectorNorm(const FeatureVector& vec);

/// @brief Scale a vector to unit length.
/// @param vec Vector to normalize in place.
/// @return False (vector untouched) if the norm is zero or not finite.
bool normalizeVector(FeatureVector& vec);

// ---------------------------------------------------------------------------
// Classification enums
// ---------------------------------------------------------------------------

/// Coarse confidence bucket for a key classification score.
enum class ConfidenceTier : uint8_t {
  High,    ///< score > 0.8
  Medium,  ///< score > 0.5
  Low
};

/// @brief Convert ConfidenceTier to human-readable string.
const char* confidenceTierToString(ConfidenceTier tier);

/// @brief Map a correlation score to its confidence tier.
ConfidenceTier confidenceTierForScore(double score);

/// Key naming scheme used in composed file names.
enum class KeyNotation : uint8_t {
  Classic,      ///< Letter names: "C", "A#m".
  Alphanumeric  ///< Camelot wheel codes: "8B", "11A".
};

/// @brief Convert KeyNotation to string ("classic" / "alphanumeric").
const char* keyNotationToString(KeyNotation notation);

/// @brief Parse a KeyNotation. Accepts "classic", "alphanumeric", "camelot".
/// @param str Notation name (case-insensitive).
/// @param out Parsed value, untouched on failure.
/// @return True if the name was recognized.
bool keyNotationFromString(const std::string& str, KeyNotation& out);

/// Output format of the per-run report artifact.
enum class ReportFormat : uint8_t {
  Tabular,    ///< CSV
  Structured  ///< JSON
};

/// @brief Convert ReportFormat to its file extension without dot ("csv"/"json").
const char* reportFormatToString(ReportFormat format);

/// @brief Parse a ReportFormat. Accepts "csv"/"tabular" and "json"/"structured".
/// @param str Format name (case-insensitive).
/// @param out Parsed value, untouched on failure.
/// @return True if the name was recognized.
bool reportFormatFromString(const std::string& str, ReportFormat& out);

}  // namespace trackkey

#endif  // TRACKKEY_CORE_BASIC_TYPES_H
