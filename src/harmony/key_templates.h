// Key template bank: 24 unit-normalized reference pitch-class profiles.
//
// Built once from the Krumhansl-Kessler probe-tone profiles (Krumhansl 1990),
// rotated to each of the 12 tonics. Immutable after construction.

#ifndef TRACKKEY_HARMONY_KEY_TEMPLATES_H
#define TRACKKEY_HARMONY_KEY_TEMPLATES_H

#include <array>
#include <string>

#include "core/basic_types.h"
#include "harmony/key.h"

namespace trackkey {

/// Number of templates in the bank (12 tonics x {major, minor}).
constexpr int kKeyTemplateCount = 24;

/// @brief One reference profile for a tonal center.
struct KeyTemplate {
  std::string label;     ///< Classic label: "C", "C#m".
  bool is_minor = false;
  int rotation = 0;      ///< Tonic pitch class, 0..11.
  FeatureVector vector{};

  KeySignature keySignature() const {
    return {keyFromPitchClass(rotation), is_minor};
  }
};

/// Raw (unnormalized) major probe-tone profile, tonic at index 0.
constexpr FeatureVector kMajorProfile = {6.35f, 2.23f, 3.48f, 2.33f, 4.38f, 4.09f,
                                         2.52f, 5.19f, 2.39f, 3.66f, 2.29f, 2.88f};

/// Raw (unnormalized) minor probe-tone profile, tonic at index 0.
constexpr FeatureVector kMinorProfile = {6.33f, 2.68f, 3.52f, 5.38f, 2.60f, 3.53f,
                                         2.54f, 4.75f, 3.98f, 2.69f, 3.34f, 3.17f};

/// @brief Rotate a profile so its tonic lands on pitch class `rotation`.
///
/// rotated[j] = profile[(j - rotation) mod 12].
FeatureVector rotateProfile(const FeatureVector& profile, int rotation);

/// @brief The process-wide template bank.
///
/// Ordered by rotation ascending, major before minor at each rotation:
/// index 2*i is the major template on tonic i, index 2*i+1 the minor one.
/// This order is the classifier's tie-break order.
const std::array<KeyTemplate, kKeyTemplateCount>& keyTemplateBank();

/// @brief Look up a template by its classic label.
/// @return Pointer into the bank, or nullptr if the label is not in the bank.
const KeyTemplate* findKeyTemplate(const std::string& label);

}  // namespace trackkey

#endif  // TRACKKEY_HARMONY_KEY_TEMPLATES_H
