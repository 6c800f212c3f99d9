// Tonal classifier: best-matching key template for a chroma vector.

#ifndef TRACKKEY_HARMONY_TONAL_CLASSIFIER_H
#define TRACKKEY_HARMONY_TONAL_CLASSIFIER_H

#include <optional>
#include <string>

#include "core/basic_types.h"

namespace trackkey {

/// @brief Result of classifying one feature vector.
struct Classification {
  std::string key_label;  ///< Classic label from the template bank.
  double score = 0.0;     ///< Dot product with the winning template.
  ConfidenceTier tier = ConfidenceTier::Low;
};

/// @brief Score a feature vector against all 24 templates.
///
/// Templates are visited in bank order (rotation ascending, major before
/// minor) and a later template only wins with a strictly greater score, so
/// ties go to the lowest rotation and then to major.
///
/// @param chroma L2-normalized pitch-class profile.
/// @return Classification, or std::nullopt if the vector is all-zero or
///         contains non-finite values.
std::optional<Classification> classifyKey(const FeatureVector& chroma);

}  // namespace trackkey

#endif  // TRACKKEY_HARMONY_TONAL_CLASSIFIER_H
