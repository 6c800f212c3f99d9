/// @file
/// @brief Template-matching key classifier.

#include "harmony/tonal_classifier.h"

#include <cmath>

#include "harmony/key_templates.h"

namespace trackkey {

namespace {

/// Scores closer than this are equal; the earlier rotation keeps the win.
constexpr double kTieTolerance = 1e-9;

}  // namespace

std::optional<Classification> classifyKey(const FeatureVector& chroma) {
  float energy = 0.0f;
  for (float val : chroma) {
    if (!std::isfinite(val)) return std::nullopt;
    energy += std::fabs(val);
  }
  if (energy <= 0.0f) return std::nullopt;

  // Dot products of unit vectors lie in [-1, 1]; start strictly below.
  double best_score = -1.0;
  const KeyTemplate* best = nullptr;
  for (const auto& entry : keyTemplateBank()) {
    double score = dotProduct(chroma, entry.vector);
    if (score > best_score + kTieTolerance) {
      best_score = score;
      best = &entry;
    }
  }
  if (!best) return std::nullopt;

  Classification result;
  result.key_label = best->label;
  result.score = best_score;
  result.tier = confidenceTierForScore(best_score);
  return result;
}

}  // namespace trackkey
