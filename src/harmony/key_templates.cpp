/// @file
/// @brief Template bank construction.

#include "harmony/key_templates.h"

namespace trackkey {

namespace {

std::array<KeyTemplate, kKeyTemplateCount> buildBank() {
  FeatureVector major_unit = kMajorProfile;
  FeatureVector minor_unit = kMinorProfile;
  normalizeVector(major_unit);
  normalizeVector(minor_unit);

  std::array<KeyTemplate, kKeyTemplateCount> bank;
  for (int rotation = 0; rotation < kPitchClassCount; ++rotation) {
    KeyTemplate& major = bank[rotation * 2];
    major.is_minor = false;
    major.rotation = rotation;
    major.vector = rotateProfile(major_unit, rotation);
    major.label = keyLabel(major.keySignature());

    KeyTemplate& minor = bank[rotation * 2 + 1];
    minor.is_minor = true;
    minor.rotation = rotation;
    minor.vector = rotateProfile(minor_unit, rotation);
    minor.label = keyLabel(minor.keySignature());
  }
  return bank;
}

}  // namespace

FeatureVector rotateProfile(const FeatureVector& profile, int rotation) {
  FeatureVector rotated{};
  for (int idx = 0; idx < kPitchClassCount; ++idx) {
    int src = ((idx - rotation) % kPitchClassCount + kPitchClassCount) % kPitchClassCount;
    rotated[idx] = profile[src];
  }
  return rotated;
}

const std::array<KeyTemplate, kKeyTemplateCount>& keyTemplateBank() {
  static const std::array<KeyTemplate, kKeyTemplateCount> bank = buildBank();
  return bank;
}

const KeyTemplate* findKeyTemplate(const std::string& label) {
  for (const auto& entry : keyTemplateBank()) {
    if (entry.label == label) return &entry;
  }
  return nullptr;
}

}  // namespace trackkey
