// Tests for harmony/key_templates.h -- the 24-entry template bank.

#include "harmony/key_templates.h"

#include <gtest/gtest.h>

#include <set>

namespace trackkey {
namespace {

TEST(RotateProfileTest, MovesTonicToRotation) {
  FeatureVector rotated = rotateProfile(kMajorProfile, 2);
  EXPECT_FLOAT_EQ(rotated[2], kMajorProfile[0]);
  EXPECT_FLOAT_EQ(rotated[9], kMajorProfile[7]);
  EXPECT_FLOAT_EQ(rotated[0], kMajorProfile[10]);
}

TEST(RotateProfileTest, ZeroRotationIsIdentity) {
  FeatureVector rotated = rotateProfile(kMinorProfile, 0);
  for (int idx = 0; idx < kPitchClassCount; ++idx) {
    EXPECT_FLOAT_EQ(rotated[idx], kMinorProfile[idx]);
  }
}

TEST(KeyTemplateBankTest, HasTwentyFourUnitTemplates) {
  const auto& bank = keyTemplateBank();
  ASSERT_EQ(bank.size(), static_cast<size_t>(kKeyTemplateCount));
  for (const auto& entry : bank) {
    EXPECT_NEAR(vectorNorm(entry.vector), 1.0f, 1e-5f) << entry.label;
  }
}

TEST(KeyTemplateBankTest, OrderedByRotationMajorFirst) {
  const auto& bank = keyTemplateBank();
  for (int rotation = 0; rotation < kPitchClassCount; ++rotation) {
    EXPECT_EQ(bank[rotation * 2].rotation, rotation);
    EXPECT_FALSE(bank[rotation * 2].is_minor);
    EXPECT_EQ(bank[rotation * 2 + 1].rotation, rotation);
    EXPECT_TRUE(bank[rotation * 2 + 1].is_minor);
  }
  EXPECT_EQ(bank[0].label, "C");
  EXPECT_EQ(bank[1].label, "Cm");
  EXPECT_EQ(bank[19].label, "Am");
  EXPECT_EQ(bank[23].label, "Bm");
}

TEST(KeyTemplateBankTest, LabelsAreUnique) {
  std::set<std::string> labels;
  for (const auto& entry : keyTemplateBank()) labels.insert(entry.label);
  EXPECT_EQ(labels.size(), static_cast<size_t>(kKeyTemplateCount));
}

TEST(KeyTemplateBankTest, IsStableAcrossCalls) {
  EXPECT_EQ(&keyTemplateBank(), &keyTemplateBank());
}

TEST(FindKeyTemplateTest, LooksUpByLabel) {
  const KeyTemplate* entry = findKeyTemplate("F#m");
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->rotation, 6);
  EXPECT_TRUE(entry->is_minor);
  EXPECT_EQ(entry->keySignature(), (KeySignature{Key::Fs, true}));
  EXPECT_EQ(findKeyTemplate("Gb"), nullptr);
  EXPECT_EQ(findKeyTemplate("8A"), nullptr);
}

}  // namespace
}  // namespace trackkey
