// Tests for harmony/key.h -- circle of fifths, labels.

#include "harmony/key.h"

#include <gtest/gtest.h>

#include <set>

namespace trackkey {
namespace {

// ---------------------------------------------------------------------------
// fifthsFromC
// ---------------------------------------------------------------------------

TEST(FifthsFromCTest, KnownPositions) {
  EXPECT_EQ(fifthsFromC(Key::C), 0);
  EXPECT_EQ(fifthsFromC(Key::G), 1);
  EXPECT_EQ(fifthsFromC(Key::D), 2);
  EXPECT_EQ(fifthsFromC(Key::B), 5);
  EXPECT_EQ(fifthsFromC(Key::Fs), 6);
  EXPECT_EQ(fifthsFromC(Key::F), 11);
}

TEST(FifthsFromCTest, IsBijective) {
  std::set<int> seen;
  for (int pc = 0; pc < kPitchClassCount; ++pc) {
    seen.insert(fifthsFromC(keyFromPitchClass(pc)));
  }
  EXPECT_EQ(seen.size(), 12u);
}

// ---------------------------------------------------------------------------
// Labels
// ---------------------------------------------------------------------------

TEST(KeyLabelTest, SharpSpellings) {
  EXPECT_EQ(keyLabel({Key::C, false}), "C");
  EXPECT_EQ(keyLabel({Key::As, true}), "A#m");
  EXPECT_EQ(keyLabel({Key::Fs, false}), "F#");
}

TEST(KeyLabelParseTest, AcceptsSharpsFlatsAndMinor) {
  auto parsed = keySignatureFromLabel("Ebm");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->tonic, Key::Ds);
  EXPECT_TRUE(parsed->is_minor);

  parsed = keySignatureFromLabel("F#");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->tonic, Key::Fs);
  EXPECT_FALSE(parsed->is_minor);

  parsed = keySignatureFromLabel("Cb");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->tonic, Key::B);

  parsed = keySignatureFromLabel("bbm");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->tonic, Key::As);
  EXPECT_TRUE(parsed->is_minor);
}

TEST(KeyLabelParseTest, RejectsMalformed) {
  EXPECT_FALSE(keySignatureFromLabel("").has_value());
  EXPECT_FALSE(keySignatureFromLabel("H").has_value());
  EXPECT_FALSE(keySignatureFromLabel("C major").has_value());
  EXPECT_FALSE(keySignatureFromLabel("Amm").has_value());
  EXPECT_FALSE(keySignatureFromLabel("8A").has_value());
}

TEST(KeyLabelParseTest, RoundTripsEveryLabel) {
  for (int pc = 0; pc < kPitchClassCount; ++pc) {
    for (bool minor : {false, true}) {
      KeySignature key_sig = {keyFromPitchClass(pc), minor};
      auto parsed = keySignatureFromLabel(keyLabel(key_sig));
      ASSERT_TRUE(parsed.has_value());
      EXPECT_EQ(*parsed, key_sig);
    }
  }
}

}  // namespace
}  // namespace trackkey
