// Implementation of key labels and circle-of-fifths utilities.

#include "harmony/key.h"

#include <cctype>

namespace trackkey {

// ---------------------------------------------------------------------------
// Circle of fifths
// ---------------------------------------------------------------------------

int fifthsFromC(Key tonic) {
  // Each fifth is +7 semitones; 7 is its own inverse mod 12 (7 * 7 = 49 = 1).
  return (static_cast<int>(tonic) * 7) % kPitchClassCount;
}

// ---------------------------------------------------------------------------
// Labels
// ---------------------------------------------------------------------------

std::string keyLabel(const KeySignature& key_sig) {
  std::string result(keyToString(key_sig.tonic));
  if (key_sig.is_minor) {
    result += 'm';
  }
  return result;
}

/// @brief Pitch class of a natural note letter, or -1.
static int naturalPitchClass(char letter) {
  switch (std::toupper(static_cast<unsigned char>(letter))) {
    case 'C': return 0;
    case 'D': return 2;
    case 'E': return 4;
    case 'F': return 5;
    case 'G': return 7;
    case 'A': return 9;
    case 'B': return 11;
    default:  return -1;
  }
}

std::optional<KeySignature> keySignatureFromLabel(std::string_view label) {
  if (label.empty()) return std::nullopt;

  int pitch_class = naturalPitchClass(label[0]);
  if (pitch_class < 0) return std::nullopt;

  size_t pos = 1;
  if (pos < label.size() && label[pos] == '#') {
    ++pitch_class;
    ++pos;
  } else if (pos < label.size() && label[pos] == 'b') {
    --pitch_class;
    ++pos;
  }

  KeySignature result;
  result.tonic = keyFromPitchClass(pitch_class);
  if (pos < label.size() && label[pos] == 'm') {
    result.is_minor = true;
    ++pos;
  }
  if (pos != label.size()) return std::nullopt;
  return result;
}

}  // namespace trackkey
