// Key signature value type, label formatting/parsing and circle-of-fifths position.

#ifndef TRACKKEY_HARMONY_KEY_H
#define TRACKKEY_HARMONY_KEY_H

#include <optional>
#include <string>
#include <string_view>

#include "core/basic_types.h"

namespace trackkey {

/// @brief A tonal center: tonic pitch class plus mode.
struct KeySignature {
  Key tonic = Key::C;
  bool is_minor = false;

  bool operator==(const KeySignature& other) const {
    return tonic == other.tonic && is_minor == other.is_minor;
  }

  bool operator!=(const KeySignature& other) const {
    return !(*this == other);
  }
};

/// @brief Steps clockwise on the circle of fifths from C to the given tonic (0-11).
/// @param tonic Tonic pitch class.
/// @return 0 for C, 1 for G, ... 11 for F.
int fifthsFromC(Key tonic);

/// @brief Format a key as a classic label: "C", "F#", "Am", "A#m".
///
/// Always uses sharp spellings, which are the labels of the template bank.
std::string keyLabel(const KeySignature& key_sig);

/// @brief Parse a classic label such as "C", "F#", "Gb", "Am", "Ebm", "bbm".
///
/// The first letter is case-insensitive; an optional '#' or 'b' accidental
/// follows; a trailing 'm' marks minor. Nothing else is accepted.
///
/// @param label Label text.
/// @return Parsed key, or std::nullopt on malformed input.
std::optional<KeySignature> keySignatureFromLabel(std::string_view label);

}  // namespace trackkey

#endif  // TRACKKEY_HARMONY_KEY_H
