// Notation table: classic key labels <-> alphanumeric (Camelot wheel) codes.
//
// Wheel layout: major keys carry the letter 'B', minor keys 'A', and a minor
// key shares the number of the major key on the same tonic. C major is 8B,
// C minor is 8A, and each step clockwise adds a perfect fifth:
//
//   1B B    2B F#   3B C#   4B G#   5B D#   6B A#
//   7B F    8B C    9B G   10B D   11B A   12B E
//   1A Bm   2A F#m  3A C#m  4A G#m  5A D#m  6A A#m
//   7A Fm   8A Cm   9A Gm  10A Dm  11A Am  12A Em

#ifndef TRACKKEY_HARMONY_NOTATION_TABLE_H
#define TRACKKEY_HARMONY_NOTATION_TABLE_H

#include <optional>
#include <string>
#include <string_view>

#include "core/basic_types.h"
#include "harmony/key.h"

namespace trackkey {

/// @brief Wheel code for a key signature, e.g. "8B".
std::string alphanumericCode(const KeySignature& key_sig);

/// @brief Map a classic label ("Am", "Bb") to its wheel code ("11A", "6B").
/// @return Code, or std::nullopt if the label does not parse.
std::optional<std::string> toAlphanumeric(std::string_view classic_label);

/// @brief Map a wheel code ("11A", case-insensitive) to a classic label ("Am").
/// @return Sharp-spelled label, or std::nullopt if the code is malformed.
std::optional<std::string> fromAlphanumeric(std::string_view code);

/// @brief Key label rendered in the requested notation.
///
/// Labels without a table entry are returned unchanged.
std::string displayKey(const std::string& classic_label, KeyNotation notation);

}  // namespace trackkey

#endif  // TRACKKEY_HARMONY_NOTATION_TABLE_H
