/// @file
/// @brief Camelot wheel arithmetic over the circle of fifths.

#include "harmony/notation_table.h"

namespace trackkey {

namespace {

/// Wheel number of C major and C minor.
constexpr int kWheelNumberOfC = 8;

/// @brief Wheel number (1-12) of a tonic; both modes share it.
int wheelNumber(Key tonic) {
  return (fifthsFromC(tonic) + kWheelNumberOfC - 1) % kPitchClassCount + 1;
}

}  // namespace

std::string alphanumericCode(const KeySignature& key_sig) {
  // Same tonic, same number: Cm is 8A next to C at 8B.
  std::string code = std::to_string(wheelNumber(key_sig.tonic));
  code += key_sig.is_minor ? 'A' : 'B';
  return code;
}

std::optional<std::string> toAlphanumeric(std::string_view classic_label) {
  auto key_sig = keySignatureFromLabel(classic_label);
  if (!key_sig) return std::nullopt;
  return alphanumericCode(*key_sig);
}

std::optional<std::string> fromAlphanumeric(std::string_view code) {
  if (code.size() < 2 || code.size() > 3) return std::nullopt;

  char letter = code.back();
  bool is_minor = false;
  if (letter == 'A' || letter == 'a') {
    is_minor = true;
  } else if (letter != 'B' && letter != 'b') {
    return std::nullopt;
  }

  int number = 0;
  for (size_t idx = 0; idx + 1 < code.size(); ++idx) {
    char digit = code[idx];
    if (digit < '0' || digit > '9') return std::nullopt;
    number = number * 10 + (digit - '0');
  }
  if (number < 1 || number > kPitchClassCount) return std::nullopt;

  // Invert wheelNumber: fifths from C, then fifths -> pitch class (x7).
  int fifths = (number - kWheelNumberOfC + kPitchClassCount) % kPitchClassCount;
  return keyLabel({keyFromPitchClass(fifths * 7), is_minor});
}

std::string displayKey(const std::string& classic_label, KeyNotation notation) {
  if (notation != KeyNotation::Alphanumeric) return classic_label;
  auto code = toAlphanumeric(classic_label);
  return code ? *code : classic_label;
}

}  // namespace trackkey
