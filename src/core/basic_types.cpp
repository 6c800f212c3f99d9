// Implementation of enum-to-string conversions and feature-vector math.

#include "core/basic_types.h"

#include <cmath>

#include "core/text_utils.h"

namespace trackkey {

const char* keyToString(Key key) {
  switch (key) {
    case Key::C:  return "C";
    case Key::Cs: return "C#";
    case Key::D:  return "D";
    case Key::Ds: return "D#";
    case Key::E:  return "E";
    case Key::F:  return "F";
    case Key::Fs: return "F#";
    case Key::G:  return "G";
    case Key::Gs: return "G#";
    case Key::A:  return "A";
    case Key::As: return "A#";
    case Key::B:  return "B";
  }
  return "?";
}

Key keyFromPitchClass(int pitch_class) {
  int wrapped = pitch_class % kPitchClassCount;
  if (wrapped < 0) wrapped += kPitchClassCount;
  return static_cast<Key>(wrapped);
}

double dotProduct(const FeatureVector& lhs, const FeatureVector& rhs) {
  double sum = 0.0;
  for (int idx = 0; idx < kPitchClassCount; ++idx) {
    sum += static_cast<double>(lhs[idx]) * static_cast<double>(rhs[idx]);
  }
  return sum;
}

float vectorNorm(const FeatureVector& vec) {
  return static_cast<float>(std::sqrt(dotProduct(vec, vec)));
}

bool normalizeVector(FeatureVector& vec) {
  float norm = vectorNorm(vec);
  if (!(norm > 0.0f) || !std::isfinite(norm)) {
    return false;
  }
  for (float& val : vec) {
    val /= norm;
  }
  return true;
}

const char* confidenceTierToString(ConfidenceTier tier) {
  switch (tier) {
    case ConfidenceTier::High:   return "High";
    case ConfidenceTier::Medium: return "Medium";
    case ConfidenceTier::Low:    return "Low";
  }
  return "Unknown";
}

ConfidenceTier confidenceTierForScore(double score) {
  if (score > 0.8) return ConfidenceTier::High;
  if (score > 0.5) return ConfidenceTier::Medium;
  return ConfidenceTier::Low;
}

const char* keyNotationToString(KeyNotation notation) {
  switch (notation) {
    case KeyNotation::Classic:      return "classic";
    case KeyNotation::Alphanumeric: return "alphanumeric";
  }
  return "unknown";
}

bool keyNotationFromString(const std::string& str, KeyNotation& out) {
  if (text::equalsIgnoreCase(str, "classic")) {
    out = KeyNotation::Classic;
    return true;
  }
  if (text::equalsIgnoreCase(str, "alphanumeric") || text::equalsIgnoreCase(str, "camelot")) {
    out = KeyNotation::Alphanumeric;
    return true;
  }
  return false;
}

const char* reportFormatToString(ReportFormat format) {
  switch (format) {
    case ReportFormat::Tabular:    return "csv";
    case ReportFormat::Structured: return "json";
  }
  return "unknown";
}

bool reportFormatFromString(const std::string& str, ReportFormat& out) {
  if (text::equalsIgnoreCase(str, "csv") || text::equalsIgnoreCase(str, "tabular")) {
    out = ReportFormat::Tabular;
    return true;
  }
  if (text::equalsIgnoreCase(str, "json") || text::equalsIgnoreCase(str, "structured")) {
    out = ReportFormat::Structured;
    return true;
  }
  return false;
}

}  // namespace trackkey
