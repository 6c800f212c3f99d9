/// @file
/// @brief Pure name-rewrite stages.

#include "rename/name_pipeline.h"

#include <cstring>
#include <optional>

#include "core/text_utils.h"
#include "harmony/notation_table.h"

namespace trackkey {

namespace {

/// @brief The key token that must not survive in a name targeting `notation`.
std::optional<std::string> conflictingKeyToken(const std::string& key_label,
                                               KeyNotation notation) {
  if (notation == KeyNotation::Alphanumeric) {
    return key_label;
  }
  return toAlphanumeric(key_label);
}

}  // namespace

std::string cleanBaseName(const std::string& stem, const std::string& key_label,
                          const RenamePolicy& policy) {
  std::string base = stem;

  for (const auto& literal : policy.remove_literals) {
    base = text::replaceAll(base, literal, "");
  }
  for (const auto& pair : policy.replace_pairs) {
    base = text::replaceAll(base, pair.first, pair.second);
  }

  auto conflicting = conflictingKeyToken(key_label, policy.notation);
  if (conflicting) {
    base = text::removeWholeWord(base, *conflicting);
  }

  base = text::removeBpmTokens(base);

  base = text::trim(base);
  base = text::stripLeadingSeparators(base);
  return text::collapseWhitespace(base);
}

bool isAlreadyNamed(const std::string& stem, const std::string& display_key, int bpm) {
  return text::containsWholeWord(stem, std::to_string(bpm)) &&
         text::containsWholeWord(stem, display_key);
}

std::string sanitizeFileName(const std::string& name) {
  std::string result = name;
  for (char& chr : result) {
    if (chr != '\0' && std::strchr(kInvalidFileNameChars, chr) != nullptr) {
      chr = '-';
    }
  }
  return text::collapseWhitespace(result);
}

std::string composeCandidate(const std::string& display_key, int bpm,
                             const std::string& cleaned_base) {
  std::string name = display_key + " - " + std::to_string(bpm) + " BPM - " + cleaned_base;
  return sanitizeFileName(name);
}

std::string collisionCandidate(const std::string& composed, int index) {
  return composed + "_" + std::to_string(index);
}

NamePlan planName(const std::string& stem, const std::string& key_label, int bpm,
                  const RenamePolicy& policy) {
  NamePlan plan;
  plan.display_key = displayKey(key_label, policy.notation);
  plan.cleaned_base = cleanBaseName(stem, key_label, policy);
  plan.already_named = isAlreadyNamed(stem, plan.display_key, bpm);
  plan.composed = composeCandidate(plan.display_key, bpm, plan.cleaned_base);
  return plan;
}

}  // namespace trackkey
