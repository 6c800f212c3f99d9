// Pure name-rewrite stages of the rename engine. No filesystem access.
//
// Pipeline over a file stem (steps run in this order):
//   1. strip remove_literals (exact substrings, policy order)
//   2. apply replace_pairs (sequential substitution)
//   3. purge the non-target key notation (whole word, case-insensitive)
//   4. purge "<digits> bpm" tokens (whole word, case-insensitive)
//   5. trim: outer whitespace, leading whitespace/hyphen run, inner runs
// Then the composed name is "{display key} - {bpm} BPM - {cleaned base}",
// sanitized for file systems.

#ifndef TRACKKEY_RENAME_NAME_PIPELINE_H
#define TRACKKEY_RENAME_NAME_PIPELINE_H

#include <string>

#include "rename/rename_policy.h"

namespace trackkey {

/// Characters replaced by '-' in composed names.
constexpr const char* kInvalidFileNameChars = "<>:\"/\\|?*";

/// @brief Everything the pure stages decide about one file name.
struct NamePlan {
  std::string display_key;   ///< Key label in the policy's notation.
  std::string cleaned_base;  ///< Stem after steps 1-5.
  std::string composed;      ///< Sanitized "{key} - {bpm} BPM - {base}" (no extension).
  bool already_named = false;  ///< Original stem already carries bpm and display key.
};

/// @brief Run steps 1-5 on a stem.
/// @param stem Original file stem (no extension).
/// @param key_label Classic key label of the classification.
/// @param policy Rename policy.
std::string cleanBaseName(const std::string& stem, const std::string& key_label,
                          const RenamePolicy& policy);

/// @brief True if the stem holds both the decimal bpm and the display key as
///        whole words (case-insensitive).
bool isAlreadyNamed(const std::string& stem, const std::string& display_key, int bpm);

/// @brief Replace invalid file-name characters with '-' and collapse whitespace.
std::string sanitizeFileName(const std::string& name);

/// @brief Compose and sanitize "{display_key} - {bpm} BPM - {cleaned_base}".
std::string composeCandidate(const std::string& display_key, int bpm,
                             const std::string& cleaned_base);

/// @brief Name with a collision suffix: "{composed}_{index}".
std::string collisionCandidate(const std::string& composed, int index);

/// @brief Run every pure stage for one stem.
NamePlan planName(const std::string& stem, const std::string& key_label, int bpm,
                  const RenamePolicy& policy);

}  // namespace trackkey

#endif  // TRACKKEY_RENAME_NAME_PIPELINE_H
