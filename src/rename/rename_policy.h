// Rename policy: operator-chosen rules for rewriting file names.

#ifndef TRACKKEY_RENAME_RENAME_POLICY_H
#define TRACKKEY_RENAME_RENAME_POLICY_H

#include <string>
#include <utility>
#include <vector>

#include "core/basic_types.h"

namespace trackkey {

/// @brief Immutable-per-run rules for the rename pipeline.
struct RenamePolicy {
  bool rename_enabled = true;
  KeyNotation notation = KeyNotation::Classic;
  /// Literal substrings stripped from the base name, in order.
  std::vector<std::string> remove_literals;
  /// (old, new) substitutions applied sequentially, in order.
  std::vector<std::pair<std::string, std::string>> replace_pairs;
};

/// @brief Parse a comma-separated removal list ("Official Video, [HD]").
///
/// Entries are trimmed; empty entries are dropped.
std::vector<std::string> parseRemoveList(const std::string& text);

/// @brief Parse a comma-separated replacement list ("_: , -:|").
///
/// Each entry is trimmed and split on its first ':' into (old, new). Entries
/// without a colon or with an empty old part are dropped. A repeated old part
/// keeps the position of its first occurrence and takes the later new part.
std::vector<std::pair<std::string, std::string>> parseReplaceList(const std::string& text);

}  // namespace trackkey

#endif  // TRACKKEY_RENAME_RENAME_POLICY_H
