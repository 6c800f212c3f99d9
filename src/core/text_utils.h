// Text helpers for file-name cleaning: case folding, whole-word search and
// whitespace normalization. ASCII semantics throughout; bytes >= 0x80 are
// treated as non-word characters and compared verbatim.

#ifndef TRACKKEY_CORE_TEXT_UTILS_H
#define TRACKKEY_CORE_TEXT_UTILS_H

#include <string>
#include <string_view>
#include <vector>

namespace trackkey {
namespace text {

/// @brief ASCII lowercase copy of a string.
std::string toLower(std::string_view str);

/// @brief True for ASCII letters, digits and underscore.
bool isWordChar(char chr);

/// @brief True for space, tab, newline, carriage return, vertical tab, form feed.
bool isSpace(char chr);

/// @brief Case-insensitive ASCII equality.
bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs);

/// @brief Replace every non-overlapping occurrence of a substring.
/// @param str Source string.
/// @param from Substring to find. An empty pattern leaves the string unchanged.
/// @param to Replacement text.
/// @return New string with replacements applied left to right.
std::string replaceAll(std::string_view str, std::string_view from, std::string_view to);

/// @brief Find a whole-word, case-insensitive occurrence of a token.
///
/// A match must not be preceded or followed by a word character. This also
/// works for tokens that end in punctuation ("C#"), where a plain regex
/// word boundary would require a word character after the '#'.
///
/// @param haystack Text to search.
/// @param token Token to look for. An empty token never matches.
/// @param from Starting offset.
/// @return Offset of the match, or std::string::npos.
size_t findWholeWord(std::string_view haystack, std::string_view token, size_t from = 0);

/// @brief True if token occurs as a whole word (case-insensitive).
inline bool containsWholeWord(std::string_view haystack, std::string_view token) {
  return findWholeWord(haystack, token) != std::string::npos;
}

/// @brief Remove every whole-word, case-insensitive occurrence of a token.
std::string removeWholeWord(std::string_view str, std::string_view token);

/// @brief Remove every "<digits><whitespace*>bpm" whole-word token (case-insensitive).
std::string removeBpmTokens(std::string_view str);

/// @brief Strip leading and trailing whitespace.
std::string trim(std::string_view str);

/// @brief Strip a leading run of whitespace and hyphens.
std::string stripLeadingSeparators(std::string_view str);

/// @brief Split on whitespace runs and re-join with single spaces.
///
/// Leading and trailing whitespace disappear as a side effect.
std::string collapseWhitespace(std::string_view str);

/// @brief Split on a delimiter, trim each piece and drop empty pieces.
std::vector<std::string> splitTrimmed(std::string_view str, char delimiter);

/// @brief Truncate to max_len columns, replacing the tail with "...".
/// @param str Source string.
/// @param max_len Maximum length of the result (>= 3).
std::string truncateWithEllipsis(std::string_view str, size_t max_len);

}  // namespace text
}  // namespace trackkey

#endif  // TRACKKEY_CORE_TEXT_UTILS_H
