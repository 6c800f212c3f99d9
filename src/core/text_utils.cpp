/// @file
/// @brief Implementation of file-name text helpers.

#include "core/text_utils.h"

#include <cctype>

namespace trackkey {
namespace text {

namespace {

char lowerChar(char chr) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(chr)));
}

bool isDigit(char chr) {
  return chr >= '0' && chr <= '9';
}

/// @brief Case-insensitive comparison of token against haystack at offset.
bool matchesAt(std::string_view haystack, size_t pos, std::string_view token) {
  if (pos + token.size() > haystack.size()) return false;
  for (size_t idx = 0; idx < token.size(); ++idx) {
    if (lowerChar(haystack[pos + idx]) != lowerChar(token[idx])) return false;
  }
  return true;
}

}  // namespace

std::string toLower(std::string_view str) {
  std::string result;
  result.reserve(str.size());
  for (char chr : str) {
    result.push_back(lowerChar(chr));
  }
  return result;
}

bool isWordChar(char chr) {
  return (chr >= 'a' && chr <= 'z') || (chr >= 'A' && chr <= 'Z') ||
         isDigit(chr) || chr == '_';
}

bool isSpace(char chr) {
  return chr == ' ' || chr == '\t' || chr == '\n' || chr == '\r' ||
         chr == '\v' || chr == '\f';
}

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
  return lhs.size() == rhs.size() && matchesAt(lhs, 0, rhs);
}

std::string replaceAll(std::string_view str, std::string_view from, std::string_view to) {
  std::string result;
  if (from.empty()) {
    result.assign(str);
    return result;
  }
  result.reserve(str.size());
  size_t pos = 0;
  while (pos < str.size()) {
    size_t hit = str.find(from, pos);
    if (hit == std::string_view::npos) {
      result.append(str.substr(pos));
      break;
    }
    result.append(str.substr(pos, hit - pos));
    result.append(to);
    pos = hit + from.size();
  }
  return result;
}

size_t findWholeWord(std::string_view haystack, std::string_view token, size_t from) {
  if (token.empty()) return std::string::npos;
  for (size_t pos = from; pos + token.size() <= haystack.size(); ++pos) {
    if (!matchesAt(haystack, pos, token)) continue;
    bool left_ok = pos == 0 || !isWordChar(haystack[pos - 1]);
    size_t end = pos + token.size();
    bool right_ok = end == haystack.size() || !isWordChar(haystack[end]);
    if (left_ok && right_ok) return pos;
  }
  return std::string::npos;
}

std::string removeWholeWord(std::string_view str, std::string_view token) {
  std::string result;
  if (token.empty()) {
    result.assign(str);
    return result;
  }
  size_t pos = 0;
  while (pos < str.size()) {
    size_t hit = findWholeWord(str, token, pos);
    if (hit == std::string::npos) {
      result.append(str.substr(pos));
      break;
    }
    result.append(str.substr(pos, hit - pos));
    pos = hit + token.size();
  }
  return result;
}

std::string removeBpmTokens(std::string_view str) {
  std::string result;
  result.reserve(str.size());
  size_t pos = 0;
  while (pos < str.size()) {
    bool at_word_start = pos == 0 || !isWordChar(str[pos - 1]);
    if (isDigit(str[pos]) && at_word_start) {
      size_t cursor = pos;
      while (cursor < str.size() && isDigit(str[cursor])) ++cursor;
      while (cursor < str.size() && isSpace(str[cursor])) ++cursor;
      size_t end = cursor + 3;
      if (matchesAt(str, cursor, "bpm") &&
          (end == str.size() || !isWordChar(str[end]))) {
        pos = end;
        continue;
      }
    }
    result.push_back(str[pos]);
    ++pos;
  }
  return result;
}

std::string trim(std::string_view str) {
  size_t begin = 0;
  size_t end = str.size();
  while (begin < end && isSpace(str[begin])) ++begin;
  while (end > begin && isSpace(str[end - 1])) --end;
  return std::string(str.substr(begin, end - begin));
}

std::string stripLeadingSeparators(std::string_view str) {
  size_t begin = 0;
  while (begin < str.size() && (isSpace(str[begin]) || str[begin] == '-')) ++begin;
  return std::string(str.substr(begin));
}

std::string collapseWhitespace(std::string_view str) {
  std::string result;
  result.reserve(str.size());
  bool pending_space = false;
  for (char chr : str) {
    if (isSpace(chr)) {
      pending_space = !result.empty();
      continue;
    }
    if (pending_space) {
      result.push_back(' ');
      pending_space = false;
    }
    result.push_back(chr);
  }
  return result;
}

std::vector<std::string> splitTrimmed(std::string_view str, char delimiter) {
  std::vector<std::string> pieces;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t hit = str.find(delimiter, pos);
    if (hit == std::string_view::npos) hit = str.size();
    std::string piece = trim(str.substr(pos, hit - pos));
    if (!piece.empty()) {
      pieces.push_back(piece);
    }
    pos = hit + 1;
  }
  return pieces;
}

std::string truncateWithEllipsis(std::string_view str, size_t max_len) {
  if (str.size() <= max_len) return std::string(str);
  if (max_len < 3) return std::string(str.substr(0, max_len));
  return std::string(str.substr(0, max_len - 3)) + "...";
}

}  // namespace text
}  // namespace trackkey
