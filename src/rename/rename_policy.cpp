// Parsing of operator-entered removal and replacement lists.

#include "rename/rename_policy.h"

#include "core/text_utils.h"

namespace trackkey {

std::vector<std::string> parseRemoveList(const std::string& text) {
  return text::splitTrimmed(text, ',');
}

std::vector<std::pair<std::string, std::string>> parseReplaceList(const std::string& text) {
  std::vector<std::pair<std::string, std::string>> pairs;
  for (const auto& entry : text::splitTrimmed(text, ',')) {
    auto colon = entry.find(':');
    if (colon == std::string::npos || colon == 0) continue;

    std::string old_part = entry.substr(0, colon);
    std::string new_part = entry.substr(colon + 1);

    bool replaced = false;
    for (auto& existing : pairs) {
      if (existing.first == old_part) {
        existing.second = new_part;
        replaced = true;
        break;
      }
    }
    if (!replaced) {
      pairs.emplace_back(old_part, new_part);
    }
  }
  return pairs;
}

}  // namespace trackkey
