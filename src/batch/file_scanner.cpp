/// @file
/// @brief Directory enumeration for the batch orchestrator.

#include "batch/file_scanner.h"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include "core/text_utils.h"

namespace trackkey {

namespace fs = std::filesystem;

bool isSupportedAudioFile(const std::string& path) {
  std::string ext = text::toLower(fs::path(path).extension().string());
  for (const char* supported : kSupportedExtensions) {
    if (ext == supported) return true;
  }
  return false;
}

std::vector<std::string> scanAudioFiles(const std::string& folder) {
  std::vector<fs::path> found;
  std::error_code ec;
  fs::directory_iterator iter(folder, ec);
  if (ec) return {};

  for (fs::directory_iterator end; iter != end; iter.increment(ec)) {
    if (ec) break;
    std::error_code type_ec;
    if (!iter->is_regular_file(type_ec) || type_ec) continue;
    if (isSupportedAudioFile(iter->path().string())) {
      found.push_back(iter->path());
    }
  }

  std::sort(found.begin(), found.end(), [](const fs::path& lhs, const fs::path& rhs) {
    return lhs.filename().string() < rhs.filename().string();
  });
  found.erase(std::unique(found.begin(), found.end()), found.end());

  std::vector<std::string> paths;
  paths.reserve(found.size());
  for (const auto& path : found) {
    paths.push_back(path.string());
  }
  return paths;
}

}  // namespace trackkey
