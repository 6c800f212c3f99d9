// Enumeration of supported audio files in a folder.

#ifndef TRACKKEY_BATCH_FILE_SCANNER_H
#define TRACKKEY_BATCH_FILE_SCANNER_H

#include <array>
#include <string>
#include <vector>

namespace trackkey {

/// Supported container extensions (lowercase, with dot).
constexpr std::array<const char*, 6> kSupportedExtensions = {
    ".mp3", ".wav", ".flac", ".ogg", ".m4a", ".aac"};

/// @brief True if the path's extension is supported (case-insensitive).
bool isSupportedAudioFile(const std::string& path);

/// @brief List supported regular files directly inside a folder.
///
/// Not recursive. Results are de-duplicated and sorted by file name so that
/// processing order is deterministic.
///
/// @param folder Directory to scan.
/// @return Full paths; empty if the folder cannot be read.
std::vector<std::string> scanAudioFiles(const std::string& folder);

}  // namespace trackkey

#endif  // TRACKKEY_BATCH_FILE_SCANNER_H
