// Pure abstract interface for audio container metadata.
// Concrete implementation: TagLibTagStore.

#ifndef TRACKKEY_IO_I_TAG_STORE_H
#define TRACKKEY_IO_I_TAG_STORE_H

#include <string>

namespace trackkey {

/// @brief Writes the title tag of an audio file.
class ITagStore {
 public:
  virtual ~ITagStore() = default;

  /// @brief Replace the title tag.
  /// @param path Audio file path.
  /// @param title New title (UTF-8).
  /// @return False if the container is unsupported or the save failed.
  virtual bool writeTitle(const std::string& path, const std::string& title) = 0;
};

}  // namespace trackkey

#endif  // TRACKKEY_IO_I_TAG_STORE_H
