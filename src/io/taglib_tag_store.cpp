/// @file
/// @brief TagLib Tag Store.

#include "io/taglib_tag_store.h"

#include <taglib/fileref.h>
#include <taglib/tag.h>
#include <taglib/tstring.h>

namespace trackkey {

bool TagLibTagStore::writeTitle(const std::string& path, const std::string& title) {
  TagLib::FileRef file(path.c_str());
  if (file.isNull() || file.tag() == nullptr) {
    return false;
  }
  file.tag()->setTitle(TagLib::String(title, TagLib::String::UTF8));
  return file.save();
}

}  // namespace trackkey
