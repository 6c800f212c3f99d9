// Tag Store backed by TagLib.

#ifndef TRACKKEY_IO_TAGLIB_TAG_STORE_H
#define TRACKKEY_IO_TAGLIB_TAG_STORE_H

#include "io/i_tag_store.h"

namespace trackkey {

/// @brief ITagStore writing the generic title field through TagLib::FileRef.
class TagLibTagStore : public ITagStore {
 public:
  bool writeTitle(const std::string& path, const std::string& title) override;
};

}  // namespace trackkey

#endif  // TRACKKEY_IO_TAGLIB_TAG_STORE_H
