// Rename engine: applies a NamePlan to the filesystem and syncs the title tag.

#ifndef TRACKKEY_RENAME_RENAME_ENGINE_H
#define TRACKKEY_RENAME_RENAME_ENGINE_H

#include <mutex>
#include <string>

#include "rename/rename_policy.h"

namespace trackkey {

class ITagStore;
class RunLog;

/// @brief Outcome of one rename request.
struct RenameResult {
  bool success = false;      ///< File is correctly named at final_path.
  bool moved = false;        ///< A filesystem move was performed.
  bool tag_written = false;  ///< Title tag synchronized.
  std::string final_path;    ///< New path on a move, original path otherwise.
  std::string error_message;
};

/// @brief Computes canonical names, resolves collisions and moves files.
///
/// The collision check and the move run under one lock, so a single engine
/// is the renaming authority for every directory it touches, also when
/// rename() is called from several threads.
class RenameEngine {
 public:
  RenameEngine(ITagStore& tag_store, RunLog& log);

  /// @brief Rename one file to "{key} - {bpm} BPM - {cleaned stem}{ext}".
  ///
  /// Already-correct names are left in place (success, no move). A taken
  /// target name gets a "_1", "_2", ... suffix. Tag Store failures are logged
  /// and never turn a successful rename into a failure.
  ///
  /// @param file_path Existing audio file.
  /// @param key_label Classic key label from the template bank.
  /// @param bpm Normalized tempo (> 0).
  /// @param policy Rename policy.
  RenameResult rename(const std::string& file_path, const std::string& key_label, int bpm,
                      const RenamePolicy& policy);

 private:
  bool syncTitle(const std::string& path, const std::string& title);

  ITagStore& tag_store_;
  RunLog& log_;
  std::mutex move_mutex_;
};

}  // namespace trackkey

#endif  // TRACKKEY_RENAME_RENAME_ENGINE_H
