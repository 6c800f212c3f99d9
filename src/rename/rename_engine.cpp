/// @file
/// @brief Filesystem stage of the rename pipeline.

#include "rename/rename_engine.h"

#include <exception>
#include <filesystem>
#include <system_error>

#include "core/run_log.h"
#include "io/i_tag_store.h"
#include "rename/name_pipeline.h"

namespace trackkey {

namespace fs = std::filesystem;

namespace {

constexpr const char* kLogTag = "Rename";

/// @brief True if any directory entry (also a dangling symlink) exists at path.
bool entryExists(const fs::path& path) {
  std::error_code ec;
  fs::file_status status = fs::symlink_status(path, ec);
  return !ec && fs::exists(status);
}

}  // namespace

RenameEngine::RenameEngine(ITagStore& tag_store, RunLog& log)
    : tag_store_(tag_store), log_(log) {}

RenameResult RenameEngine::rename(const std::string& file_path, const std::string& key_label,
                                  int bpm, const RenamePolicy& policy) {
  RenameResult result;
  result.final_path = file_path;

  const fs::path source(file_path);
  std::error_code ec;
  if (!fs::is_regular_file(source, ec)) {
    result.error_message = "file not found: " + file_path;
    log_.error(kLogTag, "File not found to rename: %s", file_path.c_str());
    return result;
  }
  if (bpm <= 0) {
    result.error_message = "invalid bpm " + std::to_string(bpm);
    log_.error(kLogTag, "Refusing to rename %s with bpm %d", file_path.c_str(), bpm);
    return result;
  }

  const std::string stem = source.stem().string();
  const std::string extension = source.extension().string();
  const NamePlan plan = planName(stem, key_label, bpm, policy);

  if (plan.already_named) {
    log_.info(kLogTag, "File already correct (%s, %d): %s", plan.display_key.c_str(), bpm,
              source.filename().string().c_str());
    result.success = true;
    result.tag_written = syncTitle(file_path, stem);
    return result;
  }

  std::lock_guard<std::mutex> lock(move_mutex_);

  const fs::path dir = source.parent_path();
  fs::path candidate = dir / (plan.composed + extension);
  int suffix = 1;
  // Paths compare as text: a hard link to the source is still another name.
  while (candidate != source && entryExists(candidate)) {
    candidate = dir / (collisionCandidate(plan.composed, suffix) + extension);
    ++suffix;
  }

  if (candidate == source) {
    log_.info(kLogTag, "Filename already correct: %s", source.filename().string().c_str());
    result.success = true;
    result.tag_written = syncTitle(file_path, plan.composed);
    return result;
  }

  fs::rename(source, candidate, ec);
  if (ec) {
    result.error_message = "move failed: " + ec.message();
    log_.error(kLogTag, "Error renaming %s: %s", file_path.c_str(), ec.message().c_str());
    return result;
  }

  result.success = true;
  result.moved = true;
  result.final_path = candidate.string();
  log_.info(kLogTag, "Renamed: %s -> %s", source.filename().string().c_str(),
            candidate.filename().string().c_str());

  result.tag_written = syncTitle(result.final_path, candidate.stem().string());
  return result;
}

bool RenameEngine::syncTitle(const std::string& path, const std::string& title) {
  bool written = false;
  try {
    written = tag_store_.writeTitle(path, title);
  } catch (const std::exception& err) {
    log_.error(kLogTag, "Tag store failed on %s: %s", path.c_str(), err.what());
  }
  if (!written) {
    log_.warning(kLogTag, "Title tag not updated: %s", path.c_str());
    return false;
  }
  log_.info(kLogTag, "Title tag updated: '%s'", title.c_str());
  return true;
}

}  // namespace trackkey
