// Report writer: one timestamped CSV or JSON artifact per run.

#ifndef TRACKKEY_BATCH_REPORT_WRITER_H
#define TRACKKEY_BATCH_REPORT_WRITER_H

#include <string>
#include <vector>

#include "batch/track_result.h"
#include "core/basic_types.h"

namespace trackkey {

/// @brief Outcome of writing a report artifact.
struct ReportWriteResult {
  bool success = false;
  std::string path;
  std::string error_message;
};

/// @brief Artifact name: "music_analysis_{stamp}.{csv|json}".
std::string reportFileName(ReportFormat format, const std::string& stamp);

/// @brief Render results as CSV with a header row.
///
/// Columns: original_filename, filename, path, bpm, key, confidence,
/// duration_seconds, size_mb, renamed, timestamp. Absent values are empty
/// cells; duration and size carry 2 decimals.
std::string renderCsv(const std::vector<TrackResult>& results);

/// @brief Render results as a pretty-printed JSON array (absent values are null).
std::string renderJson(const std::vector<TrackResult>& results);

/// @brief Write the report into a folder.
/// @param results Ordered run results.
/// @param folder Target folder (the scanned folder).
/// @param format Tabular (CSV) or Structured (JSON).
/// @param stamp File-name stamp, see fileStamp().
ReportWriteResult writeReport(const std::vector<TrackResult>& results, const std::string& folder,
                              ReportFormat format, const std::string& stamp);

}  // namespace trackkey

#endif  // TRACKKEY_BATCH_REPORT_WRITER_H
