// Human-readable run summary: BPM statistics, key histogram, rename counts
// and a truncated per-file listing.

#ifndef TRACKKEY_BATCH_SUMMARY_PRESENTER_H
#define TRACKKEY_BATCH_SUMMARY_PRESENTER_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "batch/track_result.h"

namespace trackkey {

/// Column widths of the per-file listing.
constexpr size_t kSummaryOriginalWidth = 30;
constexpr size_t kSummaryFinalWidth = 40;

/// @brief Aggregate over the BPM values of a run.
struct BpmStatistics {
  uint32_t count = 0;
  double mean = 0.0;
  int min = 0;
  int max = 0;
  double std_dev = 0.0;  ///< Population standard deviation.
};

/// @brief Occurrences of one key label.
struct KeyCount {
  std::string key_label;
  uint32_t count = 0;
};

/// @brief Everything the summary text is rendered from.
struct RunSummary {
  uint32_t total_files = 0;
  std::optional<BpmStatistics> bpm;
  std::vector<KeyCount> key_histogram;  ///< Descending count; ties in first-seen order.
  RunStatistics statistics;
};

/// @brief BPM statistics over results that have a BPM, or nullopt if none do.
std::optional<BpmStatistics> computeBpmStatistics(const std::vector<TrackResult>& results);

/// @brief Key frequency histogram sorted by descending count (stable).
std::vector<KeyCount> computeKeyHistogram(const std::vector<TrackResult>& results);

/// @brief Aggregate results and counters into a RunSummary.
RunSummary buildSummary(const std::vector<TrackResult>& results, const RunStatistics& statistics);

/// @brief Render the summary and the per-file listing as text.
/// @param summary Aggregates.
/// @param results Ordered results for the listing.
std::string formatSummary(const RunSummary& summary, const std::vector<TrackResult>& results);

}  // namespace trackkey

#endif  // TRACKKEY_BATCH_SUMMARY_PRESENTER_H
