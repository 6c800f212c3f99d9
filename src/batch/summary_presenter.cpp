/// @file
/// @brief Run summary aggregation and text rendering.

#include "batch/summary_presenter.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>

#include "core/text_utils.h"

namespace trackkey {

namespace {

constexpr size_t kRuleWidth = 100;
constexpr size_t kTableRuleWidth = 120;

std::string padRight(const std::string& str, size_t width) {
  if (str.size() >= width) return str;
  return str + std::string(width - str.size(), ' ');
}

}  // namespace

std::optional<BpmStatistics> computeBpmStatistics(const std::vector<TrackResult>& results) {
  std::vector<int> values;
  for (const auto& row : results) {
    if (row.bpm) values.push_back(*row.bpm);
  }
  if (values.empty()) return std::nullopt;

  BpmStatistics stats;
  stats.count = static_cast<uint32_t>(values.size());
  stats.min = *std::min_element(values.begin(), values.end());
  stats.max = *std::max_element(values.begin(), values.end());

  double sum = 0.0;
  for (int val : values) sum += val;
  stats.mean = sum / static_cast<double>(values.size());

  double sq_sum = 0.0;
  for (int val : values) {
    double diff = val - stats.mean;
    sq_sum += diff * diff;
  }
  stats.std_dev = std::sqrt(sq_sum / static_cast<double>(values.size()));
  return stats;
}

std::vector<KeyCount> computeKeyHistogram(const std::vector<TrackResult>& results) {
  std::vector<KeyCount> histogram;
  for (const auto& row : results) {
    if (!row.key_label) continue;
    auto iter = std::find_if(histogram.begin(), histogram.end(), [&](const KeyCount& entry) {
      return entry.key_label == *row.key_label;
    });
    if (iter == histogram.end()) {
      histogram.push_back({*row.key_label, 1});
    } else {
      ++iter->count;
    }
  }
  std::stable_sort(histogram.begin(), histogram.end(),
                   [](const KeyCount& lhs, const KeyCount& rhs) { return lhs.count > rhs.count; });
  return histogram;
}

RunSummary buildSummary(const std::vector<TrackResult>& results, const RunStatistics& statistics) {
  RunSummary summary;
  summary.total_files = static_cast<uint32_t>(results.size());
  summary.bpm = computeBpmStatistics(results);
  summary.key_histogram = computeKeyHistogram(results);
  summary.statistics = statistics;
  return summary;
}

std::string formatSummary(const RunSummary& summary, const std::vector<TrackResult>& results) {
  std::ostringstream oss;
  if (results.empty()) {
    oss << "\nNo results to display\n";
    return oss.str();
  }

  const std::string rule(kRuleWidth, '=');
  oss << "\n" << rule << "\nANALYSIS SUMMARY\n" << rule << "\n";

  char buf[64];
  if (summary.bpm) {
    oss << "\nBPM\n";
    std::snprintf(buf, sizeof(buf), "%.2f", summary.bpm->mean);
    oss << "  Average: " << buf << "\n";
    oss << "  Min: " << summary.bpm->min << "\n";
    oss << "  Max: " << summary.bpm->max << "\n";
    std::snprintf(buf, sizeof(buf), "%.2f", summary.bpm->std_dev);
    oss << "  Std Dev: " << buf << "\n";
  }

  if (!summary.key_histogram.empty()) {
    oss << "\nKeys Found:\n";
    for (const auto& entry : summary.key_histogram) {
      oss << "  " << entry.key_label << ": " << entry.count << "x\n";
    }
  }

  oss << "\nRename Summary:\n";
  oss << "  Total files: " << summary.total_files << "\n";
  oss << "  Renamed: " << summary.statistics.files_renamed << "\n";
  oss << "  Moved: " << summary.statistics.files_moved << "\n";
  oss << "  Errors: " << summary.statistics.rename_errors << "\n";
  if (summary.statistics.analysis_failures > 0) {
    oss << "  Analysis failures: " << summary.statistics.analysis_failures << "\n";
  }
  if (summary.statistics.tag_write_failures > 0) {
    oss << "  Tag write failures: " << summary.statistics.tag_write_failures << "\n";
  }
  oss << rule << "\n\n";

  const std::string table_rule(kTableRuleWidth, '-');
  oss << "DETAILS:\n" << table_rule << "\n";
  oss << padRight("Original File", kSummaryOriginalWidth) << " "
      << padRight("New File", kSummaryFinalWidth) << " " << padRight("BPM", 7) << " "
      << padRight("Key", 12) << "\n";
  oss << table_rule << "\n";
  for (const auto& row : results) {
    std::string bpm_str = row.bpm ? std::to_string(*row.bpm) : "N/A";
    std::string key_str = row.key_label ? *row.key_label : "N/A";
    oss << padRight(text::truncateWithEllipsis(row.original_filename, kSummaryOriginalWidth),
                    kSummaryOriginalWidth)
        << " "
        << padRight(text::truncateWithEllipsis(row.final_filename, kSummaryFinalWidth),
                    kSummaryFinalWidth)
        << " " << padRight(bpm_str, 7) << " " << padRight(key_str, 12) << "\n";
  }
  oss << table_rule << "\n";
  return oss.str();
}

}  // namespace trackkey
