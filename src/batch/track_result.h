// Per-file results and per-run counters of a batch run.

#ifndef TRACKKEY_BATCH_TRACK_RESULT_H
#define TRACKKEY_BATCH_TRACK_RESULT_H

#include <cstdint>
#include <optional>
#include <string>

#include "core/basic_types.h"

namespace trackkey {

/// @brief Record of one processed file. Never mutated after it is appended.
struct TrackResult {
  std::string original_filename;
  std::string final_filename;
  std::string final_path;
  std::optional<int> bpm;
  std::optional<std::string> key_label;
  std::optional<double> confidence;            ///< Classifier score.
  std::optional<ConfidenceTier> confidence_tier;
  std::optional<double> duration_seconds;
  std::optional<uint64_t> size_bytes;
  bool renamed = false;  ///< Rename outcome succeeded (moved or already correct).
  std::string timestamp;  ///< ISO-8601, set when processing finished.
};

/// @brief Aggregate counters, updated once per file by the coordinator.
struct RunStatistics {
  uint32_t files_processed = 0;
  uint32_t files_renamed = 0;
  uint32_t files_moved = 0;
  uint32_t rename_errors = 0;
  uint32_t tag_write_failures = 0;
  uint32_t analysis_failures = 0;
};

/// @brief Bytes to mebibytes.
inline double bytesToMegabytes(uint64_t bytes) {
  return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

}  // namespace trackkey

#endif  // TRACKKEY_BATCH_TRACK_RESULT_H
