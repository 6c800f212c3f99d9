// Batch orchestrator: scans a folder, classifies each file, renames it and
// reports the run.

#ifndef TRACKKEY_BATCH_BATCH_ORCHESTRATOR_H
#define TRACKKEY_BATCH_BATCH_ORCHESTRATOR_H

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "batch/track_result.h"
#include "core/basic_types.h"
#include "harmony/tonal_classifier.h"
#include "rename/rename_engine.h"
#include "rename/rename_policy.h"

namespace trackkey {

class IFeatureProvider;
class ITagStore;
class RunLog;

/// Terminal state of a run.
enum class RunStatus : uint8_t {
  Completed,
  FolderNotFound,
  NoSupportedFiles,
  Cancelled  ///< Stopped between files; partial results are kept.
};

/// @brief Convert RunStatus to human-readable string.
const char* runStatusToString(RunStatus status);

/// @brief Per-run configuration assembled by the operator console.
struct BatchConfig {
  RenamePolicy policy;
  ReportFormat report_format = ReportFormat::Tabular;
  uint32_t jobs = 1;  ///< Analysis worker threads (1 = sequential).
  bool write_report = true;
};

/// @brief Everything a run produced.
struct RunReport {
  RunStatus status = RunStatus::Completed;
  std::vector<TrackResult> results;  ///< Enumeration order.
  RunStatistics statistics;
  std::string report_path;  ///< Empty if no artifact was written.
  std::string error_message;
};

/// @brief Feature-provider output for one file, before renaming.
struct FileAnalysis {
  std::optional<uint64_t> size_bytes;
  std::optional<double> duration_seconds;
  std::optional<int> bpm;
  std::optional<Classification> classification;
};

/// @brief Drives per-file analysis and renaming for one folder.
///
/// The coordinating thread is the only writer of results and statistics. With
/// BatchConfig::jobs > 1, analysis runs on worker threads while renames and
/// aggregation stay on the coordinator in enumeration order, so results are
/// identical to a sequential run.
class BatchOrchestrator {
 public:
  BatchOrchestrator(IFeatureProvider& provider, ITagStore& tag_store, RunLog& log);

  /// @brief Process every supported file in a folder.
  RunReport run(const std::string& folder, const BatchConfig& config);

  /// @brief Size, duration, BPM and key of one file. Never fails or throws;
  ///        missing pieces stay empty.
  FileAnalysis analyzeFile(const std::string& path);

  /// @brief Stop before the next file. Safe to call from any thread.
  void requestStop() { stop_requested_.store(true); }

 private:
  /// @brief Feature extraction stages of analyzeFile; may throw.
  void extractFeatures(const std::string& path, FileAnalysis& analysis);

  /// @brief Rename (if applicable) and assemble the file's TrackResult.
  TrackResult finishFile(const std::string& path, const FileAnalysis& analysis,
                         const BatchConfig& config, RunStatistics& statistics);

  /// @brief Analyze on a worker pool, finish files in order on this thread.
  /// @return False if the run was cancelled.
  bool processParallel(const std::vector<std::string>& paths, const BatchConfig& config,
                       RunReport& report);

  /// @brief Analyze and finish files one by one.
  /// @return False if the run was cancelled.
  bool processSequential(const std::vector<std::string>& paths, const BatchConfig& config,
                         RunReport& report);

  IFeatureProvider& provider_;
  RunLog& log_;
  RenameEngine rename_engine_;
  std::atomic<bool> stop_requested_{false};
};

}  // namespace trackkey

#endif  // TRACKKEY_BATCH_BATCH_ORCHESTRATOR_H
