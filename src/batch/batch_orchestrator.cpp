/// @file
/// @brief Batch run coordination.

#include "batch/batch_orchestrator.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <filesystem>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

#include "batch/file_scanner.h"
#include "batch/report_writer.h"
#include "core/clock.h"
#include "core/run_log.h"
#include "harmony/tempo_normalizer.h"
#include "io/i_feature_provider.h"

namespace trackkey {

namespace fs = std::filesystem;

namespace {

constexpr const char* kLogTag = "Batch";

std::string fileNameOf(const std::string& path) {
  return fs::path(path).filename().string();
}

}  // namespace

const char* runStatusToString(RunStatus status) {
  switch (status) {
    case RunStatus::Completed:        return "completed";
    case RunStatus::FolderNotFound:   return "folder_not_found";
    case RunStatus::NoSupportedFiles: return "no_supported_files";
    case RunStatus::Cancelled:        return "cancelled";
  }
  return "unknown";
}

BatchOrchestrator::BatchOrchestrator(IFeatureProvider& provider, ITagStore& tag_store,
                                     RunLog& log)
    : provider_(provider), log_(log), rename_engine_(tag_store, log) {}

RunReport BatchOrchestrator::run(const std::string& folder, const BatchConfig& config) {
  RunReport report;
  stop_requested_.store(false);

  std::error_code ec;
  if (!fs::is_directory(folder, ec)) {
    report.status = RunStatus::FolderNotFound;
    report.error_message = "folder not found: " + folder;
    log_.error(kLogTag, "Folder not found: %s", folder.c_str());
    return report;
  }

  std::vector<std::string> paths = scanAudioFiles(folder);
  if (paths.empty()) {
    report.status = RunStatus::NoSupportedFiles;
    report.error_message = "no audio files found in: " + folder;
    log_.warning(kLogTag, "No audio files found in: %s", folder.c_str());
    return report;
  }
  log_.info(kLogTag, "Found %zu files to analyze", paths.size());

  report.results.reserve(paths.size());
  bool finished = config.jobs > 1 ? processParallel(paths, config, report)
                                  : processSequential(paths, config, report);
  report.status = finished ? RunStatus::Completed : RunStatus::Cancelled;
  if (!finished) {
    log_.warning(kLogTag, "Run cancelled after %zu of %zu files", report.results.size(),
                 paths.size());
  }

  if (config.write_report && !report.results.empty()) {
    ReportWriteResult written = writeReport(report.results, folder, config.report_format,
                                            fileStamp(std::chrono::system_clock::now()));
    if (written.success) {
      report.report_path = written.path;
      log_.info(kLogTag, "Results saved to: %s", written.path.c_str());
    } else {
      report.error_message = written.error_message;
      log_.error(kLogTag, "Could not save results: %s", written.error_message.c_str());
    }
  }
  return report;
}

FileAnalysis BatchOrchestrator::analyzeFile(const std::string& path) {
  FileAnalysis analysis;
  const std::string name = fileNameOf(path);

  std::error_code ec;
  uintmax_t size = fs::file_size(path, ec);
  if (!ec) {
    analysis.size_bytes = static_cast<uint64_t>(size);
  }

  log_.info(kLogTag, "Analyzing: %s", name.c_str());
  try {
    extractFeatures(path, analysis);
  } catch (const std::exception& err) {
    log_.error(kLogTag, "Analysis aborted for %s: %s", name.c_str(), err.what());
    analysis.bpm.reset();
    analysis.classification.reset();
  }
  return analysis;
}

void BatchOrchestrator::extractFeatures(const std::string& path, FileAnalysis& analysis) {
  const std::string name = fileNameOf(path);
  analysis.duration_seconds = provider_.readDuration(path);

  std::optional<AudioSignal> signal = provider_.loadSignal(path);
  if (!signal || signal->empty()) {
    log_.warning(kLogTag, "No usable signal in %s", name.c_str());
    return;
  }
  if (!analysis.duration_seconds) {
    analysis.duration_seconds = signal->durationSeconds();
  }

  std::optional<float> raw_tempo = provider_.rawTempo(*signal);
  if (raw_tempo) {
    analysis.bpm = normalizeTempo(*raw_tempo);
  }
  if (analysis.bpm) {
    if (*analysis.bpm != static_cast<int>(*raw_tempo)) {
      log_.debug(kLogTag, "  BPM %.2f corrected to %d", *raw_tempo, *analysis.bpm);
    }
    log_.info(kLogTag, "  BPM detected: %d", *analysis.bpm);
  } else {
    log_.warning(kLogTag, "  BPM not detected: %s", name.c_str());
  }

  std::optional<FeatureVector> chroma = provider_.chromaVector(*signal);
  if (chroma) {
    analysis.classification = classifyKey(*chroma);
  }
  if (analysis.classification) {
    log_.info(kLogTag, "  Key: %s (corr: %.2f, %s)", analysis.classification->key_label.c_str(),
              analysis.classification->score,
              confidenceTierToString(analysis.classification->tier));
  } else {
    log_.warning(kLogTag, "  Key not detected: %s", name.c_str());
  }
}

TrackResult BatchOrchestrator::finishFile(const std::string& path, const FileAnalysis& analysis,
                                          const BatchConfig& config,
                                          RunStatistics& statistics) {
  TrackResult row;
  row.original_filename = fileNameOf(path);
  row.final_path = path;
  row.size_bytes = analysis.size_bytes;
  row.duration_seconds = analysis.duration_seconds;
  row.bpm = analysis.bpm;
  if (analysis.classification) {
    row.key_label = analysis.classification->key_label;
    row.confidence = analysis.classification->score;
    row.confidence_tier = analysis.classification->tier;
  }

  const bool analyzed = row.bpm.has_value() && row.key_label.has_value();
  if (!analyzed) {
    ++statistics.analysis_failures;
  }

  if (config.policy.rename_enabled && analyzed) {
    RenameResult renamed = rename_engine_.rename(path, *row.key_label, *row.bpm, config.policy);
    if (renamed.success) {
      row.renamed = true;
      row.final_path = renamed.final_path;
      ++statistics.files_renamed;
      if (renamed.moved) ++statistics.files_moved;
      if (!renamed.tag_written) ++statistics.tag_write_failures;
    } else {
      ++statistics.rename_errors;
    }
  }

  row.final_filename = fileNameOf(row.final_path);
  row.timestamp = isoTimestampNow();
  ++statistics.files_processed;
  return row;
}

bool BatchOrchestrator::processSequential(const std::vector<std::string>& paths,
                                          const BatchConfig& config, RunReport& report) {
  for (size_t idx = 0; idx < paths.size(); ++idx) {
    if (stop_requested_.load()) return false;
    log_.info(kLogTag, "[%zu/%zu] Processing: %s", idx + 1, paths.size(),
              fileNameOf(paths[idx]).c_str());
    FileAnalysis analysis = analyzeFile(paths[idx]);
    report.results.push_back(finishFile(paths[idx], analysis, config, report.statistics));
  }
  return true;
}

bool BatchOrchestrator::processParallel(const std::vector<std::string>& paths,
                                        const BatchConfig& config, RunReport& report) {
  struct Slot {
    bool ready = false;
    bool skipped = false;
    FileAnalysis analysis;
  };

  std::vector<Slot> slots(paths.size());
  std::mutex slots_mutex;
  std::condition_variable slot_ready;
  std::atomic<size_t> next_index{0};

  auto worker = [&]() {
    for (;;) {
      size_t idx = next_index.fetch_add(1);
      if (idx >= paths.size()) return;
      FileAnalysis analysis;
      bool skipped = stop_requested_.load();
      if (!skipped) {
        analysis = analyzeFile(paths[idx]);
      }
      {
        std::lock_guard<std::mutex> lock(slots_mutex);
        slots[idx].analysis = std::move(analysis);
        slots[idx].skipped = skipped;
        slots[idx].ready = true;
      }
      slot_ready.notify_all();
    }
  };

  size_t worker_count = std::min<size_t>(config.jobs, paths.size());
  log_.info(kLogTag, "Analyzing with %zu worker threads", worker_count);
  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for (size_t idx = 0; idx < worker_count; ++idx) {
    workers.emplace_back(worker);
  }

  bool finished = true;
  for (size_t idx = 0; idx < paths.size(); ++idx) {
    if (stop_requested_.load()) {
      finished = false;
      break;
    }
    FileAnalysis analysis;
    {
      std::unique_lock<std::mutex> lock(slots_mutex);
      slot_ready.wait(lock, [&]() { return slots[idx].ready; });
      if (slots[idx].skipped) {
        finished = false;
        break;
      }
      analysis = std::move(slots[idx].analysis);
    }
    log_.info(kLogTag, "[%zu/%zu] Finishing: %s", idx + 1, paths.size(),
              fileNameOf(paths[idx]).c_str());
    report.results.push_back(finishFile(paths[idx], analysis, config, report.statistics));
  }

  if (!finished) {
    stop_requested_.store(true);
  }
  for (auto& thread : workers) {
    thread.join();
  }
  return finished;
}

}  // namespace trackkey
