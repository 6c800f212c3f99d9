// Tests for batch/batch_orchestrator.h -- end-to-end runs over fake features.

#include "batch/batch_orchestrator.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "core/run_log.h"
#include "test_helpers.h"

namespace trackkey {
namespace {

using test_helpers::chromaFor;
using test_helpers::FakeFeatureProvider;
using test_helpers::FakeTagStore;
using test_helpers::FakeTrack;
using test_helpers::TempDir;

FakeTrack track(float raw_tempo, const std::string& key_label) {
  FakeTrack result;
  result.raw_tempo = raw_tempo;
  result.chroma = chromaFor(key_label);
  return result;
}

class BatchOrchestratorTest : public ::testing::Test {
 protected:
  BatchOrchestratorTest() { log_.setConsoleEnabled(false); }

  RunReport runOnce(const BatchConfig& config) {
    BatchOrchestrator orchestrator(provider_, tags_, log_);
    return orchestrator.run(dir_.str(), config);
  }

  /// Report artifacts written into the folder.
  std::vector<std::string> reportFiles() const {
    std::vector<std::string> reports;
    for (const auto& name : dir_.fileNames()) {
      if (name.rfind("music_analysis_", 0) == 0) reports.push_back(name);
    }
    return reports;
  }

  TempDir dir_;
  FakeFeatureProvider provider_;
  FakeTagStore tags_;
  RunLog log_;
};

TEST_F(BatchOrchestratorTest, RenamesAnalyzedTrack) {
  dir_.writeFile("track.mp3");
  provider_.addTrack("track.mp3", track(65.4f, "C"));

  BatchConfig config;
  config.write_report = false;
  RunReport report = runOnce(config);

  EXPECT_EQ(report.status, RunStatus::Completed);
  ASSERT_EQ(report.results.size(), 1u);
  const TrackResult& row = report.results[0];
  EXPECT_EQ(row.original_filename, "track.mp3");
  EXPECT_EQ(row.final_filename, "C - 130 BPM - track.mp3");
  EXPECT_EQ(row.bpm, 130);
  EXPECT_EQ(row.key_label, "C");
  ASSERT_TRUE(row.confidence.has_value());
  EXPECT_NEAR(*row.confidence, 1.0, 1e-5);
  EXPECT_EQ(row.confidence_tier, ConfidenceTier::High);
  ASSERT_TRUE(row.duration_seconds.has_value());
  EXPECT_DOUBLE_EQ(*row.duration_seconds, 2.0);
  EXPECT_EQ(row.size_bytes, 5u);
  EXPECT_TRUE(row.renamed);
  EXPECT_FALSE(row.timestamp.empty());
  EXPECT_TRUE(dir_.contains("C - 130 BPM - track.mp3"));

  EXPECT_EQ(report.statistics.files_processed, 1u);
  EXPECT_EQ(report.statistics.files_renamed, 1u);
  EXPECT_EQ(report.statistics.files_moved, 1u);
  EXPECT_EQ(report.statistics.analysis_failures, 0u);
  EXPECT_TRUE(report.report_path.empty());
}

TEST_F(BatchOrchestratorTest, SecondRunDoesNotMove) {
  dir_.writeFile("track.mp3");
  provider_.addTrack("track.mp3", track(65.4f, "C"));
  provider_.addTrack("C - 130 BPM - track.mp3", track(65.4f, "C"));

  BatchConfig config;
  config.write_report = false;
  runOnce(config);
  RunReport second = runOnce(config);

  ASSERT_EQ(second.results.size(), 1u);
  EXPECT_TRUE(second.results[0].renamed);
  EXPECT_EQ(second.statistics.files_renamed, 1u);
  EXPECT_EQ(second.statistics.files_moved, 0u);
  EXPECT_EQ(dir_.fileNames(), std::vector<std::string>{"C - 130 BPM - track.mp3"});
}

TEST_F(BatchOrchestratorTest, AlphanumericNotation) {
  dir_.writeFile("Am Deep House.mp3");
  provider_.addTrack("Am Deep House.mp3", track(128.3f, "Am"));

  BatchConfig config;
  config.policy.notation = KeyNotation::Alphanumeric;
  config.write_report = false;
  RunReport report = runOnce(config);

  ASSERT_EQ(report.results.size(), 1u);
  EXPECT_EQ(report.results[0].final_filename, "11A - 128 BPM - Deep House.mp3");
  EXPECT_EQ(report.results[0].key_label, "Am");
}

TEST_F(BatchOrchestratorTest, RenameDisabledKeepsNames) {
  dir_.writeFile("track.wav");
  provider_.addTrack("track.wav", track(220.0f, "G"));

  BatchConfig config;
  config.policy.rename_enabled = false;
  config.write_report = false;
  RunReport report = runOnce(config);

  ASSERT_EQ(report.results.size(), 1u);
  EXPECT_EQ(report.results[0].bpm, 110);
  EXPECT_FALSE(report.results[0].renamed);
  EXPECT_EQ(report.results[0].final_filename, "track.wav");
  EXPECT_EQ(report.statistics.files_renamed, 0u);
  EXPECT_TRUE(tags_.writes().empty());
  EXPECT_TRUE(dir_.contains("track.wav"));
}

TEST_F(BatchOrchestratorTest, FolderNotFound) {
  BatchOrchestrator orchestrator(provider_, tags_, log_);
  RunReport report = orchestrator.run((dir_.path() / "missing").string(), BatchConfig());
  EXPECT_EQ(report.status, RunStatus::FolderNotFound);
  EXPECT_TRUE(report.results.empty());
  EXPECT_TRUE(report.report_path.empty());
}

TEST_F(BatchOrchestratorTest, NoSupportedFiles) {
  dir_.writeFile("readme.txt");
  RunReport report = runOnce(BatchConfig());
  EXPECT_EQ(report.status, RunStatus::NoSupportedFiles);
  EXPECT_TRUE(report.results.empty());
  EXPECT_TRUE(reportFiles().empty());
}

TEST_F(BatchOrchestratorTest, AnalysisFailuresAreRecorded) {
  dir_.writeFile("a_undecodable.mp3");
  dir_.writeFile("b_no_beat.mp3");
  dir_.writeFile("c_good.mp3");
  FakeTrack undecodable;
  undecodable.decodable = false;
  provider_.addTrack("a_undecodable.mp3", undecodable);
  FakeTrack no_beat;
  no_beat.chroma = chromaFor("D");
  provider_.addTrack("b_no_beat.mp3", no_beat);
  provider_.addTrack("c_good.mp3", track(100.0f, "D"));

  BatchConfig config;
  config.write_report = false;
  RunReport report = runOnce(config);

  EXPECT_EQ(report.status, RunStatus::Completed);
  ASSERT_EQ(report.results.size(), 3u);
  EXPECT_EQ(report.results[0].original_filename, "a_undecodable.mp3");
  EXPECT_FALSE(report.results[0].bpm.has_value());
  EXPECT_FALSE(report.results[0].key_label.has_value());
  // Duration comes from the container header, not from decoding.
  EXPECT_EQ(report.results[0].duration_seconds, 2.0);
  EXPECT_TRUE(report.results[0].size_bytes.has_value());
  EXPECT_FALSE(report.results[0].renamed);

  EXPECT_FALSE(report.results[1].bpm.has_value());
  EXPECT_EQ(report.results[1].key_label, "D");
  EXPECT_FALSE(report.results[1].renamed);

  EXPECT_EQ(report.results[2].final_filename, "D - 100 BPM - c_good.mp3");

  EXPECT_EQ(report.statistics.files_processed, 3u);
  EXPECT_EQ(report.statistics.analysis_failures, 2u);
  EXPECT_EQ(report.statistics.files_renamed, 1u);
  EXPECT_EQ(report.statistics.rename_errors, 0u);
}

TEST_F(BatchOrchestratorTest, TagFailuresAreCounted) {
  dir_.writeFile("track.mp3");
  provider_.addTrack("track.mp3", track(120.0f, "F"));
  tags_.setSucceed(false);

  BatchConfig config;
  config.write_report = false;
  RunReport report = runOnce(config);

  ASSERT_EQ(report.results.size(), 1u);
  EXPECT_TRUE(report.results[0].renamed);
  EXPECT_EQ(report.statistics.tag_write_failures, 1u);
}

/// Tag store whose backend throws instead of reporting failure.
class ThrowingTagStore : public ITagStore {
 public:
  bool writeTitle(const std::string& path, const std::string&) override {
    throw std::runtime_error("tag backend exploded on " + path);
  }
};

TEST_F(BatchOrchestratorTest, ThrowingTagStoreCountsAsTagFailure) {
  dir_.writeFile("a.mp3");
  dir_.writeFile("b.mp3");
  provider_.addTrack("a.mp3", track(120.0f, "F"));
  provider_.addTrack("b.mp3", track(121.0f, "G"));
  ThrowingTagStore throwing_tags;

  BatchConfig config;
  config.write_report = false;
  BatchOrchestrator orchestrator(provider_, throwing_tags, log_);
  RunReport report = orchestrator.run(dir_.str(), config);

  ASSERT_EQ(report.results.size(), 2u);
  EXPECT_TRUE(report.results[0].renamed);
  EXPECT_EQ(report.results[0].final_filename, "F - 120 BPM - a.mp3");
  EXPECT_EQ(report.results[1].final_filename, "G - 121 BPM - b.mp3");
  EXPECT_EQ(report.statistics.tag_write_failures, 2u);
  EXPECT_EQ(report.statistics.rename_errors, 0u);
}

TEST_F(BatchOrchestratorTest, FailedMoveKeepsOriginalAndContinues) {
  // The composed name exceeds the 255-byte file-name limit, so the move fails.
  const std::string long_name = std::string(240, 'x') + ".mp3";
  dir_.writeFile(long_name);
  dir_.writeFile("z_next.mp3");
  provider_.addTrack(long_name, track(130.0f, "C"));
  provider_.addTrack("z_next.mp3", track(124.0f, "A"));

  BatchConfig config;
  config.write_report = false;
  RunReport report = runOnce(config);

  EXPECT_EQ(report.status, RunStatus::Completed);
  ASSERT_EQ(report.results.size(), 2u);
  const TrackResult& failed = report.results[0];
  EXPECT_EQ(failed.original_filename, long_name);
  EXPECT_FALSE(failed.renamed);
  EXPECT_EQ(failed.final_filename, long_name);
  EXPECT_EQ(failed.final_path, (dir_.path() / long_name).string());
  EXPECT_EQ(failed.bpm, 130);
  EXPECT_EQ(failed.key_label, "C");
  EXPECT_TRUE(dir_.contains(long_name));

  EXPECT_TRUE(report.results[1].renamed);
  EXPECT_EQ(report.results[1].final_filename, "A - 124 BPM - z_next.mp3");

  EXPECT_EQ(report.statistics.rename_errors, 1u);
  EXPECT_EQ(report.statistics.files_renamed, 1u);
  EXPECT_EQ(report.statistics.files_processed, 2u);
  EXPECT_EQ(report.statistics.analysis_failures, 0u);
}

/// Provider that deletes the file while decoding it, as if it vanished
/// between the scan and the rename.
class VanishingFeatureProvider : public FakeFeatureProvider {
 public:
  std::optional<AudioSignal> loadSignal(const std::string& path) override {
    std::error_code ec;
    if (std::filesystem::path(path).filename().string() == "a_gone.mp3") {
      std::filesystem::remove(path, ec);
    }
    return FakeFeatureProvider::loadSignal(path);
  }
};

TEST_F(BatchOrchestratorTest, VanishedFileIsRenameError) {
  VanishingFeatureProvider vanishing;
  dir_.writeFile("a_gone.mp3");
  dir_.writeFile("b.mp3");
  vanishing.addTrack("a_gone.mp3", track(128.0f, "D"));
  vanishing.addTrack("b.mp3", track(128.0f, "D"));

  BatchConfig config;
  config.write_report = false;
  BatchOrchestrator orchestrator(vanishing, tags_, log_);
  RunReport report = orchestrator.run(dir_.str(), config);

  ASSERT_EQ(report.results.size(), 2u);
  EXPECT_FALSE(report.results[0].renamed);
  EXPECT_EQ(report.results[0].final_filename, "a_gone.mp3");
  EXPECT_TRUE(report.results[1].renamed);
  EXPECT_EQ(report.statistics.rename_errors, 1u);
}

/// Provider whose decoder throws for one file, like an allocation failure on
/// a corrupt header.
class ThrowingFeatureProvider : public FakeFeatureProvider {
 public:
  std::optional<AudioSignal> loadSignal(const std::string& path) override {
    if (std::filesystem::path(path).filename().string() == "a_bad.mp3") {
      throw std::bad_alloc();
    }
    return FakeFeatureProvider::loadSignal(path);
  }
};

class ThrowingProviderTest : public BatchOrchestratorTest,
                             public ::testing::WithParamInterface<uint32_t> {};

TEST_P(ThrowingProviderTest, ThrowingFileIsRecordedAndBatchContinues) {
  ThrowingFeatureProvider throwing;
  dir_.writeFile("a_bad.mp3");
  dir_.writeFile("b.mp3");
  throwing.addTrack("a_bad.mp3", track(120.0f, "C"));
  throwing.addTrack("b.mp3", track(126.0f, "E"));

  BatchConfig config;
  config.write_report = false;
  config.jobs = GetParam();
  BatchOrchestrator orchestrator(throwing, tags_, log_);
  RunReport report = orchestrator.run(dir_.str(), config);

  EXPECT_EQ(report.status, RunStatus::Completed);
  ASSERT_EQ(report.results.size(), 2u);
  EXPECT_EQ(report.results[0].original_filename, "a_bad.mp3");
  EXPECT_FALSE(report.results[0].bpm.has_value());
  EXPECT_FALSE(report.results[0].key_label.has_value());
  EXPECT_FALSE(report.results[0].renamed);
  EXPECT_TRUE(dir_.contains("a_bad.mp3"));
  EXPECT_EQ(report.results[1].final_filename, "E - 126 BPM - b.mp3");
  EXPECT_EQ(report.statistics.analysis_failures, 1u);
  EXPECT_EQ(report.statistics.files_processed, 2u);
}

INSTANTIATE_TEST_SUITE_P(SequentialAndParallel, ThrowingProviderTest,
                         ::testing::Values(1u, 2u));

TEST_F(BatchOrchestratorTest, WritesReportArtifact) {
  dir_.writeFile("track.mp3");
  provider_.addTrack("track.mp3", track(120.0f, "C"));

  BatchConfig config;
  config.report_format = ReportFormat::Structured;
  RunReport report = runOnce(config);

  ASSERT_FALSE(report.report_path.empty());
  EXPECT_TRUE(std::filesystem::exists(report.report_path));
  auto reports = reportFiles();
  ASSERT_EQ(reports.size(), 1u);
  EXPECT_EQ(std::filesystem::path(reports[0]).extension().string(), ".json");
}

TEST_F(BatchOrchestratorTest, ParallelRunMatchesSequential) {
  const std::vector<std::pair<std::string, std::string>> tracks = {
      {"01 intro.mp3", "C"},  {"02 drive.flac", "Am"}, {"03 peak.wav", "F#"},
      {"04 break.ogg", "Em"}, {"05 outro.m4a", "Bb"},  {"06 extra.aac", "G"}};

  auto runWithJobs = [&](uint32_t jobs) {
    TempDir dir;
    for (size_t idx = 0; idx < tracks.size(); ++idx) {
      dir.writeFile(tracks[idx].first);
      std::string label = tracks[idx].second == "Bb" ? "A#" : tracks[idx].second;
      provider_.addTrack(tracks[idx].first, track(60.0f + 20.0f * idx, label));
    }
    BatchConfig config;
    config.jobs = jobs;
    config.write_report = false;
    BatchOrchestrator orchestrator(provider_, tags_, log_);
    RunReport report = orchestrator.run(dir.str(), config);
    std::vector<std::string> names;
    for (const auto& row : report.results) names.push_back(row.final_filename);
    EXPECT_EQ(report.statistics.files_moved, tracks.size());
    return names;
  };

  std::vector<std::string> sequential = runWithJobs(1);
  std::vector<std::string> parallel = runWithJobs(4);
  ASSERT_EQ(sequential.size(), tracks.size());
  EXPECT_EQ(sequential, parallel);
  EXPECT_EQ(sequential[0], "C - 120 BPM - 01 intro.mp3");
  EXPECT_EQ(sequential[1], "Am - 80 BPM - 02 drive.flac");
}

TEST_F(BatchOrchestratorTest, AnalyzeFileReportsPieces) {
  std::string path = dir_.writeFile("solo.mp3", "1234567890");
  provider_.addTrack("solo.mp3", track(174.2f, "Cm"));

  BatchOrchestrator orchestrator(provider_, tags_, log_);
  FileAnalysis analysis = orchestrator.analyzeFile(path);
  EXPECT_EQ(analysis.size_bytes, 10u);
  EXPECT_EQ(analysis.bpm, 174);
  ASSERT_TRUE(analysis.classification.has_value());
  EXPECT_EQ(analysis.classification->key_label, "Cm");
}

/// Provider that asks the orchestrator to stop while decoding the first file.
class StoppingFeatureProvider : public FakeFeatureProvider {
 public:
  std::optional<AudioSignal> loadSignal(const std::string& path) override {
    if (orchestrator != nullptr) orchestrator->requestStop();
    return FakeFeatureProvider::loadSignal(path);
  }

  BatchOrchestrator* orchestrator = nullptr;
};

TEST_F(BatchOrchestratorTest, StopRequestCancelsBetweenFiles) {
  StoppingFeatureProvider stopping;
  for (const char* name : {"a.mp3", "b.mp3", "c.mp3"}) {
    dir_.writeFile(name);
    stopping.addTrack(name, track(120.0f, "C"));
  }
  BatchOrchestrator orchestrator(stopping, tags_, log_);
  stopping.orchestrator = &orchestrator;

  BatchConfig config;
  config.policy.rename_enabled = false;
  RunReport report = orchestrator.run(dir_.str(), config);

  EXPECT_EQ(report.status, RunStatus::Cancelled);
  ASSERT_EQ(report.results.size(), 1u);
  EXPECT_EQ(report.results[0].original_filename, "a.mp3");
  EXPECT_EQ(report.statistics.files_processed, 1u);
  EXPECT_FALSE(report.report_path.empty());
}

TEST_F(BatchOrchestratorTest, StopRequestCancelsParallelRun) {
  StoppingFeatureProvider stopping;
  for (const char* name : {"a.mp3", "b.mp3", "c.mp3", "d.mp3"}) {
    dir_.writeFile(name);
    stopping.addTrack(name, track(120.0f, "C"));
  }
  BatchOrchestrator orchestrator(stopping, tags_, log_);
  stopping.orchestrator = &orchestrator;

  BatchConfig config;
  config.policy.rename_enabled = false;
  config.write_report = false;
  config.jobs = 2;
  RunReport report = orchestrator.run(dir_.str(), config);

  EXPECT_EQ(report.status, RunStatus::Cancelled);
  EXPECT_LT(report.results.size(), 4u);
}

TEST(RunStatusTest, ToString) {
  EXPECT_STREQ(runStatusToString(RunStatus::Completed), "completed");
  EXPECT_STREQ(runStatusToString(RunStatus::FolderNotFound), "folder_not_found");
  EXPECT_STREQ(runStatusToString(RunStatus::NoSupportedFiles), "no_supported_files");
  EXPECT_STREQ(runStatusToString(RunStatus::Cancelled), "cancelled");
}

}  // namespace
}  // namespace trackkey
