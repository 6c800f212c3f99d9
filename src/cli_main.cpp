/// @file
/// @brief CLI entry point for the track key/tempo analyzer.

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "batch/batch_orchestrator.h"
#include "batch/summary_presenter.h"
#include "core/basic_types.h"
#include "core/run_log.h"
#include "io/sndfile_aubio_feature_provider.h"
#include "io/taglib_tag_store.h"
#include "rename/rename_policy.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitRunFailed = 1;
constexpr int kExitUsage = 2;

/// @brief Command-line options parsed from argv.
struct CliOptions {
  std::string folder;
  bool rename = true;
  trackkey::KeyNotation notation = trackkey::KeyNotation::Classic;
  std::string remove_list;
  std::string replace_list;
  trackkey::ReportFormat format = trackkey::ReportFormat::Tabular;
  uint32_t jobs = 1;
  std::string log_file = "trackkey.log";
  bool quiet = false;
};

/// Orchestrator reachable from the SIGINT handler.
trackkey::BatchOrchestrator* g_active_orchestrator = nullptr;

void handleInterrupt(int /*signum*/) {
  if (g_active_orchestrator != nullptr) {
    g_active_orchestrator->requestStop();
  }
}

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("trackkey_cli - Audio key/tempo analyzer and renamer\n\n");
  std::printf("Usage: trackkey_cli [options] FOLDER\n\n");
  std::printf("Options:\n");
  std::printf("  --no-rename        Analyze only, leave file names untouched\n");
  std::printf("  --notation NOT     Key notation: classic, alphanumeric (camelot)\n");
  std::printf("  --remove LIST      Comma-separated literals to strip from names\n");
  std::printf("  --replace LIST     Comma-separated old:new substitutions\n");
  std::printf("  --format FMT       Report format: csv, json\n");
  std::printf("  --jobs N           Analysis worker threads (default 1)\n");
  std::printf("  --log FILE         Log file (default trackkey.log, '-' disables)\n");
  std::printf("  --quiet            Only warnings and errors on stderr\n");
  std::printf("  --help             Show this help\n");
  std::printf("\nSupported files: .mp3 .wav .flac .ogg .m4a .aac\n");
}

/// @brief Parse command-line arguments into CliOptions.
/// @param argc Argument count from main().
/// @param argv Argument vector from main().
/// @param opts Output structure populated with parsed values.
/// @param exit_code Set when the caller should exit immediately.
/// @return False if the caller should exit with exit_code.
bool parseArgs(int argc, char* argv[], CliOptions& opts, int& exit_code) {
  for (int idx = 1; idx < argc; ++idx) {
    const char* arg = argv[idx];
    bool has_value = idx + 1 < argc;
    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      printUsage();
      exit_code = kExitOk;
      return false;
    }
    if (std::strcmp(arg, "--no-rename") == 0) {
      opts.rename = false;
    } else if (std::strcmp(arg, "--quiet") == 0) {
      opts.quiet = true;
    } else if (std::strcmp(arg, "--notation") == 0 && has_value) {
      if (!trackkey::keyNotationFromString(argv[++idx], opts.notation)) {
        std::fprintf(stderr, "Error: unknown notation '%s'\n", argv[idx]);
        exit_code = kExitUsage;
        return false;
      }
    } else if (std::strcmp(arg, "--format") == 0 && has_value) {
      if (!trackkey::reportFormatFromString(argv[++idx], opts.format)) {
        std::fprintf(stderr, "Error: unknown report format '%s'\n", argv[idx]);
        exit_code = kExitUsage;
        return false;
      }
    } else if (std::strcmp(arg, "--remove") == 0 && has_value) {
      opts.remove_list = argv[++idx];
    } else if (std::strcmp(arg, "--replace") == 0 && has_value) {
      opts.replace_list = argv[++idx];
    } else if (std::strcmp(arg, "--jobs") == 0 && has_value) {
      int jobs = std::atoi(argv[++idx]);
      if (jobs < 1) {
        std::fprintf(stderr, "Error: --jobs needs a positive number\n");
        exit_code = kExitUsage;
        return false;
      }
      opts.jobs = static_cast<uint32_t>(jobs);
    } else if (std::strcmp(arg, "--log") == 0 && has_value) {
      opts.log_file = argv[++idx];
    } else if (arg[0] == '-' && arg[1] != '\0') {
      std::fprintf(stderr, "Error: unknown or incomplete option '%s'\n", arg);
      exit_code = kExitUsage;
      return false;
    } else if (opts.folder.empty()) {
      opts.folder = arg;
    } else {
      std::fprintf(stderr, "Error: more than one folder given\n");
      exit_code = kExitUsage;
      return false;
    }
  }
  if (opts.folder.empty()) {
    printUsage();
    exit_code = kExitUsage;
    return false;
  }
  return true;
}

/// @brief Build a BatchConfig from parsed CLI options.
/// @param opts Parsed command-line options.
/// @return BatchConfig ready for the orchestrator.
trackkey::BatchConfig buildBatchConfig(const CliOptions& opts) {
  trackkey::BatchConfig config;
  config.policy.rename_enabled = opts.rename;
  config.policy.notation = opts.notation;
  config.policy.remove_literals = trackkey::parseRemoveList(opts.remove_list);
  config.policy.replace_pairs = trackkey::parseReplaceList(opts.replace_list);
  config.report_format = opts.format;
  config.jobs = opts.jobs;
  return config;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  int exit_code = kExitOk;
  if (!parseArgs(argc, argv, opts, exit_code)) {
    return exit_code;
  }

  trackkey::BatchConfig config = buildBatchConfig(opts);

  trackkey::RunLog log(opts.quiet ? trackkey::LogLevel::Warning : trackkey::LogLevel::Info);
  if (opts.log_file != "-" && !log.openFile(opts.log_file)) {
    std::fprintf(stderr, "Warning: cannot open log file %s\n", opts.log_file.c_str());
  }

  std::printf("trackkey_cli v1.0.0\n");
  std::printf("Folder:     %s\n", opts.folder.c_str());
  std::printf("Rename:     %s\n", config.policy.rename_enabled ? "yes" : "no");
  std::printf("Notation:   %s\n", trackkey::keyNotationToString(config.policy.notation));
  std::printf("Remove:     %zu literal(s)\n", config.policy.remove_literals.size());
  std::printf("Replace:    %zu pair(s)\n", config.policy.replace_pairs.size());
  std::printf("Format:     %s\n", trackkey::reportFormatToString(config.report_format));
  std::printf("Jobs:       %u\n", config.jobs);
  std::printf("\n");

  trackkey::SndfileAubioFeatureProvider provider(log);
  trackkey::TagLibTagStore tag_store;
  trackkey::BatchOrchestrator orchestrator(provider, tag_store, log);

  g_active_orchestrator = &orchestrator;
  std::signal(SIGINT, handleInterrupt);
  trackkey::RunReport report = orchestrator.run(opts.folder, config);
  std::signal(SIGINT, SIG_DFL);
  g_active_orchestrator = nullptr;

  switch (report.status) {
    case trackkey::RunStatus::FolderNotFound:
    case trackkey::RunStatus::NoSupportedFiles:
      std::fprintf(stderr, "Error: %s\n", report.error_message.c_str());
      return kExitRunFailed;
    case trackkey::RunStatus::Cancelled:
      std::printf("Interrupted: %zu file(s) processed\n", report.results.size());
      break;
    case trackkey::RunStatus::Completed:
      break;
  }

  trackkey::RunSummary summary = trackkey::buildSummary(report.results, report.statistics);
  std::printf("%s", trackkey::formatSummary(summary, report.results).c_str());

  if (!report.report_path.empty()) {
    std::printf("\nOutput:    %s\n", report.report_path.c_str());
  } else if (config.write_report && !report.results.empty()) {
    std::fprintf(stderr, "Error: failed to write report: %s\n", report.error_message.c_str());
    return kExitRunFailed;
  }
  return kExitOk;
}
