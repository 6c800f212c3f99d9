/// @file
/// @brief CSV and JSON rendering of run results.

#include "batch/report_writer.h"

#include <cstdio>
#include <filesystem>
#include <fstream>

#include "core/json_helpers.h"

namespace trackkey {

namespace {

/// Confidence scores are written with this many decimals.
constexpr int kConfidenceDecimals = 4;

/// Duration and size are written with this many decimals.
constexpr int kMeasureDecimals = 2;

std::string formatFixed(double val, int decimals) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, val);
  return buf;
}

/// @brief Quote a CSV field if it contains a delimiter, quote or line break.
std::string csvField(const std::string& val) {
  if (val.find_first_of(",\"\r\n") == std::string::npos) return val;
  std::string quoted = "\"";
  for (char chr : val) {
    if (chr == '"') quoted += '"';
    quoted += chr;
  }
  quoted += '"';
  return quoted;
}

}  // namespace

std::string reportFileName(ReportFormat format, const std::string& stamp) {
  return "music_analysis_" + stamp + "." + reportFormatToString(format);
}

std::string renderCsv(const std::vector<TrackResult>& results) {
  std::string out =
      "original_filename,filename,path,bpm,key,confidence,duration_seconds,size_mb,"
      "renamed,timestamp\n";
  for (const auto& row : results) {
    out += csvField(row.original_filename);
    out += ',';
    out += csvField(row.final_filename);
    out += ',';
    out += csvField(row.final_path);
    out += ',';
    if (row.bpm) out += std::to_string(*row.bpm);
    out += ',';
    if (row.key_label) out += csvField(*row.key_label);
    out += ',';
    if (row.confidence) out += formatFixed(*row.confidence, kConfidenceDecimals);
    out += ',';
    if (row.duration_seconds) out += formatFixed(*row.duration_seconds, kMeasureDecimals);
    out += ',';
    if (row.size_bytes) out += formatFixed(bytesToMegabytes(*row.size_bytes), kMeasureDecimals);
    out += ',';
    out += row.renamed ? "true" : "false";
    out += ',';
    out += csvField(row.timestamp);
    out += '\n';
  }
  return out;
}

std::string renderJson(const std::vector<TrackResult>& results) {
  JsonWriter writer;
  writer.beginArray();
  for (const auto& row : results) {
    writer.beginObject();
    writer.key("original_filename");
    writer.value(row.original_filename);
    writer.key("filename");
    writer.value(row.final_filename);
    writer.key("path");
    writer.value(row.final_path);
    writer.key("bpm");
    writer.valueOrNull(row.bpm);
    writer.key("key");
    writer.valueOrNull(row.key_label);
    writer.key("confidence");
    if (row.confidence) {
      writer.valueFixed(*row.confidence, kConfidenceDecimals);
    } else {
      writer.valueNull();
    }
    writer.key("duration_seconds");
    if (row.duration_seconds) {
      writer.valueFixed(*row.duration_seconds, kMeasureDecimals);
    } else {
      writer.valueNull();
    }
    writer.key("size_mb");
    if (row.size_bytes) {
      writer.valueFixed(bytesToMegabytes(*row.size_bytes), kMeasureDecimals);
    } else {
      writer.valueNull();
    }
    writer.key("renamed");
    writer.value(row.renamed);
    writer.key("timestamp");
    writer.value(row.timestamp);
    writer.endObject();
  }
  writer.endArray();
  return writer.toPrettyString(2) + "\n";
}

ReportWriteResult writeReport(const std::vector<TrackResult>& results, const std::string& folder,
                              ReportFormat format, const std::string& stamp) {
  ReportWriteResult result;
  result.path = (std::filesystem::path(folder) / reportFileName(format, stamp)).string();

  std::ofstream file(result.path, std::ios::out | std::ios::trunc);
  if (!file.is_open()) {
    result.error_message = "cannot open " + result.path;
    return result;
  }
  file << (format == ReportFormat::Tabular ? renderCsv(results) : renderJson(results));
  file.close();
  if (file.fail()) {
    result.error_message = "write failed: " + result.path;
    return result;
  }
  result.success = true;
  return result;
}

}  // namespace trackkey
