// Minimal JSON serialization writer (no external dependencies).
//
// Builds JSON output via a string-builder approach. Used for the structured
// run report. Does not parse JSON.

#ifndef TRACKKEY_CORE_JSON_HELPERS_H
#define TRACKKEY_CORE_JSON_HELPERS_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trackkey {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("bpm");
///   writer.value(128);
///   writer.key("key");
///   writer.value("8A");
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"bpm":128,"key":"8A"}
/// @endcode
///
/// Supports nested objects and arrays. Tracks comma insertion automatically.
/// Does not validate structure (caller must match begin/end pairs).
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  void key(std::string_view name);

  /// @brief Write a string value (JSON-escaped).
  void value(std::string_view val);

  /// @brief Write a string value from a C string (avoids the bool overload).
  void value(const char* val) { value(std::string_view(val)); }

  void value(int val);
  void value(int64_t val);

  /// @brief Write a floating-point value; NaN and infinity become null.
  void value(double val);

  /// @brief Write a floating-point value with a fixed number of decimals.
  /// @param val Value to write; NaN and infinity become null.
  /// @param decimals Digits after the decimal point.
  void valueFixed(double val, int decimals);

  void value(bool val);
  void valueNull();

  /// @brief Write an optional integer, null when absent.
  void valueOrNull(const std::optional<int>& val);

  /// @brief Write an optional string, null when absent.
  void valueOrNull(const std::optional<std::string>& val);

  /// @brief Get the accumulated JSON string.
  std::string toString() const;

  /// @brief Get the accumulated JSON string with pretty-print indentation.
  /// @param indent_size Number of spaces per indent level (default: 2).
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// Write a comma if needed before the next value/key.
  void maybeComma();

  /// Mark the current container as holding at least one element.
  void markWritten();

  /// Append a pre-formatted scalar token.
  void writeRaw(const std::string& token);

  /// Escape special characters in a string for JSON output.
  static std::string escapeString(std::string_view input);

  std::string buffer_;

  // One entry per open container: whether the next element needs a comma.
  std::vector<bool> needs_comma_;
};

}  // namespace trackkey

#endif  // TRACKKEY_CORE_JSON_HELPERS_H
