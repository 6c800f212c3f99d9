// Tests for core/json_helpers.h -- JsonWriter serialization.

#include "core/json_helpers.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <optional>
#include <string>

namespace trackkey {
namespace {

// ---------------------------------------------------------------------------
// Simple values
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, EmptyObject) {
  JsonWriter writer;
  writer.beginObject();
  writer.endObject();
  EXPECT_EQ(writer.toString(), "{}");
}

TEST(JsonWriterTest, EmptyArray) {
  JsonWriter writer;
  writer.beginArray();
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[]");
}

TEST(JsonWriterTest, StringLiteralIsNotBool) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("key");
  writer.value("Am");
  writer.endObject();
  EXPECT_EQ(writer.toString(), R"({"key":"Am"})");
}

TEST(JsonWriterTest, StdStringValue) {
  JsonWriter writer;
  std::string name = "track.mp3";
  writer.beginObject();
  writer.key("filename");
  writer.value(name);
  writer.endObject();
  EXPECT_EQ(writer.toString(), R"({"filename":"track.mp3"})");
}

TEST(JsonWriterTest, BooleanValues) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("renamed");
  writer.value(true);
  writer.key("moved");
  writer.value(false);
  writer.endObject();
  EXPECT_EQ(writer.toString(), R"({"renamed":true,"moved":false})");
}

TEST(JsonWriterTest, FixedDecimals) {
  JsonWriter writer;
  writer.beginArray();
  writer.valueFixed(0.91234567, 4);
  writer.valueFixed(2.5, 2);
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[0.9123,2.50]");
}

TEST(JsonWriterTest, OptionalValues) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("bpm");
  writer.valueOrNull(std::optional<int>(128));
  writer.key("key");
  writer.valueOrNull(std::optional<std::string>());
  writer.endObject();
  EXPECT_EQ(writer.toString(), R"({"bpm":128,"key":null})");
}

TEST(JsonWriterTest, NonFiniteBecomesNull) {
  JsonWriter writer;
  writer.beginArray();
  writer.value(std::numeric_limits<double>::quiet_NaN());
  writer.valueFixed(std::numeric_limits<double>::infinity(), 2);
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[null,null]");
}

// ---------------------------------------------------------------------------
// Nesting and escaping
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, ArrayOfObjects) {
  JsonWriter writer;
  writer.beginArray();
  for (int bpm : {120, 128}) {
    writer.beginObject();
    writer.key("bpm");
    writer.value(bpm);
    writer.endObject();
  }
  writer.endArray();
  EXPECT_EQ(writer.toString(), R"([{"bpm":120},{"bpm":128}])");
}

TEST(JsonWriterTest, EscapesQuotesBackslashAndControl) {
  JsonWriter writer;
  writer.beginArray();
  writer.value("say \"hi\"\\\n\x01");
  writer.endArray();
  EXPECT_EQ(writer.toString(), R"(["say \"hi\"\\\n\u0001"])");
}

TEST(JsonWriterTest, PrettyPrint) {
  JsonWriter writer;
  writer.beginArray();
  writer.beginObject();
  writer.key("key");
  writer.value("C#m");
  writer.key("tags");
  writer.beginArray();
  writer.endArray();
  writer.endObject();
  writer.endArray();
  EXPECT_EQ(writer.toPrettyString(2),
            "[\n  {\n    \"key\": \"C#m\",\n    \"tags\": []\n  }\n]");
}

TEST(JsonWriterTest, PrettyPrintKeepsPunctuationInStrings) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("name");
  writer.value("a, b: {c}");
  writer.endObject();
  EXPECT_EQ(writer.toPrettyString(2), "{\n  \"name\": \"a, b: {c}\"\n}");
}

}  // namespace
}  // namespace trackkey
