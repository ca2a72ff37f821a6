/**
 * @file test_format.cpp
 * @brief Unit tests for record formatters
 * @brief 记录格式化器的单元测试
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#include <gtest/gtest.h>

#include <chrono>
#include <regex>
#include <string>

#include <kvlog/format.hpp>

namespace kvlog {
namespace test {

namespace {

Event MakeEvent() {
    Event event;
    event.level = Level::Info;
    event.fields.push_back(Field{"id", Value(42)});
    event.fields.push_back(Field{"name", Value("bob")});
    event.message = "user created";
    return event;
}

}  // namespace

// ==============================================================================
// JsonFormat Tests / JsonFormat 测试
// ==============================================================================

TEST(JsonFormatTest, FieldOrder) {
    Event event = MakeEvent();
    event.time = Value("2024-05-01T10:00:00Z");

    JsonFormat format;
    EXPECT_EQ(format.FormatEvent(event),
              "{\"level\":\"info\",\"time\":\"2024-05-01T10:00:00Z\",\"id\":42,"
              "\"name\":\"bob\",\"message\":\"user created\"}");
}

TEST(JsonFormatTest, NoLevelOmitsLevelAndTime) {
    Event event;
    event.message = "raw line";

    JsonFormat format;
    EXPECT_EQ(format.FormatEvent(event), "{\"message\":\"raw line\"}");
}

TEST(JsonFormatTest, EmptyMessageOmitted) {
    Event event;
    event.level = Level::Warn;

    JsonFormat format;
    EXPECT_EQ(format.FormatEvent(event), "{\"level\":\"warn\"}");
}

TEST(JsonFormatTest, ErrorAndCaller) {
    Event event = MakeEvent();
    event.hasError = true;
    event.error = Error("disk full");
    event.caller = "main.cpp:12";

    JsonFormat format;
    EXPECT_EQ(format.FormatEvent(event),
              "{\"level\":\"info\",\"id\":42,\"name\":\"bob\",\"error\":\"disk full\","
              "\"caller\":\"main.cpp:12\",\"message\":\"user created\"}");
}

TEST(JsonFormatTest, NilErrorIsNull) {
    Event event;
    event.level = Level::Error;
    event.hasError = true;
    event.message = "m";

    JsonFormat format;
    EXPECT_EQ(format.FormatEvent(event), "{\"level\":\"error\",\"error\":null,\"message\":\"m\"}");
}

TEST(JsonFormatTest, StackFrames) {
    Event event;
    event.level = Level::Error;
    event.stack = StackTrace::Capture();

    JsonFormat format;
    const std::string json = format.FormatEvent(event);
    EXPECT_NE(json.find("\"stack\":[{\"func\":"), std::string::npos);
    EXPECT_NE(json.find("\"addr\":\"0x"), std::string::npos);
}

TEST(JsonFormatTest, EscapeJson) {
    EXPECT_EQ(JsonFormat::EscapeJson("plain"), "plain");
    EXPECT_EQ(JsonFormat::EscapeJson("a\"b\\c"), "a\\\"b\\\\c");
    EXPECT_EQ(JsonFormat::EscapeJson("line\nnext\ttab"), "line\\nnext\\ttab");
    EXPECT_EQ(JsonFormat::EscapeJson(std::string("\x01", 1)), "\\u0001");
}

TEST(JsonFormatTest, EscapeJsonKeepsValidUtf8) {
    EXPECT_EQ(JsonFormat::EscapeJson("caf\xc3\xa9"), "caf\xc3\xa9");
    EXPECT_EQ(JsonFormat::EscapeJson("\xe2\x82\xac 5"), "\xe2\x82\xac 5");
    EXPECT_EQ(JsonFormat::EscapeJson("\xf0\x9f\x98\x80"), "\xf0\x9f\x98\x80");
}

TEST(JsonFormatTest, EscapeJsonReplacesInvalidUtf8) {
    EXPECT_EQ(JsonFormat::EscapeJson("bad\xff\xfe" " utf8"), "bad\\ufffd\\ufffd utf8");
    // Truncated sequence / 截断的序列
    EXPECT_EQ(JsonFormat::EscapeJson("\xc3"), "\\ufffd");
    EXPECT_EQ(JsonFormat::EscapeJson("\xe2\x82" "x"), "\\ufffd\\ufffdx");
    // Overlong encoding of '/' / '/' 的过长编码
    EXPECT_EQ(JsonFormat::EscapeJson("\xc0\xaf"), "\\ufffd\\ufffd");
    // UTF-16 surrogate half / UTF-16 代理项
    EXPECT_EQ(JsonFormat::EscapeJson("\xed\xa0\x80"), "\\ufffd\\ufffd\\ufffd");
    // Above U+10FFFF / 大于 U+10FFFF
    EXPECT_EQ(JsonFormat::EscapeJson("\xf4\x90\x80\x80"), "\\ufffd\\ufffd\\ufffd\\ufffd");
}

// ==============================================================================
// ConsoleFormat Tests / ConsoleFormat 测试
// ==============================================================================

TEST(ConsoleFormatTest, Line) {
    Event event = MakeEvent();
    event.time = Value("10:00");
    event.fields.push_back(Field{"note", Value("two words")});
    event.hasError = true;
    event.error = Error("disk full");

    ConsoleFormat format;
    EXPECT_EQ(format.FormatEvent(event),
              "10:00 INF user created id=42 name=bob note=\"two words\" error=\"disk full\"");
}

TEST(ConsoleFormatTest, CallerAndNilError) {
    Event event;
    event.level = Level::Trace;
    event.caller = "main.cpp:3";
    event.message = "step";
    event.hasError = true;

    ConsoleFormat format;
    EXPECT_EQ(format.FormatEvent(event), "TRC main.cpp:3 > step error=null");
}

// ==============================================================================
// Time Format Tests / 时间格式测试
// ==============================================================================

TEST(FormatTimeTest, UnixFormats) {
    using namespace std::chrono;
    const system_clock::time_point t{seconds(1700000000) + milliseconds(123)};

    EXPECT_EQ(Format::FormatTime(t, kTimeFormatUnix).AsInt(), 1700000000);
    EXPECT_EQ(Format::FormatTime(t, kTimeFormatUnixMs).AsInt(), 1700000000123);
    EXPECT_EQ(Format::FormatTime(t, kTimeFormatUnixMicro).AsInt(), 1700000000123000);
    EXPECT_EQ(Format::FormatTime(t, kTimeFormatUnixNano).AsInt(), 1700000000123000000);
}

TEST(FormatTimeTest, RFC3339) {
    const auto now = std::chrono::system_clock::now();
    const std::regex rfc3339(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}(Z|[+-]\d{2}:\d{2}))");

    Value v = Format::FormatTime(now, kTimeFormatRFC3339);
    ASSERT_TRUE(v.IsString());
    EXPECT_TRUE(std::regex_match(v.AsString(), rfc3339)) << v.AsString();

    Value empty = Format::FormatTime(now, "");
    ASSERT_TRUE(empty.IsString());
    EXPECT_TRUE(std::regex_match(empty.AsString(), rfc3339)) << empty.AsString();
}

TEST(FormatTimeTest, RFC3339Nano) {
    using namespace std::chrono;
    const system_clock::time_point t{seconds(1700000000) + milliseconds(500)};
    const std::regex nano(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.5(Z|[+-]\d{2}:\d{2}))");

    Value v = Format::FormatTime(t, kTimeFormatRFC3339Nano);
    ASSERT_TRUE(v.IsString());
    EXPECT_TRUE(std::regex_match(v.AsString(), nano)) << v.AsString();
}

TEST(FormatTimeTest, StrftimePattern) {
    const std::regex dateTime(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})");
    Value v = Format::FormatTime(std::chrono::system_clock::now(), kTimeFormatDateTime);
    ASSERT_TRUE(v.IsString());
    EXPECT_TRUE(std::regex_match(v.AsString(), dateTime)) << v.AsString();
}

}  // namespace test
}  // namespace kvlog
