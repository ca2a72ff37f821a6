/**
 * @file format.cpp
 * @brief Record formatters implementation
 * @brief 日志记录格式化器实现
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#include "kvlog/format.hpp"

#include <ctime>
#include <iterator>

#include <fmt/format.h>

namespace kvlog {

namespace {

std::tm ToLocalTime(std::time_t seconds) {
    std::tm tmTime{};
#ifdef _WIN32
    localtime_s(&tmTime, &seconds);
#else
    localtime_r(&seconds, &tmTime);
#endif
    return tmTime;
}

// "+02:00", "-05:30" or "Z"
void AppendOffset(std::string& out, const std::tm& tmTime) {
    long offset = tmTime.tm_gmtoff;
    if (offset == 0) {
        out += 'Z';
        return;
    }
    char sign = '+';
    if (offset < 0) {
        sign = '-';
        offset = -offset;
    }
    fmt::format_to(std::back_inserter(out), "{}{:02}:{:02}", sign, offset / 3600,
                   (offset % 3600) / 60);
}

bool NeedsQuote(std::string_view str) {
    if (str.empty()) {
        return true;
    }
    for (char c : str) {
        if (c == ' ' || c == '"' || c == '=' || c == '\\' ||
            static_cast<unsigned char>(c) < 0x20) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Length of the well-formed UTF-8 sequence starting at pos, 0 if malformed
 * @brief 从 pos 开始的合法 UTF-8 序列长度，非法时为 0
 *
 * Overlong forms, surrogates and code points above U+10FFFF are malformed.
 * 过长编码、代理项以及大于 U+10FFFF 的码点均视为非法。
 */
size_t Utf8SequenceLength(std::string_view str, size_t pos) {
    const auto byte = [&str](size_t i) { return static_cast<unsigned char>(str[i]); };
    const unsigned char lead = byte(pos);

    size_t length = 0;
    unsigned char low = 0x80;
    unsigned char high = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) {
            low = 0xA0;
        } else if (lead == 0xED) {
            high = 0x9F;
        }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) {
            low = 0x90;
        } else if (lead == 0xF4) {
            high = 0x8F;
        }
    } else {
        return 0;
    }

    if (pos + length > str.size()) {
        return 0;
    }
    // Only the second byte has a narrowed range / 只有第二个字节的范围会收窄
    if (byte(pos + 1) < low || byte(pos + 1) > high) {
        return 0;
    }
    for (size_t i = 2; i < length; ++i) {
        if (byte(pos + i) < 0x80 || byte(pos + i) > 0xBF) {
            return 0;
        }
    }
    return length;
}

}  // namespace

// ==============================================================================
// Format Implementation / Format 实现
// ==============================================================================

Value Format::FormatTime(std::chrono::system_clock::time_point time, std::string_view format) {
    using namespace std::chrono;
    const auto sinceEpoch = time.time_since_epoch();

    if (format == kTimeFormatUnix) {
        return static_cast<int64_t>(duration_cast<seconds>(sinceEpoch).count());
    }
    if (format == kTimeFormatUnixMs) {
        return static_cast<int64_t>(duration_cast<milliseconds>(sinceEpoch).count());
    }
    if (format == kTimeFormatUnixMicro) {
        return static_cast<int64_t>(duration_cast<microseconds>(sinceEpoch).count());
    }
    if (format == kTimeFormatUnixNano) {
        return static_cast<int64_t>(duration_cast<nanoseconds>(sinceEpoch).count());
    }

    const auto secs = duration_cast<seconds>(sinceEpoch);
    const std::tm tmTime = ToLocalTime(static_cast<std::time_t>(secs.count()));

    std::string result;
    if (format.empty() || format == kTimeFormatRFC3339 || format == kTimeFormatRFC3339Nano) {
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tmTime);
        result = buf;
        if (format == kTimeFormatRFC3339Nano) {
            // Fraction without trailing zeros / 去掉末尾零的小数部分
            auto nanos = duration_cast<nanoseconds>(sinceEpoch - secs).count();
            if (nanos != 0) {
                std::string frac = fmt::format("{:09}", nanos);
                frac.erase(frac.find_last_not_of('0') + 1);
                result += '.';
                result += frac;
            }
        }
        AppendOffset(result, tmTime);
        return result;
    }

    const std::string pattern(format);
    char buf[128];
    const size_t len = std::strftime(buf, sizeof(buf), pattern.c_str(), &tmTime);
    result.assign(buf, len);
    return result;
}

// ==============================================================================
// JsonFormat Implementation / JsonFormat 实现
// ==============================================================================

void JsonFormat::AppendString(std::string& out, std::string_view str) {
    out += '"';
    size_t i = 0;
    while (i < str.size()) {
        const char c = str[i];
        if (static_cast<unsigned char>(c) >= 0x80) {
            // Malformed bytes become U+FFFD one by one
            // 非法字节逐个替换为 U+FFFD
            const size_t length = Utf8SequenceLength(str, i);
            if (length == 0) {
                out += "\\ufffd";
                ++i;
            } else {
                out.append(str.data() + i, length);
                i += length;
            }
            continue;
        }
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    // Control character, escape as \uXXXX
                    // 控制字符，转义为 \uXXXX
                    fmt::format_to(std::back_inserter(out), "\\u{:04x}",
                                   static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    out += c;
                }
                break;
        }
        ++i;
    }
    out += '"';
}

std::string JsonFormat::EscapeJson(std::string_view str) {
    std::string quoted;
    quoted.reserve(str.size() + 16);
    AppendString(quoted, str);
    return quoted.substr(1, quoted.size() - 2);
}

void JsonFormat::AppendKey(std::string& out, std::string_view key) {
    if (out.size() > 1) {
        out += ',';
    }
    AppendString(out, key);
    out += ':';
}

void JsonFormat::AppendStack(std::string& out, const StackTrace& stack) {
    out += '[';
    bool first = true;
    for (const auto& frame : stack.Frames()) {
        if (!first) {
            out += ',';
        }
        first = false;
        out += "{\"func\":";
        AppendString(out, frame.function);
        out += ",\"source\":";
        AppendString(out, frame.source);
        fmt::format_to(std::back_inserter(out), ",\"addr\":\"{:#x}\"}}", frame.address);
    }
    out += ']';
}

std::string JsonFormat::FormatEvent(const Event& event) {
    std::string out;
    out.reserve(256);
    out += '{';

    // Level / 日志级别
    if (event.level != Level::NoLevel) {
        AppendKey(out, "level");
        AppendString(out, LevelToString(event.level));
    }

    // Timestamp / 时间戳
    if (!event.time.IsNull()) {
        AppendKey(out, "time");
        event.time.AppendJson(out);
    }

    // Fields / 字段
    for (const auto& field : event.fields) {
        AppendKey(out, field.key);
        field.value.AppendJson(out);
    }

    // Error / 错误
    if (event.hasError) {
        AppendKey(out, "error");
        if (event.error.IsNil()) {
            out += "null";
        } else {
            AppendString(out, event.error.Message());
        }
    }

    if (!event.stack.Empty()) {
        AppendKey(out, "stack");
        AppendStack(out, event.stack);
    }

    if (!event.caller.empty()) {
        AppendKey(out, "caller");
        AppendString(out, event.caller);
    }

    // Message / 消息
    if (!event.message.empty()) {
        AppendKey(out, "message");
        AppendString(out, event.message);
    }

    out += '}';
    return out;
}

// ==============================================================================
// ConsoleFormat Implementation / ConsoleFormat 实现
// ==============================================================================

void ConsoleFormat::AppendValue(std::string& out, const Value& value) {
    if (value.IsString() || value.IsError()) {
        const std::string text = value.ToString();
        if (NeedsQuote(text)) {
            JsonFormat::AppendString(out, text);
        } else {
            out += text;
        }
        return;
    }
    out += value.ToString();
}

std::string ConsoleFormat::FormatEvent(const Event& event) {
    std::string out;
    out.reserve(256);

    if (!event.time.IsNull()) {
        out += event.time.ToString();
        out += ' ';
    }

    out += LevelToShortString(event.level);

    if (!event.caller.empty()) {
        out += ' ';
        out += event.caller;
        out += " >";
    }

    if (!event.message.empty()) {
        out += ' ';
        out += event.message;
    }

    for (const auto& field : event.fields) {
        out += ' ';
        out += field.key;
        out += '=';
        AppendValue(out, field.value);
    }

    if (event.hasError) {
        out += " error=";
        if (event.error.IsNil()) {
            out += "null";
        } else {
            AppendValue(out, Value(event.error));
        }
    }

    if (!event.stack.Empty()) {
        out += '\n';
        std::string stack = event.stack.ToString();
        while (!stack.empty() && stack.back() == '\n') {
            stack.pop_back();
        }
        out += stack;
    }

    return out;
}

}  // namespace kvlog
