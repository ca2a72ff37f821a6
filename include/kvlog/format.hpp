/**
 * @file format.hpp
 * @brief Record formatters for kvlog
 * @brief kvlog 日志记录格式化器
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "kvlog/common.hpp"
#include "kvlog/event.hpp"

namespace kvlog {

/**
 * @brief Base class for record formatters
 * @brief 日志记录格式化器基类
 *
 * Format is responsible for converting Event objects into single lines.
 * The returned line carries no trailing newline; sinks add it.
 *
 * Format 负责将 Event 对象转换为单行文本。返回的行不带换行符，由 Sink 添加。
 */
class Format {
public:
    virtual ~Format() = default;

    /**
     * @brief Format a record into one line
     * @brief 将记录格式化为一行
     *
     * @param event The record to format / 要格式化的记录
     * @return Formatted line / 格式化后的行
     */
    virtual std::string FormatEvent(const Event& event) = 0;

    /**
     * @brief Render a timestamp for the "time" attribute
     * @brief 为 "time" 属性渲染时间戳
     *
     * The UNIX* formats give an integer Value, every other format a string.
     * RFC3339 uses local time with its numeric offset ("Z" for UTC); any
     * other string is passed to strftime.
     *
     * UNIX* 格式返回整数 Value，其余格式返回字符串。RFC3339 使用本地时间
     * 及其数字偏移（UTC 为 "Z"）；其他字符串交给 strftime。
     *
     * @param time Time point to render / 要渲染的时间点
     * @param format Time field format / 时间字段格式
     */
    static Value FormatTime(std::chrono::system_clock::time_point time, std::string_view format);
};

// ==============================================================================
// JsonFormat / JSON 格式化器
// ==============================================================================

/**
 * @brief One JSON object per record
 * @brief 每条记录一个 JSON 对象
 *
 * Output example / 输出示例:
 * @code
 * {"level":"info","time":"2024-05-01T10:00:00+02:00","k":"v","message":"value 42"}
 * @endcode
 */
class JsonFormat : public Format {
public:
    std::string FormatEvent(const Event& event) override;

    /**
     * @brief Append a quoted and escaped JSON string
     * @brief 追加带引号并转义的 JSON 字符串
     *
     * @param out Output buffer / 输出缓冲区
     * @param str Raw string / 原始字符串
     */
    static void AppendString(std::string& out, std::string_view str);

    /**
     * @brief Escape special characters in a JSON string
     * @brief 转义 JSON 字符串中的特殊字符
     */
    static std::string EscapeJson(std::string_view str);

private:
    static void AppendKey(std::string& out, std::string_view key);
    static void AppendStack(std::string& out, const StackTrace& stack);
};

// ==============================================================================
// ConsoleFormat / 控制台格式化器
// ==============================================================================

/**
 * @brief Human readable single line, without colors
 * @brief 人类可读的单行格式，无颜色
 *
 * Output example / 输出示例:
 * @code
 * 2024-05-01T10:00:00+02:00 INF value 42 k=v error="disk full"
 * @endcode
 */
class ConsoleFormat : public Format {
public:
    std::string FormatEvent(const Event& event) override;

private:
    static void AppendValue(std::string& out, const Value& value);
};

}  // namespace kvlog
