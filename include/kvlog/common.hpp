/**
 * @file common.hpp
 * @brief Common definitions for kvlog (Level, time formats, defaults)
 * @brief kvlog 通用定义（日志级别、时间格式、默认值）
 *
 * This file contains fundamental types and constants used throughout the library:
 * - Level: Log severity levels (Trace, Debug, Info, Warn, Error, Fatal, Disabled)
 * - Level names as accepted by Config::WithLevel
 * - Time field formats for the "time" key of a record
 *
 * 此文件包含整个库使用的基本类型和常量：
 * - Level：日志严重级别（Trace、Debug、Info、Warn、Error、Fatal、Disabled）
 * - Config::WithLevel 接受的级别名称
 * - 记录中 "time" 字段的时间格式
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#ifndef KVLOG_COMMON_HPP
#define KVLOG_COMMON_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace kvlog {

// ==============================================================================
// Log Level / 日志级别
// ==============================================================================

/**
 * @brief Log level enumeration
 * @brief 日志级别枚举
 *
 * Levels are ordered by severity from lowest (Trace) to highest (Fatal).
 * Disabled turns a logger off. NoLevel marks records written by the Print
 * family: they carry no "level" key and pass every filter except Disabled.
 *
 * 日志级别按严重程度从低（Trace）到高（Fatal）排序。
 * Disabled 关闭日志器。NoLevel 标记 Print 系列写入的记录：
 * 它们不带 "level" 字段，除 Disabled 外不受级别过滤。
 */
enum class Level : uint8_t {
    Trace = 0,     ///< Most detailed tracing info / 最详细的跟踪信息
    Debug = 1,     ///< Debug information / 调试信息
    Info = 2,      ///< General information / 一般信息
    Warn = 3,      ///< Warning messages / 警告信息
    Error = 4,     ///< Error messages / 错误信息
    Fatal = 5,     ///< Fatal errors, process stops / 致命错误，进程终止
    Disabled = 6,  ///< Logging disabled / 关闭日志
    NoLevel = 7    ///< Record without level / 无级别记录
};

/// Level names / 级别名称
constexpr std::string_view kLevelTrace = "trace";
constexpr std::string_view kLevelDebug = "debug";
constexpr std::string_view kLevelInfo = "info";
constexpr std::string_view kLevelWarn = "warn";
constexpr std::string_view kLevelError = "error";
constexpr std::string_view kLevelFatal = "fatal";
constexpr std::string_view kLevelDisabled = "disabled";

/// All supported level names in severity order / 按严重程度排序的全部级别名称
constexpr std::string_view kLevels[] = {
    kLevelTrace, kLevelDebug, kLevelInfo, kLevelWarn, kLevelError, kLevelFatal, kLevelDisabled,
};

constexpr size_t kLevelCount = 6;         ///< Number of log levels (excluding Disabled)
constexpr size_t kLevelCountWithOff = 7;  ///< Total number of named levels (including Disabled)

/**
 * @brief Convert log level to its name
 * @brief 将日志级别转换为名称
 *
 * NoLevel has an empty name. / NoLevel 的名称为空。
 */
constexpr std::string_view LevelToString(Level level) noexcept {
    switch (level) {
        case Level::Trace:
            return kLevelTrace;
        case Level::Debug:
            return kLevelDebug;
        case Level::Info:
            return kLevelInfo;
        case Level::Warn:
            return kLevelWarn;
        case Level::Error:
            return kLevelError;
        case Level::Fatal:
            return kLevelFatal;
        case Level::Disabled:
            return kLevelDisabled;
        default:
            return "";
    }
}

/**
 * @brief Short upper-case level tag for console output
 * @brief 控制台输出使用的级别短标签
 */
constexpr std::string_view LevelToShortString(Level level) noexcept {
    switch (level) {
        case Level::Trace:
            return "TRC";
        case Level::Debug:
            return "DBG";
        case Level::Info:
            return "INF";
        case Level::Warn:
            return "WRN";
        case Level::Error:
            return "ERR";
        case Level::Fatal:
            return "FTL";
        case Level::Disabled:
            return "OFF";
        default:
            return "???";
    }
}

/**
 * @brief Parse a level name, returns nullopt on unknown names
 * @brief 解析级别名称，未知名称返回 nullopt
 */
std::optional<Level> TryParseLevel(std::string_view name) noexcept;

/**
 * @brief Parse a level name
 * @brief 解析级别名称
 *
 * @throws std::invalid_argument "cannot parse level=<name>" for unknown names
 */
Level ParseLevel(std::string_view name);

/**
 * @brief Check if a record of the given level passes the threshold
 * @brief 检查给定级别的记录是否通过阈值
 */
constexpr bool ShouldLog(Level recordLevel, Level threshold) noexcept {
    if (threshold == Level::Disabled) {
        return false;
    }
    if (recordLevel == Level::NoLevel) {
        return true;
    }
    return static_cast<uint8_t>(recordLevel) >= static_cast<uint8_t>(threshold);
}

// ==============================================================================
// Time Field Format / 时间字段格式
// ==============================================================================

/// RFC3339 with seconds, local offset (default) / 带本地时区偏移的 RFC3339（默认）
constexpr std::string_view kTimeFormatRFC3339 = "RFC3339";
/// RFC3339 with nanoseconds / 带纳秒的 RFC3339
constexpr std::string_view kTimeFormatRFC3339Nano = "RFC3339NANO";
/// Unix seconds as a number / Unix 秒（数值）
constexpr std::string_view kTimeFormatUnix = "UNIX";
/// Unix milliseconds as a number / Unix 毫秒（数值）
constexpr std::string_view kTimeFormatUnixMs = "UNIXMS";
/// Unix microseconds as a number / Unix 微秒（数值）
constexpr std::string_view kTimeFormatUnixMicro = "UNIXMICRO";
/// Unix nanoseconds as a number / Unix 纳秒（数值）
constexpr std::string_view kTimeFormatUnixNano = "UNIXNANO";
/// Date and time without zone, a strftime pattern / 不带时区的日期时间，strftime 模式
constexpr std::string_view kTimeFormatDateTime = "%Y-%m-%d %H:%M:%S";

// ==============================================================================
// Defaults / 默认值
// ==============================================================================

/// Default diode capacity. Lines are lost when more than that many are written
/// within one polling interval.
/// 默认 diode 容量。一个轮询间隔内写入超过该数量的行将被丢弃。
constexpr size_t kDefaultDiodeSize = 1000;

/// Default diode polling interval / 默认 diode 轮询间隔
constexpr std::chrono::milliseconds kDefaultDiodePollingInterval{10};

// ==============================================================================
// Source Location / 源位置
// ==============================================================================

/**
 * @brief Source code location information
 * @brief 源代码位置信息
 */
struct SourceLocation {
    const char* file;      ///< Source file name / 源文件名
    uint32_t line;         ///< Line number / 行号
    const char* function;  ///< Function name / 函数名

    constexpr SourceLocation() noexcept : file(nullptr), line(0), function(nullptr) {}

    constexpr SourceLocation(const char* f, uint32_t l, const char* fn) noexcept
        : file(f), line(l), function(fn) {}

    constexpr bool IsValid() const noexcept { return file != nullptr && line > 0; }
};

/**
 * @brief Message text together with the location of the logging call
 * @brief 消息文本及日志调用所在的源位置
 *
 * Built implicitly from anything convertible to std::string_view. The
 * defaulted builtins are evaluated where the conversion happens, which is
 * the argument list of the logging call.
 *
 * 可由任何能转换为 std::string_view 的类型隐式构造。默认参数中的内建函数
 * 在发生转换处求值，即日志调用的参数列表处。
 */
struct LocatedMessage {
    std::string_view text;
    SourceLocation location;

    template <typename T,
              typename = std::enable_if_t<std::is_convertible_v<const T&, std::string_view>>>
    LocatedMessage(const T& msg, const char* file = __builtin_FILE(),
                   int line = __builtin_LINE(), const char* function = __builtin_FUNCTION())
        : text(msg), location(file, static_cast<uint32_t>(line), function) {}
};

}  // namespace kvlog

/**
 * @brief Macro to capture current source location
 * @brief 捕获当前源位置的宏
 */
#define KVLOG_CURRENT_LOCATION \
    ::kvlog::SourceLocation(__FILE__, static_cast<uint32_t>(__LINE__), __FUNCTION__)

#endif  // KVLOG_COMMON_HPP
