/**
 * @file logger.hpp
 * @brief Logger class for kvlog
 * @brief kvlog 日志管理器
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "kvlog/backend.hpp"
#include "kvlog/classifier.hpp"
#include "kvlog/common.hpp"
#include "kvlog/config.hpp"
#include "kvlog/error.hpp"
#include "kvlog/value.hpp"

namespace kvlog {

// ==============================================================================
// Logger Class / Logger 类
// ==============================================================================

/**
 * @brief Structured logger
 * @brief 结构化日志器
 *
 * Every call produces at most one record. Arguments after the message are
 * converted to Values and classified:
 * - Info(msg, fields...): fields are key/value pairs
 * - Infof(fmt, args...): the first N arguments fill the N '%' of fmt, the rest are fields
 * - Err(err, msg, fields...): err is the record's error, fields are not scanned
 *
 * The first error found among the fields of Info/Infof and friends becomes
 * the record's "error" attribute and is counted by the error counter.
 *
 * 每次调用最多产生一条记录。消息之后的参数被转换为 Value 并分类：
 * - Info(msg, fields...)：字段为键值对
 * - Infof(fmt, args...)：前 N 个参数填充 fmt 中的 N 个 '%'，其余为字段
 * - Err(err, msg, fields...)：err 为记录的错误，字段不再扫描
 *
 * Info/Infof 等调用的字段中找到的第一个错误成为记录的 "error" 属性，
 * 并由错误计数器计数。
 *
 * A Logger is a cheap value: copies and derived loggers share the backend
 * and the error counter. Logging through one Logger from many threads is
 * safe; Update() is not.
 *
 * Logger 是轻量值类型：拷贝和派生的日志器共享后端与错误计数器。
 * 多线程通过同一 Logger 记录日志是安全的；Update() 不是。
 *
 * @code
 * kvlog::Logger lg(kvlog::C().WithConsoleJSON(), "service", "api");
 * lg.Info("user created", "id", 42);
 * lg.Infof("value %d", 42, "k", "v");
 * lg.Err(kvlog::Error("disk full"), "cannot save");
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Zero-value placeholder, discards everything
     * @brief 零值占位日志器，丢弃所有内容
     */
    Logger() = default;

    /**
     * @brief Construct a logger from a configuration
     * @brief 根据配置构造日志器
     *
     * - No sinks or level "disabled": records are discarded
     * - Empty level: info
     * - Several sinks: fan out through a MultiSink
     * - Unless WithNoDiode(): output goes through a DiodeSink
     *
     * @param cfg Configuration / 配置
     * @param fields Context fields attached to every record / 附加到每条记录的上下文字段
     * @throws std::invalid_argument on an unknown level name / 未知级别名称时抛出
     */
    template <typename... Fields>
    explicit Logger(const Config& cfg, Fields&&... fields) {
        Init(cfg, MakeValues(std::forward<Fields>(fields)...));
    }

    /**
     * @brief Logger that discards everything
     * @brief 丢弃所有内容的日志器
     */
    static Logger Nop();

    /**
     * @brief Logger writing JSON to stderr
     * @brief 向 stderr 写入 JSON 的日志器
     */
    template <typename... Fields>
    static Logger ConsoleJson(Fields&&... fields) {
        return Logger(Config().WithConsoleJSON(), std::forward<Fields>(fields)...);
    }

    /**
     * @brief Rebuild every member from a new configuration
     * @brief 根据新配置重建所有成员
     *
     * Not safe while other threads log through this object.
     * 其他线程正通过此对象记录日志时调用是不安全的。
     */
    template <typename... Fields>
    void Update(const Config& cfg, Fields&&... fields) {
        Logger fresh(cfg, std::forward<Fields>(fields)...);
        *this = std::move(fresh);
    }

    /**
     * @brief True for the zero-value placeholder and Nop()
     * @brief 零值占位日志器与 Nop() 返回 true
     */
    bool NotInited() const noexcept { return !m_inited; }

    // =========================================================================
    // Derivation / 派生
    // =========================================================================

    /**
     * @brief Copy with extra context fields
     * @brief 附加上下文字段的副本
     */
    template <typename... Fields>
    Logger WithFields(Fields&&... fields) const {
        return WithFieldList(MakeValues(std::forward<Fields>(fields)...));
    }

    /// Shortcut for WithFields / WithFields 的简写
    template <typename... Fields>
    Logger With(Fields&&... fields) const {
        return WithFieldList(MakeValues(std::forward<Fields>(fields)...));
    }

    /**
     * @brief Copy with another minimum level, empty keeps the current one
     * @brief 使用另一最低级别的副本，空字符串保持当前级别
     *
     * @throws std::invalid_argument on an unknown level name / 未知级别名称时抛出
     */
    Logger WithLevel(std::string_view level) const;

    Logger WithStack(bool stackTrace) const;

    Logger WithErrorCounter(std::shared_ptr<ErrorCounter> counter) const;

    Logger WithSimpleErrorCounter() const;

    /// Copy with a replaced ignore list / 替换忽略列表的副本
    Logger WithToIgnore(std::vector<std::string> toIgnore) const;

    // =========================================================================
    // Leveled Logging / 分级日志
    // =========================================================================

    /**
     * @brief Trace record carrying the call site as "caller" ("file:line")
     * @brief 携带调用位置 "caller"（"file:line"）的 Trace 记录
     */
    template <typename... Fields>
    void Trace(LocatedMessage msg, Fields&&... fields) const {
        LogImpl(Level::Trace, msg.text, MakeValues(std::forward<Fields>(fields)...),
                msg.location);
    }

    template <typename... Args>
    void Tracef(LocatedMessage format, Args&&... args) const {
        LogfImpl(Level::Trace, format.text, MakeValues(std::forward<Args>(args)...),
                 format.location);
    }

    /**
     * @brief Trace record whose "caller" is "file:line"
     * @brief "caller" 为 "file:line" 的 Trace 记录
     */
    template <typename... Fields>
    void TraceAt(const SourceLocation& loc, std::string_view msg, Fields&&... fields) const {
        LogImpl(Level::Trace, msg, MakeValues(std::forward<Fields>(fields)...), loc);
    }

    template <typename... Args>
    void TracefAt(const SourceLocation& loc, std::string_view format, Args&&... args) const {
        LogfImpl(Level::Trace, format, MakeValues(std::forward<Args>(args)...), loc);
    }

    template <typename... Fields>
    void Debug(std::string_view msg, Fields&&... fields) const {
        LogImpl(Level::Debug, msg, MakeValues(std::forward<Fields>(fields)...));
    }

    template <typename... Args>
    void Debugf(std::string_view format, Args&&... args) const {
        LogfImpl(Level::Debug, format, MakeValues(std::forward<Args>(args)...));
    }

    template <typename... Fields>
    void Info(std::string_view msg, Fields&&... fields) const {
        LogImpl(Level::Info, msg, MakeValues(std::forward<Fields>(fields)...));
    }

    template <typename... Args>
    void Infof(std::string_view format, Args&&... args) const {
        LogfImpl(Level::Info, format, MakeValues(std::forward<Args>(args)...));
    }

    template <typename... Fields>
    void Warn(std::string_view msg, Fields&&... fields) const {
        LogImpl(Level::Warn, msg, MakeValues(std::forward<Fields>(fields)...));
    }

    template <typename... Args>
    void Warnf(std::string_view format, Args&&... args) const {
        LogfImpl(Level::Warn, format, MakeValues(std::forward<Args>(args)...));
    }

    template <typename... Fields>
    void Error(std::string_view msg, Fields&&... fields) const {
        LogImpl(Level::Error, msg, MakeValues(std::forward<Fields>(fields)...));
    }

    template <typename... Args>
    void Errorf(std::string_view format, Args&&... args) const {
        LogfImpl(Level::Error, format, MakeValues(std::forward<Args>(args)...));
    }

    // =========================================================================
    // Error Logging / 错误日志
    // =========================================================================

    /**
     * @brief Error record with a dedicated error
     * @brief 带专用错误的 Error 记录
     *
     * A nil err is written as "error":null and is not counted.
     * nil 错误写为 "error":null，且不计数。
     */
    template <typename... Fields>
    void Err(const kvlog::Error& err, std::string_view msg, Fields&&... fields) const {
        ErrImpl(err, msg, MakeValues(std::forward<Fields>(fields)...), false);
    }

    template <typename... Args>
    void Errf(const kvlog::Error& err, std::string_view format, Args&&... args) const {
        ErrImpl(err, format, MakeValues(std::forward<Args>(args)...), true);
    }

    /**
     * @brief Error record whose message is the error followed by its stack
     * @brief 消息为错误及其调用栈的 Error 记录
     *
     * A stack is captured here when err carries none.
     * 当 err 不带调用栈时在此处捕获。
     */
    template <typename... Fields>
    void ErrStack(const kvlog::Error& err, Fields&&... fields) const {
        ErrStackImpl(err, MakeValues(std::forward<Fields>(fields)...));
    }

    // =========================================================================
    // Fatal and Panic / 致命与 Panic
    // =========================================================================

    /**
     * @brief Fatal record from Sprint(args...), then std::exit(1)
     * @brief 由 Sprint(args...) 生成 Fatal 记录，然后 std::exit(1)
     */
    template <typename... Args>
    [[noreturn]] void Fatal(Args&&... args) const {
        FatalImpl(Sprint(MakeValues(std::forward<Args>(args)...)), {});
    }

    template <typename... Args>
    [[noreturn]] void Fatalf(std::string_view format, Args&&... args) const {
        FatalfImpl(format, MakeValues(std::forward<Args>(args)...));
    }

    template <typename... Args>
    [[noreturn]] void Fatalln(Args&&... args) const {
        FatalImpl(Sprintln(MakeValues(std::forward<Args>(args)...)), {});
    }

    /**
     * @brief Fatal record from Sprint(args...), then throw PanicError
     * @brief 由 Sprint(args...) 生成 Fatal 记录，然后抛出 PanicError
     */
    template <typename... Args>
    [[noreturn]] void Panic(Args&&... args) const {
        PanicImpl(Sprint(MakeValues(std::forward<Args>(args)...)), {});
    }

    template <typename... Args>
    [[noreturn]] void Panicf(std::string_view format, Args&&... args) const {
        PanicfImpl(format, MakeValues(std::forward<Args>(args)...));
    }

    template <typename... Args>
    [[noreturn]] void Panicln(Args&&... args) const {
        PanicImpl(Sprintln(MakeValues(std::forward<Args>(args)...)), {});
    }

    // =========================================================================
    // Records Without Level / 无级别记录
    // =========================================================================

    /**
     * @brief Record without level from Sprint(args...), nothing without arguments
     * @brief 由 Sprint(args...) 生成无级别记录，无参数时不记录
     */
    template <typename... Args>
    void Print(Args&&... args) const {
        if constexpr (sizeof...(Args) > 0) {
            LogImpl(Level::NoLevel, Sprint(MakeValues(std::forward<Args>(args)...)), {});
        }
    }

    /// Alias for Print / Print 的别名
    template <typename... Args>
    void Log(Args&&... args) const {
        Print(std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Printf(std::string_view format, Args&&... args) const {
        LogfImpl(Level::NoLevel, format, MakeValues(std::forward<Args>(args)...));
    }

    template <typename... Args>
    void Println(Args&&... args) const {
        LogImpl(Level::NoLevel, Sprintln(MakeValues(std::forward<Args>(args)...)), {});
    }

    /**
     * @brief Record without level whose message is the current stack
     * @brief 消息为当前调用栈的无级别记录
     */
    template <typename... Fields>
    void PrintStack(Fields&&... fields) const {
        PrintStackImpl(MakeValues(std::forward<Fields>(fields)...));
    }

    /**
     * @brief Record without level from one raw line, trailing newlines removed
     * @brief 由一行原始文本生成无级别记录，去除末尾换行
     */
    void Write(std::string_view line) const;

    // =========================================================================
    // Accessors / 访问方法
    // =========================================================================

    void Flush() const;

    const std::shared_ptr<ErrorCounter>& GetErrorCounter() const noexcept { return m_errorCounter; }

    Level GetLevel() const noexcept { return m_level; }

    bool Enabled(Level level) const noexcept { return m_backend != nullptr && ShouldLog(level, m_level); }

    bool StackTraceEnabled() const noexcept { return m_stackTrace; }

    const std::vector<std::string>& GetToIgnore() const noexcept { return m_toIgnore; }

    const FieldList& GetContext() const noexcept { return m_context; }

    /**
     * @brief Underlying record engine, null for the placeholder
     * @brief 底层记录引擎，占位日志器为空
     */
    const std::shared_ptr<Backend>& GetBackend() const noexcept { return m_backend; }

private:
    void Init(const Config& cfg, ValueList fields);

    Logger WithFieldList(ValueList fields) const;

    void LogImpl(Level level, std::string_view msg, ValueList fields,
                 const SourceLocation& loc = {}) const;

    void LogfImpl(Level level, std::string_view format, ValueList args,
                  const SourceLocation& loc = {}) const;

    void ErrImpl(const kvlog::Error& err, std::string_view msg, ValueList args,
                 bool formatted) const;

    void ErrStackImpl(const kvlog::Error& err, ValueList fields) const;

    void PrintStackImpl(ValueList fields) const;

    [[noreturn]] void FatalImpl(std::string message, ValueList fields) const;
    [[noreturn]] void FatalfImpl(std::string_view format, ValueList args) const;
    [[noreturn]] void PanicImpl(std::string message, ValueList fields) const;
    [[noreturn]] void PanicfImpl(std::string_view format, ValueList args) const;

    /**
     * @brief Write a terminal record and count a synthesized error
     * @brief 写入终止记录并计数合成的错误
     *
     * A suppressed message skips both; the caller still exits or throws.
     * 被屏蔽的消息两者都跳过；调用者仍然退出或抛出异常。
     */
    void LogTerminal(const std::string& message, ValueList fields) const;

    /**
     * @brief Shared tail of every logging call
     * @brief 所有日志调用的公共尾部
     *
     * Applies the ignore list, extracts (when scanFields) and counts the
     * error, filters by level and emits.
     * 应用忽略列表，提取（当 scanFields 为真）并计数错误，按级别过滤并输出。
     */
    void Dispatch(Level level, std::string message, ValueList fields, bool scanFields,
                  const kvlog::Error* dedicated, const SourceLocation& loc) const;

    bool IsIgnored(std::string_view message) const;

    void CountError(const kvlog::Error& err) const;

    std::shared_ptr<Backend> m_backend;             ///< Record engine / 记录引擎
    Level m_level{Level::Info};                     ///< Minimum level / 最低级别
    FieldList m_context;                            ///< Context fields / 上下文字段
    std::shared_ptr<ErrorCounter> m_errorCounter;   ///< Shared counter / 共享计数器
    std::vector<std::string> m_toIgnore;            ///< Ignore list / 忽略列表
    bool m_stackTrace{false};                       ///< Attach stacks / 附加调用栈
    bool m_inited{false};                           ///< Built from a Config / 由 Config 构建
};

}  // namespace kvlog
