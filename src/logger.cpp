/**
 * @file logger.cpp
 * @brief Logger implementation
 * @brief Logger 实现
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#include "kvlog/logger.hpp"

#include <cstdlib>
#include <optional>
#include <stdexcept>

#include <fmt/format.h>

#include "kvlog/diode_sink.hpp"

namespace kvlog {

// ==============================================================================
// Construction / 构造
// ==============================================================================

void Logger::Init(const Config& cfg, ValueList fields) {
    m_level = cfg.GetLevel().empty() ? Level::Info : ParseLevel(cfg.GetLevel());

    std::shared_ptr<Sink> sink;
    const auto& sinks = cfg.GetSinks();
    if (sinks.empty() || m_level == Level::Disabled) {
        sink = std::make_shared<NullSink>();
    } else if (sinks.size() == 1) {
        sink = sinks.front();
    } else {
        sink = std::make_shared<MultiSink>(sinks);
    }

    if (!cfg.NoDiode() && m_level != Level::Disabled && !sinks.empty()) {
        DiodeAlert alert = cfg.GetDiodeAlert();
        if (!alert) {
            alert = &Config::DefaultDiodeAlert;
        }
        sink = std::make_shared<DiodeSink>(std::move(sink), cfg.GetDiodeSize(),
                                           cfg.GetDiodePollingInterval(), cfg.UseDiodeWaiter(),
                                           std::move(alert));
    }

    m_backend = std::make_shared<Backend>(std::move(sink), cfg.GetTimeFieldFormat(), cfg.GetHook());
    m_context = BuildFields(fields);
    m_errorCounter = cfg.GetErrorCounter();
    m_toIgnore = cfg.GetToIgnore();
    m_stackTrace = cfg.StackTraceEnabled();
    m_inited = true;
}

Logger Logger::Nop() {
    Logger logger;
    logger.m_backend = std::make_shared<Backend>(std::make_shared<NullSink>(), std::string(), nullptr);
    logger.m_level = Level::Disabled;
    return logger;
}

// ==============================================================================
// Derivation / 派生
// ==============================================================================

Logger Logger::WithFieldList(ValueList fields) const {
    Logger copy = *this;
    FieldList extra = BuildFields(fields);
    copy.m_context.insert(copy.m_context.end(), std::make_move_iterator(extra.begin()),
                          std::make_move_iterator(extra.end()));
    return copy;
}

Logger Logger::WithLevel(std::string_view level) const {
    if (level.empty()) {
        return *this;
    }
    Logger copy = *this;
    copy.m_level = ParseLevel(level);
    return copy;
}

Logger Logger::WithStack(bool stackTrace) const {
    Logger copy = *this;
    copy.m_stackTrace = stackTrace;
    return copy;
}

Logger Logger::WithErrorCounter(std::shared_ptr<ErrorCounter> counter) const {
    Logger copy = *this;
    copy.m_errorCounter = std::move(counter);
    return copy;
}

Logger Logger::WithSimpleErrorCounter() const {
    return WithErrorCounter(std::make_shared<SimpleErrorCounter>());
}

Logger Logger::WithToIgnore(std::vector<std::string> toIgnore) const {
    Logger copy = *this;
    copy.m_toIgnore = std::move(toIgnore);
    return copy;
}

// ==============================================================================
// Logging Paths / 日志路径
// ==============================================================================

void Logger::LogImpl(Level level, std::string_view msg, ValueList fields,
                     const SourceLocation& loc) const {
    // A disabled record still counts its error / 被过滤的记录仍然计数其错误
    if (!Enabled(level) && !m_errorCounter) {
        return;
    }
    Dispatch(level, std::string(msg), std::move(fields), true, nullptr, loc);
}

void Logger::LogfImpl(Level level, std::string_view format, ValueList args,
                      const SourceLocation& loc) const {
    if (!Enabled(level) && !m_errorCounter) {
        return;
    }
    FormatSplit split = SplitFormatArgs(format, std::move(args));
    std::string message = RenderMessage(format, split.formatArgs);
    Dispatch(level, std::move(message), std::move(split.fieldArgs), true, nullptr, loc);
}

void Logger::ErrImpl(const kvlog::Error& err, std::string_view msg, ValueList args,
                     bool formatted) const {
    if (!Enabled(Level::Error) && (!m_errorCounter || err.IsNil())) {
        return;
    }
    if (!formatted) {
        Dispatch(Level::Error, std::string(msg), std::move(args), false, &err, SourceLocation());
        return;
    }
    FormatSplit split = SplitFormatArgs(msg, std::move(args));
    std::string message = RenderMessage(msg, split.formatArgs);
    Dispatch(Level::Error, std::move(message), std::move(split.fieldArgs), false, &err,
             SourceLocation());
}

void Logger::ErrStackImpl(const kvlog::Error& err, ValueList fields) const {
    if (!Enabled(Level::Error) && !m_errorCounter) {
        return;
    }
    std::string message;
    if (err.IsNil() || err.HasStack()) {
        message = err.Verbose();
    } else {
        message = err.Message() + "\n" + StackTrace::CaptureFromCaller().ToString();
    }
    Dispatch(Level::Error, std::move(message), std::move(fields), true, nullptr, SourceLocation());
}

void Logger::PrintStackImpl(ValueList fields) const {
    if (!Enabled(Level::NoLevel) && !m_errorCounter) {
        return;
    }
    Dispatch(Level::NoLevel, StackTrace::CaptureFromCaller().ToString(), std::move(fields), true,
             nullptr, SourceLocation());
}

void Logger::Write(std::string_view line) const {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }
    if (!Enabled(Level::NoLevel)) {
        return;
    }
    Dispatch(Level::NoLevel, std::string(line), {}, false, nullptr, SourceLocation());
}

// ==============================================================================
// Fatal and Panic / 致命与 Panic
// ==============================================================================

void Logger::LogTerminal(const std::string& message, ValueList fields) const {
    if (IsIgnored(message)) {
        return;
    }
    CountError(kvlog::Error(message));
    if (Enabled(Level::Fatal)) {
        Dispatch(Level::Fatal, message, std::move(fields), false, nullptr, SourceLocation());
    }
    Flush();
}

void Logger::FatalImpl(std::string message, ValueList fields) const {
    LogTerminal(message, std::move(fields));
    std::exit(1);
}

void Logger::FatalfImpl(std::string_view format, ValueList args) const {
    FormatSplit split = SplitFormatArgs(format, std::move(args));
    FatalImpl(RenderMessage(format, split.formatArgs), std::move(split.fieldArgs));
}

void Logger::PanicImpl(std::string message, ValueList fields) const {
    LogTerminal(message, std::move(fields));
    throw PanicError(message);
}

void Logger::PanicfImpl(std::string_view format, ValueList args) const {
    FormatSplit split = SplitFormatArgs(format, std::move(args));
    PanicImpl(RenderMessage(format, split.formatArgs), std::move(split.fieldArgs));
}

// ==============================================================================
// Dispatch / 分发
// ==============================================================================

bool Logger::IsIgnored(std::string_view message) const {
    for (const auto& ignore : m_toIgnore) {
        if (message.find(ignore) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

void Logger::CountError(const kvlog::Error& err) const {
    if (m_errorCounter && !err.IsNil()) {
        m_errorCounter->Inc(err);
    }
}

void Logger::Dispatch(Level level, std::string message, ValueList fields, bool scanFields,
                      const kvlog::Error* dedicated, const SourceLocation& loc) const {
    if (IsIgnored(message)) {
        return;
    }

    std::optional<kvlog::Error> found;
    const kvlog::Error* attached = dedicated;
    if (scanFields) {
        found = ExtractError(fields);
        if (found) {
            attached = &*found;
        }
    }

    if (attached != nullptr) {
        CountError(*attached);
    }

    if (!Enabled(level)) {
        return;
    }

    Event event;
    event.level = level;
    event.fields = m_context;
    FieldList callFields = BuildFields(fields);
    event.fields.insert(event.fields.end(), std::make_move_iterator(callFields.begin()),
                        std::make_move_iterator(callFields.end()));

    if (attached != nullptr) {
        event.hasError = true;
        event.error = *attached;
        if (m_stackTrace && !attached->IsNil()) {
            event.stack = attached->HasStack() ? attached->Stack() : StackTrace::CaptureFromCaller();
        }
    }

    if (loc.IsValid()) {
        event.caller = fmt::format("{}:{}", loc.file, loc.line);
    }

    event.message = std::move(message);
    m_backend->Emit(event);
}

void Logger::Flush() const {
    if (m_backend) {
        m_backend->Flush();
    }
}

}  // namespace kvlog
