/**
 * @file global.cpp
 * @brief Process-wide default logger implementation
 * @brief 进程级默认日志器实现
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#include "kvlog/global.hpp"

#include <iostream>

namespace kvlog {
namespace global {

namespace {

struct LegacyState {
    std::unique_ptr<LegacyLogBuffer> buffer;  ///< Installed mirror / 已安装的镜像
    std::streambuf* original{nullptr};        ///< std::clog buffer before the first mirror / 首次镜像前的缓冲区
    std::mutex mutex;

    // std::clog outlives this object and is flushed at exit
    // std::clog 的生命周期长于本对象，并在退出时被刷新
    ~LegacyState() {
        std::lock_guard<std::mutex> lock(mutex);
        if (buffer) {
            std::clog.rdbuf(original);
        }
    }
};

LegacyState& GetLegacyState() {
    static LegacyState state;
    return state;
}

}  // namespace

// ==============================================================================
// LegacyLogBuffer Implementation / LegacyLogBuffer 实现
// ==============================================================================

LegacyLogBuffer::~LegacyLogBuffer() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_line.empty()) {
        EmitLine();
    }
}

LegacyLogBuffer::int_type LegacyLogBuffer::overflow(int_type ch) {
    if (traits_type::eq_int_type(ch, traits_type::eof())) {
        return traits_type::not_eof(ch);
    }
    const char c = traits_type::to_char_type(ch);
    Append(&c, 1);
    return ch;
}

std::streamsize LegacyLogBuffer::xsputn(const char* s, std::streamsize count) {
    if (count > 0) {
        Append(s, static_cast<size_t>(count));
    }
    return count;
}

int LegacyLogBuffer::sync() {
    if (kvlog::detail::InSinkWrite() && m_passthrough != nullptr) {
        return m_passthrough->pubsync();
    }
    // Partial lines wait for their newline / 不完整的行等待换行符
    return 0;
}

void LegacyLogBuffer::Append(const char* s, size_t count) {
    if (kvlog::detail::InSinkWrite()) {
        if (m_passthrough != nullptr) {
            m_passthrough->sputn(s, static_cast<std::streamsize>(count));
        }
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    for (size_t i = 0; i < count; ++i) {
        if (s[i] == '\n') {
            EmitLine();
        } else {
            m_line += s[i];
        }
    }
}

void LegacyLogBuffer::EmitLine() {
    m_logger.Write(m_line);
    m_line.clear();
}

namespace detail {

void InstallLegacyBuffer(Logger logger) {
    auto& state = GetLegacyState();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (!state.buffer) {
        state.original = std::clog.rdbuf();
    }
    auto buffer = std::make_unique<LegacyLogBuffer>(std::move(logger), state.original);
    std::clog.rdbuf(buffer.get());
    state.buffer = std::move(buffer);
}

}  // namespace detail

void RestoreLegacySink() {
    auto& state = GetLegacyState();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (!state.buffer) {
        return;
    }
    std::clog.rdbuf(state.original);
    state.buffer.reset();
    state.original = nullptr;
}

// ==============================================================================
// Default Logger Implementation / 默认日志器实现
// ==============================================================================

namespace detail {

std::shared_ptr<const Logger>& GetDefaultLoggerPtr() {
    static std::shared_ptr<const Logger> defaultLogger = std::make_shared<const Logger>();
    return defaultLogger;
}

std::mutex& GetDefaultLoggerMutex() {
    static std::mutex mutex;
    return mutex;
}

void Install(std::shared_ptr<const Logger> logger) {
    {
        std::lock_guard<std::mutex> lock(GetDefaultLoggerMutex());
        GetDefaultLoggerPtr().swap(logger);
    }
    // logger now holds the previous one / logger 现在持有之前的日志器
    SetLoggerForDefault(*Default());
}

}  // namespace detail

std::shared_ptr<const Logger> Default() {
    std::lock_guard<std::mutex> lock(detail::GetDefaultLoggerMutex());
    return detail::GetDefaultLoggerPtr();
}

void Shutdown() {
    RestoreLegacySink();

    std::shared_ptr<const Logger> previous = std::make_shared<const Logger>();
    {
        std::lock_guard<std::mutex> lock(detail::GetDefaultLoggerMutex());
        detail::GetDefaultLoggerPtr().swap(previous);
    }
    previous->Flush();
}

// ==============================================================================
// Global Convenience Functions / 全局便捷函数
// ==============================================================================

Logger WithLevel(std::string_view level) {
    return Default()->WithLevel(level);
}

Logger WithErrorCounter(std::shared_ptr<ErrorCounter> counter) {
    return Default()->WithErrorCounter(std::move(counter));
}

Logger WithSimpleErrorCounter() {
    return Default()->WithSimpleErrorCounter();
}

std::shared_ptr<ErrorCounter> GetErrorCounter() {
    return Default()->GetErrorCounter();
}

void Flush() {
    Default()->Flush();
}

void Write(std::string_view line) {
    Default()->Write(line);
}

}  // namespace global
}  // namespace kvlog
