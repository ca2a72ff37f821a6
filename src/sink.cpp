/**
 * @file sink.cpp
 * @brief Record output sinks implementation
 * @brief 日志记录输出目标实现
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#include "kvlog/sink.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace kvlog {

namespace detail {

namespace {

thread_local bool t_inSinkWrite = false;

}  // namespace

bool InSinkWrite() noexcept {
    return t_inSinkWrite;
}

SinkWriteScope::SinkWriteScope() noexcept : m_previous(t_inSinkWrite) {
    t_inSinkWrite = true;
}

SinkWriteScope::~SinkWriteScope() {
    t_inSinkWrite = m_previous;
}

}  // namespace detail

// ==============================================================================
// Sink Implementation / Sink 实现
// ==============================================================================

void Sink::Log(const Event& event) {
    if (m_format) {
        Write(m_format->FormatEvent(event));
        return;
    }
    JsonFormat json;
    Write(json.FormatEvent(event));
}

// ==============================================================================
// StreamSink Implementation / StreamSink 实现
// ==============================================================================

void StreamSink::Write(const std::string& line) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stream << line << '\n';
    if (m_stream.fail()) {
        m_hasError = true;
        m_lastError = "Write failed";
        m_stream.clear();
    }
}

void StreamSink::Flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stream.flush();
}

bool StreamSink::HasError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_hasError;
}

std::string StreamSink::GetLastError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastError;
}

// ==============================================================================
// ConsoleSink Implementation / ConsoleSink 实现
// ==============================================================================

void ConsoleSink::Write(const std::string& line) {
    std::lock_guard<std::mutex> lock(m_mutex);
    FILE* out = (m_stream == Stream::StdOut) ? stdout : stderr;
    if (std::fputs(line.c_str(), out) == EOF || std::fputc('\n', out) == EOF) {
        m_hasError = true;
        m_lastError = std::strerror(errno);
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    FILE* out = (m_stream == Stream::StdOut) ? stdout : stderr;
    std::fflush(out);
}

bool ConsoleSink::HasError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_hasError;
}

std::string ConsoleSink::GetLastError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastError;
}

// ==============================================================================
// FileSink Implementation / FileSink 实现
// ==============================================================================

FileSink::FileSink(const std::string& filename) : m_filename(filename) {
    m_file.open(m_filename, std::ios::app);
    if (!m_file.is_open()) {
        m_hasError = true;
        m_lastError = "Failed to open file: " + m_filename;
    }
}

FileSink::~FileSink() {
    Close();
}

void FileSink::Write(const std::string& line) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_file.is_open()) {
        m_hasError = true;
        m_lastError = "File not open";
        return;
    }

    m_file << line << '\n';

    if (m_file.fail()) {
        m_hasError = true;
        m_lastError = "Write failed";
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) {
        m_file.flush();
    }
}

void FileSink::Close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) {
        m_file.close();
    }
}

bool FileSink::HasError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_hasError;
}

std::string FileSink::GetLastError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastError;
}

// ==============================================================================
// MultiSink Implementation / MultiSink 实现
// ==============================================================================

void MultiSink::Log(const Event& event) {
    for (const auto& sink : m_sinks) {
        sink->Log(event);
    }
}

void MultiSink::Write(const std::string& line) {
    for (const auto& sink : m_sinks) {
        sink->Write(line);
    }
}

void MultiSink::Flush() {
    for (const auto& sink : m_sinks) {
        sink->Flush();
    }
}

void MultiSink::Close() {
    for (const auto& sink : m_sinks) {
        sink->Close();
    }
}

bool MultiSink::HasError() const {
    for (const auto& sink : m_sinks) {
        if (sink->HasError()) {
            return true;
        }
    }
    return false;
}

std::string MultiSink::GetLastError() const {
    for (const auto& sink : m_sinks) {
        if (sink->HasError()) {
            return sink->GetLastError();
        }
    }
    return {};
}

}  // namespace kvlog
