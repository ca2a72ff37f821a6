/**
 * @file backend.cpp
 * @brief Backend implementation
 * @brief Backend 实现
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#include "kvlog/backend.hpp"

#include <chrono>

#include "kvlog/format.hpp"

namespace kvlog {

Backend::Backend(std::shared_ptr<Sink> sink, std::string timeFormat, std::shared_ptr<Hook> hook)
    : m_sink(std::move(sink)), m_timeFormat(std::move(timeFormat)), m_hook(std::move(hook)) {
    if (!m_sink) {
        m_sink = std::make_shared<NullSink>();
    }
    if (m_timeFormat.empty()) {
        m_timeFormat = std::string(kTimeFormatRFC3339);
    }
}

Backend::~Backend() {
    detail::SinkWriteScope scope;
    m_sink->Flush();
}

void Backend::Emit(Event& event) const {
    event.time = Format::FormatTime(std::chrono::system_clock::now(), m_timeFormat);
    detail::SinkWriteScope scope;
    if (m_hook) {
        const std::string message = event.message;
        m_hook->Run(event, event.level, message);
    }
    m_sink->Log(event);
}

void Backend::Flush() const {
    detail::SinkWriteScope scope;
    m_sink->Flush();
}

}  // namespace kvlog
