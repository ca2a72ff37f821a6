/**
 * @file config.cpp
 * @brief Logger configuration builder implementation
 * @brief Logger 配置构建器实现
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#include "kvlog/config.hpp"

#include <cstdio>

#include <fmt/format.h>

#include "kvlog/format.hpp"

namespace kvlog {

Config::Config(std::vector<std::shared_ptr<Sink>> sinks) : m_sinks(std::move(sinks)) {}

Config Config::WithSink(std::shared_ptr<Sink> sink) const {
    Config c = *this;
    c.m_sinks.push_back(std::move(sink));
    return c;
}

Config Config::WithConsole() const {
    auto sink = std::make_shared<ConsoleSink>(ConsoleSink::Stream::StdErr);
    sink->SetFormat(std::make_shared<ConsoleFormat>());
    return WithSink(std::move(sink));
}

Config Config::WithConsoleJSON() const {
    return WithSink(std::make_shared<ConsoleSink>(ConsoleSink::Stream::StdErr));
}

Config Config::WithLevel(std::string_view level) const {
    Config c = *this;
    c.m_level = std::string(level);
    return c;
}

Config Config::WithHook(std::shared_ptr<Hook> hook) const {
    Config c = *this;
    c.m_hook = std::move(hook);
    return c;
}

Config Config::WithToIgnore(std::vector<std::string> toIgnore) const {
    Config c = *this;
    c.m_toIgnore = std::move(toIgnore);
    return c;
}

Config Config::WithTimeFieldFormat(std::string_view format) const {
    Config c = *this;
    c.m_timeFieldFormat = std::string(format);
    return c;
}

Config Config::WithDiodeSize(size_t size) const {
    Config c = *this;
    c.m_diodeSize = size;
    return c;
}

Config Config::WithDiodePollingInterval(std::chrono::milliseconds interval) const {
    Config c = *this;
    c.m_diodePollingInterval = interval;
    return c;
}

Config Config::WithDiodeAlert(DiodeAlert alert) const {
    Config c = *this;
    c.m_diodeAlert = std::move(alert);
    return c;
}

Config Config::WithNoDiode() const {
    Config c = *this;
    c.m_noDiode = true;
    return c;
}

Config Config::WithDiodeWaiter() const {
    Config c = *this;
    c.m_useDiodeWaiter = true;
    return c;
}

Config Config::WithStackTrace() const {
    Config c = *this;
    c.m_stackTrace = true;
    return c;
}

Config Config::WithErrorCounter(std::shared_ptr<ErrorCounter> counter) const {
    Config c = *this;
    c.m_errorCounter = std::move(counter);
    return c;
}

Config Config::WithSimpleErrorCounter() const {
    return WithErrorCounter(std::make_shared<SimpleErrorCounter>());
}

void Config::DefaultDiodeAlert(uint64_t dropped) {
    fmt::print(stderr, "WRN: logger dropped {} messages\n", dropped);
}

}  // namespace kvlog
