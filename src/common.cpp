/**
 * @file common.cpp
 * @brief Level parsing
 * @brief 日志级别解析
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#include "kvlog/common.hpp"

#include <stdexcept>
#include <string>

namespace kvlog {

std::optional<Level> TryParseLevel(std::string_view name) noexcept {
    if (name == kLevelTrace) {
        return Level::Trace;
    }
    if (name == kLevelDebug) {
        return Level::Debug;
    }
    if (name == kLevelInfo) {
        return Level::Info;
    }
    if (name == kLevelWarn) {
        return Level::Warn;
    }
    if (name == kLevelError) {
        return Level::Error;
    }
    if (name == kLevelFatal) {
        return Level::Fatal;
    }
    if (name == kLevelDisabled) {
        return Level::Disabled;
    }
    return std::nullopt;
}

Level ParseLevel(std::string_view name) {
    auto level = TryParseLevel(name);
    if (!level) {
        throw std::invalid_argument("cannot parse level=" + std::string(name));
    }
    return *level;
}

}  // namespace kvlog
