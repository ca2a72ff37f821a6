/**
 * @file kvlog.hpp
 * @brief Main header for kvlog
 * @brief kvlog 主头文件
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#pragma once

#include "kvlog/backend.hpp"
#include "kvlog/classifier.hpp"
#include "kvlog/common.hpp"
#include "kvlog/config.hpp"
#include "kvlog/diode_sink.hpp"
#include "kvlog/error.hpp"
#include "kvlog/event.hpp"
#include "kvlog/format.hpp"
#include "kvlog/global.hpp"
#include "kvlog/logger.hpp"
#include "kvlog/macros.hpp"
#include "kvlog/sink.hpp"
#include "kvlog/stack_trace.hpp"
#include "kvlog/value.hpp"

/// Library version / 库版本
#define KVLOG_VERSION_MAJOR 0
#define KVLOG_VERSION_MINOR 1
#define KVLOG_VERSION_PATCH 0
