/**
 * @file macros.hpp
 * @brief Logging macros for kvlog
 * @brief kvlog 日志宏定义
 *
 * The macros log through the process-wide default logger. KVLOG_TRACE and
 * KVLOG_TRACEF attach "file:line" of the call site as the caller field.
 * 这些宏通过进程级默认日志器记录日志。KVLOG_TRACE 与 KVLOG_TRACEF 将调用点的
 * "file:line" 作为 caller 字段附加。
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#pragma once

#include "kvlog/global.hpp"

// ==============================================================================
// Basic Logging Macros / 基本日志宏
// ==============================================================================

/**
 * @brief Log at TRACE level with the call site
 * @brief 以 TRACE 级别记录日志并附带调用点
 */
#ifndef KVLOG_DISABLE_TRACE
#define KVLOG_TRACE(...) \
    do { \
        ::kvlog::global::Default()->TraceAt(KVLOG_CURRENT_LOCATION, __VA_ARGS__); \
    } while (0)
#define KVLOG_TRACEF(...) \
    do { \
        ::kvlog::global::Default()->TracefAt(KVLOG_CURRENT_LOCATION, __VA_ARGS__); \
    } while (0)
#else
#define KVLOG_TRACE(...) ((void)0)
#define KVLOG_TRACEF(...) ((void)0)
#endif

/**
 * @brief Log at DEBUG level
 * @brief 以 DEBUG 级别记录日志
 */
#ifndef KVLOG_DISABLE_DEBUG
#define KVLOG_DEBUG(...) \
    do { \
        ::kvlog::global::Default()->Debug(__VA_ARGS__); \
    } while (0)
#define KVLOG_DEBUGF(...) \
    do { \
        ::kvlog::global::Default()->Debugf(__VA_ARGS__); \
    } while (0)
#else
#define KVLOG_DEBUG(...) ((void)0)
#define KVLOG_DEBUGF(...) ((void)0)
#endif

/**
 * @brief Log at INFO level
 * @brief 以 INFO 级别记录日志
 */
#define KVLOG_INFO(...) \
    do { \
        ::kvlog::global::Default()->Info(__VA_ARGS__); \
    } while (0)
#define KVLOG_INFOF(...) \
    do { \
        ::kvlog::global::Default()->Infof(__VA_ARGS__); \
    } while (0)

/**
 * @brief Log at WARN level
 * @brief 以 WARN 级别记录日志
 */
#define KVLOG_WARN(...) \
    do { \
        ::kvlog::global::Default()->Warn(__VA_ARGS__); \
    } while (0)
#define KVLOG_WARNF(...) \
    do { \
        ::kvlog::global::Default()->Warnf(__VA_ARGS__); \
    } while (0)

/**
 * @brief Log at ERROR level
 * @brief 以 ERROR 级别记录日志
 */
#define KVLOG_ERROR(...) \
    do { \
        ::kvlog::global::Default()->Error(__VA_ARGS__); \
    } while (0)
#define KVLOG_ERRORF(...) \
    do { \
        ::kvlog::global::Default()->Errorf(__VA_ARGS__); \
    } while (0)

/**
 * @brief Log a dedicated error at ERROR level
 * @brief 以 ERROR 级别记录专用错误
 */
#define KVLOG_ERR(err, ...) \
    do { \
        ::kvlog::global::Default()->Err((err), __VA_ARGS__); \
    } while (0)
