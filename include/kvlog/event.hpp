/**
 * @file event.hpp
 * @brief Log record passed from a Logger to its sinks
 * @brief 从 Logger 传递到 Sink 的日志记录
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#pragma once

#include <string>
#include <string_view>

#include "kvlog/common.hpp"
#include "kvlog/error.hpp"
#include "kvlog/stack_trace.hpp"
#include "kvlog/value.hpp"

namespace kvlog {

/**
 * @brief One log record
 * @brief 一条日志记录
 *
 * Attribute order on output / 输出时的属性顺序:
 * level, time, fields, error, stack, caller, message
 *
 * An Event is a plain value: it is copied into the diode buffer and
 * formatted later on the diode thread.
 * Event 是普通值类型：它被拷贝进 diode 缓冲区，稍后在 diode 线程中格式化。
 */
struct Event {
    Level level{Level::NoLevel};  ///< NoLevel omits the level key / NoLevel 不输出 level 键
    Value time;                   ///< Rendered timestamp, null omits it / 已渲染的时间戳，null 则省略
    FieldList fields;             ///< Context fields then call fields / 上下文字段后接调用字段
    bool hasError{false};         ///< Emit the error key / 输出 error 键
    Error error;                  ///< May be nil ("error":null) / 可以为 nil
    StackTrace stack;             ///< Empty omits the stack key / 为空则省略 stack 键
    std::string caller;           ///< Empty omits the caller key / 为空则省略 caller 键
    std::string message;
};

/**
 * @brief Callback run on every emitted record before it is formatted
 * @brief 在每条记录格式化之前运行的回调
 *
 * A hook may add fields to the event. It runs on the logging thread.
 * 钩子可以向事件添加字段。它在日志调用线程上运行。
 */
class Hook {
public:
    virtual ~Hook() = default;

    virtual void Run(Event& event, Level level, std::string_view message) = 0;
};

}  // namespace kvlog
