/**
 * @file error.hpp
 * @brief Error values, error counters and the panic exception
 * @brief 错误值、错误计数器与 panic 异常
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

#include "kvlog/stack_trace.hpp"

namespace kvlog {

// ==============================================================================
// Error / 错误值
// ==============================================================================

/**
 * @brief Error value attached to log records
 * @brief 附加到日志记录的错误值
 *
 * A default constructed Error is nil. Copies share the same immutable
 * payload, so passing an Error around is cheap.
 *
 * 默认构造的 Error 为 nil。拷贝共享同一份不可变数据，传递开销很小。
 *
 * @code
 * kvlog::Error err("connection refused");
 * kvlog::Error traced = kvlog::Error::WithStack("disk full");
 * kvlog::Error wrapped = kvlog::Error::Wrap(traced, "cannot save");
 * @endcode
 */
class Error {
public:
    /**
     * @brief Construct a nil error
     * @brief 构造 nil 错误
     */
    Error() = default;

    /**
     * @brief Construct an error with a message and no stack
     * @brief 使用消息构造不带栈的错误
     */
    explicit Error(std::string message);

    /**
     * @brief Construct an error carrying the stack of its creation site
     * @brief 构造携带创建位置调用栈的错误
     */
    static Error WithStack(std::string message);

    /**
     * @brief Prefix an error with context, keeping its stack
     * @brief 为错误添加上下文前缀，保留其调用栈
     *
     * The message becomes "<message>: <cause>". A nil cause yields a nil error.
     * 消息变为 "<message>: <cause>"。nil 的 cause 返回 nil 错误。
     */
    static Error Wrap(const Error& cause, const std::string& message);

    /**
     * @brief Convert an exception into an error value
     * @brief 将异常转换为错误值
     */
    static Error FromException(const std::exception& e);

    bool IsNil() const noexcept { return m_detail == nullptr; }

    explicit operator bool() const noexcept { return m_detail != nullptr; }

    /**
     * @brief Error message, empty for nil
     * @brief 错误消息，nil 时为空
     */
    const std::string& Message() const noexcept;

    bool HasStack() const noexcept { return m_detail != nullptr && !m_detail->stack.Empty(); }

    /**
     * @brief Stack captured at creation, empty if none
     * @brief 创建时捕获的栈，没有则为空
     */
    const StackTrace& Stack() const noexcept;

    /**
     * @brief Message followed by the stack, one frame per line
     * @brief 消息后接调用栈，每行一帧
     */
    std::string Verbose() const;

    friend bool operator==(const Error& lhs, const Error& rhs) noexcept {
        return lhs.m_detail == rhs.m_detail;
    }
    friend bool operator!=(const Error& lhs, const Error& rhs) noexcept { return !(lhs == rhs); }

private:
    struct Detail {
        std::string message;
        StackTrace stack;
    };

    explicit Error(std::shared_ptr<const Detail> detail) : m_detail(std::move(detail)) {}

    std::shared_ptr<const Detail> m_detail;
};

// ==============================================================================
// ErrorCounter / 错误计数器
// ==============================================================================

/**
 * @brief Counts logged errors
 * @brief 统计已记录的错误
 *
 * Implementations must be safe to call from many threads at once.
 * 实现必须支持多线程并发调用。
 */
class ErrorCounter {
public:
    virtual ~ErrorCounter() = default;

    /**
     * @brief Called once for every logged error
     * @brief 每记录一个错误调用一次
     */
    virtual void Inc(const Error& err) = 0;
};

/**
 * @brief ErrorCounter backed by an atomic integer
 * @brief 基于原子整数的 ErrorCounter
 */
class SimpleErrorCounter : public ErrorCounter {
public:
    void Inc(const Error&) override { m_count.fetch_add(1, std::memory_order_relaxed); }

    int64_t Count() const noexcept { return m_count.load(std::memory_order_relaxed); }

private:
    std::atomic<int64_t> m_count{0};
};

// ==============================================================================
// PanicError / Panic 异常
// ==============================================================================

/**
 * @brief Thrown by the Panic family after the record is written
 * @brief Panic 系列在写入记录后抛出
 *
 * Catching it prevents the crash; left alone it terminates the program.
 * 捕获它可阻止崩溃；不处理则程序终止。
 */
class PanicError : public std::runtime_error {
public:
    explicit PanicError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace kvlog
