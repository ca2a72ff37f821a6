/**
 * @file error.cpp
 * @brief Error value implementation
 * @brief 错误值实现
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#include "kvlog/error.hpp"

namespace kvlog {

namespace {

const std::string kEmptyMessage;
const StackTrace kEmptyStack;

}  // namespace

Error::Error(std::string message)
    : m_detail(std::make_shared<Detail>(Detail{std::move(message), StackTrace{}})) {}

Error Error::WithStack(std::string message) {
    // Skip WithStack itself / 跳过 WithStack 本身
    return Error(std::make_shared<Detail>(Detail{std::move(message), StackTrace::Capture(1)}));
}

Error Error::Wrap(const Error& cause, const std::string& message) {
    if (cause.IsNil()) {
        return Error();
    }
    return Error(std::make_shared<Detail>(
        Detail{message + ": " + cause.Message(), cause.Stack()}));
}

Error Error::FromException(const std::exception& e) {
    return Error(std::string(e.what()));
}

const std::string& Error::Message() const noexcept {
    return m_detail ? m_detail->message : kEmptyMessage;
}

const StackTrace& Error::Stack() const noexcept {
    return m_detail ? m_detail->stack : kEmptyStack;
}

std::string Error::Verbose() const {
    if (IsNil()) {
        return "<nil>";
    }
    if (!HasStack()) {
        return m_detail->message;
    }
    return m_detail->message + "\n" + m_detail->stack.ToString();
}

}  // namespace kvlog
