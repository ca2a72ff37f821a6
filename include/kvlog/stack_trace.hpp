/**
 * @file stack_trace.hpp
 * @brief Call stack capture for error records
 * @brief 用于错误记录的调用栈捕获
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace kvlog {

/**
 * @brief One resolved stack frame
 * @brief 一个已解析的栈帧
 */
struct StackFrame {
    std::string function;  ///< Demangled function name, may be empty / 反修饰后的函数名，可能为空
    std::string source;    ///< Binary or shared object / 可执行文件或共享库
    uintptr_t address{0};  ///< Return address / 返回地址
};

/**
 * @brief Captured call stack
 * @brief 捕获的调用栈
 *
 * Frames are ordered from the innermost call outwards. Symbol names are
 * resolved with the dynamic symbol table, so static functions show up with
 * an empty name unless the binary is linked with -rdynamic.
 *
 * 栈帧从最内层调用向外排列。符号名通过动态符号表解析，
 * 因此除非使用 -rdynamic 链接，静态函数的名称为空。
 */
class StackTrace {
public:
    /// Maximum number of frames kept / 保留的最大栈帧数
    static constexpr size_t kMaxDepth = 64;

    StackTrace() = default;

    /**
     * @brief Capture the stack of the calling thread
     * @brief 捕获调用线程的栈
     *
     * @param skip Frames to drop above the caller of Capture / 在 Capture 调用者之上跳过的帧数
     */
    static StackTrace Capture(size_t skip = 0);

    /**
     * @brief Capture the stack starting at the first frame outside the logging call chain
     * @brief 从日志调用链之外的第一帧开始捕获调用栈
     */
    static StackTrace CaptureFromCaller();

    bool Empty() const noexcept { return m_frames.empty(); }

    const std::vector<StackFrame>& Frames() const noexcept { return m_frames; }

    /**
     * @brief Multi-line human readable form
     * @brief 多行可读形式
     */
    std::string ToString() const;

private:
    std::vector<StackFrame> m_frames;
};

}  // namespace kvlog
