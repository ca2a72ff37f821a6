/**
 * @file stack_trace.cpp
 * @brief Call stack capture implementation (glibc backtrace + dladdr)
 * @brief 调用栈捕获实现（glibc backtrace + dladdr）
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#include "kvlog/stack_trace.hpp"

#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>

#include <array>
#include <cstdlib>
#include <iterator>
#include <string_view>

#include <fmt/format.h>

namespace kvlog {

namespace {

std::string Demangle(const char* symbol) {
    if (symbol == nullptr) {
        return {};
    }
    int status = 0;
    char* demangled = abi::__cxa_demangle(symbol, nullptr, nullptr, &status);
    if (status != 0 || demangled == nullptr) {
        return symbol;
    }
    std::string result(demangled);
    std::free(demangled);
    return result;
}

StackFrame Resolve(void* address) {
    StackFrame frame;
    frame.address = reinterpret_cast<uintptr_t>(address);

    Dl_info info{};
    if (dladdr(address, &info) != 0) {
        frame.function = Demangle(info.dli_sname);
        if (info.dli_fname != nullptr) {
            frame.source = info.dli_fname;
        }
    }
    return frame;
}

// Frames belonging to the logging call chain itself
// 属于日志调用链本身的栈帧
bool IsLoggingFrame(std::string_view function) {
    return function.find("kvlog::Logger::") != std::string_view::npos ||
           function.find("kvlog::StackTrace::") != std::string_view::npos ||
           function.find("kvlog::global::") != std::string_view::npos;
}

}  // namespace

__attribute__((noinline)) StackTrace StackTrace::Capture(size_t skip) {
    std::array<void*, kMaxDepth + 8> addresses{};
    const int depth = backtrace(addresses.data(), static_cast<int>(addresses.size()));

    StackTrace trace;
    // Frame 0 is Capture itself / 第 0 帧是 Capture 本身
    for (size_t i = 1 + skip; i < static_cast<size_t>(depth) && trace.m_frames.size() < kMaxDepth;
         ++i) {
        trace.m_frames.push_back(Resolve(addresses[i]));
    }
    return trace;
}

__attribute__((noinline)) StackTrace StackTrace::CaptureFromCaller() {
    StackTrace trace = Capture(1);
    size_t first = 0;
    while (first < trace.m_frames.size() && IsLoggingFrame(trace.m_frames[first].function)) {
        ++first;
    }
    trace.m_frames.erase(trace.m_frames.begin(),
                         trace.m_frames.begin() + static_cast<std::ptrdiff_t>(first));
    return trace;
}

std::string StackTrace::ToString() const {
    std::string result;
    for (size_t i = 0; i < m_frames.size(); ++i) {
        const auto& frame = m_frames[i];
        fmt::format_to(std::back_inserter(result), "#{} {:#x} {} ({})\n", i, frame.address,
                       frame.function.empty() ? "??" : frame.function, frame.source);
    }
    return result;
}

}  // namespace kvlog
