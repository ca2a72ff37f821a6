/**
 * @file example_basic.cpp
 * @brief Basic usage example for kvlog
 * @brief kvlog 基本用法示例
 *
 * Features demonstrated / 演示的功能:
 * - Logger construction from a Config / 由 Config 构造日志器
 * - Fields, formatted messages and embedded errors / 字段、格式化消息与内嵌错误
 * - Ignore list and error counter / 忽略列表与错误计数器
 * - Process-wide default logger and std::clog mirroring / 进程级默认日志器与 std::clog 镜像
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#include <iostream>
#include <memory>

#include <kvlog/kvlog.hpp>

// ==============================================================================
// Example 1: Standalone Logger
// 示例 1: 独立日志器
// ==============================================================================

void StandaloneLoggerExample() {
    std::cout << "\n=== Example 1: Standalone Logger / 独立日志器 ===" << std::endl;

    auto counter = std::make_shared<kvlog::SimpleErrorCounter>();
    kvlog::Logger logger(kvlog::C()
                             .WithConsoleJSON()
                             .WithLevel(kvlog::kLevelDebug)
                             .WithToIgnore({"heartbeat"})
                             .WithErrorCounter(counter),
                         "service", "example");

    logger.Debug("user created", "id", 42, "name", "bob");
    logger.Infof("value %d", 42, "k", "v");
    logger.Warn("slow request", "ms", 812.5, "error", kvlog::Error("deadline exceeded"));
    logger.Err(kvlog::Error("disk full"), "cannot save", "file", "report.pdf");
    logger.Info("heartbeat");  // suppressed

    auto request = logger.With("request_id", "r-17");
    request.Info("handled");

    logger.Flush();
    std::cout << "errors counted: " << counter->Count() << std::endl;
}

// ==============================================================================
// Example 2: Console Line Output
// 示例 2: 控制台行输出
// ==============================================================================

void ConsoleExample() {
    std::cout << "\n=== Example 2: Console Output / 控制台输出 ===" << std::endl;

    kvlog::Logger logger(kvlog::C().WithConsole().WithNoDiode().WithLevel(kvlog::kLevelTrace));
    logger.Trace("entering");
    logger.Info("listening", "port", 8080);
    logger.Err(kvlog::Error::WithStack("bind failed"), "cannot start");
}

// ==============================================================================
// Example 3: Default Logger
// 示例 3: 默认日志器
// ==============================================================================

void DefaultLoggerExample() {
    std::cout << "\n=== Example 3: Default Logger / 默认日志器 ===" << std::endl;

    kvlog::global::Init(kvlog::C().WithConsoleJSON().WithDiodeWaiter(), "app", "example");

    kvlog::global::Info("started");
    KVLOG_TRACE("not shown at info level");
    KVLOG_INFOF("%d workers", 4);
    std::clog << "line from a legacy component" << std::endl;

    kvlog::global::Update(kvlog::C().WithConsoleJSON().WithLevel(kvlog::kLevelTrace));
    KVLOG_TRACE("shown after update");

    try {
        kvlog::global::Panic("unrecoverable state");
    } catch (const kvlog::PanicError& e) {
        std::cout << "recovered from panic: " << e.what() << std::endl;
    }

    kvlog::global::Shutdown();
}

int main() {
    StandaloneLoggerExample();
    ConsoleExample();
    DefaultLoggerExample();
    return 0;
}
