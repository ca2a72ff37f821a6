/**
 * @file config.hpp
 * @brief Logger configuration builder
 * @brief Logger 配置构建器
 *
 * Every With* method is const and returns a modified copy, so a Config
 * handed to one Logger can never be altered through another handle.
 *
 * 每个 With* 方法都是 const 的并返回修改后的副本，因此交给某个 Logger 的
 * Config 不会被其他持有者修改。
 *
 * @code
 * auto cfg = kvlog::C(fileSink)
 *                .WithConsole()
 *                .WithLevel(kvlog::kLevelDebug)
 *                .WithToIgnore({"healthcheck"})
 *                .WithSimpleErrorCounter();
 * kvlog::Logger lg(cfg, "service", "api");
 * @endcode
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "kvlog/common.hpp"
#include "kvlog/diode_sink.hpp"
#include "kvlog/error.hpp"
#include "kvlog/event.hpp"
#include "kvlog/sink.hpp"

namespace kvlog {

/**
 * @brief Logger configuration
 * @brief Logger 配置
 */
class Config {
public:
    /**
     * @brief Configuration without sinks (records are discarded)
     * @brief 不带 Sink 的配置（记录被丢弃）
     */
    Config() = default;

    /**
     * @brief Configuration writing to the given sinks, in order
     * @brief 按顺序写入给定 Sink 的配置
     */
    explicit Config(std::vector<std::shared_ptr<Sink>> sinks);

    // ==========================================================================
    // Builders / 构建方法
    // ==========================================================================

    /// Append a sink / 追加一个 Sink
    Config WithSink(std::shared_ptr<Sink> sink) const;

    /// Append a plain console sink on stderr / 追加 stderr 上的纯文本控制台 Sink
    Config WithConsole() const;

    /// Append a JSON sink on stderr / 追加 stderr 上的 JSON Sink
    Config WithConsoleJSON() const;

    /// Minimum level by name, empty means info / 按名称设置最低级别，空表示 info
    Config WithLevel(std::string_view level) const;

    Config WithHook(std::shared_ptr<Hook> hook) const;

    /// Replace the ignore list / 替换忽略列表
    Config WithToIgnore(std::vector<std::string> toIgnore) const;

    /**
     * @brief Time field format
     * @brief 时间字段格式
     *
     * One of the kTimeFormat* constants or a strftime pattern.
     * kTimeFormat* 常量之一或 strftime 模式。
     */
    Config WithTimeFieldFormat(std::string_view format) const;

    Config WithDiodeSize(size_t size) const;

    Config WithDiodePollingInterval(std::chrono::milliseconds interval) const;

    Config WithDiodeAlert(DiodeAlert alert) const;

    /// Write synchronously, without the diode buffer / 同步写入，不使用 diode 缓冲
    Config WithNoDiode() const;

    /// Diode thread waits for records instead of polling / diode 线程等待记录而不是轮询
    Config WithDiodeWaiter() const;

    /// Attach stacks to logged errors / 为记录的错误附加调用栈
    Config WithStackTrace() const;

    Config WithErrorCounter(std::shared_ptr<ErrorCounter> counter) const;

    /// Attach a fresh SimpleErrorCounter / 附加新的 SimpleErrorCounter
    Config WithSimpleErrorCounter() const;

    // ==========================================================================
    // Accessors / 访问方法
    // ==========================================================================

    const std::vector<std::shared_ptr<Sink>>& GetSinks() const { return m_sinks; }
    const std::string& GetLevel() const { return m_level; }
    const std::string& GetTimeFieldFormat() const { return m_timeFieldFormat; }
    const std::shared_ptr<Hook>& GetHook() const { return m_hook; }
    const std::vector<std::string>& GetToIgnore() const { return m_toIgnore; }
    const std::shared_ptr<ErrorCounter>& GetErrorCounter() const { return m_errorCounter; }
    size_t GetDiodeSize() const { return m_diodeSize; }
    std::chrono::milliseconds GetDiodePollingInterval() const { return m_diodePollingInterval; }
    bool UseDiodeWaiter() const { return m_useDiodeWaiter; }
    const DiodeAlert& GetDiodeAlert() const { return m_diodeAlert; }
    bool NoDiode() const { return m_noDiode; }
    bool StackTraceEnabled() const { return m_stackTrace; }

    /**
     * @brief Alert used when none is configured
     * @brief 未配置时使用的告警回调
     *
     * Prints "WRN: logger dropped N messages" to stderr.
     * 向 stderr 打印 "WRN: logger dropped N messages"。
     */
    static void DefaultDiodeAlert(uint64_t dropped);

private:
    std::vector<std::shared_ptr<Sink>> m_sinks;             ///< Output sinks / 输出 Sink
    std::string m_level;                                    ///< Level name / 级别名称
    std::string m_timeFieldFormat;                          ///< Time field format / 时间字段格式
    std::shared_ptr<Hook> m_hook;                           ///< Hook / 钩子
    std::vector<std::string> m_toIgnore;                    ///< Ignore list / 忽略列表
    std::shared_ptr<ErrorCounter> m_errorCounter;           ///< Error counter / 错误计数器
    size_t m_diodeSize{kDefaultDiodeSize};                  ///< Diode capacity / diode 容量
    std::chrono::milliseconds m_diodePollingInterval{kDefaultDiodePollingInterval};
    bool m_useDiodeWaiter{false};                           ///< Waiter mode / 等待模式
    DiodeAlert m_diodeAlert;                                ///< Drop report / 丢弃报告
    bool m_noDiode{false};                                  ///< Synchronous output / 同步输出
    bool m_stackTrace{false};                               ///< Stack traces / 调用栈
};

/**
 * @brief Shortcut for Config({sinks...})
 * @brief Config({sinks...}) 的简写
 */
template <typename... Sinks>
Config C(Sinks&&... sinks) {
    return Config(std::vector<std::shared_ptr<Sink>>{std::forward<Sinks>(sinks)...});
}

}  // namespace kvlog
