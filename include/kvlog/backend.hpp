/**
 * @file backend.hpp
 * @brief Record engine shared by a Logger and the loggers derived from it
 * @brief 由 Logger 及其派生 Logger 共享的记录引擎
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#pragma once

#include <memory>
#include <string>

#include "kvlog/event.hpp"
#include "kvlog/sink.hpp"

namespace kvlog {

/**
 * @brief Stamps, hooks and hands records to the output sink
 * @brief 为记录打时间戳、运行钩子并交给输出 Sink
 *
 * A Backend is immutable after construction and safe to use from many
 * threads. Level filtering is done by the Logger, not here.
 * Backend 构造后不可变，可被多线程安全使用。级别过滤由 Logger 完成。
 */
class Backend {
public:
    /**
     * @brief Construct a backend
     * @brief 构造后端
     *
     * @param sink Output sink, NullSink when null / 输出 Sink，为空时使用 NullSink
     * @param timeFormat Time field format / 时间字段格式
     * @param hook Optional hook / 可选钩子
     */
    Backend(std::shared_ptr<Sink> sink, std::string timeFormat, std::shared_ptr<Hook> hook);

    /**
     * @brief Flushes the sink; a DiodeSink built for this backend drains on destruction
     * @brief 刷新 Sink；为此后端创建的 DiodeSink 在析构时排空
     */
    ~Backend();

    Backend(const Backend&) = delete;
    Backend& operator=(const Backend&) = delete;

    /**
     * @brief Stamp the time, run the hook and write the record
     * @brief 打时间戳、运行钩子并写入记录
     */
    void Emit(Event& event) const;

    void Flush() const;

    const std::shared_ptr<Sink>& GetSink() const { return m_sink; }

    const std::string& GetTimeFormat() const { return m_timeFormat; }

private:
    std::shared_ptr<Sink> m_sink;  ///< Output sink / 输出 Sink
    std::string m_timeFormat;      ///< Time field format / 时间字段格式
    std::shared_ptr<Hook> m_hook;  ///< Optional hook / 可选钩子
};

}  // namespace kvlog
