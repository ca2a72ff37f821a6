/**
 * @file sink.hpp
 * @brief Record output sinks for kvlog
 * @brief kvlog 日志记录输出目标
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

#include "kvlog/common.hpp"
#include "kvlog/event.hpp"
#include "kvlog/format.hpp"

namespace kvlog {

namespace detail {

/**
 * @brief True while the calling thread is handing records to a sink
 * @brief 调用线程正在向 Sink 投递记录时为真
 *
 * Lets the std::clog mirror pass through bytes a sink writes to std::clog
 * instead of turning them into new records.
 * 使 std::clog 镜像将 Sink 写入 std::clog 的字节直接透传，而不是生成新记录。
 */
bool InSinkWrite() noexcept;

/**
 * @brief Marks the calling thread as writing to a sink for its lifetime
 * @brief 在其生命周期内将调用线程标记为正在写入 Sink
 */
class SinkWriteScope {
public:
    SinkWriteScope() noexcept;
    ~SinkWriteScope();

    SinkWriteScope(const SinkWriteScope&) = delete;
    SinkWriteScope& operator=(const SinkWriteScope&) = delete;

private:
    bool m_previous;
};

}  // namespace detail

// ==============================================================================
// Sink Base Class / Sink 基类
// ==============================================================================

/**
 * @brief Base class for record output sinks
 * @brief 日志记录输出目标基类
 *
 * A sink receives records through Log(), renders them with its Format
 * (JsonFormat when none is set) and writes the resulting line.
 * Sinks never throw from Log() or Write(); failures are kept in
 * HasError() / GetLastError().
 *
 * Sink 通过 Log() 接收记录，使用其 Format（未设置时为 JsonFormat）渲染，
 * 并写出结果行。Log() 与 Write() 从不抛出异常，失败记录在
 * HasError() / GetLastError() 中。
 */
class Sink {
public:
    virtual ~Sink() = default;

    /**
     * @brief Set the formatter for this sink
     * @brief 设置此 Sink 的格式化器
     */
    void SetFormat(std::shared_ptr<Format> format) { m_format = std::move(format); }

    /**
     * @brief Get the formatter
     * @brief 获取格式化器
     */
    std::shared_ptr<Format> GetFormat() const { return m_format; }

    /**
     * @brief Format and write one record
     * @brief 格式化并写入一条记录
     */
    virtual void Log(const Event& event);

    /**
     * @brief Write one formatted line, the newline is appended here
     * @brief 写入一行已格式化文本，换行符在此追加
     */
    virtual void Write(const std::string& line) = 0;

    /**
     * @brief Flush any buffered output
     * @brief 刷新所有缓冲的输出
     */
    virtual void Flush() = 0;

    /**
     * @brief Close the sink and release resources
     * @brief 关闭 Sink 并释放资源
     */
    virtual void Close() = 0;

    /**
     * @brief Check if an error has occurred
     * @brief 检查是否发生错误
     */
    virtual bool HasError() const = 0;

    /**
     * @brief Get the last error message
     * @brief 获取最后的错误消息
     */
    virtual std::string GetLastError() const = 0;

protected:
    std::shared_ptr<Format> m_format;  ///< Formatter / 格式化器
};

// ==============================================================================
// NullSink / 空输出
// ==============================================================================

/**
 * @brief Discards everything
 * @brief 丢弃所有内容
 */
class NullSink : public Sink {
public:
    void Log(const Event&) override {}
    void Write(const std::string&) override {}
    void Flush() override {}
    void Close() override {}
    bool HasError() const override { return false; }
    std::string GetLastError() const override { return {}; }
};

// ==============================================================================
// StreamSink / 流输出
// ==============================================================================

/**
 * @brief Writes lines to a caller owned std::ostream
 * @brief 将行写入调用方持有的 std::ostream
 *
 * The stream must outlive the sink.
 * 流的生命周期必须长于 Sink。
 */
class StreamSink : public Sink {
public:
    explicit StreamSink(std::ostream& stream) : m_stream(stream) {}

    void Write(const std::string& line) override;
    void Flush() override;
    void Close() override {}
    bool HasError() const override;
    std::string GetLastError() const override;

private:
    std::ostream& m_stream;           ///< Output stream / 输出流
    bool m_hasError{false};           ///< Error flag / 错误标志
    std::string m_lastError;          ///< Last error message / 最后的错误消息
    mutable std::mutex m_mutex;       ///< Mutex for thread safety / 线程安全互斥锁
};

// ==============================================================================
// ConsoleSink / 控制台输出
// ==============================================================================

/**
 * @brief Console output sink
 * @brief 控制台输出 Sink
 *
 * Writes lines to stdout or stderr. Output is never colored.
 * 将行写入 stdout 或 stderr，输出不带颜色。
 */
class ConsoleSink : public Sink {
public:
    /**
     * @brief Output stream selection
     * @brief 输出流选择
     */
    enum class Stream {
        StdOut,  ///< Standard output / 标准输出
        StdErr   ///< Standard error / 标准错误
    };

    explicit ConsoleSink(Stream stream = Stream::StdErr) : m_stream(stream) {}

    void Write(const std::string& line) override;
    void Flush() override;
    void Close() override {}
    bool HasError() const override;
    std::string GetLastError() const override;

    Stream GetStream() const { return m_stream; }

private:
    Stream m_stream;                  ///< Output stream / 输出流
    bool m_hasError{false};           ///< Error flag / 错误标志
    std::string m_lastError;          ///< Last error message / 最后的错误消息
    mutable std::mutex m_mutex;       ///< Mutex for thread safety / 线程安全互斥锁
};

// ==============================================================================
// FileSink / 文件输出
// ==============================================================================

/**
 * @brief Appends lines to a file
 * @brief 向文件追加行
 */
class FileSink : public Sink {
public:
    /**
     * @brief Open (or create) the file in append mode
     * @brief 以追加模式打开（或创建）文件
     *
     * @param filename Path to the log file / 日志文件路径
     */
    explicit FileSink(const std::string& filename);

    ~FileSink() override;

    void Write(const std::string& line) override;
    void Flush() override;
    void Close() override;
    bool HasError() const override;
    std::string GetLastError() const override;

    const std::string& GetFilename() const { return m_filename; }

private:
    std::string m_filename;           ///< Log file path / 日志文件路径
    std::ofstream m_file;             ///< File stream / 文件流
    bool m_hasError{false};           ///< Error flag / 错误标志
    std::string m_lastError;          ///< Last error message / 最后的错误消息
    mutable std::mutex m_mutex;       ///< Mutex for thread safety / 线程安全互斥锁
};

// ==============================================================================
// MultiSink / 多路输出
// ==============================================================================

/**
 * @brief Fans every record out to several sinks, in order
 * @brief 按顺序将每条记录分发到多个 Sink
 *
 * Each child formats the record with its own Format, so a console line and
 * a JSON line can be produced from the same record.
 * 每个子 Sink 使用自己的 Format 格式化记录，因此同一条记录可以同时产生
 * 控制台行与 JSON 行。
 */
class MultiSink : public Sink {
public:
    explicit MultiSink(std::vector<std::shared_ptr<Sink>> sinks) : m_sinks(std::move(sinks)) {}

    void Log(const Event& event) override;
    void Write(const std::string& line) override;
    void Flush() override;
    void Close() override;

    /// True if any child has an error / 任一子 Sink 出错即为 true
    bool HasError() const override;

    /// First child error / 第一个子 Sink 的错误
    std::string GetLastError() const override;

    const std::vector<std::shared_ptr<Sink>>& GetSinks() const { return m_sinks; }

private:
    std::vector<std::shared_ptr<Sink>> m_sinks;  ///< Child sinks / 子 Sink 列表
};

}  // namespace kvlog
