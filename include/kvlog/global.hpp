/**
 * @file global.hpp
 * @brief Process-wide default logger and free logging functions
 * @brief 进程级默认日志器与自由日志函数
 *
 * Lifecycle / 生命周期:
 * @code
 * int main() {
 *     kvlog::global::Init(kvlog::C().WithConsoleJSON().WithLevel(kvlog::kLevelDebug));
 *     kvlog::global::Info("started", "pid", getpid());
 *     std::clog << "legacy line\n";   // captured as a record without level
 *     ...
 *     kvlog::global::Shutdown();
 * }
 * @endcode
 *
 * Init, Update and Shutdown must not run concurrently with each other.
 * Free functions read the installed logger under a lock, so a call racing
 * with Update uses either the old or the new logger, never a mix.
 *
 * Init、Update 与 Shutdown 不得彼此并发执行。自由函数在锁保护下读取
 * 已安装的日志器，因此与 Update 竞争的调用要么使用旧日志器，要么使用
 * 新日志器，不会混用。
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#pragma once

#include <memory>
#include <mutex>
#include <streambuf>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "kvlog/logger.hpp"

namespace kvlog {
namespace global {

// ==============================================================================
// Legacy Sink Mirror / 传统输出镜像
// ==============================================================================

/**
 * @brief Stream buffer turning every line written to it into a Logger record
 * @brief 将写入的每一行转换为 Logger 记录的流缓冲区
 *
 * Installed into std::clog by SetLoggerForDefault(). Lines carry no
 * prefix or timestamp of their own; the Logger adds the time field.
 * Bytes written while a record of this buffer is being emitted on the same
 * thread (a sink that itself writes to std::clog) go to passthrough
 * unchanged, or are dropped when passthrough is null.
 *
 * 由 SetLoggerForDefault() 安装到 std::clog。行本身不带前缀或时间戳，
 * 时间字段由 Logger 添加。同一线程在输出本缓冲区记录期间写入的字节
 * （Sink 本身写入 std::clog 的情况）原样写入 passthrough，
 * passthrough 为空时丢弃。
 */
class LegacyLogBuffer : public std::streambuf {
public:
    explicit LegacyLogBuffer(Logger logger, std::streambuf* passthrough = nullptr)
        : m_logger(std::move(logger)), m_passthrough(passthrough) {}

    ~LegacyLogBuffer() override;

    const Logger& GetLogger() const { return m_logger; }

protected:
    int_type overflow(int_type ch) override;
    std::streamsize xsputn(const char* s, std::streamsize count) override;
    int sync() override;

private:
    void Append(const char* s, size_t count);
    void EmitLine();

    Logger m_logger;     ///< Destination / 目标日志器
    std::string m_line;  ///< Pending partial line / 待处理的不完整行
    std::mutex m_mutex;  ///< std::clog may be shared by threads / std::clog 可能被多线程共享
    std::streambuf* m_passthrough{nullptr};  ///< Target of nested writes / 嵌套写入的目标
};

namespace detail {

/**
 * @brief Replace the std::clog buffer with a LegacyLogBuffer writing to logger
 * @brief 用写入 logger 的 LegacyLogBuffer 替换 std::clog 的缓冲区
 */
void InstallLegacyBuffer(Logger logger);

}  // namespace detail

/**
 * @brief Route std::clog into logger.WithFields(fields...)
 * @brief 将 std::clog 路由到 logger.WithFields(fields...)
 */
template <typename... Fields>
void SetLoggerForDefault(const Logger& logger, Fields&&... fields) {
    detail::InstallLegacyBuffer(logger.WithFields(std::forward<Fields>(fields)...));
}

/**
 * @brief Put back the std::clog buffer that was active before the first mirror
 * @brief 恢复首次镜像前 std::clog 使用的缓冲区
 */
void RestoreLegacySink();

// ==============================================================================
// Default Logger / 默认日志器
// ==============================================================================

namespace detail {

/**
 * @brief Get the default logger slot
 * @brief 获取默认日志器存储位置
 */
std::shared_ptr<const Logger>& GetDefaultLoggerPtr();

/**
 * @brief Get the mutex guarding the slot
 * @brief 获取保护该存储位置的互斥锁
 */
std::mutex& GetDefaultLoggerMutex();

/**
 * @brief Install a logger and mirror std::clog into it
 * @brief 安装日志器并将 std::clog 镜像到其中
 */
void Install(std::shared_ptr<const Logger> logger);

}  // namespace detail

/**
 * @brief Snapshot of the installed logger
 * @brief 已安装日志器的快照
 *
 * Before Init() and after Shutdown() this is the zero-value placeholder.
 * 在 Init() 之前与 Shutdown() 之后为零值占位日志器。
 */
std::shared_ptr<const Logger> Default();

/**
 * @brief Build and install a logger, mirror std::clog into it
 * @brief 构建并安装日志器，将 std::clog 镜像到其中
 *
 * @throws std::invalid_argument on an unknown level name / 未知级别名称时抛出
 */
template <typename... Fields>
void Init(const Config& cfg, Fields&&... fields) {
    detail::Install(std::make_shared<const Logger>(cfg, std::forward<Fields>(fields)...));
}

/**
 * @brief Rebuild the installed logger from a new configuration and install it
 * @brief 根据新配置重建已安装的日志器并安装
 */
template <typename... Fields>
void Update(const Config& cfg, Fields&&... fields) {
    detail::Install(std::make_shared<const Logger>(cfg, std::forward<Fields>(fields)...));
}

/**
 * @brief Restore std::clog, flush and drop the installed logger
 * @brief 恢复 std::clog，刷新并释放已安装的日志器
 */
void Shutdown();

// ==============================================================================
// Global Convenience Functions / 全局便捷函数
// ==============================================================================

template <typename... Fields>
Logger WithFields(Fields&&... fields) {
    return Default()->WithFields(std::forward<Fields>(fields)...);
}

template <typename... Fields>
Logger With(Fields&&... fields) {
    return Default()->With(std::forward<Fields>(fields)...);
}

Logger WithLevel(std::string_view level);

Logger WithErrorCounter(std::shared_ptr<ErrorCounter> counter);

Logger WithSimpleErrorCounter();

std::shared_ptr<ErrorCounter> GetErrorCounter();

void Flush();

template <typename... Fields>
void Trace(LocatedMessage msg, Fields&&... fields) {
    Default()->Trace(msg, std::forward<Fields>(fields)...);
}

template <typename... Args>
void Tracef(LocatedMessage format, Args&&... args) {
    Default()->Tracef(format, std::forward<Args>(args)...);
}

template <typename... Fields>
void Debug(std::string_view msg, Fields&&... fields) {
    Default()->Debug(msg, std::forward<Fields>(fields)...);
}

template <typename... Args>
void Debugf(std::string_view format, Args&&... args) {
    Default()->Debugf(format, std::forward<Args>(args)...);
}

template <typename... Fields>
void Info(std::string_view msg, Fields&&... fields) {
    Default()->Info(msg, std::forward<Fields>(fields)...);
}

template <typename... Args>
void Infof(std::string_view format, Args&&... args) {
    Default()->Infof(format, std::forward<Args>(args)...);
}

template <typename... Fields>
void Warn(std::string_view msg, Fields&&... fields) {
    Default()->Warn(msg, std::forward<Fields>(fields)...);
}

template <typename... Args>
void Warnf(std::string_view format, Args&&... args) {
    Default()->Warnf(format, std::forward<Args>(args)...);
}

template <typename... Fields>
void Error(std::string_view msg, Fields&&... fields) {
    Default()->Error(msg, std::forward<Fields>(fields)...);
}

template <typename... Args>
void Errorf(std::string_view format, Args&&... args) {
    Default()->Errorf(format, std::forward<Args>(args)...);
}

template <typename... Fields>
void Err(const kvlog::Error& err, std::string_view msg, Fields&&... fields) {
    Default()->Err(err, msg, std::forward<Fields>(fields)...);
}

template <typename... Args>
void Errf(const kvlog::Error& err, std::string_view format, Args&&... args) {
    Default()->Errf(err, format, std::forward<Args>(args)...);
}

template <typename... Fields>
void ErrStack(const kvlog::Error& err, Fields&&... fields) {
    Default()->ErrStack(err, std::forward<Fields>(fields)...);
}

template <typename... Args>
[[noreturn]] void Fatal(Args&&... args) {
    Default()->Fatal(std::forward<Args>(args)...);
}

template <typename... Args>
[[noreturn]] void Fatalf(std::string_view format, Args&&... args) {
    Default()->Fatalf(format, std::forward<Args>(args)...);
}

template <typename... Args>
[[noreturn]] void Fatalln(Args&&... args) {
    Default()->Fatalln(std::forward<Args>(args)...);
}

template <typename... Args>
[[noreturn]] void Panic(Args&&... args) {
    Default()->Panic(std::forward<Args>(args)...);
}

template <typename... Args>
[[noreturn]] void Panicf(std::string_view format, Args&&... args) {
    Default()->Panicf(format, std::forward<Args>(args)...);
}

template <typename... Args>
[[noreturn]] void Panicln(Args&&... args) {
    Default()->Panicln(std::forward<Args>(args)...);
}

template <typename... Args>
void Print(Args&&... args) {
    Default()->Print(std::forward<Args>(args)...);
}

template <typename... Args>
void Printf(std::string_view format, Args&&... args) {
    Default()->Printf(format, std::forward<Args>(args)...);
}

template <typename... Args>
void Println(Args&&... args) {
    Default()->Println(std::forward<Args>(args)...);
}

template <typename... Fields>
void PrintStack(Fields&&... fields) {
    Default()->PrintStack(std::forward<Fields>(fields)...);
}

void Write(std::string_view line);

}  // namespace global
}  // namespace kvlog
