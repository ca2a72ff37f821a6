/**
 * @file diode_sink.hpp
 * @brief Asynchronous, drop-on-overflow sink decorator
 * @brief 异步、溢出即丢弃的 Sink 装饰器
 *
 * DiodeSink is responsible for:
 * - Buffering records from any number of logging threads in a bounded queue
 * - Dropping the oldest record when the queue is full, so logging never blocks
 * - Delivering buffered records to the wrapped sink on its own thread
 * - Reporting dropped records through an alert callback
 *
 * DiodeSink 负责：
 * - 在有界队列中缓存来自任意数量日志线程的记录
 * - 队列满时丢弃最旧的记录，使日志调用永不阻塞
 * - 在自己的线程上将缓存的记录投递到被包装的 Sink
 * - 通过告警回调报告被丢弃的记录
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>

#include "kvlog/sink.hpp"

namespace kvlog {

/**
 * @brief Called on the diode thread with the number of records dropped since the last call
 * @brief 在 diode 线程上调用，参数为上次调用以来丢弃的记录数
 */
using DiodeAlert = std::function<void(uint64_t dropped)>;

/**
 * @brief Bounded asynchronous buffer in front of a sink
 * @brief 位于 Sink 之前的有界异步缓冲区
 *
 * Data flow / 数据流:
 * - Logging threads → bounded queue → diode thread → wrapped sink
 *
 * Two consumer modes / 两种消费模式:
 * - Poller: the diode thread wakes up every polling interval
 * - Waiter: the diode thread sleeps until a record arrives
 *
 * The thread starts in the constructor. Close() and the destructor stop it
 * and deliver whatever is still buffered.
 * 线程在构造函数中启动。Close() 与析构函数停止线程并投递剩余的缓存记录。
 */
class DiodeSink : public Sink {
public:
    /**
     * @brief Wrap a sink
     * @brief 包装一个 Sink
     *
     * @param inner Destination sink / 目标 Sink
     * @param size Queue capacity, at least 1 / 队列容量，至少为 1
     * @param pollInterval Poller wake-up interval / 轮询唤醒间隔
     * @param waiter Use waiter mode instead of polling / 使用等待模式代替轮询
     * @param alert Drop report callback, may be empty / 丢弃报告回调，可以为空
     */
    DiodeSink(std::shared_ptr<Sink> inner, size_t size, std::chrono::milliseconds pollInterval,
              bool waiter, DiodeAlert alert);

    ~DiodeSink() override;

    // Non-copyable, non-movable
    DiodeSink(const DiodeSink&) = delete;
    DiodeSink& operator=(const DiodeSink&) = delete;
    DiodeSink(DiodeSink&&) = delete;
    DiodeSink& operator=(DiodeSink&&) = delete;

    /**
     * @brief Buffer a record, dropping the oldest one if the queue is full
     * @brief 缓存一条记录，队列满时丢弃最旧的记录
     */
    void Log(const Event& event) override;

    /**
     * @brief Buffer a raw line, same policy as Log()
     * @brief 缓存一行原始文本，策略与 Log() 相同
     */
    void Write(const std::string& line) override;

    /**
     * @brief Deliver everything buffered so far and flush the wrapped sink
     * @brief 投递目前缓存的全部内容并刷新被包装的 Sink
     */
    void Flush() override;

    /**
     * @brief Stop the thread, deliver the rest and close the wrapped sink
     * @brief 停止线程、投递剩余内容并关闭被包装的 Sink
     */
    void Close() override;

    bool HasError() const override { return m_inner->HasError(); }
    std::string GetLastError() const override { return m_inner->GetLastError(); }

    /**
     * @brief Total number of records dropped since construction
     * @brief 构造以来丢弃的记录总数
     */
    uint64_t GetDroppedCount() const noexcept {
        return m_droppedTotal.load(std::memory_order_relaxed);
    }

    size_t GetCapacity() const noexcept { return m_capacity; }

    bool IsWaiter() const noexcept { return m_waiter; }

    const std::shared_ptr<Sink>& GetInner() const { return m_inner; }

private:
    using Item = std::variant<Event, std::string>;

    void Push(Item item);

    /**
     * @brief Main thread function
     * @brief 主线程函数
     */
    void ThreadFunc();

    /**
     * @brief Take the queue and hand it to the wrapped sink
     * @brief 取出队列并交给被包装的 Sink
     */
    void Drain();

    void Stop();

    std::shared_ptr<Sink> m_inner;                 ///< Wrapped sink / 被包装的 Sink
    const size_t m_capacity;                       ///< Queue capacity / 队列容量
    const std::chrono::milliseconds m_pollInterval;  ///< Poll interval / 轮询间隔
    const bool m_waiter;                           ///< Waiter mode / 等待模式
    DiodeAlert m_alert;                            ///< Drop report / 丢弃报告

    std::deque<Item> m_queue;                      ///< Pending items / 待处理条目
    uint64_t m_droppedPending{0};                  ///< Drops not yet reported / 尚未报告的丢弃数
    std::atomic<uint64_t> m_droppedTotal{0};       ///< Dropped entry count / 丢弃的条目计数
    bool m_stopping{false};                        ///< Stop request / 停止请求
    std::mutex m_mutex;                            ///< Guards queue and stop flag / 保护队列与停止标志
    std::condition_variable m_cv;                  ///< Consumer wake-up / 消费者唤醒
    std::mutex m_deliverMutex;                     ///< Keeps deliveries in order / 保证投递顺序
    std::thread m_thread;                          ///< Diode thread / diode 线程
};

}  // namespace kvlog
