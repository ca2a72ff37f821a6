/**
 * @file diode_sink.cpp
 * @brief DiodeSink implementation
 * @brief DiodeSink 实现
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#include "kvlog/diode_sink.hpp"

#include <algorithm>

namespace kvlog {

DiodeSink::DiodeSink(std::shared_ptr<Sink> inner, size_t size,
                     std::chrono::milliseconds pollInterval, bool waiter, DiodeAlert alert)
    : m_inner(std::move(inner))
    , m_capacity(std::max<size_t>(size, 1))
    , m_pollInterval(pollInterval.count() > 0 ? pollInterval : std::chrono::milliseconds(1))
    , m_waiter(waiter)
    , m_alert(std::move(alert)) {
    if (!m_inner) {
        m_inner = std::make_shared<NullSink>();
    }
    m_thread = std::thread(&DiodeSink::ThreadFunc, this);
}

DiodeSink::~DiodeSink() {
    Stop();
    Drain();
    m_inner->Flush();
}

void DiodeSink::Log(const Event& event) {
    Push(Item(std::in_place_type<Event>, event));
}

void DiodeSink::Write(const std::string& line) {
    Push(Item(std::in_place_type<std::string>, line));
}

void DiodeSink::Push(Item item) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_stopping) {
            if (m_queue.size() >= m_capacity) {
                // Drop the oldest entry / 丢弃最旧的条目
                m_queue.pop_front();
                ++m_droppedPending;
                m_droppedTotal.fetch_add(1, std::memory_order_relaxed);
            }
            m_queue.push_back(std::move(item));
            if (m_waiter) {
                m_cv.notify_one();
            }
            return;
        }
    }

    // Thread already stopped, deliver on the caller's thread
    // 线程已停止，在调用者线程上投递
    std::lock_guard<std::mutex> deliver(m_deliverMutex);
    detail::SinkWriteScope scope;
    if (auto* event = std::get_if<Event>(&item)) {
        m_inner->Log(*event);
    } else {
        m_inner->Write(std::get<std::string>(item));
    }
}

void DiodeSink::Flush() {
    Drain();
    m_inner->Flush();
}

void DiodeSink::Close() {
    Stop();
    Drain();
    m_inner->Close();
}

void DiodeSink::ThreadFunc() {
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (m_waiter) {
                m_cv.wait(lock, [this] { return m_stopping || !m_queue.empty(); });
            } else {
                m_cv.wait_for(lock, m_pollInterval, [this] { return m_stopping; });
            }
            if (m_stopping) {
                break;
            }
        }
        Drain();
    }
}

void DiodeSink::Drain() {
    std::lock_guard<std::mutex> deliver(m_deliverMutex);
    detail::SinkWriteScope scope;

    std::deque<Item> batch;
    uint64_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        batch.swap(m_queue);
        dropped = m_droppedPending;
        m_droppedPending = 0;
    }

    if (dropped > 0 && m_alert) {
        m_alert(dropped);
    }

    for (const auto& item : batch) {
        if (const auto* event = std::get_if<Event>(&item)) {
            m_inner->Log(*event);
        } else {
            m_inner->Write(std::get<std::string>(item));
        }
    }
}

void DiodeSink::Stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            return;
        }
        m_stopping = true;
    }
    m_cv.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

}  // namespace kvlog
