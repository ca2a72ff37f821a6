/**
 * @file test_sink.cpp
 * @brief Unit tests for sinks and the diode buffer
 * @brief Sink 与 diode 缓冲的单元测试
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <kvlog/diode_sink.hpp>
#include <kvlog/sink.hpp>

#include "test_helpers.hpp"

namespace kvlog {
namespace test {

namespace {

Event MakeEvent(const std::string& message) {
    Event event;
    event.level = Level::Info;
    event.message = message;
    return event;
}

// Poll until pred holds or the deadline passes / 轮询直到条件成立或超时
template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return pred();
}

}  // namespace

// ==============================================================================
// Basic Sinks / 基本 Sink
// ==============================================================================

TEST(SinkTest, DefaultFormatIsJson) {
    CaptureSink sink;
    sink.Log(MakeEvent("hello"));
    EXPECT_EQ(sink.Last(), "{\"level\":\"info\",\"message\":\"hello\"}");
}

TEST(SinkTest, CustomFormat) {
    CaptureSink sink;
    sink.SetFormat(std::make_shared<ConsoleFormat>());
    sink.Log(MakeEvent("hello"));
    EXPECT_EQ(sink.Last(), "INF hello");
}

TEST(SinkTest, StreamSinkWritesLines) {
    std::ostringstream out;
    StreamSink sink(out);
    sink.Write("first");
    sink.Log(MakeEvent("second"));
    sink.Flush();
    EXPECT_EQ(out.str(), "first\n{\"level\":\"info\",\"message\":\"second\"}\n");
    EXPECT_FALSE(sink.HasError());
}

TEST(SinkTest, StreamSinkReportsFailure) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    StreamSink sink(out);
    sink.Write("lost");
    EXPECT_TRUE(sink.HasError());
    EXPECT_EQ(sink.GetLastError(), "Write failed");
}

TEST(SinkTest, FileSinkAppends) {
    const std::string path = "kvlog_test_file_sink.log";
    std::remove(path.c_str());
    {
        FileSink sink(path);
        EXPECT_FALSE(sink.HasError());
        EXPECT_EQ(sink.GetFilename(), path);
        sink.Write("one");
    }
    {
        FileSink sink(path);
        sink.Write("two");
        sink.Close();
    }

    std::ifstream in(path);
    std::string line;
    std::vector<std::string> lines;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    EXPECT_EQ(lines, (std::vector<std::string>{"one", "two"}));
    std::remove(path.c_str());
}

TEST(SinkTest, FileSinkOpenFailure) {
    FileSink sink("/nonexistent-dir/kvlog/test.log");
    EXPECT_TRUE(sink.HasError());
    sink.Write("lost");
    EXPECT_EQ(sink.GetLastError(), "File not open");
}

TEST(SinkTest, MultiSinkFansOut) {
    auto json = std::make_shared<CaptureSink>();
    auto console = std::make_shared<CaptureSink>();
    console->SetFormat(std::make_shared<ConsoleFormat>());

    MultiSink multi({json, console});
    multi.Log(MakeEvent("hi"));
    multi.Flush();
    multi.Close();

    EXPECT_EQ(json->Last(), "{\"level\":\"info\",\"message\":\"hi\"}");
    EXPECT_EQ(console->Last(), "INF hi");
    EXPECT_EQ(json->FlushCount(), 1);
    EXPECT_TRUE(console->Closed());
    EXPECT_FALSE(multi.HasError());
    EXPECT_EQ(multi.GetSinks().size(), 2u);
}

TEST(SinkTest, MultiSinkReportsChildError) {
    std::ostringstream bad;
    bad.setstate(std::ios::badbit);
    auto failing = std::make_shared<StreamSink>(bad);
    MultiSink multi({std::make_shared<NullSink>(), failing});

    multi.Write("x");
    EXPECT_TRUE(multi.HasError());
    EXPECT_EQ(multi.GetLastError(), "Write failed");
}

// ==============================================================================
// DiodeSink / Diode 缓冲
// ==============================================================================

TEST(DiodeSinkTest, PollerDeliversInOrder) {
    auto inner = std::make_shared<CaptureSink>();
    DiodeSink diode(inner, 100, std::chrono::milliseconds(5), false, nullptr);
    EXPECT_FALSE(diode.IsWaiter());
    EXPECT_EQ(diode.GetCapacity(), 100u);

    for (int i = 0; i < 10; ++i) {
        diode.Write(std::to_string(i));
    }
    ASSERT_TRUE(WaitFor([&] { return inner->Size() == 10; }));

    auto lines = inner->Lines();
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(lines[i], std::to_string(i));
    }
    EXPECT_EQ(diode.GetDroppedCount(), 0u);
}

TEST(DiodeSinkTest, WaiterDelivers) {
    auto inner = std::make_shared<CaptureSink>();
    DiodeSink diode(inner, 100, std::chrono::milliseconds(1000), true, nullptr);
    EXPECT_TRUE(diode.IsWaiter());

    diode.Log(MakeEvent("wake"));
    // Waiter mode does not depend on the long poll interval
    ASSERT_TRUE(WaitFor([&] { return inner->Size() == 1; }, std::chrono::milliseconds(500)));
    EXPECT_EQ(inner->Last(), "{\"level\":\"info\",\"message\":\"wake\"}");
}

TEST(DiodeSinkTest, FlushDrainsSynchronously) {
    auto inner = std::make_shared<CaptureSink>();
    DiodeSink diode(inner, 100, std::chrono::milliseconds(10000), false, nullptr);

    diode.Write("a");
    diode.Write("b");
    diode.Flush();

    EXPECT_EQ(inner->Lines(), (std::vector<std::string>{"a", "b"}));
    EXPECT_GE(inner->FlushCount(), 1);
}

TEST(DiodeSinkTest, OverflowDropsOldestAndAlerts) {
    auto inner = std::make_shared<CaptureSink>();
    std::atomic<uint64_t> reported{0};
    DiodeSink diode(inner, 3, std::chrono::milliseconds(10000), false,
                    [&reported](uint64_t dropped) { reported += dropped; });

    for (int i = 0; i < 5; ++i) {
        diode.Write(std::to_string(i));
    }
    diode.Flush();

    EXPECT_EQ(inner->Lines(), (std::vector<std::string>{"2", "3", "4"}));
    EXPECT_EQ(diode.GetDroppedCount(), 2u);
    EXPECT_EQ(reported.load(), 2u);
}

TEST(DiodeSinkTest, CloseDeliversPendingAndWritesThrough) {
    auto inner = std::make_shared<CaptureSink>();
    DiodeSink diode(inner, 100, std::chrono::milliseconds(10000), false, nullptr);

    diode.Write("pending");
    diode.Close();
    EXPECT_EQ(inner->Lines(), (std::vector<std::string>{"pending"}));
    EXPECT_TRUE(inner->Closed());

    // After Close lines are delivered on the caller's thread
    diode.Write("late");
    EXPECT_EQ(inner->Last(), "late");
}

TEST(DiodeSinkTest, DestructorDrains) {
    auto inner = std::make_shared<CaptureSink>();
    {
        DiodeSink diode(inner, 100, std::chrono::milliseconds(10000), false, nullptr);
        diode.Write("x");
    }
    EXPECT_EQ(inner->Lines(), (std::vector<std::string>{"x"}));
}

TEST(DiodeSinkTest, ConcurrentWriters) {
    auto inner = std::make_shared<CaptureSink>();
    DiodeSink diode(inner, 10000, std::chrono::milliseconds(1), true, nullptr);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&diode, t] {
            for (int i = 0; i < 250; ++i) {
                diode.Write(std::to_string(t) + ":" + std::to_string(i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    diode.Flush();
    EXPECT_EQ(inner->Size(), 1000u);
}

}  // namespace test
}  // namespace kvlog
