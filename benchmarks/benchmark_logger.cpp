/**
 * @file benchmark_logger.cpp
 * @brief Logger throughput benchmark
 * @brief 日志器吞吐量基准测试
 *
 * Measures kvlog structured logging into a null sink, synchronously and
 * through the diode buffer, and compares it with spdlog (if available).
 *
 * 测量 kvlog 结构化日志写入空 Sink 的性能（同步与经 diode 缓冲），
 * 并与 spdlog 进行对比（如果可用）。
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <memory>
#include <string>

#include <kvlog/kvlog.hpp>

#ifdef HAS_SPDLOG
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#endif

namespace {

/// Default iteration count / 默认迭代次数
constexpr int kDefaultIterations = 200000;

/**
 * @brief Run fn iterations times and print the throughput
 * @brief 运行 fn 指定次数并打印吞吐量
 */
void Run(const char* name, int iterations, const std::function<void(int)>& fn) {
    const auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < iterations; ++i) {
        fn(i);
    }
    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);
    std::printf("%-32s %10.0f ops/s  %8.1f ns/op\n", name, iterations / elapsed.count(),
                elapsed.count() * 1e9 / iterations);
}

}  // namespace

int main(int argc, char** argv) {
    const int iterations = argc > 1 ? std::atoi(argv[1]) : kDefaultIterations;

    // kvlog, synchronous / kvlog 同步
    {
        kvlog::Logger logger(kvlog::C(std::make_shared<kvlog::NullSink>()).WithNoDiode());
        Run("kvlog sync Info", iterations,
            [&logger](int i) { logger.Info("request handled", "id", i, "path", "/api/v1"); });
        Run("kvlog sync Infof", iterations,
            [&logger](int i) { logger.Infof("request %d handled", i, "path", "/api/v1"); });
        Run("kvlog sync filtered Debug", iterations,
            [&logger](int i) { logger.Debug("request handled", "id", i); });
    }

    // kvlog through the diode / kvlog 经 diode 缓冲
    {
        kvlog::Logger logger(kvlog::C(std::make_shared<kvlog::NullSink>())
                                 .WithDiodeWaiter()
                                 .WithDiodeSize(65536)
                                 .WithDiodeAlert([](uint64_t) {}));
        Run("kvlog diode Info", iterations,
            [&logger](int i) { logger.Info("request handled", "id", i, "path", "/api/v1"); });
        logger.Flush();
    }

#ifdef HAS_SPDLOG
    {
        auto nullSink = std::make_shared<spdlog::sinks::null_sink_mt>();
        spdlog::logger logger("bench", nullSink);
        logger.set_level(spdlog::level::info);
        Run("spdlog sync info", iterations, [&logger](int i) {
            logger.info("request handled id={} path={}", i, "/api/v1");
        });
    }
#endif

    return 0;
}
