// ============================================================================
// Stress Tests - High-load testing for production readiness
// ============================================================================

#include "pledge/core/aggregate.hpp"
#include "pledge/core/combinators.hpp"
#include "pledge/core/promise.hpp"
#include "pledge/core/spawn.hpp"
#include "pledge/runtime/thread_pool_executor.hpp"
#include "pledge/sync/await.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <random>
#include <thread>
#include <vector>

using namespace pledge;
using namespace std::chrono_literals;

#if defined(PLEDGE_ASAN_ACTIVE)
constexpr int kScale = 1;
#else
constexpr int kScale = 10;
#endif

// ============================================================================
// Deep Chains
// ============================================================================

TEST(StressTest, DeepMapChain) {
    constexpr int kDepth = 1000;
    ThreadPoolExecutor executor(4);
    Promise<int> head(executor);

    Future<int> tail = head.GetFuture();
    for (int i = 0; i < kDepth; ++i) {
        tail = Map(tail, [](int x) { return x + 1; });
    }

    // Completing the head only schedules work; no stage runs here
    head.SetValue(0);
    EXPECT_EQ(Get(tail, 30s), kDepth);
}

TEST(StressTest, DeepFlatMapChain) {
    constexpr int kDepth = 1000;
    ThreadPoolExecutor executor(4);

    Future<int> tail = MakeSuccessful(executor, 0);
    for (int i = 0; i < kDepth; ++i) {
        tail = FlatMap(tail, [&executor](int x) { return Spawn(executor, [x] { return x + 1; }); });
    }
    EXPECT_EQ(Get(tail, 30s), kDepth);
}

// ============================================================================
// High Volume
// ============================================================================

TEST(StressTest, ManySpawnedComputations) {
    constexpr int kCount = 1000 * kScale;
    ThreadPoolExecutor executor(4);

    std::vector<Future<int>> futures;
    futures.reserve(kCount);
    for (int i = 0; i < kCount; ++i) {
        futures.push_back(Spawn(executor, [] { return 1; }));
    }

    EXPECT_EQ(Get(Fold(executor, 0, futures, [](int a, int b) { return a + b; }), 30s), kCount);
    EXPECT_TRUE(executor.Quiescence().WaitForQuiescence(5s));
}

TEST(StressTest, ConcurrentCompleteAndRegister) {
    constexpr int kRounds = 200 * kScale;
    ThreadPoolExecutor executor(4);
    std::atomic<int> delivered{0};

    for (int round = 0; round < kRounds; ++round) {
        Promise<int> promise(executor);
        Future<int> future = promise.GetFuture();

        std::thread registrar([&] {
            for (int i = 0; i < 4; ++i) {
                future.OnComplete([&](const Try<int>&) { delivered++; });
            }
        });
        std::thread completer([&] {
            promise.SetValue(round);
            promise.SetValue(-1);
        });
        registrar.join();
        completer.join();
    }

    executor.Run();
    EXPECT_EQ(delivered.load(), kRounds * 4);
}

TEST(StressTest, RandomizedAggregates) {
    ThreadPoolExecutor executor(8);
    std::mt19937 random(2024);

    for (int round = 0; round < 10; ++round) {
        std::vector<Future<int>> futures;
        int expected = 0;
        for (int i = 0; i < 100; ++i) {
            auto delay = std::chrono::microseconds(random() % 500);
            futures.push_back(Spawn(executor, [i, delay] {
                std::this_thread::sleep_for(delay);
                return i;
            }));
            expected += i;
        }

        auto sum = Reduce(executor, futures, [](int a, int b) { return a + b; });
        auto all = Sequence(executor, futures);
        EXPECT_EQ(Get(sum, 30s), expected);

        auto values = Get(all, 30s);
        for (int i = 0; i < 100; ++i) {
            ASSERT_EQ(values[i], i);
        }
    }
}
