// ============================================================================
// Spawn Tests
// ============================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "pledge/core/spawn.hpp"
#include "pledge/runtime/thread_pool_executor.hpp"
#include "pledge/sync/await.hpp"

using namespace pledge;
using namespace std::chrono_literals;

// ============================================================================
// Basic Spawn Tests
// ============================================================================

TEST(SpawnTest, SpawnWithResult) {
    ThreadPoolExecutor executor(2);
    auto future = Spawn(executor, [] { return 21 * 2; });
    EXPECT_EQ(Get(future), 42);
}

TEST(SpawnTest, VoidCallableYieldsUnit) {
    ThreadPoolExecutor executor(2);
    std::atomic<bool> ran{false};

    Future<Unit> done = Spawn(executor, [&] { ran = true; });
    EXPECT_TRUE(Await(done).IsSuccess());
    EXPECT_TRUE(ran.load());
}

TEST(SpawnTest, RunsOnWorkerThread) {
    ThreadPoolExecutor executor(2);
    auto id = Get(Spawn(executor, [] { return std::this_thread::get_id(); }));
    EXPECT_NE(id, std::this_thread::get_id());
}

TEST(SpawnTest, ExceptionBecomesFailure) {
    ThreadPoolExecutor executor(2);
    auto future = Spawn(executor, []() -> std::string { throw std::runtime_error("boom"); });

    auto result = Await(future);
    ASSERT_TRUE(result.IsFailure());
    EXPECT_EQ(ErrorMessage(result.Error()), "boom");
}

TEST(SpawnTest, MultipleSpawns) {
    ThreadPoolExecutor executor(4);
    std::vector<Future<int>> futures;
    for (int i = 0; i < 100; ++i) {
        futures.push_back(Spawn(executor, [i] { return i; }));
    }
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(Get(futures[i]), i);
    }
}

// ============================================================================
// Quiescence
// ============================================================================

TEST(SpawnTest, QuiescenceCoversSpawnedWork) {
    ThreadPoolExecutor executor(2);
    std::atomic<bool> release{false};

    auto blocked = Spawn(executor, [&] {
        while (!release.load()) {
            std::this_thread::sleep_for(1ms);
        }
        return 1;
    });

    EXPECT_EQ(executor.Quiescence().Outstanding(), 1u);
    EXPECT_FALSE(executor.Quiescence().WaitForQuiescence(10ms));

    release = true;
    EXPECT_TRUE(executor.Quiescence().WaitForQuiescence(5s));
    EXPECT_EQ(Get(blocked), 1);
}

TEST(SpawnTest, QuiescenceBalancedAfterFailures) {
    ThreadPoolExecutor executor(4);
    for (int i = 0; i < 50; ++i) {
        Spawn(executor, [i]() -> int {
            if (i % 2 == 0) throw std::runtime_error("even");
            return i;
        });
    }
    EXPECT_TRUE(executor.Quiescence().WaitForQuiescence(5s));
    EXPECT_TRUE(executor.Quiescence().IsQuiescent());
}

TEST(SpawnTest, SpawnAfterStopRunsOnWorker) {
    ThreadPoolExecutor executor(2);
    executor.Stop();

    auto future = Spawn(executor, [&executor] { return executor.IsCurrent(); });
    EXPECT_TRUE(Get(future, 5s));
    EXPECT_TRUE(executor.Quiescence().WaitForQuiescence(5s));
}

TEST(SpawnTest, SpawnAfterShutdownStillCompletes) {
    ThreadPoolExecutor executor(1);
    executor.Shutdown();

    auto future = Spawn(executor, [] { return 7; });
    EXPECT_TRUE(future.IsCompleted());
    EXPECT_EQ(Get(future), 7);
    EXPECT_TRUE(executor.Quiescence().IsQuiescent());
}
