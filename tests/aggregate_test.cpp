// ============================================================================
// Aggregate Tests - Fold, Reduce, Sequence, Traverse
// ============================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "pledge/core/aggregate.hpp"
#include "pledge/core/error.hpp"
#include "pledge/core/promise.hpp"
#include "pledge/core/spawn.hpp"
#include "pledge/runtime/thread_pool_executor.hpp"
#include "pledge/sync/await.hpp"

using namespace pledge;
using namespace std::chrono_literals;

namespace {

class AggregateTest : public ::testing::Test {
   protected:
    // Futures resolving to 0..count-1, each after a random short delay
    std::vector<Future<int>> DelayedRange(int count) {
        std::vector<Future<int>> futures;
        for (int i = 0; i < count; ++i) {
            auto delay = std::chrono::microseconds(random_() % 2000);
            futures.push_back(Spawn(executor_, [i, delay] {
                std::this_thread::sleep_for(delay);
                return i;
            }));
        }
        return futures;
    }

    ThreadPoolExecutor executor_{8};
    std::mt19937 random_{12345};
};

int Add(int a, int b) {
    return a + b;
}

}  // namespace

// ============================================================================
// Fold
// ============================================================================

TEST_F(AggregateTest, FoldSumsAllInputs) {
    auto sum = Fold(executor_, 0, DelayedRange(10), Add);
    EXPECT_EQ(Get(sum), 45);
}

TEST_F(AggregateTest, FoldEmptyYieldsZero) {
    auto sum = Fold(executor_, 0, std::vector<Future<int>>{}, Add);
    EXPECT_EQ(Get(sum), 0);
}

TEST_F(AggregateTest, FoldIntoDifferentType) {
    auto count = Fold(executor_, std::string(), DelayedRange(5),
                      [](std::string acc, int) { return acc + "x"; });
    EXPECT_EQ(Get(count), "xxxxx");
}

TEST_F(AggregateTest, FoldFirstFailureWins) {
    auto futures = DelayedRange(10);
    futures[3] = Spawn(executor_, []() -> int { throw std::runtime_error("boom"); });

    auto result = Await(Fold(executor_, 0, futures, Add));
    ASSERT_TRUE(result.IsFailure());
    EXPECT_EQ(ErrorMessage(result.Error()), "boom");
}

TEST_F(AggregateTest, FoldIgnoresInputsAfterFailure) {
    Promise<int> late(executor_);
    std::vector<Future<int>> futures{MakeFailed<int>(executor_, std::runtime_error("boom")), late.GetFuture()};

    auto sum = Fold(executor_, 0, futures, Add);
    auto result = Await(sum);
    ASSERT_TRUE(result.IsFailure());

    late.SetValue(5);
    executor_.Run();
    EXPECT_EQ(ErrorMessage(sum.Peek()->Error()), "boom");
}

TEST_F(AggregateTest, FoldThrowingCombineFails) {
    auto sum = Fold(executor_, 0, DelayedRange(3), [](int, int) -> int { throw std::overflow_error("too big"); });
    auto result = Await(sum);
    ASSERT_TRUE(result.IsFailure());
    EXPECT_EQ(ErrorMessage(result.Error()), "too big");
}

// ============================================================================
// Reduce
// ============================================================================

TEST_F(AggregateTest, ReduceSumsAllInputs) {
    auto sum = Reduce(executor_, DelayedRange(10), Add);
    EXPECT_EQ(Get(sum), 45);
}

TEST_F(AggregateTest, ReduceSingleInput) {
    std::vector<Future<int>> futures{MakeSuccessful(executor_, 9)};
    EXPECT_EQ(Get(Reduce(executor_, futures, Add)), 9);
}

TEST_F(AggregateTest, ReduceEmptyFails) {
    auto result = Await(Reduce(executor_, std::vector<Future<int>>{}, Add));
    ASSERT_TRUE(result.IsFailure());
    EXPECT_EQ(ErrorCodeOf(result.Error()), Errc::EmptyAggregate);
}

TEST_F(AggregateTest, ReduceFirstFailureWins) {
    auto futures = DelayedRange(10);
    futures[7] = Spawn(executor_, []() -> int { throw std::runtime_error("boom"); });

    auto result = Await(Reduce(executor_, futures, Add));
    ASSERT_TRUE(result.IsFailure());
    EXPECT_EQ(ErrorMessage(result.Error()), "boom");
}

TEST_F(AggregateTest, ReduceMax) {
    auto max = Reduce(executor_, DelayedRange(20), [](int a, int b) { return std::max(a, b); });
    EXPECT_EQ(Get(max), 19);
}

// ============================================================================
// Sequence
// ============================================================================

TEST_F(AggregateTest, SequencePreservesInputOrder) {
    auto all = Get(Sequence(executor_, DelayedRange(100)));
    ASSERT_EQ(all.size(), 100u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(all[i], i);
    }
}

TEST_F(AggregateTest, SequenceEmpty) {
    EXPECT_TRUE(Get(Sequence(executor_, std::vector<Future<int>>{})).empty());
}

TEST_F(AggregateTest, SequenceFailure) {
    auto futures = DelayedRange(10);
    futures[0] = MakeFailed<int>(executor_, std::runtime_error("boom"));
    EXPECT_THROW(Get(Sequence(executor_, futures)), std::runtime_error);
}

TEST_F(AggregateTest, SequenceOfOddNumbersSums) {
    std::vector<Future<int>> futures;
    for (int i = 0; i < 100; ++i) {
        futures.push_back(Spawn(executor_, [i] { return 2 * i + 1; }));
    }
    auto odds = Get(Sequence(executor_, futures));
    EXPECT_EQ(odds.front(), 1);
    EXPECT_EQ(odds.back(), 199);
    EXPECT_EQ(std::accumulate(odds.begin(), odds.end(), 0), 10000);
}

// ============================================================================
// Traverse
// ============================================================================

TEST_F(AggregateTest, TraverseOddNumbers) {
    std::vector<int> inputs(100);
    std::iota(inputs.begin(), inputs.end(), 0);

    auto odds = Traverse(executor_, inputs, [this](const int& i) {
        auto delay = std::chrono::microseconds((i * 37) % 1000);
        return Spawn(executor_, [i, delay] {
            std::this_thread::sleep_for(delay);
            return 2 * i + 1;
        });
    });

    auto values = Get(odds);
    ASSERT_EQ(values.size(), 100u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(values[i], 2 * i + 1);
    }
    EXPECT_EQ(std::accumulate(values.begin(), values.end(), 0), 10000);
}

TEST_F(AggregateTest, TraverseThrowingFunctionFails) {
    std::vector<std::string> words{"a", "", "c"};
    auto lengths = Traverse(executor_, words, [this](const std::string& w) {
        if (w.empty()) throw std::invalid_argument("empty word");
        return MakeSuccessful(executor_, w.size());
    });

    auto result = Await(lengths);
    ASSERT_TRUE(result.IsFailure());
    EXPECT_EQ(ErrorMessage(result.Error()), "empty word");
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(AggregateTest, InputsCompletedFromManyThreads) {
    constexpr int kInputs = 64;
    std::vector<Promise<int>> promises;
    std::vector<Future<int>> futures;
    for (int i = 0; i < kInputs; ++i) {
        promises.emplace_back(executor_);
        futures.push_back(promises.back().GetFuture());
    }

    auto sum = Fold(executor_, 0, futures, Add);
    auto ordered = Sequence(executor_, futures);

    std::vector<int> order(kInputs);
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), random_);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int k = t; k < kInputs; k += 4) {
                promises[order[k]].SetValue(order[k]);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(Get(sum), kInputs * (kInputs - 1) / 2);
    auto values = Get(ordered);
    for (int i = 0; i < kInputs; ++i) {
        EXPECT_EQ(values[i], i);
    }
}
