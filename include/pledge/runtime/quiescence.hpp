// ============================================================================
// pledge/runtime/quiescence.hpp - Outstanding Work Counter
// ============================================================================
//
// QuiescenceCounter tracks how many future-bound units of work are still
// outstanding on an executor. It is incremented when such work is scheduled
// and decremented once the promise it feeds has been completed.
//
// It is a diagnostic side channel for orderly shutdown and for tests that
// need to know everything has drained; futures never consult it.
//
// USAGE:
// ------
//   auto f = Spawn(executor, [] { return Compute(); });
//   executor.Quiescence().WaitForQuiescence(1s);
//   EXPECT_TRUE(executor.Quiescence().IsQuiescent());
//
// ============================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace pledge {

class QuiescenceCounter {
   public:
    QuiescenceCounter() = default;

    QuiescenceCounter(const QuiescenceCounter&) = delete;
    QuiescenceCounter& operator=(const QuiescenceCounter&) = delete;

    // A unit of future-bound work was scheduled
    void Increment();

    // A unit of work completed its promise. Must pair with an Increment().
    void Decrement();

    [[nodiscard]] size_t Outstanding() const;

    [[nodiscard]] bool IsQuiescent() const { return Outstanding() == 0; }

    // Block until the count reaches zero or the timeout elapses.
    // Returns true if quiescent.
    bool WaitForQuiescence(std::chrono::milliseconds timeout);

   private:
    mutable std::mutex mutex_;
    std::condition_variable drained_;
    size_t outstanding_ = 0;
};

}  // namespace pledge
