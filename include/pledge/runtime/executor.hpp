// ============================================================================
// pledge/runtime/executor.hpp - Abstract Worker Pool Interface
// ============================================================================
//
// The Executor runs the library's asynchronous work: completion callbacks of
// promises and the bodies of spawned computations. Every Promise is bound to
// one Executor at creation, and every combinator derives its result on the
// executor of its source.
//
// DESIGN PHILOSOPHY:
// ------------------
// 1. INJECTED, NOT GLOBAL: There is no default pool. Callers create an
//    executor at startup, pass it to the code that creates promises, and
//    shut it down at teardown. Promises keep a plain reference to their
//    executor, so it must outlive every promise, future and pending
//    callback bound to it. Completing after Shutdown() is fine; completing
//    after the executor is destroyed is undefined.
//
// 2. OFF-THREAD CALLBACKS: Completing a promise only posts work here, so the
//    completing thread never runs listener code and long combinator chains
//    never grow a single call stack.
//
// 3. QUIESCENCE: Each executor owns a QuiescenceCounter so callers can tell
//    when all future-bound work has drained.
//
// USAGE:
// ------
//   ThreadPoolExecutor executor(4);
//   Promise<int> promise(executor);
//   executor.Post([] { DoWork(); });
//   executor.PostAfter(100ms, [] { DoLater(); });
//
// ============================================================================

#pragma once

#include <chrono>
#include <functional>

#include "pledge/runtime/quiescence.hpp"

namespace pledge {

// ============================================================================
// Executor - Abstract Worker Pool Interface
// ============================================================================
class Executor {
   public:
    virtual ~Executor() = default;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    // Block until Stop() is called or no more work is queued or running
    virtual void Run() = 0;

    // Signal the executor to stop; posted work is still executed
    virtual void Stop() = 0;

    // Check if the executor is running
    [[nodiscard]] virtual bool IsRunning() const = 0;

    // ========================================================================
    // Scheduling
    // ========================================================================

    // Run a callback on a worker thread as soon as possible
    virtual void Post(std::function<void()> callback) = 0;

    // Run a callback on a worker thread after a delay
    virtual void PostAfter(std::chrono::milliseconds delay, std::function<void()> callback) = 0;

    // ========================================================================
    // Diagnostics
    // ========================================================================

    // Outstanding future-bound work scheduled on this executor
    virtual QuiescenceCounter& Quiescence() = 0;

    // True when called from one of this executor's own threads
    [[nodiscard]] bool IsCurrent() const noexcept;
};

// ============================================================================
// Thread-Local Executor Access
// ============================================================================
// Worker threads record the executor they belong to, so blocking reads can
// tell when they are about to park one of the pool's own workers.
//

// Get the current thread's executor (nullptr if none set)
[[nodiscard]] Executor* GetCurrentExecutor();

// Set the current thread's executor (used internally by worker threads)
void SetCurrentExecutor(Executor* executor);

// RAII guard for setting/restoring current executor
class ExecutorGuard {
   public:
    explicit ExecutorGuard(Executor* executor);
    ~ExecutorGuard();

    ExecutorGuard(const ExecutorGuard&) = delete;
    ExecutorGuard& operator=(const ExecutorGuard&) = delete;

   private:
    Executor* previous_;
};

}  // namespace pledge
