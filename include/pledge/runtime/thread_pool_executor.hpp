// ============================================================================
// pledge/runtime/thread_pool_executor.hpp - Multi-Threaded Worker Pool
// ============================================================================
//
// ThreadPoolExecutor runs posted callbacks across a fixed set of worker
// threads. It is the pool that delivers promise completions and runs
// spawned computations.
//
// KEY CONCEPTS:
// -------------
// 1. WORKER THREADS: A fixed number of threads pull work from a shared queue.
// 2. TIMER THREAD: PostAfter() parks callbacks in a deadline-ordered queue
//    and moves them onto the work queue when due.
// 3. LIFECYCLE: Workers start in the constructor. Stop() releases Run() but
//    leaves the workers serving; Shutdown() (also run by the destructor)
//    drains the queue and joins them. Nothing posted is ever dropped: work
//    arriving after shutdown runs inline on the posting thread, and pending
//    delayed work is flushed.
// 4. ISOLATION: A callback that throws is logged; the worker keeps going.
//
// USAGE:
// ------
//   ThreadPoolExecutor::Options opts;
//   opts.num_threads = 4;
//   opts.thread_name_prefix = "replies";
//   ThreadPoolExecutor executor(opts);
//
//   executor.Post([] { Work(); });
//   executor.Run();        // wait until idle
//   executor.Shutdown();   // drain and join
//
// ============================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "pledge/runtime/executor.hpp"
#include "pledge/runtime/quiescence.hpp"

namespace pledge {

// ============================================================================
// ThreadPoolExecutor
// ============================================================================
class ThreadPoolExecutor : public Executor {
public:
    // ========================================================================
    // Options
    // ========================================================================
    struct Options {
        // Worker count; 0 is raised to 1
        size_t num_threads = std::thread::hardware_concurrency();

        // Worker i names itself "<prefix>-<i>"; empty keeps the default name
        std::string thread_name_prefix = "pledge-worker";
    };

    // ========================================================================
    // Construction
    // ========================================================================

    // Create with default options
    ThreadPoolExecutor();

    // Create with specified number of threads (convenience)
    explicit ThreadPoolExecutor(size_t num_threads);

    // Create with full options
    explicit ThreadPoolExecutor(const Options& options);

    ~ThreadPoolExecutor() override;

    // Non-copyable, non-movable
    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    // ========================================================================
    // Executor Interface Implementation
    // ========================================================================

    // Block until Stop() is called or the pool is idle (no queued, running
    // or delayed work)
    void Run() override;

    // Make Run() return. Workers keep running posted work until Shutdown().
    void Stop() override;

    bool IsRunning() const override;

    void Post(std::function<void()> callback) override;

    void PostAfter(std::chrono::milliseconds delay, std::function<void()> callback) override;

    QuiescenceCounter& Quiescence() override { return quiescence_; }

    // ========================================================================
    // Thread Pool Specific
    // ========================================================================

    // Stop, flush delayed work, and join all threads. Must not be called
    // from one of this pool's workers. Idempotent.
    void Shutdown();

    // Get the number of worker threads
    size_t NumThreads() const { return workers_.size(); }

    // Get the number of queued (not yet running) callbacks
    size_t PendingTasks() const;

private:
    // Delayed work item
    struct DelayedWork {
        std::chrono::steady_clock::time_point when;
        uint64_t seq;
        std::function<void()> callback;

        bool operator>(const DelayedWork& other) const {
            return when != other.when ? when > other.when : seq > other.seq;
        }
    };

    // Worker thread function (index used in the thread name)
    void WorkerLoop(size_t worker_index);

    // Timer thread function (handles delayed work)
    void TimerLoop();

    // Run one callback with exceptions contained
    static void RunItem(std::function<void()>& callback);

    // Internal: initialize worker threads
    void InitWorkers();

    // Configuration
    Options options_;

    // Worker threads
    std::vector<std::thread> workers_;

    // Timer thread for delayed execution
    std::thread timer_thread_;

    // Work queue
    std::queue<std::function<void()>> work_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable work_available_;
    bool closed_ = false;  // guarded by queue_mutex_; set once workers are joined

    // Delayed work (priority queue, earliest first)
    std::priority_queue<DelayedWork, std::vector<DelayedWork>, std::greater<DelayedWork>> delayed_queue_;
    std::mutex delayed_mutex_;
    std::condition_variable delayed_cv_;
    uint64_t delayed_seq_ = 0;

    // Delayed items not yet moved to work_queue_. Decremented under
    // queue_mutex_ so Run() never sees the pool idle in between.
    std::atomic<size_t> delayed_pending_{0};

    // Serializes Shutdown()
    std::mutex shutdown_mutex_;

    QuiescenceCounter quiescence_;

    // State
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};  // Run() released
    std::atomic<bool> exiting_{false};   // workers and timer leave once drained
    std::atomic<size_t> active_tasks_{0};
};

}  // namespace pledge
