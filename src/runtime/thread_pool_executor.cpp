// ============================================================================
// ThreadPoolExecutor Implementation
// ============================================================================

#include "pledge/runtime/thread_pool_executor.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "pledge/core/check.hpp"
#include "pledge/core/log.hpp"
#include "pledge/runtime/thread_utils.hpp"

namespace pledge {

// ============================================================================
// Construction / Destruction
// ============================================================================

ThreadPoolExecutor::ThreadPoolExecutor() : ThreadPoolExecutor(Options{}) {}

ThreadPoolExecutor::ThreadPoolExecutor(size_t num_threads) : ThreadPoolExecutor(Options{num_threads}) {}

ThreadPoolExecutor::ThreadPoolExecutor(const Options& options) : options_(options) {
    options_.num_threads = std::max<size_t>(options_.num_threads, 1);
    InitWorkers();
}

void ThreadPoolExecutor::InitWorkers() {
    running_ = true;

    workers_.reserve(options_.num_threads);
    for (size_t i = 0; i < options_.num_threads; ++i) {
        workers_.emplace_back([this, i] { WorkerLoop(i); });
    }

    timer_thread_ = std::thread([this] { TimerLoop(); });

    PLEDGE_LOG_DEBUG("thread pool started with {} workers", options_.num_threads);
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
    Shutdown();
}

void ThreadPoolExecutor::Shutdown() {
    std::lock_guard<std::mutex> guard(shutdown_mutex_);
    PLEDGE_CHECK(!IsCurrent(), "Shutdown() called from one of the pool's own workers");

    Stop();
    {
        std::lock_guard<std::mutex> delayed_lock(delayed_mutex_);
        std::lock_guard<std::mutex> queue_lock(queue_mutex_);
        exiting_ = true;
    }
    work_available_.notify_all();
    delayed_cv_.notify_all();

    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }

    // Delayed work that never came due is run now rather than dropped
    {
        std::lock_guard<std::mutex> delayed_lock(delayed_mutex_);
        std::lock_guard<std::mutex> queue_lock(queue_mutex_);
        while (!delayed_queue_.empty()) {
            work_queue_.push(delayed_queue_.top().callback);
            delayed_queue_.pop();
        }
        delayed_pending_ = 0;
    }
    work_available_.notify_all();

    bool joined_any = false;
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
            joined_any = true;
        }
    }

    // Anything posted after the last worker left runs here
    std::queue<std::function<void()>> leftovers;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        closed_ = true;
        std::swap(leftovers, work_queue_);
    }
    while (!leftovers.empty()) {
        RunItem(leftovers.front());
        leftovers.pop();
    }

    if (joined_any) {
        PLEDGE_LOG_DEBUG("thread pool shut down");
    }
}

// ============================================================================
// Executor Interface
// ============================================================================

void ThreadPoolExecutor::Run() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    work_available_.wait(lock, [this] {
        return stopping_ ||
               (work_queue_.empty() && active_tasks_ == 0 && delayed_pending_ == 0);
    });
}

// Only releases Run(). Workers and the timer keep serving until Shutdown(),
// so completions that happen after Stop() are still delivered.
void ThreadPoolExecutor::Stop() {
    running_ = false;
    {
        // Storing under the lock orders the flag before any waiter's
        // predicate check, so no wakeup is lost.
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    work_available_.notify_all();
}

bool ThreadPoolExecutor::IsRunning() const {
    return running_;
}

void ThreadPoolExecutor::Post(std::function<void()> callback) {
    if (!callback) return;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!closed_) {
            work_queue_.push(std::move(callback));
            work_available_.notify_one();
            return;
        }
    }

    PLEDGE_LOG_WARN("work posted after shutdown; running it on the posting thread");
    RunItem(callback);
}

void ThreadPoolExecutor::PostAfter(std::chrono::milliseconds delay, std::function<void()> callback) {
    if (!callback) return;

    auto when = std::chrono::steady_clock::now() + delay;
    {
        std::lock_guard<std::mutex> lock(delayed_mutex_);
        if (!exiting_) {
            delayed_queue_.push({when, delayed_seq_++, std::move(callback)});
            delayed_pending_++;
            delayed_cv_.notify_one();
            return;
        }
    }

    // The timer thread is gone; run as soon as possible instead
    Post(std::move(callback));
}

size_t ThreadPoolExecutor::PendingTasks() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return work_queue_.size();
}

void ThreadPoolExecutor::RunItem(std::function<void()>& callback) {
    try {
        callback();
    } catch (const std::exception& e) {
        PLEDGE_LOG_ERROR("posted callback threw: {}", e.what());
    } catch (...) {
        PLEDGE_LOG_ERROR("posted callback threw a non-standard exception");
    }
}

// ============================================================================
// Worker Thread
// ============================================================================

void ThreadPoolExecutor::WorkerLoop(size_t worker_index) {
    ExecutorGuard current(this);

    if (!NameWorkerThread(options_.thread_name_prefix, worker_index)) {
        PLEDGE_LOG_DEBUG("worker {}: cannot set thread name", worker_index);
    }

    while (true) {
        std::function<void()> item;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            work_available_.wait(lock, [this] {
                return exiting_ || !work_queue_.empty();
            });

            // Shutting down and drained
            if (work_queue_.empty()) {
                break;
            }

            item = std::move(work_queue_.front());
            work_queue_.pop();
            // Increment active_tasks_ while still holding the lock so that
            // Run() never sees empty queue + zero active tasks prematurely.
            active_tasks_++;
        }

        // Execute outside the lock
        RunItem(item);

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_tasks_--;
        }
        // Notify in case Run() is waiting
        work_available_.notify_all();
    }
}

// ============================================================================
// Timer Thread
// ============================================================================

void ThreadPoolExecutor::TimerLoop() {
    std::unique_lock<std::mutex> lock(delayed_mutex_);

    while (!exiting_) {
        if (delayed_queue_.empty()) {
            delayed_cv_.wait(lock, [this] {
                return exiting_ || !delayed_queue_.empty();
            });
            continue;
        }

        auto when = delayed_queue_.top().when;
        if (std::chrono::steady_clock::now() < when) {
            // Woken early by a new (possibly sooner) item, shutdown, or spuriously
            delayed_cv_.wait_until(lock, when);
            continue;
        }

        std::function<void()> callback = delayed_queue_.top().callback;
        delayed_queue_.pop();

        lock.unlock();
        {
            // closed_ cannot be set yet: Shutdown() joins this thread first
            std::lock_guard<std::mutex> queue_lock(queue_mutex_);
            work_queue_.push(std::move(callback));
            delayed_pending_--;
        }
        work_available_.notify_all();
        lock.lock();
    }
}

}  // namespace pledge
