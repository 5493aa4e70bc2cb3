// ============================================================================
// pledge/core/future.hpp - Shared Result Cell and its Read-Only Handle
// ============================================================================
//
// A Future<T> is a read-only view over a write-once cell that a Promise<T>
// completes. Both are cheap, copyable handles to one reference-counted
// SharedState; the state lives until the last handle and the last pending
// callback are gone.
//
// KEY CONCEPTS:
// -------------
// 1. WRITE ONCE: The only transition is Pending -> Completed(Try<T>). A
//    second completion attempt is a silent no-op.
//
// 2. CALLBACK REGISTRY: OnComplete() listeners are delivered exactly once,
//    in registration order, whether they were registered before or after
//    completion. Delivery always happens on the promise's Executor:
//      - Complete() takes the listener list under the lock and posts one
//        delivery job; it never runs listener code itself.
//      - Registrations that arrive while a delivery job is running are
//        appended and drained by that same job, which keeps the order.
//
// 3. ISOLATION: A listener that throws is logged and skipped; the stored
//    Try, the completer, and later listeners are unaffected.
//
// 4. BLOCKING READS: Wait()/WaitFor() park on a condition variable and
//    re-check the state on every wakeup. A timeout changes nothing.
//
// USAGE:
// ------
//   Promise<int> promise(executor);
//   Future<int> future = promise.GetFuture();
//
//   future.OnComplete([](const Try<int>& result) {
//       if (result) Use(result.Value());
//   });
//   promise.SetValue(42);
//
// ============================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "pledge/core/check.hpp"
#include "pledge/core/concepts.hpp"
#include "pledge/core/defer.hpp"
#include "pledge/core/log.hpp"
#include "pledge/core/try.hpp"
#include "pledge/runtime/executor.hpp"

namespace pledge {

namespace detail {

// ============================================================================
// SharedState<T> - The write-once cell plus its listener list
// ============================================================================
template <typename T>
class SharedState : public std::enable_shared_from_this<SharedState<T>> {
   public:
    using Callback = std::function<void(const Try<T>&)>;

    explicit SharedState(Executor& executor) : executor_(&executor) {}

    SharedState(const SharedState&) = delete;
    SharedState& operator=(const SharedState&) = delete;

    Executor& GetExecutor() const noexcept { return *executor_; }

    // Returns false (and changes nothing) if already completed
    bool Complete(Try<T> result) {
        bool schedule = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (result_.has_value()) {
                return false;
            }
            result_.emplace(std::move(result));
            if (!callbacks_.empty()) {
                draining_ = true;
                schedule = true;
            }
        }
        completed_.notify_all();
        if (schedule) {
            ScheduleDelivery();
        }
        return true;
    }

    void AddCallback(Callback callback) {
        bool schedule = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callbacks_.push_back(std::move(callback));
            if (result_.has_value() && !draining_) {
                draining_ = true;
                schedule = true;
            }
        }
        if (schedule) {
            ScheduleDelivery();
        }
    }

    bool IsCompleted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return result_.has_value();
    }

    std::optional<Try<T>> Peek() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return result_;
    }

    Try<T> Wait() const {
        std::unique_lock<std::mutex> lock(mutex_);
        completed_.wait(lock, [this] { return result_.has_value(); });
        return *result_;
    }

    template <typename Rep, typename Period>
    bool WaitFor(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return completed_.wait_for(lock, timeout, [this] { return result_.has_value(); });
    }

   private:
    // If Post() throws, no job is in flight: clear draining_ so the next
    // AddCallback() schedules one instead of queueing forever.
    void ScheduleDelivery() {
        Defer unclaim([this] {
            std::lock_guard<std::mutex> lock(mutex_);
            draining_ = false;
        });
        executor_->Post([self = this->shared_from_this()] { self->Deliver(); });
        unclaim.Dismiss();
    }

    // Runs on the executor. Only one Deliver() per state is in flight at a
    // time (draining_), so listeners see registration order.
    void Deliver() {
        while (true) {
            std::vector<Callback> batch;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (callbacks_.empty()) {
                    draining_ = false;
                    return;
                }
                batch.swap(callbacks_);
            }

            // result_ never changes once set
            for (auto& callback : batch) {
                InvokeIsolated(callback, *result_);
            }
        }
    }

    static void InvokeIsolated(Callback& callback, const Try<T>& result) {
        try {
            callback(result);
        } catch (const std::exception& e) {
            PLEDGE_LOG_WARN("completion callback threw: {}", e.what());
        } catch (...) {
            PLEDGE_LOG_WARN("completion callback threw a non-standard exception");
        }
    }

    mutable std::mutex mutex_;
    mutable std::condition_variable completed_;
    std::optional<Try<T>> result_;
    std::vector<Callback> callbacks_;
    bool draining_ = false;
    Executor* executor_;
};

}  // namespace detail

// ============================================================================
// Future<T> - Read-only handle
// ============================================================================
template <typename T>
class Future {
   public:
    using ValueType = T;
    using State = detail::SharedState<T>;

    // An empty handle; only assignment and IsValid() are allowed on it
    Future() = default;

    explicit Future(std::shared_ptr<State> state) : state_(std::move(state)) {}

    Future(const Future&) = default;
    Future(Future&&) noexcept = default;
    Future& operator=(const Future&) = default;
    Future& operator=(Future&&) noexcept = default;

    [[nodiscard]] bool IsValid() const noexcept { return state_ != nullptr; }

    // ========================================================================
    // Inspection
    // ========================================================================

    [[nodiscard]] bool IsCompleted() const { return Checked().IsCompleted(); }

    // The stored Try, or nullopt while pending
    [[nodiscard]] std::optional<Try<T>> Peek() const { return Checked().Peek(); }

    // Executor that runs this future's callbacks
    Executor& GetExecutor() const { return Checked().GetExecutor(); }

    // ========================================================================
    // Callback Registration
    // ========================================================================

    // Invoke callback exactly once with the final Try, on the executor
    template <TryCallback<T> F>
    void OnComplete(F&& callback) const {
        Checked().AddCallback(typename State::Callback(std::forward<F>(callback)));
    }

    // ========================================================================
    // Blocking Reads (see sync/await.hpp for the public gateway)
    // ========================================================================

    Try<T> Wait() const { return Checked().Wait(); }

    template <typename Rep, typename Period>
    bool WaitFor(const std::chrono::duration<Rep, Period>& timeout) const {
        return Checked().WaitFor(timeout);
    }

   private:
    State& Checked() const {
        PLEDGE_CHECK(state_ != nullptr, "use of an empty Future");
        return *state_;
    }

    std::shared_ptr<State> state_;
};

}  // namespace pledge
