// ============================================================================
// pledge/core/promise.hpp - Write Handle of a Future
// ============================================================================
//
// Promise<T> is the completion capability for one shared result cell. Any
// number of copies may exist (the producer, a timeout path, a dataflow
// variable...); whichever completes first wins, every later attempt is a
// silent no-op that returns false.
//
// USAGE:
// ------
//   Promise<std::string> promise(executor);
//   Future<std::string> future = promise.GetFuture();
//
//   // producer side, any thread
//   promise.SetValue("World");
//   promise.SetValue("ignored");        // returns false
//
//   // ready-made futures
//   auto five = MakeSuccessful(executor, 5);
//   auto bad = MakeFailed<int>(executor, std::runtime_error("boom"));
//
// ============================================================================

#pragma once

#include <concepts>
#include <exception>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include "pledge/core/future.hpp"
#include "pledge/core/try.hpp"
#include "pledge/runtime/executor.hpp"

namespace pledge {

// ============================================================================
// Promise<T>
// ============================================================================
template <typename T>
class Promise {
   public:
    using ValueType = T;
    using State = detail::SharedState<T>;

    // Create a pending promise whose callbacks run on executor. The
    // executor must outlive this promise, its futures and their callbacks.
    explicit Promise(Executor& executor) : state_(std::make_shared<State>(executor)) {}

    Promise(const Promise&) = default;
    Promise(Promise&&) noexcept = default;
    Promise& operator=(const Promise&) = default;
    Promise& operator=(Promise&&) noexcept = default;

    // ========================================================================
    // Completion
    // ========================================================================
    // Each returns true if this call completed the promise, false if it was
    // already completed (the call then has no effect).

    bool Complete(Try<T> result) const { return state_->Complete(std::move(result)); }

    bool SetValue(T value) const { return Complete(Success(std::move(value))); }

    bool SetException(std::exception_ptr error) const { return Complete(Failure(std::move(error))); }

    template <typename E>
        requires std::derived_from<std::decay_t<E>, std::exception>
    bool SetException(E&& error) const {
        return Complete(Failure(std::forward<E>(error)));
    }

    // ========================================================================
    // Inspection
    // ========================================================================

    [[nodiscard]] bool IsCompleted() const { return state_->IsCompleted(); }

    [[nodiscard]] std::optional<Try<T>> Peek() const { return state_->Peek(); }

    Executor& GetExecutor() const { return state_->GetExecutor(); }

    // Read-only view of this promise
    Future<T> GetFuture() const { return Future<T>(state_); }

   private:
    std::shared_ptr<State> state_;
};

// ============================================================================
// Factories
// ============================================================================

template <typename T>
Promise<T> MakePromise(Executor& executor) {
    return Promise<T>(executor);
}

// An already-successful future
template <typename T>
Future<std::decay_t<T>> MakeSuccessful(Executor& executor, T&& value) {
    Promise<std::decay_t<T>> promise(executor);
    promise.SetValue(std::forward<T>(value));
    return promise.GetFuture();
}

// An already-failed future
template <typename T>
Future<T> MakeFailed(Executor& executor, std::exception_ptr error) {
    Promise<T> promise(executor);
    promise.SetException(std::move(error));
    return promise.GetFuture();
}

template <typename T, typename E>
    requires std::derived_from<std::decay_t<E>, std::exception>
Future<T> MakeFailed(Executor& executor, E&& error) {
    return MakeFailed<T>(executor, std::make_exception_ptr(std::forward<E>(error)));
}

}  // namespace pledge
