// ============================================================================
// pledge/sync/await.hpp - Blocking Reads with Optional Deadline
// ============================================================================
//
// The bridge between synchronous code and futures: block the calling thread
// until a future completes, or until a deadline passes.
//
// - Await(f)               -> Try<T>, waits forever
// - Await(f, timeout)      -> bool, whether f completed in time
// - ValueWithin(f, timeout)-> optional<Try<T>>, nullopt = not yet completed
// - Get(f)                 -> T, or rethrows the stored error
// - Get(f, timeout)        -> T, or rethrows, or throws FutureError(Timeout)
//
// A timeout belongs to the read call only. The future is not changed and can
// still be completed and read afterwards.
//
// USAGE:
// ------
//   Future<int> f = Spawn(executor, [] { return 5; });
//   int five = Get(f);
//
//   if (auto result = ValueWithin(slow, 2s)) {
//       Use(*result);          // completed, Success or Failure
//   } else {
//       Retry();               // still pending
//   }
//
// WARNING:
// --------
// Blocking inside one of the pool's own callbacks parks a worker. With a
// small pool and a future that needs that same pool to complete, this can
// deadlock. Such calls are logged at debug level.
//
// ============================================================================

#pragma once

#include <fmt/format.h>

#include <chrono>
#include <optional>
#include <utility>

#include "pledge/core/error.hpp"
#include "pledge/core/future.hpp"
#include "pledge/core/log.hpp"
#include "pledge/core/try.hpp"
#include "pledge/runtime/executor.hpp"

namespace pledge {

namespace detail {

inline void NoteBlockingRead(const Executor& executor) {
    if (executor.IsCurrent()) {
        PLEDGE_LOG_DEBUG("blocking read on a worker thread of the future's own executor");
    }
}

}  // namespace detail

// ============================================================================
// Indefinite waits
// ============================================================================

template <typename T>
Try<T> Await(const Future<T>& future) {
    detail::NoteBlockingRead(future.GetExecutor());
    return future.Wait();
}

template <typename T>
T Get(const Future<T>& future) {
    return Await(future).ValueOrThrow();
}

// ============================================================================
// Deadline-bounded waits
// ============================================================================

template <typename T, typename Rep, typename Period>
bool Await(const Future<T>& future, const std::chrono::duration<Rep, Period>& timeout) {
    detail::NoteBlockingRead(future.GetExecutor());
    return future.WaitFor(timeout);
}

// Never throws because the deadline passed
template <typename T, typename Rep, typename Period>
std::optional<Try<T>> ValueWithin(const Future<T>& future, const std::chrono::duration<Rep, Period>& timeout) {
    if (!Await(future, timeout)) {
        return std::nullopt;
    }
    return future.Peek();
}

template <typename T, typename Rep, typename Period>
T Get(const Future<T>& future, const std::chrono::duration<Rep, Period>& timeout) {
    std::optional<Try<T>> result = ValueWithin(future, timeout);
    if (!result.has_value()) {
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count();
        throw FutureError(Errc::Timeout, fmt::format("waited {}ms", millis));
    }
    return std::move(*result).ValueOrThrow();
}

}  // namespace pledge
