// ============================================================================
// pledge/core/spawn.hpp - Run a Computation, Get a Future
// ============================================================================
//
// Spawn() posts a callable to an executor and returns a Future for its
// result. It is the smallest producer that honors the runtime contract: one
// promise per unit of work, completed exactly once with the returned value or
// with whatever the callable threw.
//
// The executor's QuiescenceCounter covers the work from the moment it is
// scheduled until its promise is completed.
//
// USAGE:
// ------
//   Future<int> answer = Spawn(executor, [] { return 6 * 7; });
//   Future<Unit> done = Spawn(executor, [] { Flush(); });
//
//   executor.Quiescence().WaitForQuiescence(1s);
//
// ============================================================================

#pragma once

#include <concepts>
#include <exception>
#include <type_traits>
#include <utility>

#include "pledge/core/defer.hpp"
#include "pledge/core/future.hpp"
#include "pledge/core/promise.hpp"
#include "pledge/core/try.hpp"
#include "pledge/runtime/executor.hpp"
#include "pledge/runtime/quiescence.hpp"

namespace pledge {

// Value type of Spawn(executor, F); void becomes Unit
template <typename F>
using SpawnValueType =
    std::conditional_t<std::is_void_v<std::invoke_result_t<F&>>, Unit, std::decay_t<std::invoke_result_t<F&>>>;

template <typename F>
    requires std::invocable<F&>
Future<SpawnValueType<F>> Spawn(Executor& executor, F func) {
    using R = std::invoke_result_t<F&>;

    Promise<SpawnValueType<F>> promise(executor);
    QuiescenceCounter& quiescence = executor.Quiescence();
    quiescence.Increment();

    executor.Post([promise, func = std::move(func), &quiescence]() mutable {
        // Runs after the promise is completed, whichever way
        Defer done([&quiescence] { quiescence.Decrement(); });

        try {
            if constexpr (std::is_void_v<R>) {
                func();
                promise.SetValue(Unit{});
            } else {
                promise.SetValue(func());
            }
        } catch (...) {
            promise.SetException(std::current_exception());
        }
    });
    return promise.GetFuture();
}

}  // namespace pledge
