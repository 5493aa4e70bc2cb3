// ============================================================================
// pledge/core/aggregate.hpp - Combining Many Futures into One
// ============================================================================
//
// Fold, Reduce, Sequence and Traverse attach one listener to every input
// future and complete a single output promise once the aggregation rule is
// satisfied.
//
// KEY CONCEPTS:
// -------------
// 1. ONE LOCK PER AGGREGATION: The accumulator (or result slots), the
//    remaining-count, and the "done" flag live in a heap-allocated state
//    shared by all listeners and guarded by one mutex. Inputs may complete
//    on any thread in any order.
//
// 2. FIRST FAILURE WINS: The first failed input completes the output with
//    that failure. Every later input completion is ignored for the result.
//
// 3. COMPLETION ORDER: Fold and Reduce apply combine in the order inputs
//    complete, so combine should not depend on order. Sequence and Traverse
//    always yield values in input order.
//
// 4. EMPTY INPUT: Fold yields zero; Sequence yields an empty vector; Reduce
//    fails with EmptyAggregate, because it has no value to start from.
//
// USAGE:
// ------
//   auto sum = Fold(executor, 0, futures, [](int acc, int x) { return acc + x; });
//   auto max = Reduce(executor, futures, [](int a, int b) { return std::max(a, b); });
//   Future<std::vector<int>> all = Sequence(executor, futures);
//   auto lengths = Traverse(executor, words, [&](const std::string& w) {
//       return Spawn(executor, [w] { return w.size(); });
//   });
//
// ============================================================================

#pragma once

#include <concepts>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "pledge/core/concepts.hpp"
#include "pledge/core/error.hpp"
#include "pledge/core/future.hpp"
#include "pledge/core/promise.hpp"
#include "pledge/core/try.hpp"
#include "pledge/runtime/executor.hpp"

namespace pledge {

// ============================================================================
// Fold
// ============================================================================

template <typename T, typename R, typename F>
    requires std::invocable<F&, R, const T&> && std::convertible_to<std::invoke_result_t<F&, R, const T&>, R>
Future<R> Fold(Executor& executor, R zero, const std::vector<Future<T>>& futures, F combine) {
    Promise<R> promise(executor);
    if (futures.empty()) {
        promise.SetValue(std::move(zero));
        return promise.GetFuture();
    }

    struct FoldState {
        FoldState(R zero, size_t count, F fn)
            : accumulator(std::move(zero)), remaining(count), combine(std::move(fn)) {}

        std::mutex mutex;
        R accumulator;
        size_t remaining;
        bool done = false;
        F combine;
    };
    auto state = std::make_shared<FoldState>(std::move(zero), futures.size(), std::move(combine));

    for (const auto& future : futures) {
        future.OnComplete([state, promise](const Try<T>& result) {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->done) {
                return;
            }

            if (result.IsFailure()) {
                state->done = true;
                promise.Complete(Failure(result.Error()));
                return;
            }

            try {
                state->accumulator = state->combine(std::move(state->accumulator), result.Value());
            } catch (...) {
                state->done = true;
                promise.Complete(Failure(std::current_exception()));
                return;
            }

            if (--state->remaining == 0) {
                state->done = true;
                promise.SetValue(std::move(state->accumulator));
            }
        });
    }
    return promise.GetFuture();
}

// ============================================================================
// Reduce
// ============================================================================
// Like Fold, seeded by the first input to succeed.

template <typename T, typename F>
    requires std::invocable<F&, T, const T&> && std::convertible_to<std::invoke_result_t<F&, T, const T&>, T>
Future<T> Reduce(Executor& executor, const std::vector<Future<T>>& futures, F combine) {
    if (futures.empty()) {
        return MakeFailed<T>(executor, MakeFutureError(Errc::EmptyAggregate));
    }

    Promise<T> promise(executor);

    struct ReduceState {
        ReduceState(size_t count, F fn) : remaining(count), combine(std::move(fn)) {}

        std::mutex mutex;
        std::optional<T> accumulator;
        size_t remaining;
        bool done = false;
        F combine;
    };
    auto state = std::make_shared<ReduceState>(futures.size(), std::move(combine));

    for (const auto& future : futures) {
        future.OnComplete([state, promise](const Try<T>& result) {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->done) {
                return;
            }

            if (result.IsFailure()) {
                state->done = true;
                promise.Complete(Failure(result.Error()));
                return;
            }

            try {
                if (state->accumulator.has_value()) {
                    state->accumulator = state->combine(std::move(*state->accumulator), result.Value());
                } else {
                    state->accumulator.emplace(result.Value());
                }
            } catch (...) {
                state->done = true;
                promise.Complete(Failure(std::current_exception()));
                return;
            }

            if (--state->remaining == 0) {
                state->done = true;
                promise.SetValue(std::move(*state->accumulator));
            }
        });
    }
    return promise.GetFuture();
}

// ============================================================================
// Sequence
// ============================================================================

template <typename T>
Future<std::vector<T>> Sequence(Executor& executor, const std::vector<Future<T>>& futures) {
    Promise<std::vector<T>> promise(executor);
    if (futures.empty()) {
        promise.SetValue(std::vector<T>{});
        return promise.GetFuture();
    }

    struct SequenceState {
        std::mutex mutex;
        std::vector<std::optional<T>> slots;
        size_t remaining;
        bool done = false;
    };
    auto state = std::make_shared<SequenceState>();
    state->slots.resize(futures.size());
    state->remaining = futures.size();

    for (size_t i = 0; i < futures.size(); ++i) {
        futures[i].OnComplete([state, promise, i](const Try<T>& result) {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->done) {
                return;
            }

            if (result.IsFailure()) {
                state->done = true;
                promise.Complete(Failure(result.Error()));
                return;
            }

            state->slots[i].emplace(result.Value());
            if (--state->remaining == 0) {
                state->done = true;
                std::vector<T> values;
                values.reserve(state->slots.size());
                for (auto& slot : state->slots) {
                    values.push_back(std::move(*slot));
                }
                promise.SetValue(std::move(values));
            }
        });
    }
    return promise.GetFuture();
}

// ============================================================================
// Traverse
// ============================================================================
// Sequence over func(item) for every item, in item order. If func throws,
// the result fails with that exception.

template <typename I, typename F>
    requires FutureReturning<F, const I&>
Future<std::vector<FutureValueType<std::invoke_result_t<F&, const I&>>>> Traverse(Executor& executor,
                                                                                  const std::vector<I>& items,
                                                                                  F func) {
    using U = FutureValueType<std::invoke_result_t<F&, const I&>>;

    std::vector<Future<U>> futures;
    futures.reserve(items.size());
    try {
        for (const auto& item : items) {
            futures.push_back(func(item));
        }
    } catch (...) {
        return MakeFailed<std::vector<U>>(executor, std::current_exception());
    }
    return Sequence(executor, futures);
}

}  // namespace pledge
