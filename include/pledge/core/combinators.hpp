// ============================================================================
// pledge/core/combinators.hpp - Future Combinators
// ============================================================================
//
// Each combinator derives a new Future from a source by registering one
// OnComplete listener on it. The derived promise runs its callbacks on the
// same executor as the source.
//
// - Map:          Success(v) -> Success(f(v))
// - FlatMap:      Success(v) -> whatever the future f(v) completes with
// - Collect:      Success(v) -> Success(x) if f(v) = x, Failure(NoMatch) if nullopt
// - Recover:      Failure(e) -> Success(f(e))
// - RecoverWith:  Failure(e) -> whatever the future f(e) completes with
// - Foreach:      side effect on Success, nothing derived
// - OnFailure:    side effect on Failure, nothing derived
// - Cast<U>:      Future<std::any> -> Future<U>, Failure(TypeMismatch) if not a U
// - AsAny:        Future<T> -> Future<std::any>
//
// FAILURE PROPAGATION:
// --------------------
// A failed source is passed through untouched; Map, FlatMap and Collect never
// call their function on it. An exception thrown by the function becomes the
// derived future's failure.
//
// USAGE:
// ------
//   Future<std::string> reply = Ask(actor, "Hello");
//   Future<std::string> upper = FlatMap(reply, [&](const std::string& s) {
//       return Ask(shouter, s);
//   });
//   Future<size_t> length = Map(upper, [](const std::string& s) { return s.size(); });
//
// ============================================================================

#pragma once

#include <fmt/format.h>

#include <any>
#include <concepts>
#include <exception>
#include <optional>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include "pledge/core/concepts.hpp"
#include "pledge/core/error.hpp"
#include "pledge/core/future.hpp"
#include "pledge/core/promise.hpp"
#include "pledge/core/try.hpp"

namespace pledge {

namespace detail {

// Complete promise with whatever source completes with
template <typename T>
void ForwardTo(const Future<T>& source, const Promise<T>& promise) {
    source.OnComplete([promise](const Try<T>& result) { promise.Complete(result); });
}

}  // namespace detail

// ============================================================================
// Map
// ============================================================================

template <typename T, typename F>
    requires std::invocable<F&, const T&>
Future<std::decay_t<std::invoke_result_t<F&, const T&>>> Map(const Future<T>& source, F func) {
    using U = std::decay_t<std::invoke_result_t<F&, const T&>>;
    static_assert(!std::is_void_v<U>, "Map needs a value-returning function; use Foreach for side effects");

    Promise<U> promise(source.GetExecutor());
    source.OnComplete([promise, func = std::move(func)](const Try<T>& result) mutable {
        if (result.IsFailure()) {
            promise.Complete(Failure(result.Error()));
            return;
        }

        try {
            promise.SetValue(func(result.Value()));
        } catch (...) {
            promise.Complete(Failure(std::current_exception()));
        }
    });
    return promise.GetFuture();
}

// ============================================================================
// FlatMap
// ============================================================================

template <typename T, typename F>
    requires FutureReturning<F, const T&>
Future<FutureValueType<std::invoke_result_t<F&, const T&>>> FlatMap(const Future<T>& source, F func) {
    using U = FutureValueType<std::invoke_result_t<F&, const T&>>;

    Promise<U> promise(source.GetExecutor());
    source.OnComplete([promise, func = std::move(func)](const Try<T>& result) mutable {
        if (result.IsFailure()) {
            promise.Complete(Failure(result.Error()));
            return;
        }

        Future<U> inner;
        try {
            inner = func(result.Value());
        } catch (...) {
            promise.Complete(Failure(std::current_exception()));
            return;
        }
        detail::ForwardTo(inner, promise);
    });
    return promise.GetFuture();
}

// ============================================================================
// Collect
// ============================================================================
// extract returns std::optional<U>; nullopt means "not defined for this value".

template <typename T, typename F>
    requires Extractor<F, T>
Future<ExtractedType<F, T>> Collect(const Future<T>& source, F extract) {
    using U = ExtractedType<F, T>;

    Promise<U> promise(source.GetExecutor());
    source.OnComplete([promise, extract = std::move(extract)](const Try<T>& result) mutable {
        if (result.IsFailure()) {
            promise.Complete(Failure(result.Error()));
            return;
        }

        try {
            std::optional<U> extracted = extract(result.Value());
            if (extracted.has_value()) {
                promise.SetValue(std::move(*extracted));
            } else {
                promise.SetException(MakeFutureError(Errc::NoMatch));
            }
        } catch (...) {
            promise.Complete(Failure(std::current_exception()));
        }
    });
    return promise.GetFuture();
}

// ============================================================================
// Recover / RecoverWith
// ============================================================================

template <typename T, typename F>
    requires std::invocable<F&, const std::exception_ptr&> &&
             std::convertible_to<std::invoke_result_t<F&, const std::exception_ptr&>, T>
Future<T> Recover(const Future<T>& source, F func) {
    Promise<T> promise(source.GetExecutor());
    source.OnComplete([promise, func = std::move(func)](const Try<T>& result) mutable {
        promise.Complete(result.Recover(func));
    });
    return promise.GetFuture();
}

template <typename T, typename F>
    requires FutureReturning<F, const std::exception_ptr&> &&
             std::same_as<FutureValueType<std::invoke_result_t<F&, const std::exception_ptr&>>, T>
Future<T> RecoverWith(const Future<T>& source, F func) {
    Promise<T> promise(source.GetExecutor());
    source.OnComplete([promise, func = std::move(func)](const Try<T>& result) mutable {
        if (result.IsSuccess()) {
            promise.Complete(result);
            return;
        }

        Future<T> fallback;
        try {
            fallback = func(result.Error());
        } catch (...) {
            promise.Complete(Failure(std::current_exception()));
            return;
        }
        detail::ForwardTo(fallback, promise);
    });
    return promise.GetFuture();
}

// ============================================================================
// Foreach / OnFailure - side effects only
// ============================================================================
// Exceptions thrown by func are contained by the callback registry.

template <typename T, typename F>
    requires std::invocable<F&, const T&>
void Foreach(const Future<T>& source, F func) {
    source.OnComplete([func = std::move(func)](const Try<T>& result) mutable {
        if (result.IsSuccess()) {
            func(result.Value());
        }
    });
}

template <typename T, typename F>
    requires std::invocable<F&, const std::exception_ptr&>
void OnFailure(const Future<T>& source, F func) {
    source.OnComplete([func = std::move(func)](const Try<T>& result) mutable {
        if (result.IsFailure()) {
            func(result.Error());
        }
    });
}

// ============================================================================
// Untyped boundary
// ============================================================================
// Replies that cross an untyped runtime travel as Future<std::any>. The type
// is checked only when a typed step consumes the value.

template <typename U>
Future<U> Cast(const Future<std::any>& source) {
    Promise<U> promise(source.GetExecutor());
    source.OnComplete([promise](const Try<std::any>& result) {
        if (result.IsFailure()) {
            promise.Complete(Failure(result.Error()));
            return;
        }

        if (const U* value = std::any_cast<U>(&result.Value())) {
            promise.SetValue(*value);
        } else {
            promise.SetException(MakeFutureError(
                Errc::TypeMismatch,
                fmt::format("expected {}, got {}", typeid(U).name(), result.Value().type().name())));
        }
    });
    return promise.GetFuture();
}

template <typename T>
Future<std::any> AsAny(const Future<T>& source) {
    return Map(source, [](const T& value) { return std::any(value); });
}

}  // namespace pledge
