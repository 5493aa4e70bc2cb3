// ============================================================================
// pledge/core/concepts.hpp - Future Concepts and Traits
// ============================================================================
//
// Concepts used by the combinators to constrain the callables they accept
// and to find the value type of a returned future.
//
// CONCEPTS:
// ---------
//   FutureLike<F>             - a Future<T> specialization
//   TryCallback<F, T>         - invocable with const Try<T>&
//   FutureReturning<F, Args>  - invocable, and returns a Future<U>
//   Extractor<F, T>           - invocable with const T&, returns optional<U>
//
// USAGE:
// ------
//   template <typename T, FutureReturning<const T&> F>
//   auto FlatMap(const Future<T>& source, F func);
//
// ============================================================================

#pragma once

#include <concepts>
#include <optional>
#include <type_traits>

namespace pledge {

template <typename T>
class Future;

template <typename T>
class Try;

namespace detail {

template <typename T>
struct IsFutureImpl : std::false_type {};

template <typename T>
struct IsFutureImpl<Future<T>> : std::true_type {
    using ValueType = T;
};

template <typename T>
struct IsOptionalImpl : std::false_type {};

template <typename T>
struct IsOptionalImpl<std::optional<T>> : std::true_type {
    using ValueType = T;
};

}  // namespace detail

// ============================================================================
// FutureLike concept
// ============================================================================

template <typename F>
concept FutureLike = detail::IsFutureImpl<std::remove_cvref_t<F>>::value;

// Value type carried by a Future<T>
template <FutureLike F>
using FutureValueType = typename detail::IsFutureImpl<std::remove_cvref_t<F>>::ValueType;

// ============================================================================
// Callable concepts
// ============================================================================

template <typename F, typename T>
concept TryCallback = std::invocable<F&, const Try<T>&>;

template <typename F, typename... Args>
concept FutureReturning = std::invocable<F&, Args...> && FutureLike<std::invoke_result_t<F&, Args...>>;

template <typename F, typename T>
concept Extractor = std::invocable<F&, const T&> &&
                    detail::IsOptionalImpl<std::remove_cvref_t<std::invoke_result_t<F&, const T&>>>::value;

// Value type produced by an Extractor
template <typename F, typename T>
    requires Extractor<F, T>
using ExtractedType =
    typename detail::IsOptionalImpl<std::remove_cvref_t<std::invoke_result_t<F&, const T&>>>::ValueType;

}  // namespace pledge
