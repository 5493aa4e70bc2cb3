// ============================================================================
// pledge/core/try.hpp - Success-or-Failure Result of an Asynchronous Step
// ============================================================================
//
// Try<T> is a discriminated union that holds either a success value (T) or
// the error that prevented it. It is the value a Promise is completed with
// and the value every completion callback receives.
//
// DESIGN PHILOSOPHY:
// ------------------
// 1. ANY ERROR: The failure side is a std::exception_ptr, so whatever a
//    producer throws is kept intact. Library errors are FutureError.
// 2. IMMUTABLE: A Try is never modified after construction; combinators
//    build new ones.
// 3. COMPOSABLE: Map() / Recover() turn a throwing transform into a Failure
//    instead of an exception escaping the caller.
//
// USAGE:
// ------
//   Try<int> ok = Success(42);
//   Try<int> bad = Failure(std::runtime_error("boom"));
//
//   if (ok.IsSuccess()) {
//       std::cout << ok.Value() << std::endl;   // 42
//   }
//   bad.ValueOrThrow();                         // throws runtime_error
//
// ============================================================================

#pragma once

#include <concepts>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "pledge/core/check.hpp"

namespace pledge {

// Forward declarations
template <typename T>
class Try;

// ============================================================================
// Success and Failure Tag Types
// ============================================================================
// These allow type deduction in factory functions

template <typename T>
struct SuccessTag {
    T value;

    template <typename U>
    explicit SuccessTag(U&& v) : value(std::forward<U>(v)) {}
};

struct FailureTag {
    std::exception_ptr error;

    explicit FailureTag(std::exception_ptr e) : error(std::move(e)) {}
};

// Factory functions
template <typename T>
SuccessTag<std::decay_t<T>> Success(T&& value) {
    return SuccessTag<std::decay_t<T>>(std::forward<T>(value));
}

inline FailureTag Failure(std::exception_ptr error) {
    return FailureTag(std::move(error));
}

template <typename E>
    requires std::derived_from<std::decay_t<E>, std::exception>
FailureTag Failure(E&& error) {
    return FailureTag(std::make_exception_ptr(std::forward<E>(error)));
}

// Unit type for futures that carry no value
struct Unit {
    bool operator==(const Unit&) const = default;
};

inline SuccessTag<Unit> Success() {
    return SuccessTag<Unit>(Unit{});
}

// ============================================================================
// Try<T> - Success or Failure
// ============================================================================
template <typename T>
class Try {
   public:
    using ValueType = T;

    // ========================================================================
    // Construction
    // ========================================================================

    template <typename U>
    Try(SuccessTag<U>&& ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    Try(FailureTag&& err) : data_(std::in_place_index<1>, std::move(err.error)) {
        PLEDGE_CHECK(std::get<1>(data_) != nullptr, "Failure needs a non-null exception");
    }

    Try(const Try&) = default;
    Try(Try&&) = default;
    Try& operator=(const Try&) = default;
    Try& operator=(Try&&) = default;

    // ========================================================================
    // Observers
    // ========================================================================

    bool IsSuccess() const noexcept { return data_.index() == 0; }
    bool IsFailure() const noexcept { return data_.index() == 1; }

    explicit operator bool() const noexcept { return IsSuccess(); }

    // ========================================================================
    // Accessors
    // ========================================================================

    // Get value (undefined behavior if IsFailure())
    T& Value() & { return std::get<0>(data_); }
    const T& Value() const& { return std::get<0>(data_); }
    T&& Value() && { return std::get<0>(std::move(data_)); }

    // Get error (undefined behavior if IsSuccess())
    const std::exception_ptr& Error() const& { return std::get<1>(data_); }

    // Value, or rethrow the stored error
    const T& ValueOrThrow() const& {
        if (IsFailure()) {
            std::rethrow_exception(Error());
        }
        return Value();
    }

    T ValueOrThrow() && {
        if (IsFailure()) {
            std::rethrow_exception(Error());
        }
        return std::move(*this).Value();
    }

    std::optional<T> ValueOr() const {
        if (IsSuccess()) return std::get<0>(data_);
        return std::nullopt;
    }

    T ValueOr(T default_value) const {
        if (IsSuccess()) return std::get<0>(data_);
        return default_value;
    }

    // ========================================================================
    // Combinators
    // ========================================================================

    // Map: Transform success value. A throwing func yields a Failure.
    template <typename F>
    auto Map(F&& func) const& -> Try<std::invoke_result_t<F, const T&>> {
        if (IsFailure()) {
            return Failure(Error());
        }
        try {
            return Success(func(Value()));
        } catch (...) {
            return Failure(std::current_exception());
        }
    }

    // Recover: Turn a failure into a value. Success passes through.
    template <typename F>
        requires std::convertible_to<std::invoke_result_t<F, const std::exception_ptr&>, T>
    Try<T> Recover(F&& func) const& {
        if (IsSuccess()) {
            return *this;
        }
        try {
            return Success(static_cast<T>(func(Error())));
        } catch (...) {
            return Failure(std::current_exception());
        }
    }

   private:
    std::variant<T, std::exception_ptr> data_;
};

// ============================================================================
// Comparison Operators
// ============================================================================

template <typename T>
bool operator==(const Try<T>& lhs, const Try<T>& rhs) {
    if (lhs.IsSuccess() != rhs.IsSuccess()) return false;
    if (lhs.IsSuccess()) return lhs.Value() == rhs.Value();
    return lhs.Error() == rhs.Error();
}

template <typename T>
bool operator!=(const Try<T>& lhs, const Try<T>& rhs) {
    return !(lhs == rhs);
}

}  // namespace pledge
