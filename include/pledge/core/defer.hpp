// ============================================================================
// pledge/core/defer.hpp - Scope-Exit Actions
// ============================================================================
//
// Defer runs a callable when it goes out of scope, whether the scope ends
// normally or by an exception. Spawned work uses it to leave the quiescence
// counter balanced even when the user callable throws.
//
// USAGE:
// ------
//   counter.Increment();
//   Defer done([&] { counter.Decrement(); });
//   RunUserCode();  // may throw
//
//   PLEDGE_DEFER([&] { lock.unlock(); });
//
// ============================================================================

#pragma once

#include <type_traits>
#include <utility>

namespace pledge {

// ============================================================================
// Defer<F>
// ============================================================================
template <typename F>
class Defer {
   public:
    explicit Defer(F action) noexcept(std::is_nothrow_move_constructible_v<F>) : action_(std::move(action)) {}

    ~Defer() {
        if (armed_) {
            action_();
        }
    }

    Defer(const Defer&) = delete;
    Defer& operator=(const Defer&) = delete;

    Defer(Defer&& other) noexcept(std::is_nothrow_move_constructible_v<F>)
        : action_(std::move(other.action_)), armed_(std::exchange(other.armed_, false)) {}
    Defer& operator=(Defer&&) = delete;

    // Do not run the action at scope exit
    void Dismiss() noexcept { armed_ = false; }

    [[nodiscard]] bool IsArmed() const noexcept { return armed_; }

   private:
    F action_;
    bool armed_ = true;
};

template <typename F>
Defer(F) -> Defer<F>;

}  // namespace pledge

#define PLEDGE_DEFER_CONCAT_IMPL(a, b) a##b
#define PLEDGE_DEFER_CONCAT(a, b) PLEDGE_DEFER_CONCAT_IMPL(a, b)

// Anonymous Defer for the rest of the enclosing scope
#define PLEDGE_DEFER(lambda) ::pledge::Defer PLEDGE_DEFER_CONCAT(pledge_defer_, __LINE__)(lambda)
