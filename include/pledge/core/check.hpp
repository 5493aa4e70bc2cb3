// ============================================================================
// pledge/core/check.hpp - Always-On Precondition Checks
// ============================================================================
//
// PLEDGE_CHECK(cond, msg) stops the process when a programming error is
// detected, in every build type. It reports the failed condition, the
// message and the caller's source location on stderr, then aborts.
//
// Checks are reserved for misuse of the library (reading through an empty
// Future handle, an unbalanced quiescence Decrement, shutting a pool down
// from its own worker). Failures of the asynchronous computation itself are
// never checks: they travel as a Try.
//
// USAGE:
// ------
//   PLEDGE_CHECK(state_ != nullptr, "use of an empty Future");
//
// ============================================================================

#pragma once

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <source_location>

namespace pledge::detail {

[[noreturn]] inline void CheckFail(const char* condition, const char* message, const std::source_location& where) {
    fmt::print(stderr, "PLEDGE_CHECK({}) failed: {}\n  at {}:{} in {}\n", condition, message, where.file_name(),
               where.line(), where.function_name());
    std::fflush(stderr);
    std::abort();
}

}  // namespace pledge::detail

#define PLEDGE_CHECK(cond, msg)                                                       \
    do {                                                                              \
        if (!(cond)) [[unlikely]] {                                                   \
            ::pledge::detail::CheckFail(#cond, msg, std::source_location::current()); \
        }                                                                             \
    } while (0)
