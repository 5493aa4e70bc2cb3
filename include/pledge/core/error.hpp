// ============================================================================
// pledge/core/error.hpp - Error Codes for pledge
// ============================================================================
//
// Defines a std::error_code-based error infrastructure for the library.
// Library-originated failures are represented as Errc values in the pledge
// error category. Because a Try stores its failure as a std::exception_ptr
// (producers may throw anything), those codes travel inside FutureError, a
// std::system_error subclass.
//
// USAGE:
// ------
//   std::error_code ec = make_error_code(Errc::NoMatch);
//
//   std::exception_ptr e = MakeFutureError(Errc::EmptyAggregate);
//   ErrorCodeOf(e) == Errc::EmptyAggregate;   // true
//   ErrorMessage(e);                          // "Reduce over zero futures"
//
// ============================================================================

#pragma once

#include <exception>
#include <string>
#include <system_error>

namespace pledge {

enum class Errc {
    // A producer or a user transform threw; the original exception is kept.
    ComputationFailure = 1,
    TypeMismatch,
    NoMatch,
    EmptyAggregate,
    Timeout,
};

const std::error_category& PledgeCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

// Convenient alias used throughout the library
using Error = std::error_code;

// ============================================================================
// FutureError - Exception form of a pledge error code
// ============================================================================
class FutureError : public std::system_error {
   public:
    explicit FutureError(Errc code) : std::system_error(make_error_code(code)) {}

    FutureError(Errc code, const std::string& detail) : std::system_error(make_error_code(code), detail) {}
};

// Build a stored failure for a library error
std::exception_ptr MakeFutureError(Errc code);
std::exception_ptr MakeFutureError(Errc code, const std::string& detail);

// Classify a stored failure. Anything that is not a FutureError is a
// ComputationFailure. A null pointer yields an empty error_code.
Error ErrorCodeOf(const std::exception_ptr& error) noexcept;

// Human-readable message of a stored failure (what() for std::exception).
std::string ErrorMessage(const std::exception_ptr& error);

}  // namespace pledge

// Register with std::error_code
namespace std {
template <>
struct is_error_code_enum<pledge::Errc> : true_type {};
}  // namespace std
