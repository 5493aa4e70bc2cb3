// ============================================================================
// Try Type Tests
// ============================================================================

#include "pledge/core/try.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "pledge/core/error.hpp"

using namespace pledge;

// ============================================================================
// Basic Try Tests
// ============================================================================

TEST(TryTest, SuccessConstruction) {
    Try<int> result = Success(42);

    EXPECT_TRUE(result.IsSuccess());
    EXPECT_FALSE(result.IsFailure());
    EXPECT_EQ(result.Value(), 42);
}

TEST(TryTest, FailureConstruction) {
    Try<int> result = Failure(std::runtime_error("boom"));

    EXPECT_FALSE(result.IsSuccess());
    EXPECT_TRUE(result.IsFailure());
    EXPECT_EQ(ErrorMessage(result.Error()), "boom");
}

TEST(TryTest, BoolConversion) {
    Try<int> ok = Success(42);
    Try<int> bad = Failure(std::runtime_error("boom"));

    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(bad));
}

TEST(TryTest, UnitSuccess) {
    Try<Unit> done = Success();
    EXPECT_TRUE(done.IsSuccess());
    EXPECT_EQ(done.Value(), Unit{});
}

TEST(TryTest, ValueOrThrow) {
    Try<std::string> ok = Success(std::string("World"));
    Try<std::string> bad = Failure(MakeFutureError(Errc::NoMatch));

    EXPECT_EQ(ok.ValueOrThrow(), "World");
    EXPECT_THROW(bad.ValueOrThrow(), FutureError);
}

TEST(TryTest, RethrowsOriginalException) {
    Try<int> bad = Failure(std::invalid_argument("negative"));
    try {
        bad.ValueOrThrow();
        FAIL() << "expected an exception";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "negative");
    }
}

TEST(TryTest, ValueOr) {
    Try<int> ok = Success(42);
    Try<int> bad = Failure(std::runtime_error("boom"));

    EXPECT_EQ(ok.ValueOr(0), 42);
    EXPECT_EQ(bad.ValueOr(0), 0);
    EXPECT_EQ(ok.ValueOr(), 42);
    EXPECT_FALSE(bad.ValueOr().has_value());
}

// ============================================================================
// Combinator Tests
// ============================================================================

TEST(TryTest, Map) {
    Try<int> ok = Success(21);
    Try<int> bad = Failure(std::runtime_error("boom"));

    auto doubled_ok = ok.Map([](int x) { return x * 2; });
    auto doubled_bad = bad.Map([](int x) { return x * 2; });

    EXPECT_EQ(doubled_ok.Value(), 42);
    EXPECT_TRUE(doubled_bad.IsFailure());
    EXPECT_EQ(doubled_bad.Error(), bad.Error());
}

TEST(TryTest, MapChangesType) {
    Try<int> ok = Success(5);
    Try<std::string> text = ok.Map([](int x) { return std::to_string(x); });
    EXPECT_EQ(text.Value(), "5");
}

TEST(TryTest, MapThrowingFunctionYieldsFailure) {
    Try<int> ok = Success(1);
    auto mapped = ok.Map([](int) -> int { throw std::logic_error("bad transform"); });

    ASSERT_TRUE(mapped.IsFailure());
    EXPECT_EQ(ErrorMessage(mapped.Error()), "bad transform");
}

TEST(TryTest, Recover) {
    Try<int> ok = Success(7);
    Try<int> bad = Failure(std::runtime_error("boom"));

    auto fallback = [](const std::exception_ptr&) { return 0; };
    EXPECT_EQ(ok.Recover(fallback).Value(), 7);
    EXPECT_EQ(bad.Recover(fallback).Value(), 0);
}

TEST(TryTest, RecoverThrowingFunctionYieldsNewFailure) {
    Try<int> bad = Failure(std::runtime_error("first"));
    auto still_bad = bad.Recover([](const std::exception_ptr&) -> int { throw std::runtime_error("second"); });

    ASSERT_TRUE(still_bad.IsFailure());
    EXPECT_EQ(ErrorMessage(still_bad.Error()), "second");
}

// ============================================================================
// Comparison Tests
// ============================================================================

TEST(TryTest, Equality) {
    Try<int> a = Success(1);
    Try<int> b = Success(1);
    Try<int> c = Success(2);
    auto error = std::make_exception_ptr(std::runtime_error("boom"));
    Try<int> d = Failure(error);
    Try<int> e = Failure(error);

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, d);
    EXPECT_EQ(d, e);
}

TEST(TryTest, MoveOnlyValue) {
    Try<std::unique_ptr<int>> ok = Success(std::make_unique<int>(9));
    std::unique_ptr<int> value = std::move(ok).ValueOrThrow();
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(*value, 9);
}
