// ============================================================================
// pledge/core/error.cpp - Error Category Implementation
// ============================================================================

#include "pledge/core/error.hpp"

#include <string>

namespace pledge {

namespace {

class PledgeCategoryImpl : public std::error_category {
   public:
    const char* name() const noexcept override { return "pledge"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::ComputationFailure:
                return "Computation failed";
            case Errc::TypeMismatch:
                return "Value has an unexpected type";
            case Errc::NoMatch:
                return "No match for the completed value";
            case Errc::EmptyAggregate:
                return "Reduce over zero futures";
            case Errc::Timeout:
                return "Future not completed within timeout";
            default:
                return "Unknown pledge error";
        }
    }
};

}  // namespace

const std::error_category& PledgeCategory() noexcept {
    static const PledgeCategoryImpl instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), PledgeCategory()};
}

std::exception_ptr MakeFutureError(Errc code) {
    return std::make_exception_ptr(FutureError(code));
}

std::exception_ptr MakeFutureError(Errc code, const std::string& detail) {
    return std::make_exception_ptr(FutureError(code, detail));
}

Error ErrorCodeOf(const std::exception_ptr& error) noexcept {
    if (!error) {
        return {};
    }
    try {
        std::rethrow_exception(error);
    } catch (const FutureError& e) {
        return e.code();
    } catch (...) {
        return make_error_code(Errc::ComputationFailure);
    }
}

std::string ErrorMessage(const std::exception_ptr& error) {
    if (!error) {
        return {};
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return make_error_code(Errc::ComputationFailure).message();
    }
}

}  // namespace pledge
