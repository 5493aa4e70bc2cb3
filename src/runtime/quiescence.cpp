// ============================================================================
// pledge/runtime/quiescence.cpp - Outstanding Work Counter Implementation
// ============================================================================

#include "pledge/runtime/quiescence.hpp"

#include "pledge/core/check.hpp"

namespace pledge {

void QuiescenceCounter::Increment() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++outstanding_;
}

void QuiescenceCounter::Decrement() {
    bool drained = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        PLEDGE_CHECK(outstanding_ > 0, "Decrement without matching Increment");
        drained = --outstanding_ == 0;
    }
    if (drained) {
        drained_.notify_all();
    }
}

size_t QuiescenceCounter::Outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_;
}

bool QuiescenceCounter::WaitForQuiescence(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return drained_.wait_for(lock, timeout, [this] { return outstanding_ == 0; });
}

}  // namespace pledge
