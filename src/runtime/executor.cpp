// ============================================================================
// pledge/runtime/executor.cpp - Current-Executor Tracking
// ============================================================================

#include "pledge/runtime/executor.hpp"

#include <utility>

namespace pledge {

namespace {

// Set for the lifetime of each pool worker thread
thread_local Executor* t_current_executor = nullptr;

}  // namespace

bool Executor::IsCurrent() const noexcept {
    return t_current_executor == this;
}

Executor* GetCurrentExecutor() {
    return t_current_executor;
}

void SetCurrentExecutor(Executor* executor) {
    t_current_executor = executor;
}

ExecutorGuard::ExecutorGuard(Executor* executor) : previous_(std::exchange(t_current_executor, executor)) {}

ExecutorGuard::~ExecutorGuard() {
    t_current_executor = previous_;
}

}  // namespace pledge
