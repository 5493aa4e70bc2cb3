// ============================================================================
// pledge/runtime/thread_utils.cpp - Worker Thread Naming
// ============================================================================

#include "pledge/runtime/thread_utils.hpp"

#include <fmt/format.h>
#include <pthread.h>

namespace pledge {

namespace {

constexpr size_t kMaxThreadNameLength = 15;

}  // namespace

bool SetThreadName(const std::string& name) {
    const std::string truncated = name.substr(0, kMaxThreadNameLength);
    return pthread_setname_np(pthread_self(), truncated.c_str()) == 0;
}

bool NameWorkerThread(const std::string& prefix, size_t index) {
    if (prefix.empty()) {
        return true;
    }
    return SetThreadName(fmt::format("{}-{}", prefix, index));
}

}  // namespace pledge
