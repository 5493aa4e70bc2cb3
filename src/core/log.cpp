// ============================================================================
// pledge/core/log.cpp - Logging Implementation
// ============================================================================

#include "pledge/core/log.hpp"

#include <fmt/format.h>

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace pledge {

namespace {

LogLevel InitialLogLevel() noexcept {
    const char* env = std::getenv("PLEDGE_LOG_LEVEL");
    if (env == nullptr) {
        return LogLevel::Warn;
    }
    return ParseLogLevel(env).value_or(LogLevel::Warn);
}

std::atomic<LogLevel>& Threshold() noexcept {
    static std::atomic<LogLevel> level{InitialLogLevel()};
    return level;
}

std::mutex& SinkMutex() noexcept {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

LogLevel GetLogLevel() noexcept {
    return Threshold().load(std::memory_order_relaxed);
}

void SetLogLevel(LogLevel level) noexcept {
    Threshold().store(level, std::memory_order_relaxed);
}

std::optional<LogLevel> ParseLogLevel(std::string_view name) noexcept {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off") return LogLevel::Off;
    return std::nullopt;
}

std::string_view LogLevelName(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:
            return "trace";
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warn:
            return "warn";
        case LogLevel::Error:
            return "error";
        case LogLevel::Off:
            return "off";
    }
    return "unknown";
}

void LogMessage(LogLevel level, std::string_view message) {
    std::lock_guard<std::mutex> lock(SinkMutex());
    fmt::print(stderr, "[pledge] [{}] {}\n", LogLevelName(level), message);
    std::fflush(stderr);
}

}  // namespace pledge
