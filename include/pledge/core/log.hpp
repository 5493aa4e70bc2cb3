// ============================================================================
// pledge/core/log.hpp - Leveled Diagnostic Logging
// ============================================================================
//
// A small leveled logger for the library's own diagnostics: worker pool
// lifecycle, callbacks that threw, blocking reads on worker threads.
// Records are formatted with {fmt} and written to stderr, one line each.
//
// CONFIGURATION:
// --------------
// The threshold starts from the PLEDGE_LOG_LEVEL environment variable
// ("trace", "debug", "info", "warn", "error", "off"; default "warn") and can
// be changed at runtime with SetLogLevel().
//
// USAGE:
// ------
//   PLEDGE_LOG_WARN("callback threw: {}", e.what());
//   SetLogLevel(LogLevel::Debug);
//
// ============================================================================

#pragma once

#include <fmt/format.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace pledge {

enum class LogLevel {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

// Current threshold; records below it are dropped
LogLevel GetLogLevel() noexcept;
void SetLogLevel(LogLevel level) noexcept;

// Parse a level name (case-sensitive, lower case)
std::optional<LogLevel> ParseLogLevel(std::string_view name) noexcept;

std::string_view LogLevelName(LogLevel level) noexcept;

inline bool ShouldLog(LogLevel level) noexcept {
    return level >= GetLogLevel() && level != LogLevel::Off;
}

// Write one already-formatted record
void LogMessage(LogLevel level, std::string_view message);

template <typename... Args>
void Log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
    if (!ShouldLog(level)) {
        return;
    }
    LogMessage(level, fmt::format(format, std::forward<Args>(args)...));
}

}  // namespace pledge

#define PLEDGE_LOG_TRACE(...) ::pledge::Log(::pledge::LogLevel::Trace, __VA_ARGS__)
#define PLEDGE_LOG_DEBUG(...) ::pledge::Log(::pledge::LogLevel::Debug, __VA_ARGS__)
#define PLEDGE_LOG_INFO(...) ::pledge::Log(::pledge::LogLevel::Info, __VA_ARGS__)
#define PLEDGE_LOG_WARN(...) ::pledge::Log(::pledge::LogLevel::Warn, __VA_ARGS__)
#define PLEDGE_LOG_ERROR(...) ::pledge::Log(::pledge::LogLevel::Error, __VA_ARGS__)
