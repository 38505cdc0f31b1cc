#pragma once

/**
 * @file logging.hpp
 * @brief Logging controls for sdid128
 *
 * The library logs native call failures at debug level and successful
 * retrievals at trace level. Applications may change the level or route
 * messages to their own logger.
 */

namespace sdid128 {
namespace logging {

/// Supported logging levels
enum class LogLevel {
    // Level not chosen yet; resolved from SDID128_LOG_LEVEL on the first log call.
    // Must be lower than all the actual levels.
    Invalid = 0,

    Trace = 10,
    Debug = 20,
    Info = 30,
    Warn = 40,
    Error = 50
};

/// Convert log level to string
[[nodiscard]] constexpr const char* log_level_to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Invalid:
            return "INVALID";
    }
    return "INVALID";
}

/// Parse a log level name (case-insensitive); returns Invalid if unknown
[[nodiscard]] LogLevel log_level_from_string(const char* name) noexcept;

/// Callback receiving each message that passes the level filter
using Logger = void (*)(const char* file, unsigned line, const char* function, LogLevel level,
                        const char* message);

/// Environment variable consulted when no level was set explicitly
constexpr const char* LOG_LEVEL_ENVIRONMENT_VARIABLE = "SDID128_LOG_LEVEL";

/// Default level when neither the application nor the environment set one
constexpr LogLevel DEFAULT_LOG_LEVEL = LogLevel::Info;

/// Set the minimum level of messages passed to the logger.
/// Invalid makes the next message read SDID128_LOG_LEVEL again.
void set_log_level(LogLevel level) noexcept;

/// Get the current minimum level (Invalid until the first message or set_log_level)
[[nodiscard]] LogLevel log_level() noexcept;

/// Replace the logger; nullptr restores the default stderr logger
void set_logger(Logger logger) noexcept;

/// Write a message through the current logger if it passes the level filter
void log(const char* file, unsigned line, const char* function, LogLevel level,
         const char* message);

}  // namespace logging
}  // namespace sdid128
