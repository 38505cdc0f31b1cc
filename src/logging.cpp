#include "logging_internal.hpp"

#include <fmt/format.h>

#include <strings.h>

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace sdid128 {
namespace logging {

namespace {

std::atomic<LogLevel> current_level{LogLevel::Invalid};
std::atomic<Logger> current_logger{nullptr};

void stderr_logger(const char* file, unsigned line, const char* function, LogLevel level,
                   const char* message) {
    // Don't include the directory part of "file"
    const char* basename = std::strrchr(file, '/');
    if (basename) {
        basename++;
    } else {
        basename = file;
    }
    fmt::print(stderr, "{} {}:{} {} -- {}\n", log_level_to_string(level), basename, line, function,
               message);
}

// Called on the first message when the application never set a level
void resolve_level_from_environment() {
    LogLevel level = DEFAULT_LOG_LEVEL;

    const char* env_log_level = std::getenv(LOG_LEVEL_ENVIRONMENT_VARIABLE);
    if (env_log_level != nullptr) {
        LogLevel parsed = log_level_from_string(env_log_level);
        if (parsed == LogLevel::Invalid) {
            fmt::print(stderr, "WARN sdid128 -- ignoring invalid {}=\"{}\", using {}\n",
                       LOG_LEVEL_ENVIRONMENT_VARIABLE, env_log_level,
                       log_level_to_string(DEFAULT_LOG_LEVEL));
        } else {
            level = parsed;
        }
    }

    // A concurrent set_log_level() wins over the environment.
    LogLevel expected = LogLevel::Invalid;
    current_level.compare_exchange_strong(expected, level);
}

}  // namespace

LogLevel log_level_from_string(const char* name) noexcept {
    if (name == nullptr) {
        return LogLevel::Invalid;
    }
    if (strcasecmp(name, "TRACE") == 0) {
        return LogLevel::Trace;
    }
    if (strcasecmp(name, "DEBUG") == 0) {
        return LogLevel::Debug;
    }
    if (strcasecmp(name, "INFO") == 0) {
        return LogLevel::Info;
    }
    if (strcasecmp(name, "WARN") == 0) {
        return LogLevel::Warn;
    }
    if (strcasecmp(name, "ERROR") == 0) {
        return LogLevel::Error;
    }
    return LogLevel::Invalid;
}

void set_log_level(LogLevel level) noexcept {
    current_level.store(level);
}

LogLevel log_level() noexcept {
    return current_level.load();
}

void set_logger(Logger logger) noexcept {
    current_logger.store(logger);
}

void log(const char* file, unsigned line, const char* function, LogLevel level,
         const char* message) {
    if (current_level.load() == LogLevel::Invalid) {
        resolve_level_from_environment();
    }

    // Does this specific call still apply?
    if (level < current_level.load()) {
        return;
    }

    Logger logger = current_logger.load();
    if (logger == nullptr) {
        logger = stderr_logger;
    }
    logger(file, line, function, level, message);
}

}  // namespace logging
}  // namespace sdid128
