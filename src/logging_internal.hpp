#pragma once

// Internal logging for sdid128; not installed with the public headers.

#include "sdid128/logging.hpp"

#include <fmt/format.h>

#include <utility>

namespace sdid128 {
namespace logging {

template <typename... ArgsT>
inline void log_fmt(const char* file, unsigned line, const char* function, LogLevel level,
                    fmt::format_string<ArgsT...> format, ArgsT&&... args) {
    if (level >= log_level()) {
        log(file, line, function, level,
            fmt::format(format, std::forward<ArgsT>(args)...).c_str());
    }
}

}  // namespace logging
}  // namespace sdid128

// __VA_ARGS__ includes the format string.
#define SDID128_LOG_FMT(level, ...) \
    sdid128::logging::log_fmt(__FILE__, __LINE__, static_cast<const char*>(__FUNCTION__), level, __VA_ARGS__)

#define SDID128_LOG_TRACE(...) SDID128_LOG_FMT(sdid128::logging::LogLevel::Trace, __VA_ARGS__)
#define SDID128_LOG_DEBUG(...) SDID128_LOG_FMT(sdid128::logging::LogLevel::Debug, __VA_ARGS__)
#define SDID128_LOG_INFO(...) SDID128_LOG_FMT(sdid128::logging::LogLevel::Info, __VA_ARGS__)
#define SDID128_LOG_WARN(...) SDID128_LOG_FMT(sdid128::logging::LogLevel::Warn, __VA_ARGS__)
#define SDID128_LOG_ERROR(...) SDID128_LOG_FMT(sdid128::logging::LogLevel::Error, __VA_ARGS__)
