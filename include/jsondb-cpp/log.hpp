/// @file log.hpp
/// @brief Minimal leveled logging for jsondb-cpp, formatted with fmt.
///
/// Messages at or above the process-wide threshold are written to stderr
/// as "[LEVEL] file:line message".

#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <string_view>

namespace jsondb_cpp {

/// Severity of a log message. Lower values are more severe.
enum class LogLevel : std::uint8_t {
    off,
    error,
    warning,
    info,
    debug,
};

/// Set the process-wide log threshold (default: warning).
void set_log_level(LogLevel level) noexcept;

/// Get the process-wide log threshold.
auto log_level() noexcept -> LogLevel;

/// Check whether messages at the given level are emitted.
inline auto log_enabled(LogLevel level) noexcept -> bool {
    return level != LogLevel::off && level <= log_level();
}

namespace detail {

void write_log(LogLevel level, const char* file, int line, std::string_view message);

}  // namespace detail

}  // namespace jsondb_cpp

#define JSONDB_LOG(level, ...)                                                        \
    do {                                                                              \
        if (::jsondb_cpp::log_enabled(level)) {                                       \
            ::jsondb_cpp::detail::write_log(level, __FILE__, __LINE__,                \
                                            ::fmt::format(__VA_ARGS__));              \
        }                                                                             \
    } while (false)

#define JSONDB_LOG_ERROR(...) JSONDB_LOG(::jsondb_cpp::LogLevel::error, __VA_ARGS__)
#define JSONDB_LOG_WARN(...)  JSONDB_LOG(::jsondb_cpp::LogLevel::warning, __VA_ARGS__)
#define JSONDB_LOG_INFO(...)  JSONDB_LOG(::jsondb_cpp::LogLevel::info, __VA_ARGS__)
#define JSONDB_LOG_DEBUG(...) JSONDB_LOG(::jsondb_cpp::LogLevel::debug, __VA_ARGS__)
