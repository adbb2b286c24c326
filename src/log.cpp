#include <jsondb-cpp/log.hpp>

#include <atomic>
#include <cstdio>
#include <cstring>

namespace jsondb_cpp {

namespace {

std::atomic<LogLevel> g_level{LogLevel::warning};

auto level_name(LogLevel level) -> std::string_view {
    switch (level) {
        case LogLevel::off:     return "";
        case LogLevel::error:   return "[ERROR] ";
        case LogLevel::warning: return "[WARNING] ";
        case LogLevel::info:    return "[INFO] ";
        case LogLevel::debug:   return "[DEBUG] ";
    }
    return "";
}

// Keep the last 20 characters of the source path.
auto trim_file_name(const char* file) -> std::string_view {
    auto len = std::strlen(file);
    return len > 20 ? std::string_view{file + len - 20, 20} : std::string_view{file, len};
}

}  // anonymous namespace

void set_log_level(LogLevel level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

auto log_level() noexcept -> LogLevel {
    return g_level.load(std::memory_order_relaxed);
}

namespace detail {

void write_log(LogLevel level, const char* file, int line, std::string_view message) {
    fmt::print(stderr, "{}{}:{} {}\n", level_name(level), trim_file_name(file), line, message);
}

}  // namespace detail

}  // namespace jsondb_cpp
