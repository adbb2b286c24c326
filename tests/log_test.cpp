#include <jsondb-cpp/log.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace jsondb_cpp;

namespace {

// Restores the process-wide level when a test finishes.
class LogLevelGuard {
public:
    LogLevelGuard() : saved_{log_level()} {}
    ~LogLevelGuard() { set_log_level(saved_); }

    LogLevelGuard(const LogLevelGuard&) = delete;
    auto operator=(const LogLevelGuard&) -> LogLevelGuard& = delete;

private:
    LogLevel saved_;
};

}  // namespace

TEST(Log, default_level_is_warning) {
    EXPECT_EQ(log_level(), LogLevel::warning);
}

TEST(Log, set_and_get_level) {
    auto guard = LogLevelGuard{};
    set_log_level(LogLevel::debug);
    EXPECT_EQ(log_level(), LogLevel::debug);
    set_log_level(LogLevel::off);
    EXPECT_EQ(log_level(), LogLevel::off);
}

TEST(Log, enabled_up_to_threshold) {
    auto guard = LogLevelGuard{};
    set_log_level(LogLevel::warning);
    EXPECT_TRUE(log_enabled(LogLevel::error));
    EXPECT_TRUE(log_enabled(LogLevel::warning));
    EXPECT_FALSE(log_enabled(LogLevel::info));
    EXPECT_FALSE(log_enabled(LogLevel::debug));
}

TEST(Log, off_disables_everything) {
    auto guard = LogLevelGuard{};
    set_log_level(LogLevel::off);
    EXPECT_FALSE(log_enabled(LogLevel::error));
    EXPECT_FALSE(log_enabled(LogLevel::off));

    set_log_level(LogLevel::debug);
    EXPECT_FALSE(log_enabled(LogLevel::off));
}

TEST(Log, disabled_messages_are_not_formatted) {
    auto guard = LogLevelGuard{};
    set_log_level(LogLevel::error);
    auto calls = 0;
    auto count = [&calls] { return ++calls; };
    JSONDB_LOG_DEBUG("value {}", count());
    EXPECT_EQ(calls, 0);

    ::testing::internal::CaptureStderr();
    JSONDB_LOG_ERROR("value {}", count());
    const auto output = ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(calls, 1);
    EXPECT_NE(output.find("[ERROR]"), std::string::npos);
    EXPECT_NE(output.find("value 1"), std::string::npos);
}
