#include "toastkit/core/Log.hh"
#include <gtest/gtest.h>

namespace toastkit {
namespace Tests {

class LoggingTest : public ::testing::Test {};

TEST_F(LoggingTest, LoggersAvailableAfterInit) {
    EXPECT_NE(toastkit::log::logger(), nullptr);
    EXPECT_NE(toastkit::log::uiLogger(), nullptr);
    EXPECT_NE(toastkit::log::renderLogger(), nullptr);
}

TEST_F(LoggingTest, LogInfoDoesNotCrash) {
    TOASTKIT_LOG_INFO("Info message");
    ASSERT_TRUE(true);
}

TEST_F(LoggingTest, LogWarningDoesNotCrash) {
    TOASTKIT_LOG_WARN("Warning message");
    ASSERT_TRUE(true);
}

TEST_F(LoggingTest, LogWithFormatArgs) {
    TOASTKIT_LOG_INFO("Value: {}, Name: {}", 42, "test");
    ASSERT_TRUE(true);
}

TEST_F(LoggingTest, SubsystemLoggers) {
    TOASTKIT_UI_LOG_INFO("Toast shown: {}", "hello");
    TOASTKIT_RENDER_LOG_WARN("Dropped {} vertices", 96);
    ASSERT_TRUE(true);
}

TEST_F(LoggingTest, SetLogLevel) {
    toastkit::log::setLevel(quill::LogLevel::Warning);
    TOASTKIT_LOG_WARN("This should appear");
    toastkit::log::setUILevel(quill::LogLevel::Debug);
    TOASTKIT_UI_LOG_DEBUG("Debug toast message");
    // Reset to default
    toastkit::log::setLevel(quill::LogLevel::Info);
    toastkit::log::setUILevel(quill::LogLevel::Info);
    ASSERT_TRUE(true);
}

TEST_F(LoggingTest, SetRenderLevel) {
    toastkit::log::setRenderLevel(quill::LogLevel::Error);
    EXPECT_EQ(toastkit::log::renderLogger()->get_log_level(), quill::LogLevel::Error);
    toastkit::log::setRenderLevel(quill::LogLevel::Info);
    EXPECT_EQ(toastkit::log::renderLogger()->get_log_level(), quill::LogLevel::Info);
}

} // namespace Tests
} // namespace toastkit
