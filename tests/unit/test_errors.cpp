#include <gtest/gtest.h>
#include "core/errors/supervisor_errors.hpp"

using namespace snipvisor::core::errors;

// Simulates a worker launch that may fail
Result<int> simulate_start(bool should_fail) {
    if (should_fail) {
        return SupervisorError{ErrorCategory::Startup, "Worker never said READY", "startup_eof"};
    }
    return 4242;
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_start(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), 4242);
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_start(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Startup);
    EXPECT_EQ(error.message, "Worker never said READY");
    EXPECT_EQ(error.code, "startup_eof");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, DefaultsCodeToUnknown) {
    SupervisorError error{ErrorCategory::Internal, "poll failed"};
    EXPECT_EQ(error.code, "unknown_error");
}

TEST(ErrorModelTest, InfrastructureErrorsAreRetryable) {
    EXPECT_TRUE(is_retryable(SupervisorError{ErrorCategory::Startup, "x"}));
    EXPECT_TRUE(is_retryable(SupervisorError{ErrorCategory::ProcessDied, "x"}));
    EXPECT_TRUE(is_retryable(SupervisorError{ErrorCategory::Protocol, "x"}));

    EXPECT_FALSE(is_retryable(SupervisorError{ErrorCategory::Configuration, "x"}));
    EXPECT_FALSE(is_retryable(SupervisorError{ErrorCategory::Input, "x"}));
    EXPECT_FALSE(is_retryable(SupervisorError{ErrorCategory::Internal, "x"}));
}

TEST(ErrorModelTest, CategoryNames) {
    EXPECT_EQ(to_string(ErrorCategory::Startup), "startup");
    EXPECT_EQ(to_string(ErrorCategory::ProcessDied), "process_died");
    EXPECT_EQ(to_string(ErrorCategory::Protocol), "protocol");
    EXPECT_EQ(to_string(ErrorCategory::Configuration), "configuration");
}
