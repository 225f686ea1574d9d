#include <gtest/gtest.h>
#include "core/errors/agent_errors.hpp"

using namespace harbor::core::errors;

// A dummy function to simulate an operation failing
Result<std::string> simulate_read_file(bool should_fail) {
    if (should_fail) {
        return AgentError{ErrorCategory::Execution, "File not found"};
    }
    return std::string("file contents here");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_read_file(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "file contents here");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_read_file(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Execution);
    EXPECT_EQ(error.message, "File not found");
    EXPECT_EQ(error.code, "unknown_error");
}

TEST(ErrorModelTest, ClassifiesPolicyAndCancellation) {
    const AgentError boundary{ErrorCategory::Policy, "escape", "boundary_violation"};
    const AgentError cancelled{ErrorCategory::Cancelled, "stop", "cancelled"};
    const AgentError provider{ErrorCategory::Provider, "timeout", "backend_timeout"};

    EXPECT_TRUE(is_boundary_violation(boundary));
    EXPECT_FALSE(is_cancellation(boundary));
    EXPECT_TRUE(is_cancellation(cancelled));
    EXPECT_FALSE(is_boundary_violation(provider));
    EXPECT_FALSE(is_cancellation(provider));
}

TEST(ErrorModelTest, CategoryNames) {
    EXPECT_EQ(to_string(ErrorCategory::Input), "input");
    EXPECT_EQ(to_string(ErrorCategory::Policy), "policy");
    EXPECT_EQ(to_string(ErrorCategory::Cancelled), "cancelled");
}
