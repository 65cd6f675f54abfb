#include <filesystem>
#include <gtest/gtest.h>
#include "core/errors/warden_errors.hpp"

using namespace warden::core::errors;

// Simulates a guard refusing a path
Result<std::filesystem::path> simulate_resolve(bool should_fail) {
    if (should_fail) {
        return WardenError{ErrorCategory::Policy, "Path escapes workspace root", "path_outside_workspace"};
    }
    return std::filesystem::path("/ws/notes.txt");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_resolve(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), std::filesystem::path("/ws/notes.txt"));
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_resolve(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Policy);
    EXPECT_EQ(error.code, "path_outside_workspace");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, CategoryNames) {
    EXPECT_EQ(to_string(ErrorCategory::Logging), "logging");
    EXPECT_EQ(to_string(ErrorCategory::Config), "config");
}
