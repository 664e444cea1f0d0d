#include "fts/sync/backoff.hpp"

#include <gtest/gtest.h>

using fts::SyncConfig;
using fts::sync::RetryPolicy;
using namespace std::chrono_literals;

TEST(RetryPolicyTest, DoublesFromTwoSeconds) {
    RetryPolicy policy;
    EXPECT_EQ(policy.next_delay(0), std::optional<std::chrono::milliseconds>(2000ms));
    EXPECT_EQ(policy.next_delay(1), std::optional<std::chrono::milliseconds>(4000ms));
    EXPECT_EQ(policy.next_delay(2), std::optional<std::chrono::milliseconds>(8000ms));
}

TEST(RetryPolicyTest, StopsAtMaxRetries) {
    RetryPolicy policy;
    EXPECT_FALSE(policy.next_delay(3).has_value());
    EXPECT_FALSE(policy.next_delay(10).has_value());
}

TEST(RetryPolicyTest, FollowsConfig) {
    SyncConfig config;
    config.max_retries = 1;
    config.backoff_unit = 10ms;
    const auto policy = RetryPolicy::from_config(config);

    EXPECT_EQ(policy.next_delay(0), std::optional<std::chrono::milliseconds>(20ms));
    EXPECT_FALSE(policy.next_delay(1).has_value());
}

TEST(RetryPolicyTest, ZeroRetriesParksImmediately) {
    RetryPolicy policy{0, 1000ms};
    EXPECT_FALSE(policy.next_delay(0).has_value());
}
