#include "tsync/sync/backoff.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;
using tsync::sync::BackoffPolicy;
using tsync::sync::BackoffSettings;

TEST(BackoffPolicyTest, SlowsDownAfterThresholdAndCaps) {
    BackoffPolicy policy;
    EXPECT_EQ(policy.interval(), 5min);

    EXPECT_FALSE(policy.record_failure());
    EXPECT_FALSE(policy.record_failure());
    EXPECT_EQ(policy.interval(), 5min);

    EXPECT_TRUE(policy.record_failure());
    EXPECT_EQ(policy.interval(), 10min);
    EXPECT_TRUE(policy.degraded());

    EXPECT_TRUE(policy.record_failure());
    EXPECT_EQ(policy.interval(), 20min);
    EXPECT_TRUE(policy.record_failure());
    EXPECT_EQ(policy.interval(), 40min);
    EXPECT_TRUE(policy.record_failure());
    EXPECT_EQ(policy.interval(), 60min);
    EXPECT_FALSE(policy.record_failure());
    EXPECT_EQ(policy.interval(), 60min);
    EXPECT_EQ(policy.consecutive_failures(), 7u);
}

TEST(BackoffPolicyTest, SuccessRestoresBaseInterval) {
    BackoffPolicy policy;
    for (int i = 0; i < 4; ++i) {
        policy.record_failure();
    }
    ASSERT_EQ(policy.interval(), 20min);

    EXPECT_TRUE(policy.record_success());
    EXPECT_EQ(policy.interval(), 5min);
    EXPECT_EQ(policy.consecutive_failures(), 0u);
    EXPECT_FALSE(policy.record_success());
}

TEST(BackoffPolicyTest, SuccessBelowThresholdClearsCounter) {
    BackoffPolicy policy;
    policy.record_failure();
    policy.record_failure();
    EXPECT_FALSE(policy.record_success());

    EXPECT_FALSE(policy.record_failure());
    EXPECT_EQ(policy.consecutive_failures(), 1u);
}

TEST(BackoffPolicyTest, CustomSettings) {
    BackoffSettings settings;
    settings.base_interval = 2min;
    settings.threshold = 1;
    settings.factor = 3;
    settings.max_interval = 15min;
    BackoffPolicy policy(settings);

    EXPECT_TRUE(policy.record_failure());
    EXPECT_EQ(policy.interval(), 6min);
    EXPECT_TRUE(policy.record_failure());
    EXPECT_EQ(policy.interval(), 15min);
}

TEST(BackoffPolicyTest, InvalidSettingsAreClamped) {
    BackoffSettings settings;
    settings.base_interval = 0min;
    settings.threshold = 0;
    settings.factor = 0;
    settings.max_interval = 0min;
    BackoffPolicy policy(settings);

    EXPECT_EQ(policy.base_interval(), 1min);
    EXPECT_EQ(policy.settings().threshold, 1u);
    EXPECT_EQ(policy.settings().factor, 1u);
    EXPECT_FALSE(policy.record_failure());
    EXPECT_EQ(policy.interval(), 1min);
}
