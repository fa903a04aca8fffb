// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "pubbatch/errors.hpp"
#include "pubbatch/retry_policy.hpp"

#include <gtest/gtest.h>

namespace pubbatch::test {

using std::chrono::milliseconds;

TEST(RetryPolicyTest, DefaultsAreBounded) {
    RetryPolicy policy;
    EXPECT_EQ(policy.max_attempts, 5u);
    EXPECT_NO_THROW(policy.validate());

    // 100 + 200 + 400 + 800
    EXPECT_EQ(policy.total_backoff(), milliseconds(1500));
}

TEST(RetryPolicyTest, BackoffGrowsExponentially) {
    RetryPolicy policy;
    EXPECT_EQ(policy.backoff_for(1), milliseconds(100));
    EXPECT_EQ(policy.backoff_for(2), milliseconds(200));
    EXPECT_EQ(policy.backoff_for(3), milliseconds(400));
}

TEST(RetryPolicyTest, BackoffCappedAtCeiling) {
    RetryPolicy policy;
    policy.max_backoff = milliseconds(300);
    EXPECT_EQ(policy.backoff_for(3), milliseconds(300));
    EXPECT_EQ(policy.backoff_for(30), milliseconds(300));
}

TEST(RetryPolicyTest, SingleAttemptHasNoBackoff) {
    RetryPolicy policy;
    policy.max_attempts = 1;
    EXPECT_EQ(policy.total_backoff(), milliseconds(0));
}

TEST(RetryPolicyTest, ConstantBackoffWithUnitMultiplier) {
    RetryPolicy policy;
    policy.backoff_multiplier = 1.0;
    policy.max_attempts = 4;
    EXPECT_EQ(policy.backoff_for(3), milliseconds(100));
    EXPECT_EQ(policy.total_backoff(), milliseconds(300));
}

TEST(RetryPolicyTest, ValidateRejectsBrokenPolicies) {
    RetryPolicy zero;
    zero.max_attempts = 0;
    EXPECT_THROW(zero.validate(), ConfigError);

    RetryPolicy shrinking;
    shrinking.backoff_multiplier = 0.5;
    EXPECT_THROW(shrinking.validate(), ConfigError);

    RetryPolicy inverted;
    inverted.initial_backoff = milliseconds(1000);
    inverted.max_backoff = milliseconds(10);
    EXPECT_THROW(inverted.validate(), ConfigError);

    RetryPolicy negative;
    negative.initial_backoff = milliseconds(-1);
    EXPECT_THROW(negative.validate(), ConfigError);
}

}  // namespace pubbatch::test
