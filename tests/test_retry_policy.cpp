/**
 * Retry policy tests
 */

#include <gtest/gtest.h>

#include "../server/retry_policy.hpp"

using std::chrono::milliseconds;

TEST(RetryPolicyTest, RetriesUntilBudgetIsSpent) {
    RetryPolicy policy(3, milliseconds(100), milliseconds(10000));

    EXPECT_TRUE(policy.decide(1, WriteErrorKind::BackendUnreachable).retry);
    EXPECT_TRUE(policy.decide(2, WriteErrorKind::BackendUnreachable).retry);
    EXPECT_TRUE(policy.decide(3, WriteErrorKind::BackendUnreachable).retry);
    EXPECT_FALSE(policy.decide(4, WriteErrorKind::BackendUnreachable).retry);
    EXPECT_EQ(policy.max_attempts(), 4u);
}

TEST(RetryPolicyTest, DelayDoublesAndIsCapped) {
    RetryPolicy policy(6, milliseconds(100), milliseconds(500));

    EXPECT_EQ(policy.decide(1, WriteErrorKind::Timeout).delay, milliseconds(100));
    EXPECT_EQ(policy.decide(2, WriteErrorKind::Timeout).delay, milliseconds(200));
    EXPECT_EQ(policy.decide(3, WriteErrorKind::Timeout).delay, milliseconds(400));
    EXPECT_EQ(policy.decide(4, WriteErrorKind::Timeout).delay, milliseconds(500));
    EXPECT_EQ(policy.decide(6, WriteErrorKind::Timeout).delay, milliseconds(500));
}

TEST(RetryPolicyTest, EveryErrorKindIsRetried) {
    RetryPolicy policy(1, milliseconds(10));
    for (auto kind : {WriteErrorKind::BackendUnreachable, WriteErrorKind::Timeout, WriteErrorKind::Rejected}) {
        EXPECT_TRUE(policy.decide(1, kind).retry) << to_string(kind);
        EXPECT_FALSE(policy.decide(2, kind).retry) << to_string(kind);
    }
}

TEST(RetryPolicyTest, ZeroRetriesMeansSingleAttempt) {
    RetryPolicy policy(0, milliseconds(10));
    EXPECT_FALSE(policy.decide(1, WriteErrorKind::BackendUnreachable).retry);
    EXPECT_EQ(policy.max_attempts(), 1u);
}

TEST(RetryPolicyTest, CapBelowBaseIsRaisedToBase) {
    RetryPolicy policy(3, milliseconds(1000), milliseconds(10));
    EXPECT_EQ(policy.decide(3, WriteErrorKind::Timeout).delay, milliseconds(1000));
}
