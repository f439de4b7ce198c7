#include "ofs/core/retry.hpp"
#include "ofs/core/ids.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <set>
#include <vector>

using ofs::ErrorKind;
using ofs::Millis;
using ofs::Result;
using ofs::RetryPolicy;

namespace {

RetryPolicy fast_policy(std::uint32_t attempts) {
    return RetryPolicy{attempts, Millis{1}, Millis{5}, 2.0};
}

} // namespace

TEST(RetryPolicyTest, DelayGrowsExponentiallyAndCaps) {
    RetryPolicy policy{5, Millis{1000}, Millis{30'000}, 2.0};

    EXPECT_EQ(policy.delay_for(1), Millis{1000});
    EXPECT_EQ(policy.delay_for(2), Millis{2000});
    EXPECT_EQ(policy.delay_for(3), Millis{4000});
    EXPECT_EQ(policy.delay_for(10), Millis{30'000});
}

TEST(RetryPolicyTest, RetriesTransientErrorsUntilSuccess) {
    int calls = 0;
    auto result = ofs::retry_with_backoff<int>(fast_policy(3), [&]() -> Result<int> {
        if (++calls < 3) {
            return ofs::Fail<int>(ErrorKind::Network, "connection reset");
        }
        return ofs::Ok(42);
    });

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(calls, 3);
}

TEST(RetryPolicyTest, GivesUpAfterMaxAttempts) {
    int calls = 0;
    std::vector<std::uint32_t> retried;
    auto result = ofs::retry_with_backoff<int>(
        fast_policy(3),
        [&]() -> Result<int> {
            ++calls;
            return ofs::Fail<int>(ErrorKind::Timeout, "slow");
        },
        {},
        [&](std::uint32_t attempt, const ofs::Error&) { retried.push_back(attempt); });

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Timeout);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(retried, (std::vector<std::uint32_t>{1, 2}));
}

TEST(RetryPolicyTest, FatalErrorsAreNotRetried) {
    int calls = 0;
    auto result = ofs::retry_with_backoff<void>(fast_policy(5), [&]() -> Result<void> {
        ++calls;
        return ofs::Fail<void>(ErrorKind::Validation, "too large");
    });

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Validation);
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, CancellationStopsBeforeNextAttempt) {
    std::atomic<bool> cancelled{false};
    int calls = 0;
    auto result = ofs::retry_with_backoff<int>(
        RetryPolicy{10, Millis{50}, Millis{50}, 1.0},
        [&]() -> Result<int> {
            ++calls;
            cancelled = true;
            return ofs::Fail<int>(ErrorKind::Network, "down");
        },
        [&]() { return cancelled.load(); });

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Cancelled);
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, NoneMeansSingleAttempt) {
    int calls = 0;
    auto result = ofs::retry_with_backoff<int>(RetryPolicy::none(), [&]() -> Result<int> {
        ++calls;
        return ofs::Fail<int>(ErrorKind::Network, "down");
    });

    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(calls, 1);
}

TEST(IdsTest, GeneratedIdsArePrefixedAndUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        auto id = ofs::generate_id("op");
        EXPECT_EQ(id.rfind("op-", 0), 0u);
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 1000u);
}

TEST(ErrorTest, OnlyTransientKindsAreRetryable) {
    EXPECT_TRUE(ofs::is_retryable(ErrorKind::Network));
    EXPECT_TRUE(ofs::is_retryable(ErrorKind::Timeout));
    EXPECT_FALSE(ofs::is_retryable(ErrorKind::Conflict));
    EXPECT_FALSE(ofs::is_retryable(ErrorKind::Validation));
    EXPECT_FALSE(ofs::is_retryable(ErrorKind::Quota));
    EXPECT_FALSE(ofs::is_retryable(ErrorKind::NotFound));
}
