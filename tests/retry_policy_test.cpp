// SPDX-License-Identifier: MIT

// tests/retry_policy_test.cpp
#include <gtest/gtest.h>
#include "lib/stream/error.hpp"
#include "src/retry_policy.hpp"

using namespace jsonl_pipe;

TEST(RetryPolicyTest, ShouldRetryInitiallyTrue) {
    RetryConfig config{.max_retries = 3};
    RetryPolicy policy(config);
    EXPECT_TRUE(policy.ShouldRetry());
}

TEST(RetryPolicyTest, ZeroBudgetNeverRetries) {
    RetryPolicy policy(RetryConfig{.max_retries = 0});
    EXPECT_FALSE(policy.ShouldRetry());
    EXPECT_FALSE(policy.ShouldRetry(Error{ErrorCode::ConnectionFailed, "refused"}));
}

TEST(RetryPolicyTest, ShouldRetryFalseAfterMaxAttempts) {
    RetryConfig config{.max_retries = 2};
    RetryPolicy policy(config);

    policy.RecordAttempt();
    EXPECT_TRUE(policy.ShouldRetry());

    policy.RecordAttempt();
    EXPECT_FALSE(policy.ShouldRetry());
}

TEST(RetryPolicyTest, ResetClearsAttempts) {
    RetryConfig config{.max_retries = 2};
    RetryPolicy policy(config);

    policy.RecordAttempt();
    policy.RecordAttempt();
    EXPECT_FALSE(policy.ShouldRetry());

    policy.Reset();
    EXPECT_TRUE(policy.ShouldRetry());
    EXPECT_EQ(policy.Attempts(), 0u);
}

TEST(RetryPolicyTest, GetNextDelayUsesExponentialBackoff) {
    RetryConfig config{
        .initial_delay = std::chrono::milliseconds(100),
        .backoff_multiplier = 2.0,
        .jitter_factor = 0.0  // No jitter for predictable test
    };
    RetryPolicy policy(config);

    EXPECT_EQ(policy.GetNextDelay().count(), 100);
    policy.RecordAttempt();
    EXPECT_EQ(policy.GetNextDelay().count(), 200);
    policy.RecordAttempt();
    EXPECT_EQ(policy.GetNextDelay().count(), 400);
}

TEST(RetryPolicyTest, GetNextDelayCapsAtMaxDelay) {
    RetryConfig config{
        .initial_delay = std::chrono::milliseconds(1000),
        .max_delay = std::chrono::milliseconds(5000),
        .backoff_multiplier = 10.0,
        .jitter_factor = 0.0
    };
    RetryPolicy policy(config);

    policy.RecordAttempt();  // Would be 10000ms without cap

    EXPECT_EQ(policy.GetNextDelay().count(), 5000);
}

TEST(RetryPolicyTest, PresetsDiffer) {
    auto reconnect = RetryConfig::ReconnectDefaults();
    auto send = RetryConfig::SendDefaults();
    EXPECT_GT(reconnect.max_retries, send.max_retries);
    EXPECT_GT(reconnect.max_delay, send.max_delay);
}

// Error classification

TEST(RetryPolicyTest, TransientErrorsAreRetried) {
    RetryPolicy policy;
    for (auto code : {ErrorCode::ConnectionFailed, ErrorCode::ConnectionClosed,
                      ErrorCode::DnsResolutionFailed, ErrorCode::Timeout,
                      ErrorCode::TlsHandshakeFailed, ErrorCode::ServerError,
                      ErrorCode::RateLimited, ErrorCode::KeepaliveTimeout,
                      ErrorCode::ProtocolError}) {
        EXPECT_TRUE(policy.ShouldRetry(Error{code, "transient"})) << error_code_name(code);
    }
}

TEST(RetryPolicyTest, PermanentErrorsAreNotRetried) {
    RetryPolicy policy;
    for (auto code : {ErrorCode::HttpError, ErrorCode::HandshakeFailed,
                      ErrorCode::InvalidEndpoint, ErrorCode::ParseError,
                      ErrorCode::EncodeError, ErrorCode::Cancelled}) {
        EXPECT_FALSE(policy.ShouldRetry(Error{code, "permanent"})) << error_code_name(code);
    }
}

TEST(RetryPolicyTest, RespectsMaxRetries) {
    RetryConfig config{.max_retries = 2};
    RetryPolicy policy(config);
    Error e{ErrorCode::ServerError, "Internal server error"};

    EXPECT_TRUE(policy.ShouldRetry(e));
    policy.RecordAttempt();
    EXPECT_TRUE(policy.ShouldRetry(e));
    policy.RecordAttempt();
    EXPECT_FALSE(policy.ShouldRetry(e));  // Max reached
}

TEST(RetryPolicyTest, GetNextDelayRespectsRetryAfter) {
    RetryPolicy policy;
    Error e{ErrorCode::RateLimited, "Too many requests"};
    e.retry_after = std::chrono::milliseconds{5000};

    EXPECT_EQ(policy.GetNextDelay(e).count(), 5000);
}

TEST(RetryPolicyTest, GetNextDelayUsesBackoffWithoutRetryAfter) {
    RetryPolicy policy(RetryConfig{.initial_delay = std::chrono::milliseconds{1000},
                                   .jitter_factor = 0.1});
    Error e{ErrorCode::ServerError, "Internal server error"};

    auto delay = policy.GetNextDelay(e);
    EXPECT_GE(delay.count(), 900);   // initial_delay * (1 - jitter)
    EXPECT_LE(delay.count(), 1100);  // initial_delay * (1 + jitter)
}
