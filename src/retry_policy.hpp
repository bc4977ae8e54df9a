// SPDX-License-Identifier: MIT

// src/retry_policy.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>

#include "lib/stream/error.hpp"

namespace jsonl_pipe {

/// Configuration for exponential backoff retry behavior.
struct RetryConfig {
    uint32_t max_retries = 5;                          ///< Maximum retry attempts (0 = never)
    std::chrono::milliseconds initial_delay{500};      ///< Delay before first retry
    std::chrono::milliseconds max_delay{30000};        ///< Delay cap
    double backoff_multiplier = 2.0;                   ///< Multiplier per attempt
    double jitter_factor = 0.1;                        ///< Random jitter range (+/- fraction)

    /// Preset for stream reconnects: keep trying for a while, cap at 30 s.
    static RetryConfig ReconnectDefaults() {
        return RetryConfig{
            .max_retries = 10,
            .initial_delay = std::chrono::milliseconds{500},
            .max_delay = std::chrono::milliseconds{30000},
            .backoff_multiplier = 2.0,
            .jitter_factor = 0.2,
        };
    }

    /// Preset for one-off requests: fast retry, few attempts.
    static RetryConfig SendDefaults() {
        return RetryConfig{
            .max_retries = 3,
            .initial_delay = std::chrono::milliseconds{250},
            .max_delay = std::chrono::milliseconds{5000},
            .backoff_multiplier = 2.0,
            .jitter_factor = 0.1,
        };
    }
};

/// Stateful retry policy with exponential backoff, jitter, and error classification.
///
/// Tracks attempt count and computes delays. Classifies ErrorCode as retryable
/// or permanent so a supervisor never spins on a failure that cannot clear.
class RetryPolicy {
public:
    explicit RetryPolicy(RetryConfig config = {})
        : config_(config), attempts_(0) {}

    /// Return true if the retry budget has not been exhausted.
    bool ShouldRetry() const {
        return attempts_ < config_.max_retries;
    }

    /// Increment the attempt counter.
    void RecordAttempt() {
        ++attempts_;
    }

    /// Reset the attempt counter to zero (after a connection succeeded).
    void Reset() {
        attempts_ = 0;
    }

    /// Classify error and check retry budget.
    /// @return false for permanent errors (bad endpoint, handshake rejected, ...)
    bool ShouldRetry(const Error& e) const {
        if (!IsRetryable(e.code)) {
            return false;
        }
        return attempts_ < config_.max_retries;
    }

    /// Delay before the next attempt: the error's retry_after if present
    /// (server Retry-After or event-stream `retry:`), else backoff.
    std::chrono::milliseconds GetNextDelay(const Error& e) const {
        if (e.retry_after.has_value()) {
            return *e.retry_after;
        }
        return CalculateBackoff();
    }

    std::chrono::milliseconds GetNextDelay() const {
        return CalculateBackoff();
    }

    /// Return true if the error code represents a transient failure.
    static bool IsRetryable(ErrorCode code) {
        switch (code) {
            // Transient: the next attempt may well succeed
            case ErrorCode::ConnectionFailed:
            case ErrorCode::ConnectionClosed:
            case ErrorCode::DnsResolutionFailed:  // DNS can be temporarily unavailable
            case ErrorCode::Timeout:
            case ErrorCode::TlsHandshakeFailed:
            case ErrorCode::ServerError:
            case ErrorCode::RateLimited:
            case ErrorCode::KeepaliveTimeout:
            case ErrorCode::ProtocolError:
            case ErrorCode::BufferOverflow:
                return true;

            // Permanent: retrying repeats the same answer
            case ErrorCode::HttpError:
            case ErrorCode::HandshakeFailed:
            case ErrorCode::InvalidEndpoint:
            case ErrorCode::ParseError:
            case ErrorCode::EncodeError:
            default:
                return false;
        }
    }

    /// Return the number of recorded attempts.
    uint32_t Attempts() const { return attempts_; }

    const RetryConfig& Config() const { return config_; }

private:
    // Calculate delay using exponential backoff with jitter
    std::chrono::milliseconds CalculateBackoff() const {
        // Exponential backoff: initial * multiplier^attempts
        double delay_ms = static_cast<double>(config_.initial_delay.count());
        for (uint32_t i = 0; i < attempts_; ++i) {
            delay_ms *= config_.backoff_multiplier;
        }

        // Cap at max delay
        delay_ms = std::min(delay_ms, static_cast<double>(config_.max_delay.count()));

        // Add jitter
        if (config_.jitter_factor > 0.0) {
            std::random_device rd;
            std::mt19937 gen(rd());
            std::uniform_real_distribution<> dis(
                1.0 - config_.jitter_factor,
                1.0 + config_.jitter_factor);
            delay_ms *= dis(gen);
        }

        return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
    }

    RetryConfig config_;
    uint32_t attempts_;
};

}  // namespace jsonl_pipe
