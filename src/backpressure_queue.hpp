// SPDX-License-Identifier: MIT

// src/backpressure_queue.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <mutex>
#include <optional>
#include <utility>

#include <fmt/format.h>

#include "lib/stream/error.hpp"

namespace jsonl_pipe {

struct BackpressureConfig {
    size_t max_pending = 1000;                       ///< TryEnqueue() rejects beyond this
    std::chrono::microseconds processing_interval{1000};  ///< Minimum spacing between dequeues
};

/// Counters since construction.
struct BackpressureStats {
    uint64_t enqueued = 0;
    uint64_t dequeued = 0;
    uint64_t rejected = 0;        ///< TryEnqueue() calls refused for capacity
    uint64_t pressure_events = 0; ///< Transitions from below to at max_pending
    size_t high_watermark = 0;
};

// BackpressureQueue - bounded hand-off between the network thread and a consumer
//
// The producer never blocks: TryEnqueue() fails with CapacityExceeded once
// max_pending items are queued, leaving the shedding decision to the caller.
// The consumer blocks in Dequeue() until an item is available and, in
// addition, is held to one item per processing_interval.
//
// Close() wakes a waiting consumer. Items already queued are still handed
// out (without the spacing) and Dequeue() then returns nullopt for good.
//
// One producer and one consumer; all state is guarded by a single mutex that
// is never held while waiting.
template <typename T>
class BackpressureQueue {
public:
    using Clock = std::chrono::steady_clock;

    explicit BackpressureQueue(BackpressureConfig config = {}) : config_(config) {}

    BackpressureQueue(const BackpressureQueue&) = delete;
    BackpressureQueue& operator=(const BackpressureQueue&) = delete;

    /// Queue `item` unless full or closed. The item is consumed only on success.
    std::expected<void, Error> TryEnqueue(T&& item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return std::unexpected(Error{ErrorCode::QueueClosed, "Queue is closed"});
            }
            if (items_.size() >= config_.max_pending) {
                ++stats_.rejected;
                return std::unexpected(Error{
                    ErrorCode::CapacityExceeded,
                    fmt::format("Queue full ({} pending)", items_.size())});
            }
            PushLocked(std::move(item));
        }
        ready_.notify_one();
        return {};
    }

    std::expected<void, Error> TryEnqueue(const T& item) {
        T copy = item;
        return TryEnqueue(std::move(copy));
    }

    /// Queue a control item (stream end marker) regardless of capacity.
    /// Fails only once closed.
    std::expected<void, Error> EnqueueControl(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return std::unexpected(Error{ErrorCode::QueueClosed, "Queue is closed"});
            }
            PushLocked(std::move(item));
        }
        ready_.notify_one();
        return {};
    }

    /// Block until an item is available and the processing interval since the
    /// previous dequeue has elapsed. nullopt once closed and drained.
    std::optional<T> Dequeue() {
        return DequeueUntil(std::nullopt);
    }

    /// Dequeue() giving up after `timeout`.
    std::optional<T> DequeueFor(std::chrono::milliseconds timeout) {
        return DequeueUntil(Clock::now() + timeout);
    }

    /// Stop accepting items and wake the consumer.
    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    /// Drop every queued item. Returns how many were dropped.
    size_t Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t dropped = items_.size();
        items_.clear();
        return dropped;
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    /// Size() / max_pending, may exceed 1.0 with control items.
    double FillRatio() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (config_.max_pending == 0) return 1.0;
        return static_cast<double>(items_.size()) / static_cast<double>(config_.max_pending);
    }

    BackpressureStats Stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    const BackpressureConfig& Config() const { return config_; }

private:
    void PushLocked(T&& item) {
        items_.push_back(std::move(item));
        ++stats_.enqueued;
        if (items_.size() > stats_.high_watermark) {
            stats_.high_watermark = items_.size();
        }
        if (items_.size() == config_.max_pending) {
            ++stats_.pressure_events;
        }
    }

    std::optional<T> DequeueUntil(std::optional<Clock::time_point> deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto has_work = [this] { return !items_.empty() || closed_; };
        auto is_closed = [this] { return closed_; };

        while (true) {
            if (deadline) {
                if (!ready_.wait_until(lock, *deadline, has_work)) {
                    return std::nullopt;
                }
            } else {
                ready_.wait(lock, has_work);
            }
            if (items_.empty()) {
                return std::nullopt;  // Closed and drained
            }

            // Rate limit; Close() cuts the wait short
            if (!closed_ && last_dequeue_) {
                auto earliest = *last_dequeue_ + config_.processing_interval;
                if (deadline && *deadline < earliest) {
                    if (!ready_.wait_until(lock, *deadline, is_closed)) {
                        return std::nullopt;
                    }
                } else {
                    ready_.wait_until(lock, earliest, is_closed);
                }
            }

            if (items_.empty()) {
                continue;  // Cleared while waiting
            }
            T item = std::move(items_.front());
            items_.pop_front();
            ++stats_.dequeued;
            last_dequeue_ = Clock::now();
            return item;
        }
    }

    const BackpressureConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<T> items_;
    bool closed_ = false;
    std::optional<Clock::time_point> last_dequeue_;
    BackpressureStats stats_;
};

}  // namespace jsonl_pipe
