// SPDX-License-Identifier: MIT

// src/ring_buffer.hpp
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace jsonl_pipe {

struct RingBufferConfig {
    size_t capacity = 65536;
};

struct RingBufferMetrics {
    size_t capacity = 0;
    size_t size = 0;
    uint64_t total_enqueued = 0;
    uint64_t total_dequeued = 0;
    uint64_t dropped = 0;             ///< Items overwritten before being dequeued
    double utilization_percent = 0.0; ///< size / capacity * 100
    double drop_rate = 0.0;           ///< dropped / total_enqueued
};

// BoundedRingBuffer - fixed-capacity FIFO that overwrites its oldest item
//
// Enqueue() always succeeds; at capacity the oldest item is evicted and
// counted as dropped. Use it where losing old data under pressure is
// acceptable (load generation, rolling samples). For application data use
// BackpressureQueue, which rejects instead.
//
// Thread-safe; every operation takes one short lock.
template <typename T>
class BoundedRingBuffer {
public:
    static constexpr size_t kDefaultCapacity = 65536;

    explicit BoundedRingBuffer(size_t capacity = kDefaultCapacity) : slots_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("BoundedRingBuffer capacity must be positive");
        }
    }

    explicit BoundedRingBuffer(RingBufferConfig config) : BoundedRingBuffer(config.capacity) {}

    BoundedRingBuffer(const BoundedRingBuffer&) = delete;
    BoundedRingBuffer& operator=(const BoundedRingBuffer&) = delete;

    /// Append `item`. Returns true when an older item was evicted.
    bool Enqueue(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        bool evicted = false;
        if (size_ == slots_.size()) {
            // Full: the oldest slot is overwritten
            head_ = Next(head_);
            --size_;
            ++dropped_;
            evicted = true;
        }
        slots_[tail_] = std::move(item);
        tail_ = Next(tail_);
        ++size_;
        ++total_enqueued_;
        return evicted;
    }

    /// Oldest item, or nullopt when empty.
    std::optional<T> Dequeue() {
        std::lock_guard<std::mutex> lock(mutex_);
        return PopLocked();
    }

    /// Up to `max_items` oldest items in FIFO order.
    std::vector<T> DequeueBatch(size_t max_items) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out;
        out.reserve(std::min(max_items, size_));
        while (out.size() < max_items) {
            auto item = PopLocked();
            if (!item) break;
            out.push_back(std::move(*item));
        }
        return out;
    }

    /// Copy of the contents, oldest first, without consuming.
    std::vector<T> Snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out;
        out.reserve(size_);
        size_t index = head_;
        for (size_t i = 0; i < size_; ++i) {
            out.push_back(*slots_[index]);
            index = Next(index);
        }
        return out;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_;
    }

    size_t Capacity() const { return slots_.size(); }

    bool IsEmpty() const { return Size() == 0; }

    bool IsFull() const { return Size() == slots_.size(); }

    /// Discard the contents; counters are kept.
    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& slot : slots_) {
            slot.reset();
        }
        head_ = tail_ = size_ = 0;
    }

    RingBufferMetrics Metrics() const {
        std::lock_guard<std::mutex> lock(mutex_);
        RingBufferMetrics m;
        m.capacity = slots_.size();
        m.size = size_;
        m.total_enqueued = total_enqueued_;
        m.total_dequeued = total_dequeued_;
        m.dropped = dropped_;
        m.utilization_percent =
            100.0 * static_cast<double>(size_) / static_cast<double>(slots_.size());
        m.drop_rate = total_enqueued_ == 0
                          ? 0.0
                          : static_cast<double>(dropped_) / static_cast<double>(total_enqueued_);
        return m;
    }

private:
    size_t Next(size_t index) const { return index + 1 == slots_.size() ? 0 : index + 1; }

    std::optional<T> PopLocked() {
        if (size_ == 0) return std::nullopt;
        std::optional<T> item = std::move(slots_[head_]);
        slots_[head_].reset();
        head_ = Next(head_);
        --size_;
        ++total_dequeued_;
        return item;
    }

    mutable std::mutex mutex_;
    std::vector<std::optional<T>> slots_;
    size_t head_ = 0;
    size_t tail_ = 0;
    size_t size_ = 0;

    uint64_t total_enqueued_ = 0;
    uint64_t total_dequeued_ = 0;
    uint64_t dropped_ = 0;
};

}  // namespace jsonl_pipe
