// SPDX-License-Identifier: MIT

// lib/stream/buffer_chain.hpp
#pragma once

#include <algorithm>
#include <array>
#include <cassert>
#include <cstddef>
#include <cstring>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonl_pipe {

// Fixed-size buffer segment filled by one read() or one decrypt pass.
//
// Thread safety: Not thread-safe. Access must be externally synchronized.
struct Segment {
    static constexpr size_t kSize = 64 * 1024;  // 64KB segments

    std::array<std::byte, kSize> data;
    size_t size = 0;  // Bytes written (valid data)

    std::span<std::byte> WriteSpan() noexcept {
        return std::span{data.data() + size, kSize - size};
    }

    std::span<const std::byte> ReadSpan() const noexcept {
        return std::span{data.data(), size};
    }

    size_t Remaining() const noexcept { return kSize - size; }

    bool IsFull() const noexcept { return size >= kSize; }
};

class SegmentPool;

// Chain of segments holding received bytes that have not been consumed yet.
// Producers append whole segments; consumers scan, copy and Consume() from
// the front.
//
// Thread safety: Not thread-safe. All operations must be called from the
// event loop thread.
class BufferChain {
public:
    using RecycleCallback = std::function<void(std::shared_ptr<Segment>)>;

    BufferChain() = default;
    BufferChain(BufferChain&& other) noexcept
        : segments_(std::move(other.segments_)),
          consumed_offset_(std::exchange(other.consumed_offset_, 0)),
          total_size_(std::exchange(other.total_size_, 0)),
          recycle_callback_(std::move(other.recycle_callback_)) {
        other.segments_.clear();
    }
    BufferChain& operator=(BufferChain&& other) noexcept {
        if (this != &other) {
            segments_ = std::move(other.segments_);
            other.segments_.clear();
            consumed_offset_ = std::exchange(other.consumed_offset_, 0);
            total_size_ = std::exchange(other.total_size_, 0);
            recycle_callback_ = std::move(other.recycle_callback_);
        }
        return *this;
    }
    BufferChain(const BufferChain&) = delete;
    BufferChain& operator=(const BufferChain&) = delete;

    // Build a chain holding a copy of text (tests, request writers).
    static BufferChain FromString(std::string_view text) {
        BufferChain chain;
        chain.AppendBytes(text.data(), text.size());
        return chain;
    }

    // Set callback for recycling consumed segments back to a pool.
    void SetRecycleCallback(RecycleCallback cb) {
        recycle_callback_ = std::move(cb);
    }

    // Add segment to chain (called by socket layer after read)
    void Append(std::shared_ptr<Segment> seg) {
        assert((!seg || seg->size <= Segment::kSize) &&
               "Segment size exceeds capacity");
        if (seg && seg->size > 0) {
            total_size_ += seg->size;
            segments_.push_back(std::move(seg));
        }
    }

    // Copy bytes to the tail, filling the last segment before allocating.
    void AppendBytes(const void* bytes, size_t len, SegmentPool* pool = nullptr);

    // Splice all segments from another chain (transfers ownership).
    // 'other' must not be partially consumed.
    void Splice(BufferChain&& other) {
        if (other.Empty()) return;
        assert(other.consumed_offset_ == 0 &&
               "Cannot splice a partially-consumed chain");

        if (!recycle_callback_ && other.recycle_callback_) {
            recycle_callback_ = other.recycle_callback_;
        }

        total_size_ += other.total_size_;
        for (auto& seg : other.segments_) {
            segments_.push_back(std::move(seg));
        }
        other.segments_.clear();
        other.consumed_offset_ = 0;
        other.total_size_ = 0;
    }

    // Consume bytes from front. Fully consumed segments are recycled.
    void Consume(size_t bytes) noexcept {
        while (bytes > 0 && !segments_.empty()) {
            auto& front = segments_.front();
            size_t available = front->size - consumed_offset_;

            if (bytes >= available) {
                bytes -= available;
                total_size_ -= available;
                consumed_offset_ = 0;
                if (recycle_callback_) {
                    recycle_callback_(std::move(front));
                }
                segments_.pop_front();
            } else {
                consumed_offset_ += bytes;
                total_size_ -= bytes;
                bytes = 0;
            }
        }
    }

    // Raw pointer to the byte at offset (relative to unconsumed start).
    const std::byte* DataAt(size_t offset) const noexcept {
        size_t pos = consumed_offset_ + offset;
        size_t seg_idx = 0;

        while (seg_idx < segments_.size() && pos >= segments_[seg_idx]->size) {
            pos -= segments_[seg_idx]->size;
            ++seg_idx;
        }

        assert(seg_idx < segments_.size() && "DataAt: offset out of bounds");
        return segments_[seg_idx]->data.data() + pos;
    }

    // Copy len bytes starting at offset into dest (may cross segments).
    void CopyTo(size_t offset, size_t len, void* dest) const {
        if (len == 0) return;
        auto* out = static_cast<std::byte*>(dest);

        size_t pos = consumed_offset_ + offset;
        size_t seg_idx = 0;
        while (seg_idx < segments_.size() && pos >= segments_[seg_idx]->size) {
            pos -= segments_[seg_idx]->size;
            ++seg_idx;
        }

        size_t copied = 0;
        while (copied < len && seg_idx < segments_.size()) {
            const auto& seg = segments_[seg_idx];
            size_t to_copy = std::min(seg->size - pos, len - copied);
            std::memcpy(out + copied, seg->data.data() + pos, to_copy);
            copied += to_copy;
            pos = 0;
            ++seg_idx;
        }

        assert(copied == len && "CopyTo: not enough data");
    }

    // Offset of the first occurrence of value at or after from, across segments.
    std::optional<size_t> FindByte(std::byte value, size_t from = 0) const noexcept {
        if (from >= total_size_) return std::nullopt;

        size_t pos = consumed_offset_ + from;
        size_t seg_idx = 0;
        size_t base = from;  // Logical offset of pos within the chain
        while (seg_idx < segments_.size() && pos >= segments_[seg_idx]->size) {
            pos -= segments_[seg_idx]->size;
            ++seg_idx;
        }

        while (seg_idx < segments_.size()) {
            const auto& seg = segments_[seg_idx];
            const std::byte* start = seg->data.data() + pos;
            size_t len = seg->size - pos;
            const void* hit = std::memchr(start, std::to_integer<int>(value), len);
            if (hit != nullptr) {
                return base + static_cast<size_t>(static_cast<const std::byte*>(hit) - start);
            }
            base += len;
            pos = 0;
            ++seg_idx;
        }
        return std::nullopt;
    }

    // Copy of len bytes at offset as text.
    std::string ToString(size_t offset, size_t len) const {
        std::string out(len, '\0');
        CopyTo(offset, len, out.data());
        return out;
    }

    // Copy of all unconsumed bytes as text.
    std::string ToString() const { return ToString(0, total_size_); }

    // Total unconsumed bytes. O(1).
    size_t Size() const noexcept { return total_size_; }

    bool Empty() const noexcept { return total_size_ == 0; }

    size_t SegmentCount() const noexcept { return segments_.size(); }

    // Bytes accessible with DataAt(0) without crossing a segment.
    size_t ContiguousSize() const noexcept {
        if (segments_.empty()) return 0;
        return segments_.front()->size - consumed_offset_;
    }

    // True if adding incoming bytes would push the chain past limit.
    bool WouldOverflow(size_t incoming, size_t limit) const noexcept {
        return total_size_ > limit || incoming > limit - total_size_;
    }

    // Drop all data. Segments are recycled if a callback is set.
    void Clear() {
        if (recycle_callback_) {
            for (auto& seg : segments_) {
                recycle_callback_(std::move(seg));
            }
        }
        segments_.clear();
        consumed_offset_ = 0;
        total_size_ = 0;
    }

private:
    std::deque<std::shared_ptr<Segment>> segments_;
    size_t consumed_offset_ = 0;  // Bytes consumed from first segment
    size_t total_size_ = 0;       // Cached total unconsumed bytes
    RecycleCallback recycle_callback_;
};

// Pool for reusing Segment allocations on one thread.
//
// Thread safety: Not thread-safe.
class SegmentPool {
public:
    explicit SegmentPool(size_t max_pool_size = kDefaultMaxPoolSize)
        : max_pool_size_(max_pool_size) {}

    // Acquire a segment from pool or allocate new.
    std::shared_ptr<Segment> Acquire() {
        if (!free_list_.empty()) {
            auto seg = std::move(free_list_.back());
            free_list_.pop_back();
            seg->size = 0;
            return seg;
        }
        return std::make_shared<Segment>();
    }

    // Return segment to pool. Segments still referenced elsewhere are left
    // to deallocate when the last reference goes.
    void Release(std::shared_ptr<Segment> seg) {
        if (seg && seg.use_count() == 1 && free_list_.size() < max_pool_size_) {
            free_list_.push_back(std::move(seg));
        }
    }

    // Recycler for BufferChain::SetRecycleCallback(). The pool must outlive
    // every chain holding the recycler.
    BufferChain::RecycleCallback MakeRecycler() {
        return [this](std::shared_ptr<Segment> seg) {
            Release(std::move(seg));
        };
    }

    size_t PoolSize() const noexcept { return free_list_.size(); }

    size_t MaxPoolSize() const noexcept { return max_pool_size_; }

    void Clear() { free_list_.clear(); }

    static constexpr size_t kDefaultMaxPoolSize = 32;  // ~2MB pool

private:
    std::vector<std::shared_ptr<Segment>> free_list_;
    size_t max_pool_size_;
};

inline void BufferChain::AppendBytes(const void* bytes, size_t len, SegmentPool* pool) {
    const auto* src = static_cast<const std::byte*>(bytes);
    while (len > 0) {
        // Only a segment we exclusively own may be extended in place
        if (!segments_.empty() && !segments_.back()->IsFull() &&
            segments_.back().use_count() == 1) {
            auto& tail = segments_.back();
            size_t n = std::min(len, tail->Remaining());
            std::memcpy(tail->data.data() + tail->size, src, n);
            tail->size += n;
            total_size_ += n;
            src += n;
            len -= n;
            continue;
        }
        auto seg = pool ? pool->Acquire() : std::make_shared<Segment>();
        size_t n = std::min(len, Segment::kSize);
        std::memcpy(seg->data.data(), src, n);
        seg->size = n;
        Append(std::move(seg));
        src += n;
        len -= n;
    }
}

}  // namespace jsonl_pipe
