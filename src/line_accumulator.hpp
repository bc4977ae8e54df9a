// SPDX-License-Identifier: MIT

// src/line_accumulator.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/error.hpp"

namespace jsonl_pipe {

/// What happens when the pending bytes outgrow max_buffer_size.
enum class OverflowPolicy {
    Reset,     ///< Drop the pending bytes, report once, keep going
    FailFast,  ///< Report once and refuse input until Reset()
};

struct LineAccumulatorConfig {
    size_t max_buffer_size = 1024 * 1024;
    OverflowPolicy overflow_policy = OverflowPolicy::Reset;
};

/// Splits a byte stream into newline-terminated records.
///
/// Bytes are appended to a pending buffer; every complete record is handed to
/// the visitor in arrival order. Empty records are skipped and a trailing
/// '\r' is removed. A partial record is never visited: when the pending tail
/// grows past max_buffer_size it is discarded and the visitor receives one
/// BufferOverflow error instead.
///
/// Not thread-safe; owned by a single transport client.
class LineAccumulator {
public:
    using Record = std::expected<std::string, Error>;

    explicit LineAccumulator(LineAccumulatorConfig config = {}) : config_(config) {}

    /// Append bytes and visit each record they complete.
    template <typename F>
    void Ingest(std::string_view bytes, F&& visit) {
        if (failed_) return;
        bytes_ingested_ += bytes.size();
        buffer_.append(bytes);
        Drain(visit);
    }

    /// Same as above for bytes held in a BufferChain. The chain is consumed.
    template <typename F>
    void Ingest(BufferChain& chain, F&& visit) {
        if (failed_) {
            chain.Clear();
            return;
        }
        while (!chain.Empty()) {
            size_t chunk = chain.ContiguousSize();
            buffer_.append(reinterpret_cast<const char*>(chain.DataAt(0)), chunk);
            bytes_ingested_ += chunk;
            chain.Consume(chunk);
        }
        Drain(visit);
    }

    /// Collecting variant.
    std::vector<Record> Ingest(std::string_view bytes);

    /// Drop pending bytes and clear a FailFast latch. Counters are kept.
    void Reset() {
        buffer_.clear();
        failed_ = false;
        ++resets_;
    }

    /// Bytes waiting for their newline.
    size_t Pending() const { return buffer_.size(); }

    /// True after an overflow under OverflowPolicy::FailFast.
    bool IsFailed() const { return failed_; }

    const LineAccumulatorConfig& Config() const { return config_; }

    uint64_t BytesIngested() const { return bytes_ingested_; }
    uint64_t RecordsExtracted() const { return records_extracted_; }
    uint64_t Overflows() const { return overflows_; }

private:
    template <typename F>
    void Drain(F& visit) {
        const uint64_t epoch = resets_;
        size_t start = 0;
        while (start < buffer_.size()) {
            size_t nl = buffer_.find('\n', start);
            if (nl == std::string::npos) break;

            size_t end = nl;
            if (end > start && buffer_[end - 1] == '\r') {
                --end;
            }
            size_t next = nl + 1;
            if (end > start) {
                ++records_extracted_;
                visit(Record(buffer_.substr(start, end - start)));
                if (resets_ != epoch) return;  // Visitor reset us
            }
            start = next;
        }
        buffer_.erase(0, start);

        if (buffer_.size() > config_.max_buffer_size) {
            size_t dropped = buffer_.size();
            buffer_.clear();
            buffer_.shrink_to_fit();
            ++overflows_;
            if (config_.overflow_policy == OverflowPolicy::FailFast) {
                failed_ = true;
            }
            visit(Record(std::unexpected(Error{
                ErrorCode::BufferOverflow,
                "Pending record exceeds " + std::to_string(config_.max_buffer_size) +
                    " bytes; dropped " + std::to_string(dropped) + " bytes"})));
        }
    }

    LineAccumulatorConfig config_;
    std::string buffer_;
    bool failed_ = false;
    uint64_t resets_ = 0;

    uint64_t bytes_ingested_ = 0;
    uint64_t records_extracted_ = 0;
    uint64_t overflows_ = 0;
};

}  // namespace jsonl_pipe
