// SPDX-License-Identifier: MIT

// src/load_harness.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "src/line_accumulator.hpp"
#include "src/ring_buffer.hpp"
#include "src/stream_message.hpp"

namespace jsonl_pipe {

struct LoadConfig {
    size_t messages = 100000;
    size_t payload_bytes = 128;     ///< Filler per message
    double malformed_ratio = 0.0;   ///< Share of lines cut short
    size_t max_chunk = 4096;        ///< Chunks are 1..max_chunk bytes
    uint32_t seed = 42;
    size_t ring_capacity = BoundedRingBuffer<StreamMessage>::kDefaultCapacity;
    LineAccumulatorConfig line{};
};

struct LoadReport {
    uint64_t generated = 0;
    uint64_t malformed = 0;         ///< Lines generated broken on purpose
    uint64_t bytes = 0;
    uint64_t chunks = 0;
    uint64_t decoded = 0;
    uint64_t decode_failures = 0;
    uint64_t overflows = 0;
    uint64_t ring_dropped = 0;      ///< Overwritten in the ring before being read
    size_t ring_size = 0;
    std::chrono::nanoseconds elapsed{0};
    double messages_per_second = 0.0;
    double megabytes_per_second = 0.0;
};

/// Seeded JSONL stream of `config.messages` lines.
std::string GenerateJsonl(const LoadConfig& config, uint64_t* malformed = nullptr);

/// One-line summary for logs.
std::string FormatReport(const LoadReport& report);

// LoadHarness - synthetic throughput run of the receive pipeline
//
// Generates a seeded JSONL stream, cuts it into random chunks and pushes
// them through LineAccumulator and StreamMessageDecoder into a
// BoundedRingBuffer, timing only the pipeline. Runs are reproducible for a
// given seed.
class LoadHarness {
public:
    explicit LoadHarness(LoadConfig config = {});

    LoadReport Run();

    /// Messages from the last Run() that were not overwritten.
    BoundedRingBuffer<StreamMessage>& Buffer() { return ring_; }

    const LoadConfig& Config() const { return config_; }

private:
    LoadConfig config_;
    BoundedRingBuffer<StreamMessage> ring_;
};

}  // namespace jsonl_pipe
