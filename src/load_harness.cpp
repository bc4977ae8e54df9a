// SPDX-License-Identifier: MIT

// src/load_harness.cpp
#include "src/load_harness.hpp"

#include <algorithm>
#include <random>
#include <string_view>

#include <fmt/format.h>

namespace jsonl_pipe {

std::string GenerateJsonl(const LoadConfig& config, uint64_t* malformed) {
    std::mt19937 rng(config.seed);
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::uniform_int_distribution<int> letter('a', 'z');

    std::string out;
    out.reserve(config.messages * (config.payload_bytes + 64));
    uint64_t broken = 0;

    std::string filler;
    for (size_t i = 0; i < config.messages; ++i) {
        filler.clear();
        for (size_t j = 0; j < config.payload_bytes; ++j) {
            filler.push_back(static_cast<char>(letter(rng)));
        }
        std::string line = fmt::format(
            R"({{"id":{},"method":"tick","params":{{"seq":{},"payload":"{}"}}}})", i, i, filler);

        if (config.malformed_ratio > 0.0 && coin(rng) < config.malformed_ratio) {
            // Truncated object: still one line, never valid JSON
            line.resize(line.size() / 2);
            ++broken;
        }
        out += line;
        out.push_back('\n');
    }

    if (malformed) *malformed = broken;
    return out;
}

std::string FormatReport(const LoadReport& report) {
    return fmt::format(
        "generated={} malformed={} decoded={} failures={} overflows={} ring_dropped={} "
        "chunks={} bytes={} elapsed={:.3f}ms rate={:.0f} msg/s {:.1f} MB/s",
        report.generated, report.malformed, report.decoded, report.decode_failures,
        report.overflows, report.ring_dropped, report.chunks, report.bytes,
        static_cast<double>(report.elapsed.count()) / 1e6, report.messages_per_second,
        report.megabytes_per_second);
}

LoadHarness::LoadHarness(LoadConfig config)
    : config_(config), ring_(config.ring_capacity) {}

LoadReport LoadHarness::Run() {
    LoadReport report;
    report.generated = config_.messages;
    std::string stream = GenerateJsonl(config_, &report.malformed);
    report.bytes = stream.size();

    ring_.Clear();
    auto ring_before = ring_.Metrics();

    LineAccumulator accumulator(config_.line);
    StreamMessageDecoder decoder;
    std::mt19937 rng(config_.seed ^ 0x9e3779b9u);
    std::uniform_int_distribution<size_t> chunk_size(1, std::max<size_t>(config_.max_chunk, 1));

    auto visit = [&](LineAccumulator::Record record) {
        if (!record) {
            ++report.overflows;
            return;
        }
        auto decoded = decoder.Decode(*record);
        if (!decoded) {
            ++report.decode_failures;
            return;
        }
        ++report.decoded;
        ring_.Enqueue(std::move(decoded->value));
    };

    auto start = std::chrono::steady_clock::now();
    std::string_view rest(stream);
    while (!rest.empty()) {
        size_t n = std::min(chunk_size(rng), rest.size());
        accumulator.Ingest(rest.substr(0, n), visit);
        rest.remove_prefix(n);
        ++report.chunks;
    }
    report.elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start);

    auto ring_after = ring_.Metrics();
    report.ring_dropped = ring_after.dropped - ring_before.dropped;
    report.ring_size = ring_after.size;

    double seconds = std::chrono::duration<double>(report.elapsed).count();
    if (seconds > 0.0) {
        report.messages_per_second = static_cast<double>(report.generated) / seconds;
        report.megabytes_per_second = static_cast<double>(report.bytes) / (1024.0 * 1024.0) / seconds;
    }
    return report;
}

}  // namespace jsonl_pipe
