// SPDX-License-Identifier: MIT

// example/load_bench/main.cpp
//
// Push a synthetic JSONL stream through the receive pipeline and report
// throughput.
//
//   load_bench --messages 1000000 --malformed 0.01 --runs 3

#include <cstdio>

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include "src/load_harness.hpp"

using namespace jsonl_pipe;

int main(int argc, char** argv) {
    CLI::App app{"load_bench - synthetic JSONL pipeline throughput"};

    LoadConfig config;
    int runs = 1;
    size_t max_buffer = config.line.max_buffer_size;

    app.add_option("-n,--messages", config.messages, "Lines per run")
        ->default_val(config.messages);
    app.add_option("--payload", config.payload_bytes, "Filler bytes per line")
        ->default_val(config.payload_bytes);
    app.add_option("--malformed", config.malformed_ratio, "Share of lines cut short")
        ->check(CLI::Range(0.0, 1.0))
        ->default_val(config.malformed_ratio);
    app.add_option("--max-chunk", config.max_chunk, "Largest chunk fed at once")
        ->check(CLI::PositiveNumber)
        ->default_val(config.max_chunk);
    app.add_option("--seed", config.seed, "Generator seed")->default_val(config.seed);
    app.add_option("--ring-capacity", config.ring_capacity, "Ring buffer slots")
        ->check(CLI::PositiveNumber)
        ->default_val(config.ring_capacity);
    app.add_option("--max-buffer", max_buffer, "Pending bytes allowed without a newline")
        ->check(CLI::PositiveNumber)
        ->default_val(max_buffer);
    app.add_option("-r,--runs", runs, "Repetitions")->check(CLI::PositiveNumber)->default_val(runs);

    CLI11_PARSE(app, argc, argv);
    config.line.max_buffer_size = max_buffer;

    LoadHarness harness(config);
    double best = 0.0;
    for (int i = 0; i < runs; ++i) {
        auto report = harness.Run();
        fmt::print("run {}: {}\n", i + 1, FormatReport(report));
        if (report.messages_per_second > best) best = report.messages_per_second;

        auto ring = harness.Buffer().Metrics();
        fmt::print("  ring: {}/{} slots ({:.1f}%), drop rate {:.3f}\n", ring.size, ring.capacity,
                   ring.utilization_percent, ring.drop_rate);
    }
    if (runs > 1) {
        fmt::print("best: {:.0f} msg/s\n", best);
    }
    return 0;
}
