// SPDX-License-Identifier: MIT

// src/stream_metrics.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lib/stream/event_loop.hpp"
#include "lib/stream/timer.hpp"
#include "src/ring_buffer.hpp"

namespace jsonl_pipe {

enum class HealthStatus { Healthy, Warning, Critical };

enum class Trend { Up, Down, Stable };

constexpr std::string_view to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Warning: return "warning";
        case HealthStatus::Critical: return "critical";
    }
    return "unknown";
}

constexpr std::string_view to_string(Trend trend) {
    switch (trend) {
        case Trend::Up: return "up";
        case Trend::Down: return "down";
        case Trend::Stable: return "stable";
    }
    return "unknown";
}

struct HealthThresholds {
    double fill_warning = 0.7;              ///< Queue fill ratio above this warns
    double fill_critical = 0.9;
    double decode_success_warning = 0.99;   ///< Windowed success ratio below this warns
    double decode_success_critical = 0.95;
    double min_consumer_rate = 0.0;         ///< msg/s floor while items wait (0 = off)
    double trend_band = 0.05;               ///< Relative change counted as stable
};

struct MetricsConfig {
    std::chrono::milliseconds sample_interval{500};
    std::chrono::milliseconds throughput_window{5000};
    size_t latency_window = 100;   ///< Latencies averaged per sample
    size_t history_size = 1000;    ///< Samples kept by History()
    HealthThresholds health{};
};

/// Derived view of the pipeline at one instant.
struct MetricsSample {
    std::chrono::steady_clock::time_point at{};

    // Totals since construction
    uint64_t bytes_received = 0;
    uint64_t messages_decoded = 0;
    uint64_t decode_failures = 0;
    uint64_t overflows = 0;
    uint64_t messages_consumed = 0;
    uint64_t dropped = 0;

    // Over the trailing throughput window
    double ingest_rate = 0.0;           ///< Decoded messages per second
    double consume_rate = 0.0;          ///< Consumed messages per second
    double decode_success_ratio = 1.0;

    double mean_latency_ms = 0.0;       ///< Mean of the latest latency_window observations
    size_t queue_depth = 0;
    double queue_fill_ratio = 0.0;

    HealthStatus health = HealthStatus::Healthy;
    std::string health_reason;          ///< Empty when healthy
    Trend throughput_trend = Trend::Stable;
    Trend latency_trend = Trend::Stable;
};

// StreamMetricsCollector - throughput, latency and health observations
//
// Record*() may be called from any thread (the network loop records
// ingestion, the consumer records consumption and latency). Sample()
// derives a MetricsSample; Start() does so every sample_interval on an event
// loop and hands each sample to the OnSample() callback.
//
// Purely observational: nothing here feeds back into the pipeline.
class StreamMetricsCollector {
public:
    using Clock = std::chrono::steady_clock;
    using SampleCallback = std::function<void(const MetricsSample&)>;

    struct QueueState {
        size_t depth = 0;
        double fill_ratio = 0.0;
    };
    using QueueProbe = std::function<QueueState()>;

    explicit StreamMetricsCollector(MetricsConfig config = {});
    ~StreamMetricsCollector();

    StreamMetricsCollector(const StreamMetricsCollector&) = delete;
    StreamMetricsCollector& operator=(const StreamMetricsCollector&) = delete;

    void RecordBytes(size_t n) { bytes_.fetch_add(n, std::memory_order_relaxed); }
    void RecordDecoded() { decoded_.fetch_add(1, std::memory_order_relaxed); }
    void RecordDecodeFailure() { failures_.fetch_add(1, std::memory_order_relaxed); }
    void RecordOverflow() { overflows_.fetch_add(1, std::memory_order_relaxed); }
    void RecordConsumed() { consumed_.fetch_add(1, std::memory_order_relaxed); }
    void RecordDropped() { dropped_.fetch_add(1, std::memory_order_relaxed); }
    void RecordLatency(std::chrono::microseconds latency);

    /// Queried on every sample for depth and fill ratio.
    void SetQueueProbe(QueueProbe probe);

    /// Take a sample now. Appends to the history.
    MetricsSample Sample(Clock::time_point now = Clock::now());

    /// Sample every sample_interval on `loop`. Call on the loop thread.
    void Start(IEventLoop& loop);
    void Stop();
    bool IsRunning() const { return timer_ && timer_->IsArmed(); }

    /// Callback run on the loop thread after each periodic sample.
    void OnSample(SampleCallback cb);

    std::vector<MetricsSample> History() const { return history_.Snapshot(); }
    std::optional<MetricsSample> Latest() const;

    const MetricsConfig& Config() const { return config_; }

private:
    struct WindowPoint {
        Clock::time_point at;
        uint64_t decoded;
        uint64_t failures;
        uint64_t consumed;
    };

    Trend Compare(double previous, double current) const;
    void Classify(MetricsSample& sample) const;

    const MetricsConfig config_;

    std::atomic<uint64_t> bytes_{0};
    std::atomic<uint64_t> decoded_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> overflows_{0};
    std::atomic<uint64_t> consumed_{0};
    std::atomic<uint64_t> dropped_{0};

    mutable std::mutex latency_mutex_;
    std::deque<double> latencies_ms_;

    mutable std::mutex sample_mutex_;
    std::deque<WindowPoint> window_;
    std::optional<MetricsSample> latest_;
    QueueProbe queue_probe_;
    SampleCallback on_sample_;

    BoundedRingBuffer<MetricsSample> history_;
    std::unique_ptr<Timer> timer_;
};

}  // namespace jsonl_pipe
