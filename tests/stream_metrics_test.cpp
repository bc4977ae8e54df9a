// SPDX-License-Identifier: MIT

// tests/stream_metrics_test.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <vector>

#include "lib/stream/epoll_event_loop.hpp"
#include "src/stream_metrics.hpp"

using namespace jsonl_pipe;
using namespace std::chrono_literals;

namespace {

using Clock = StreamMetricsCollector::Clock;

void Decode(StreamMetricsCollector& m, int n) {
    for (int i = 0; i < n; ++i) m.RecordDecoded();
}

}  // namespace

TEST(StreamMetricsTest, TotalsAndRates) {
    StreamMetricsCollector metrics;
    auto t0 = Clock::now();
    metrics.Sample(t0);

    metrics.RecordBytes(4096);
    Decode(metrics, 200);
    for (int i = 0; i < 100; ++i) metrics.RecordConsumed();
    metrics.RecordOverflow();
    metrics.RecordDropped();

    auto s = metrics.Sample(t0 + 2s);
    EXPECT_EQ(s.bytes_received, 4096u);
    EXPECT_EQ(s.messages_decoded, 200u);
    EXPECT_EQ(s.messages_consumed, 100u);
    EXPECT_EQ(s.overflows, 1u);
    EXPECT_EQ(s.dropped, 1u);
    EXPECT_DOUBLE_EQ(s.ingest_rate, 100.0);
    EXPECT_DOUBLE_EQ(s.consume_rate, 50.0);
    EXPECT_DOUBLE_EQ(s.decode_success_ratio, 1.0);
    EXPECT_EQ(s.health, HealthStatus::Healthy);
    EXPECT_TRUE(s.health_reason.empty());
}

TEST(StreamMetricsTest, RatesUseTrailingWindow) {
    MetricsConfig config;
    config.throughput_window = 2000ms;
    StreamMetricsCollector metrics(config);
    auto t0 = Clock::now();

    metrics.Sample(t0);
    Decode(metrics, 1000);
    metrics.Sample(t0 + 1s);
    metrics.Sample(t0 + 2s);
    // The burst has left the window by now
    auto s = metrics.Sample(t0 + 4s);
    EXPECT_DOUBLE_EQ(s.ingest_rate, 0.0);
    EXPECT_EQ(s.messages_decoded, 1000u);
}

TEST(StreamMetricsTest, FirstSampleHasNoRate) {
    StreamMetricsCollector metrics;
    Decode(metrics, 10);
    auto s = metrics.Sample();
    EXPECT_DOUBLE_EQ(s.ingest_rate, 0.0);
}

TEST(StreamMetricsTest, MeanLatencyOverWindow) {
    MetricsConfig config;
    config.latency_window = 2;
    StreamMetricsCollector metrics(config);
    metrics.RecordLatency(10000us);
    metrics.RecordLatency(2000us);
    metrics.RecordLatency(4000us);
    EXPECT_DOUBLE_EQ(metrics.Sample().mean_latency_ms, 3.0);
}

TEST(StreamMetricsTest, DecodeFailuresDegradeHealth) {
    StreamMetricsCollector metrics;
    auto t0 = Clock::now();
    metrics.Sample(t0);

    Decode(metrics, 98);
    metrics.RecordDecodeFailure();
    metrics.RecordDecodeFailure();
    auto warning = metrics.Sample(t0 + 1s);
    EXPECT_DOUBLE_EQ(warning.decode_success_ratio, 0.98);
    EXPECT_EQ(warning.health, HealthStatus::Warning);
    EXPECT_EQ(warning.health_reason, "decode success 98.0%");

    for (int i = 0; i < 20; ++i) metrics.RecordDecodeFailure();
    auto critical = metrics.Sample(t0 + 2s);
    EXPECT_EQ(critical.health, HealthStatus::Critical);
}

TEST(StreamMetricsTest, QueueFillDrivesHealth) {
    StreamMetricsCollector metrics;
    StreamMetricsCollector::QueueState state{800, 0.8};
    metrics.SetQueueProbe([&] { return state; });

    auto s = metrics.Sample();
    EXPECT_EQ(s.queue_depth, 800u);
    EXPECT_EQ(s.health, HealthStatus::Warning);
    EXPECT_EQ(s.health_reason, "queue 80% full");

    state = {950, 0.95};
    EXPECT_EQ(metrics.Sample().health, HealthStatus::Critical);

    state = {10, 0.01};
    EXPECT_EQ(metrics.Sample().health, HealthStatus::Healthy);
}

TEST(StreamMetricsTest, SlowConsumerWarning) {
    MetricsConfig config;
    config.health.min_consumer_rate = 100.0;
    StreamMetricsCollector metrics(config);
    metrics.SetQueueProbe([] { return StreamMetricsCollector::QueueState{50, 0.05}; });

    auto t0 = Clock::now();
    metrics.Sample(t0);
    for (int i = 0; i < 10; ++i) metrics.RecordConsumed();
    auto s = metrics.Sample(t0 + 1s);
    EXPECT_EQ(s.health, HealthStatus::Warning);
    EXPECT_NE(s.health_reason.find("consumer at 10.0 msg/s"), std::string::npos);
}

TEST(StreamMetricsTest, Trends) {
    StreamMetricsCollector metrics;
    auto t0 = Clock::now();
    metrics.Sample(t0);

    Decode(metrics, 100);
    EXPECT_EQ(metrics.Sample(t0 + 1s).throughput_trend, Trend::Up);

    Decode(metrics, 100);
    EXPECT_EQ(metrics.Sample(t0 + 2s).throughput_trend, Trend::Stable);

    // Nothing new: the windowed rate falls
    EXPECT_EQ(metrics.Sample(t0 + 4s).throughput_trend, Trend::Down);
}

TEST(StreamMetricsTest, HistoryIsBounded) {
    MetricsConfig config;
    config.history_size = 3;
    StreamMetricsCollector metrics(config);
    auto t0 = Clock::now();
    for (int i = 0; i < 5; ++i) {
        metrics.RecordDecoded();
        metrics.Sample(t0 + std::chrono::seconds(i));
    }
    auto history = metrics.History();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history.front().messages_decoded, 3u);
    EXPECT_EQ(history.back().messages_decoded, 5u);
    ASSERT_TRUE(metrics.Latest().has_value());
    EXPECT_EQ(metrics.Latest()->messages_decoded, 5u);
}

TEST(StreamMetricsTest, PeriodicSamplingOnLoop) {
    EpollEventLoop loop;
    MetricsConfig config;
    config.sample_interval = 10ms;
    StreamMetricsCollector metrics(config);

    std::vector<MetricsSample> samples;
    metrics.OnSample([&](const MetricsSample& s) {
        samples.push_back(s);
        if (samples.size() == 3) loop.Stop();
    });
    metrics.Start(loop);
    EXPECT_TRUE(metrics.IsRunning());
    loop.Run();

    EXPECT_EQ(samples.size(), 3u);
    metrics.Stop();
    EXPECT_FALSE(metrics.IsRunning());
}

TEST(StreamMetricsTest, HealthNames) {
    EXPECT_EQ(to_string(HealthStatus::Critical), "critical");
    EXPECT_EQ(to_string(Trend::Down), "down");
}
