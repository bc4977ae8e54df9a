// SPDX-License-Identifier: MIT

// src/stream_metrics.cpp
#include "src/stream_metrics.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

#include <fmt/format.h>

namespace jsonl_pipe {

namespace {

double PerSecond(uint64_t delta, std::chrono::steady_clock::duration span) {
    double seconds = std::chrono::duration<double>(span).count();
    if (seconds <= 0.0) return 0.0;
    return static_cast<double>(delta) / seconds;
}

}  // namespace

StreamMetricsCollector::StreamMetricsCollector(MetricsConfig config)
    : config_(config), history_(std::max<size_t>(config.history_size, 1)) {}

StreamMetricsCollector::~StreamMetricsCollector() {
    Stop();
}

void StreamMetricsCollector::RecordLatency(std::chrono::microseconds latency) {
    std::lock_guard<std::mutex> lock(latency_mutex_);
    latencies_ms_.push_back(static_cast<double>(latency.count()) / 1000.0);
    while (latencies_ms_.size() > config_.latency_window) {
        latencies_ms_.pop_front();
    }
}

void StreamMetricsCollector::SetQueueProbe(QueueProbe probe) {
    std::lock_guard<std::mutex> lock(sample_mutex_);
    queue_probe_ = std::move(probe);
}

void StreamMetricsCollector::OnSample(SampleCallback cb) {
    std::lock_guard<std::mutex> lock(sample_mutex_);
    on_sample_ = std::move(cb);
}

std::optional<MetricsSample> StreamMetricsCollector::Latest() const {
    std::lock_guard<std::mutex> lock(sample_mutex_);
    return latest_;
}

MetricsSample StreamMetricsCollector::Sample(Clock::time_point now) {
    MetricsSample sample;
    sample.at = now;
    sample.bytes_received = bytes_.load(std::memory_order_relaxed);
    sample.messages_decoded = decoded_.load(std::memory_order_relaxed);
    sample.decode_failures = failures_.load(std::memory_order_relaxed);
    sample.overflows = overflows_.load(std::memory_order_relaxed);
    sample.messages_consumed = consumed_.load(std::memory_order_relaxed);
    sample.dropped = dropped_.load(std::memory_order_relaxed);

    {
        std::lock_guard<std::mutex> lock(latency_mutex_);
        if (!latencies_ms_.empty()) {
            sample.mean_latency_ms =
                std::accumulate(latencies_ms_.begin(), latencies_ms_.end(), 0.0) /
                static_cast<double>(latencies_ms_.size());
        }
    }

    std::lock_guard<std::mutex> lock(sample_mutex_);

    if (queue_probe_) {
        auto queue = queue_probe_();
        sample.queue_depth = queue.depth;
        sample.queue_fill_ratio = queue.fill_ratio;
    }

    window_.push_back(WindowPoint{now, sample.messages_decoded, sample.decode_failures,
                                  sample.messages_consumed});
    while (window_.size() > 1 && now - window_.front().at > config_.throughput_window) {
        window_.pop_front();
    }

    const WindowPoint& oldest = window_.front();
    auto span = now - oldest.at;
    uint64_t decoded = sample.messages_decoded - oldest.decoded;
    uint64_t failed = sample.decode_failures - oldest.failures;
    sample.ingest_rate = PerSecond(decoded, span);
    sample.consume_rate = PerSecond(sample.messages_consumed - oldest.consumed, span);
    if (decoded + failed > 0) {
        sample.decode_success_ratio =
            static_cast<double>(decoded) / static_cast<double>(decoded + failed);
    }

    Classify(sample);
    if (latest_) {
        sample.throughput_trend = Compare(latest_->ingest_rate, sample.ingest_rate);
        sample.latency_trend = Compare(latest_->mean_latency_ms, sample.mean_latency_ms);
    }

    latest_ = sample;
    history_.Enqueue(sample);
    return sample;
}

void StreamMetricsCollector::Classify(MetricsSample& sample) const {
    const auto& t = config_.health;
    auto raise = [&sample](HealthStatus level, std::string reason) {
        if (level > sample.health) {
            sample.health = level;
            sample.health_reason = std::move(reason);
        }
    };

    if (sample.queue_fill_ratio > t.fill_critical) {
        raise(HealthStatus::Critical,
              fmt::format("queue {:.0f}% full", sample.queue_fill_ratio * 100.0));
    } else if (sample.queue_fill_ratio > t.fill_warning) {
        raise(HealthStatus::Warning,
              fmt::format("queue {:.0f}% full", sample.queue_fill_ratio * 100.0));
    }

    if (sample.decode_success_ratio < t.decode_success_critical) {
        raise(HealthStatus::Critical,
              fmt::format("decode success {:.1f}%", sample.decode_success_ratio * 100.0));
    } else if (sample.decode_success_ratio < t.decode_success_warning) {
        raise(HealthStatus::Warning,
              fmt::format("decode success {:.1f}%", sample.decode_success_ratio * 100.0));
    }

    if (t.min_consumer_rate > 0.0 && sample.queue_depth > 0 &&
        sample.consume_rate < t.min_consumer_rate) {
        raise(HealthStatus::Warning,
              fmt::format("consumer at {:.1f} msg/s with {} waiting", sample.consume_rate,
                          sample.queue_depth));
    }
}

Trend StreamMetricsCollector::Compare(double previous, double current) const {
    if (previous == 0.0) {
        return current > 0.0 ? Trend::Up : Trend::Stable;
    }
    double change = (current - previous) / previous;
    if (change > config_.health.trend_band) return Trend::Up;
    if (change < -config_.health.trend_band) return Trend::Down;
    return Trend::Stable;
}

void StreamMetricsCollector::Start(IEventLoop& loop) {
    RequireLoopThread(loop, "StreamMetricsCollector::Start");
    if (!timer_) {
        timer_ = std::make_unique<Timer>(loop);
        timer_->OnTimer([this]() {
            MetricsSample sample = Sample();
            SampleCallback cb;
            {
                std::lock_guard<std::mutex> lock(sample_mutex_);
                cb = on_sample_;
            }
            if (cb) cb(sample);
        });
    }
    timer_->Start(config_.sample_interval, config_.sample_interval);
}

void StreamMetricsCollector::Stop() {
    if (timer_) {
        timer_->Stop();
    }
}

}  // namespace jsonl_pipe
