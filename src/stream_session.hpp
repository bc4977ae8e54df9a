// SPDX-License-Identifier: MIT

// src/stream_session.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "lib/stream/endpoint.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/timer.hpp"
#include "src/backpressure_queue.hpp"
#include "src/jsonl_decoder.hpp"
#include "src/retry_policy.hpp"
#include "src/stream_message.hpp"
#include "src/stream_metrics.hpp"
#include "src/transport_client.hpp"

namespace jsonl_pipe {

/// Marks the end of one connection's stream; `error` is empty for a clean end.
struct StreamEnd {
    std::optional<Error> error;
};

using QueueEntry = std::variant<DecodedMessage<StreamMessage>, StreamEnd>;

enum class TransportKind { EventStream, WebSocket };

constexpr std::string_view to_string(TransportKind kind) {
    return kind == TransportKind::EventStream ? "sse" : "websocket";
}

struct SessionConfig {
    TransportKind transport = TransportKind::EventStream;
    TransportConfig client{};
    BackpressureConfig queue{};
    MetricsConfig metrics{};
    RetryConfig retry = RetryConfig::ReconnectDefaults();
};

/// What the session is doing, as shown to a user.
struct SessionStatus {
    enum class Phase { Idle, Connecting, Streaming, Retrying, Stopped, GaveUp };

    Phase phase = Phase::Idle;
    uint32_t attempt = 0;                       ///< Reconnect attempt, 0 before any failure
    std::chrono::milliseconds retry_delay{0};   ///< Set while Retrying
    std::optional<Error> last_error;
    bool data_quality_warning = false;          ///< Decode success below the warning threshold
};

constexpr std::string_view to_string(SessionStatus::Phase phase) {
    switch (phase) {
        case SessionStatus::Phase::Idle: return "idle";
        case SessionStatus::Phase::Connecting: return "connecting";
        case SessionStatus::Phase::Streaming: return "streaming";
        case SessionStatus::Phase::Retrying: return "retrying";
        case SessionStatus::Phase::Stopped: return "stopped";
        case SessionStatus::Phase::GaveUp: return "gave up";
    }
    return "unknown";
}

/// "retrying (attempt 2 in 1000 ms): Timeout: ..." style summary.
std::string to_string(const SessionStatus& status);

/// Build the transport client for `kind`.
std::shared_ptr<TransportClient> MakeTransportClient(TransportKind kind, IEventLoop& loop,
                                                     TransportConfig config);

// StreamSession - supervised stream from one endpoint into a bounded queue
//
// Network side (event loop thread): connects the transport client, pushes
// every decoded message into a BackpressureQueue and, when the queue is
// full, sheds the message and reports it. Each connection end enqueues a
// StreamEnd marker. Retryable failures (and clean server closes) reconnect
// with backoff; anything else, or an exhausted budget, ends in GaveUp and
// closes the queue.
//
// Consumer side (any one thread): Next() blocks for the next entry, paced by
// the queue's processing interval, and returns nullopt once the session is
// stopped or gave up and the queue is drained.
//
// Start(), Send() and destruction belong to the loop thread; Stop() and
// Next() may be called from anywhere.
class StreamSession : public std::enable_shared_from_this<StreamSession> {
public:
    using StatusCallback = std::function<void(const SessionStatus&)>;
    using DiagnosticCallback = TransportClient::DiagnosticCallback;

    static std::shared_ptr<StreamSession> Create(IEventLoop& loop, Endpoint endpoint,
                                                 SessionConfig config = {});

    /// Use a caller-built client instead of one made from config.transport.
    static std::shared_ptr<StreamSession> Create(IEventLoop& loop, Endpoint endpoint,
                                                 SessionConfig config,
                                                 std::shared_ptr<TransportClient> client);

    ~StreamSession();

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    void Start();

    /// Disconnect, cancel reconnects and close the queue.
    void Stop();

    /// Next queued entry; nullopt once stopped and drained.
    std::optional<QueueEntry> Next();
    std::optional<QueueEntry> NextFor(std::chrono::milliseconds timeout);

    /// Forward a request to the connected client.
    std::expected<void, Error> Send(const StreamRequest& request,
                                    TransportClient::SendCallback on_sent = {});

    /// Status changes, on the loop thread.
    void OnStatus(StatusCallback cb) { on_status_ = std::move(cb); }

    /// Each periodic metrics sample, on the loop thread.
    void OnSample(StreamMetricsCollector::SampleCallback cb) { on_sample_ = std::move(cb); }

    /// Record-level problems and shed messages (default: stderr).
    void OnDiagnostic(DiagnosticCallback cb) { on_diagnostic_ = std::move(cb); }

    SessionStatus Status() const;

    /// Messages refused by the full queue.
    uint64_t Rejected() const { return rejected_.load(std::memory_order_relaxed); }

    StreamMetricsCollector& Metrics() { return metrics_; }
    BackpressureQueue<QueueEntry>& Queue() { return queue_; }
    TransportClient& Client() { return *client_; }
    const Endpoint& GetEndpoint() const { return endpoint_; }

private:
    StreamSession(IEventLoop& loop, Endpoint endpoint, SessionConfig config,
                  std::shared_ptr<TransportClient> client);

    void Connect();
    void HandleConnected();
    void HandleMessage(TransportClient::Message message);
    void HandleStreamEnd(std::optional<Error> error);
    void ScheduleReconnect(Error error);
    void StopOnLoop();
    void HandleDiagnostic(const StreamDiagnostic& diagnostic);
    void HandleSample(const MetricsSample& sample);
    void SyncBytes();
    void RecordConsumption(const QueueEntry& entry);
    void UpdateStatus(const std::function<void(SessionStatus&)>& change);

    IEventLoop& loop_;
    Endpoint endpoint_;
    SessionConfig config_;
    std::shared_ptr<TransportClient> client_;

    BackpressureQueue<QueueEntry> queue_;
    StreamMetricsCollector metrics_;
    RetryPolicy retry_;
    Timer reconnect_timer_;

    bool started_ = false;
    std::atomic<bool> stopping_{false};
    std::atomic<uint64_t> rejected_{0};
    uint64_t bytes_seen_ = 0;

    mutable std::mutex status_mutex_;
    SessionStatus status_;

    StatusCallback on_status_;
    DiagnosticCallback on_diagnostic_;
    StreamMetricsCollector::SampleCallback on_sample_;
};

}  // namespace jsonl_pipe
