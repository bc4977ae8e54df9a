// SPDX-License-Identifier: MIT

// src/stream_session.cpp
#include "src/stream_session.hpp"

#include <utility>

#include <fmt/format.h>

#include "src/event_stream_client.hpp"
#include "src/websocket_client.hpp"

namespace jsonl_pipe {

std::string to_string(const SessionStatus& status) {
    std::string out(to_string(status.phase));
    if (status.phase == SessionStatus::Phase::Retrying) {
        out += fmt::format(" (attempt {} in {} ms)", status.attempt, status.retry_delay.count());
    }
    if (status.last_error &&
        (status.phase == SessionStatus::Phase::Retrying ||
         status.phase == SessionStatus::Phase::GaveUp)) {
        out += fmt::format(": {}: {}", error_code_name(status.last_error->code),
                           status.last_error->message);
    }
    if (status.data_quality_warning) {
        out += " [data quality warning]";
    }
    return out;
}

std::shared_ptr<TransportClient> MakeTransportClient(TransportKind kind, IEventLoop& loop,
                                                     TransportConfig config) {
    if (kind == TransportKind::WebSocket) {
        return WebSocketClient::Create(loop, std::move(config));
    }
    return EventStreamClient::Create(loop, std::move(config));
}

std::shared_ptr<StreamSession> StreamSession::Create(IEventLoop& loop, Endpoint endpoint,
                                                     SessionConfig config) {
    auto client = MakeTransportClient(config.transport, loop, config.client);
    return Create(loop, std::move(endpoint), std::move(config), std::move(client));
}

std::shared_ptr<StreamSession> StreamSession::Create(IEventLoop& loop, Endpoint endpoint,
                                                     SessionConfig config,
                                                     std::shared_ptr<TransportClient> client) {
    struct MakeSharedEnabler : public StreamSession {
        MakeSharedEnabler(IEventLoop& l, Endpoint e, SessionConfig c,
                          std::shared_ptr<TransportClient> tc)
            : StreamSession(l, std::move(e), std::move(c), std::move(tc)) {}
    };
    return std::make_shared<MakeSharedEnabler>(loop, std::move(endpoint), std::move(config),
                                               std::move(client));
}

StreamSession::StreamSession(IEventLoop& loop, Endpoint endpoint, SessionConfig config,
                             std::shared_ptr<TransportClient> client)
    : loop_(loop),
      endpoint_(std::move(endpoint)),
      config_(std::move(config)),
      client_(std::move(client)),
      queue_(config_.queue),
      metrics_(config_.metrics),
      retry_(config_.retry),
      reconnect_timer_(loop) {
    reconnect_timer_.OnTimer([this]() { Connect(); });
}

StreamSession::~StreamSession() {
    reconnect_timer_.Stop();
    metrics_.Stop();
    queue_.Close();
    if (client_) {
        client_->Disconnect();
    }
}

void StreamSession::Start() {
    RequireLoopThread(loop_, "StreamSession::Start");
    if (started_ || stopping_.load()) return;
    started_ = true;

    std::weak_ptr<StreamSession> weak_self = weak_from_this();
    client_->OnDiagnostic([weak_self](const StreamDiagnostic& diagnostic) {
        if (auto self = weak_self.lock()) {
            self->HandleDiagnostic(diagnostic);
        }
    });

    metrics_.SetQueueProbe([this]() {
        return StreamMetricsCollector::QueueState{queue_.Size(), queue_.FillRatio()};
    });
    metrics_.OnSample([weak_self](const MetricsSample& sample) {
        if (auto self = weak_self.lock()) {
            self->HandleSample(sample);
        }
    });
    metrics_.Start(loop_);

    Connect();
}

void StreamSession::Stop() {
    stopping_.store(true);
    queue_.Close();
    if (loop_.IsInEventLoopThread()) {
        StopOnLoop();
        return;
    }
    std::weak_ptr<StreamSession> weak_self = weak_from_this();
    loop_.Defer([weak_self]() {
        if (auto self = weak_self.lock()) {
            self->StopOnLoop();
        }
    });
}

void StreamSession::StopOnLoop() {
    if (Status().phase == SessionStatus::Phase::Stopped) return;
    reconnect_timer_.Stop();
    metrics_.Stop();
    client_->Disconnect();
    UpdateStatus([](SessionStatus& s) {
        s.phase = SessionStatus::Phase::Stopped;
        s.retry_delay = std::chrono::milliseconds{0};
    });
}

std::optional<QueueEntry> StreamSession::Next() {
    auto entry = queue_.Dequeue();
    if (entry) RecordConsumption(*entry);
    return entry;
}

std::optional<QueueEntry> StreamSession::NextFor(std::chrono::milliseconds timeout) {
    auto entry = queue_.DequeueFor(timeout);
    if (entry) RecordConsumption(*entry);
    return entry;
}

void StreamSession::RecordConsumption(const QueueEntry& entry) {
    const auto* message = std::get_if<DecodedMessage<StreamMessage>>(&entry);
    if (!message) return;
    auto waited = std::chrono::system_clock::now() - message->decoded_at;
    metrics_.RecordLatency(std::chrono::duration_cast<std::chrono::microseconds>(waited));
    metrics_.RecordConsumed();
}

std::expected<void, Error> StreamSession::Send(const StreamRequest& request,
                                               TransportClient::SendCallback on_sent) {
    RequireLoopThread(loop_, "StreamSession::Send");
    return client_->Send(request, std::move(on_sent));
}

SessionStatus StreamSession::Status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return status_;
}

void StreamSession::Connect() {
    if (stopping_.load()) return;

    UpdateStatus([](SessionStatus& s) {
        s.phase = SessionStatus::Phase::Connecting;
        s.retry_delay = std::chrono::milliseconds{0};
    });

    std::weak_ptr<StreamSession> weak_self = weak_from_this();
    client_->Connect(endpoint_, [weak_self](std::expected<void, Error> result) {
        auto self = weak_self.lock();
        if (!self || self->stopping_.load()) return;
        if (!result) {
            self->ScheduleReconnect(std::move(result.error()));
            return;
        }
        self->HandleConnected();
    });
}

void StreamSession::HandleConnected() {
    retry_.Reset();
    UpdateStatus([](SessionStatus& s) {
        s.phase = SessionStatus::Phase::Streaming;
        s.attempt = 0;
        s.last_error.reset();
    });

    std::weak_ptr<StreamSession> weak_self = weak_from_this();
    auto attached = client_->ReceiveStream(
        [weak_self](TransportClient::Message message) {
            if (auto self = weak_self.lock()) {
                self->HandleMessage(std::move(message));
            }
        },
        [weak_self](std::optional<Error> error) {
            if (auto self = weak_self.lock()) {
                self->HandleStreamEnd(std::move(error));
            }
        });
    if (!attached) {
        HandleDiagnostic(StreamDiagnostic{std::move(attached.error()), {}});
    }
}

void StreamSession::HandleMessage(TransportClient::Message message) {
    SyncBytes();
    metrics_.RecordDecoded();

    auto queued = queue_.TryEnqueue(QueueEntry{std::move(message)});
    if (queued) return;

    if (queued.error().code == ErrorCode::QueueClosed) return;  // Stopping
    rejected_.fetch_add(1, std::memory_order_relaxed);
    metrics_.RecordDropped();
    StreamDiagnostic shed{std::move(queued.error()), {}};
    if (on_diagnostic_) {
        auto cb = on_diagnostic_;
        cb(shed);
    } else {
        PrintDiagnostic("session", shed);
    }
}

void StreamSession::HandleStreamEnd(std::optional<Error> error) {
    auto queued = queue_.EnqueueControl(QueueEntry{StreamEnd{error}});
    if (!queued && queued.error().code != ErrorCode::QueueClosed) {
        HandleDiagnostic(StreamDiagnostic{std::move(queued.error()), {}});
    }
    if (stopping_.load()) return;

    // A clean close from the server is retried like a dropped connection
    ScheduleReconnect(error ? std::move(*error)
                            : Error{ErrorCode::ConnectionClosed, "Stream ended by server"});
}

void StreamSession::ScheduleReconnect(Error error) {
    if (!retry_.ShouldRetry(error)) {
        UpdateStatus([&error](SessionStatus& s) {
            s.phase = SessionStatus::Phase::GaveUp;
            s.retry_delay = std::chrono::milliseconds{0};
            s.last_error = error;
        });
        metrics_.Stop();
        queue_.Close();
        return;
    }

    auto delay = retry_.GetNextDelay(error);
    retry_.RecordAttempt();
    uint32_t attempt = retry_.Attempts();
    UpdateStatus([&error, attempt, delay](SessionStatus& s) {
        s.phase = SessionStatus::Phase::Retrying;
        s.attempt = attempt;
        s.retry_delay = delay;
        s.last_error = error;
    });
    reconnect_timer_.Start(delay);
}

void StreamSession::HandleDiagnostic(const StreamDiagnostic& diagnostic) {
    SyncBytes();
    switch (diagnostic.error.code) {
        case ErrorCode::ParseError:
            metrics_.RecordDecodeFailure();
            break;
        case ErrorCode::BufferOverflow:
            metrics_.RecordOverflow();
            break;
        case ErrorCode::CapacityExceeded:
            metrics_.RecordDropped();
            break;
        default:
            break;
    }
    if (on_diagnostic_) {
        auto cb = on_diagnostic_;
        cb(diagnostic);
        return;
    }
    PrintDiagnostic(client_->Name(), diagnostic);
}

void StreamSession::HandleSample(const MetricsSample& sample) {
    bool warn = sample.decode_success_ratio < config_.metrics.health.decode_success_warning;
    if (warn != Status().data_quality_warning) {
        UpdateStatus([warn](SessionStatus& s) { s.data_quality_warning = warn; });
    }
    if (on_sample_) {
        auto cb = on_sample_;
        cb(sample);
    }
}

void StreamSession::SyncBytes() {
    uint64_t total = client_->Counters().bytes_received;
    if (total > bytes_seen_) {
        metrics_.RecordBytes(total - bytes_seen_);
    }
    bytes_seen_ = total;
}

void StreamSession::UpdateStatus(const std::function<void(SessionStatus&)>& change) {
    SessionStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        change(status_);
        snapshot = status_;
    }
    if (on_status_) {
        auto cb = on_status_;
        cb(snapshot);
    }
}

}  // namespace jsonl_pipe
