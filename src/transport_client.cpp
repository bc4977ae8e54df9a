// SPDX-License-Identifier: MIT

// src/transport_client.cpp
#include "src/transport_client.hpp"

#include <cstdio>

#include <fmt/format.h>

namespace jsonl_pipe {

void PrintDiagnostic(std::string_view source, const StreamDiagnostic& diagnostic) {
    constexpr size_t kMaxShown = 120;
    const Error& error = diagnostic.error;
    if (diagnostic.raw_line.empty()) {
        fmt::print(stderr, "[{}] {}: {}\n", source, error_code_name(error.code), error.message);
        return;
    }
    std::string_view shown(diagnostic.raw_line);
    if (shown.size() > kMaxShown) shown = shown.substr(0, kMaxShown);
    fmt::print(stderr, "[{}] {}: {} | {}{}\n", source, error_code_name(error.code), error.message,
               shown, diagnostic.raw_line.size() > kMaxShown ? "..." : "");
}

TransportClient::TransportClient(IEventLoop& loop, TransportConfig config)
    : loop_(loop),
      config_(std::move(config)),
      accumulator_(config_.line),
      decoder_(config_.max_line_size),
      connect_timer_(loop) {
    connect_timer_.OnTimer([this]() {
        if (!state_.Is(ConnectionState::Phase::Connecting)) return;
        Fail(Error{ErrorCode::Timeout,
                   fmt::format("Connect to {} timed out after {} ms", endpoint_.ToString(),
                               config_.connect_timeout.count())});
    });
}

void TransportClient::Connect(const Endpoint& endpoint, ConnectCallback on_done) {
    RequireLoopThread(loop_, "TransportClient::Connect");
    if (!state_.CanConnect()) {
        Error e{ErrorCode::InvalidState,
                fmt::format("Connect() called while {}", to_string(state_.phase()))};
        loop_.Defer([cb = std::move(on_done), e]() { cb(std::unexpected(e)); });
        return;
    }

    uint64_t gen = ++generation_;
    endpoint_ = endpoint;
    accumulator_.Reset();
    unclaimed_.clear();
    stream_ended_ = false;
    end_reason_.reset();
    connect_cb_ = std::move(on_done);

    SetState(ConnectionState::Connecting());
    if (generation_ != gen) return;  // Observer disconnected

    auto opened = OpenTransport(endpoint);
    if (!opened) {
        // Report on the next iteration so the caller never re-enters itself
        std::weak_ptr<TransportClient> weak_self = weak_from_this();
        loop_.Defer([weak_self, gen, e = std::move(opened.error())]() {
            auto self = weak_self.lock();
            if (self && self->generation_ == gen) {
                self->Fail(e);
            }
        });
        return;
    }

    if (config_.connect_timeout.count() > 0) {
        connect_timer_.Start(config_.connect_timeout);
    }
}

std::expected<void, Error> TransportClient::Send(const StreamRequest& request,
                                                 SendCallback on_sent) {
    RequireLoopThread(loop_, "TransportClient::Send");
    if (!state_.Is(ConnectionState::Phase::Connected)) {
        return std::unexpected(Error{
            ErrorCode::NotConnected,
            fmt::format("Send() requires a connected client (state: {})", to_string(state_.phase()))});
    }

    auto payload = EncodeRequest(request);
    if (!payload) {
        return std::unexpected(payload.error());
    }

    ++counters_.requests_sent;
    if (!on_sent) {
        on_sent = [](std::expected<void, Error>) {};
    }
    SendPayload(std::move(*payload), std::move(on_sent));
    return {};
}

std::expected<void, Error> TransportClient::ReceiveStream(MessageCallback on_message,
                                                          EndCallback on_end) {
    RequireLoopThread(loop_, "TransportClient::ReceiveStream");
    if (consumer_) {
        return std::unexpected(Error{ErrorCode::InvalidState, "Stream already has a consumer"});
    }

    uint64_t gen = generation_;
    while (!unclaimed_.empty()) {
        Message held = std::move(unclaimed_.front());
        unclaimed_.pop_front();
        on_message(std::move(held));
        if (generation_ != gen) break;  // Consumer reconnected or disconnected
    }

    if (generation_ == gen && stream_ended_) {
        stream_ended_ = false;
        auto reason = std::exchange(end_reason_, std::nullopt);
        on_end(std::move(reason));
        return {};
    }

    consumer_ = Consumer{std::move(on_message), std::move(on_end)};
    return {};
}

void TransportClient::Disconnect() {
    RequireLoopThread(loop_, "TransportClient::Disconnect");
    switch (state_.phase()) {
        case ConnectionState::Phase::Disconnected:
        case ConnectionState::Phase::Disconnecting:
            return;
        case ConnectionState::Phase::Failed:
            SetState(ConnectionState::Disconnected());
            return;
        default:
            break;
    }

    uint64_t gen = ++generation_;
    connect_timer_.Stop();
    SetState(ConnectionState::Disconnecting());
    if (generation_ != gen) return;
    CloseTransport(/*graceful=*/true);
    Terminate(std::nullopt,
              Error{ErrorCode::Cancelled, "Disconnected before the connection was ready"});
}

void TransportClient::MarkConnected() {
    if (!state_.Is(ConnectionState::Phase::Connecting)) return;
    connect_timer_.Stop();

    uint64_t gen = generation_;
    SetState(ConnectionState::Connected());
    if (generation_ != gen) return;
    OnConnected();
    if (generation_ != gen) return;

    auto cb = std::exchange(connect_cb_, nullptr);
    if (cb) {
        cb({});
    }
}

void TransportClient::Fail(Error e) {
    if (state_.Is(ConnectionState::Phase::Disconnected) ||
        state_.Is(ConnectionState::Phase::Failed)) {
        return;
    }
    CloseTransport(/*graceful=*/false);
    Error connect_error = e;
    Terminate(std::move(e), std::move(connect_error));
}

void TransportClient::PeerClosed() {
    if (!state_.Is(ConnectionState::Phase::Connected)) return;
    uint64_t gen = ++generation_;
    SetState(ConnectionState::Disconnecting());
    if (generation_ != gen) return;
    CloseTransport(/*graceful=*/false);
    Terminate(std::nullopt, Error{ErrorCode::ConnectionClosed, "Peer closed the connection"});
}

void TransportClient::Terminate(std::optional<Error> failure, Error connect_error) {
    ++generation_;
    connect_timer_.Stop();

    // Take everything before any callback can start a new cycle
    auto connect_cb = std::exchange(connect_cb_, nullptr);
    auto consumer = std::exchange(consumer_, std::nullopt);
    if (!consumer) {
        stream_ended_ = true;
        end_reason_ = failure;
    }

    SetState(failure ? ConnectionState::Failed(*failure) : ConnectionState::Disconnected());

    if (connect_cb) {
        connect_cb(std::unexpected(std::move(connect_error)));
    }
    if (consumer) {
        consumer->on_end(std::move(failure));
    }
}

void TransportClient::SetState(ConnectionState next) {
    state_ = std::move(next);
    ConnectionState snapshot = state_;
    auto cb = on_state_;
    cb(snapshot);
}

void TransportClient::DeliverBytes(std::string_view bytes) {
    if (!state_.Is(ConnectionState::Phase::Connected)) return;
    counters_.bytes_received += bytes.size();

    uint64_t gen = generation_;
    accumulator_.Ingest(bytes, [this, gen](LineAccumulator::Record record) {
        if (generation_ != gen) return;
        HandleRecord(std::move(record));
    });
    if (generation_ == gen && accumulator_.IsFailed()) {
        Fail(Error{ErrorCode::BufferOverflow,
                   fmt::format("Record exceeded {} bytes", accumulator_.Config().max_buffer_size)});
    }
}

void TransportClient::DeliverBytes(BufferChain& chain) {
    if (!state_.Is(ConnectionState::Phase::Connected)) {
        chain.Clear();
        return;
    }
    counters_.bytes_received += chain.Size();

    uint64_t gen = generation_;
    accumulator_.Ingest(chain, [this, gen](LineAccumulator::Record record) {
        if (generation_ != gen) return;
        HandleRecord(std::move(record));
    });
    if (generation_ == gen && accumulator_.IsFailed()) {
        Fail(Error{ErrorCode::BufferOverflow,
                   fmt::format("Record exceeded {} bytes", accumulator_.Config().max_buffer_size)});
    }
}

void TransportClient::HandleRecord(LineAccumulator::Record record) {
    if (!record) {
        ++counters_.overflows;
        Diagnose(std::move(record.error()));
        return;
    }

    ++counters_.records;
    auto decoded = decoder_.Decode(*record);
    if (!decoded) {
        ++counters_.decode_failures;
        Diagnose(Error{ErrorCode::ParseError, std::move(decoded.error().diagnostic)},
                 std::move(decoded.error().raw_line));
        return;
    }
    ++counters_.messages_decoded;

    if (consumer_) {
        // The consumer may detach itself from inside the callback
        auto on_message = consumer_->on_message;
        on_message(std::move(*decoded));
        return;
    }

    if (unclaimed_.size() >= config_.max_unclaimed_messages) {
        ++counters_.unclaimed_dropped;
        Diagnose(Error{ErrorCode::CapacityExceeded,
                       fmt::format("No consumer attached and {} messages already held",
                                   unclaimed_.size())},
                 std::move(*record));
        return;
    }
    unclaimed_.push_back(std::move(*decoded));
}

void TransportClient::ReportOverflow(Error error) {
    if (!state_.Is(ConnectionState::Phase::Connected)) return;
    ++counters_.overflows;

    uint64_t gen = generation_;
    Diagnose(error);
    if (generation_ != gen) return;
    if (config_.line.overflow_policy == OverflowPolicy::FailFast) {
        Fail(std::move(error));
    }
}

void TransportClient::Diagnose(Error error, std::string raw_line) {
    if (on_diagnostic_) {
        auto cb = on_diagnostic_;
        cb(StreamDiagnostic{std::move(error), std::move(raw_line)});
        return;
    }

    PrintDiagnostic(Name(), StreamDiagnostic{std::move(error), std::move(raw_line)});
}

}  // namespace jsonl_pipe
