// SPDX-License-Identifier: MIT

// src/transport_client.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/endpoint.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/timer.hpp"
#include "lib/stream/tls_transport.hpp"
#include "src/connection_state.hpp"
#include "src/jsonl_decoder.hpp"
#include "src/line_accumulator.hpp"
#include "src/request_encoder.hpp"
#include "src/stream_message.hpp"

namespace jsonl_pipe {

/// Settings shared by both transports.
struct TransportConfig {
    std::chrono::milliseconds connect_timeout{10000};     ///< Connect() gives up after this
    std::chrono::milliseconds keepalive_interval{30000};  ///< WebSocket ping period (0 = off)
    LineAccumulatorConfig line{};
    size_t max_line_size = StreamMessageDecoder::kDefaultMaxLineSize;
    TlsConfig tls{};
    size_t max_unclaimed_messages = 1000;  ///< Held until ReceiveStream() is called
    std::vector<std::pair<std::string, std::string>> headers;  ///< Extra request headers
};

/// Record-level problem that did not end the stream.
struct StreamDiagnostic {
    Error error;
    std::string raw_line;  ///< Offending record, empty when not applicable
};

/// Default diagnostic sink: one line on stderr, the raw record truncated.
void PrintDiagnostic(std::string_view source, const StreamDiagnostic& diagnostic);

struct TransportCounters {
    uint64_t bytes_received = 0;
    uint64_t records = 0;            ///< Lines handed to the decoder
    uint64_t messages_decoded = 0;
    uint64_t decode_failures = 0;
    uint64_t overflows = 0;
    uint64_t unclaimed_dropped = 0;
    uint64_t requests_sent = 0;
};

/// Base of the event-stream and WebSocket clients.
///
/// Owns the connection state machine and the shared receive pipeline
/// (LineAccumulator -> StreamMessageDecoder -> consumer). Subclasses supply
/// the wire: opening and closing the transport, request delivery and the
/// framing that turns transport payloads into JSONL bytes.
///
/// Every public method must be called on the event loop thread; callbacks run
/// there too. Instances are created through the subclasses' Create().
class TransportClient : public std::enable_shared_from_this<TransportClient> {
public:
    using Message = DecodedMessage<StreamMessage>;
    using ConnectCallback = std::function<void(std::expected<void, Error>)>;
    using SendCallback = std::function<void(std::expected<void, Error>)>;
    using MessageCallback = std::function<void(Message)>;
    /// nullopt when the stream ended through a disconnect, the error otherwise.
    using EndCallback = std::function<void(std::optional<Error>)>;
    using StateCallback = std::function<void(const ConnectionState&)>;
    using DiagnosticCallback = std::function<void(const StreamDiagnostic&)>;

    virtual ~TransportClient() = default;

    TransportClient(const TransportClient&) = delete;
    TransportClient& operator=(const TransportClient&) = delete;

    /// Start connecting. `on_done` runs exactly once: with success when the
    /// transport reports ready, or with the error that moved the client to
    /// failed (Timeout after connect_timeout, Cancelled on Disconnect()).
    void Connect(const Endpoint& endpoint, ConnectCallback on_done);

    /// Encode and send one request. Fails immediately with NotConnected
    /// unless connected, or with EncodeError. `on_sent` reports delivery.
    std::expected<void, Error> Send(const StreamRequest& request, SendCallback on_sent = {});

    /// Attach the consumer of decoded messages for the current connection.
    /// Messages that arrived earlier are delivered first. `on_end` runs once
    /// when the stream terminates. A second consumer is rejected with
    /// InvalidState; a fresh Connect() starts a new stream.
    std::expected<void, Error> ReceiveStream(MessageCallback on_message, EndCallback on_end);

    /// Close the connection. Idempotent; the client is disconnected when
    /// this returns.
    void Disconnect();

    const ConnectionState& State() const { return state_; }

    void OnStateChange(StateCallback cb) { on_state_ = std::move(cb); }

    /// Replace the diagnostic sink (default: one line on stderr).
    void OnDiagnostic(DiagnosticCallback cb) { on_diagnostic_ = std::move(cb); }

    const TransportCounters& Counters() const { return counters_; }
    const TransportConfig& Config() const { return config_; }
    const Endpoint& CurrentEndpoint() const { return endpoint_; }

    /// "sse" or "websocket"
    virtual std::string_view Name() const = 0;

protected:
    TransportClient(IEventLoop& loop, TransportConfig config);

    /// Begin opening the wire to `endpoint`. An error return fails the connect.
    virtual std::expected<void, Error> OpenTransport(const Endpoint& endpoint) = 0;

    /// Drop the wire. `graceful` is true for a local Disconnect(). Must not
    /// call back into the base class.
    virtual void CloseTransport(bool graceful) = 0;

    /// Deliver one encoded request.
    virtual void SendPayload(std::string payload, SendCallback on_sent) = 0;

    /// Called right after the state becomes connected.
    virtual void OnConnected() {}

    /// The transport is ready: connecting -> connected.
    void MarkConnected();

    /// Connection-level failure: any live phase -> failed(e). Ignored once
    /// disconnected or failed.
    void Fail(Error e);

    /// The peer ended the session cleanly: -> disconnecting -> disconnected.
    void PeerClosed();

    /// Feed raw JSONL bytes into the shared receive pipeline.
    void DeliverBytes(std::string_view bytes);
    void DeliverBytes(BufferChain& chain);

    void Diagnose(Error error, std::string raw_line = {});

    /// Transport framing dropped an oversized record: counted and diagnosed
    /// like an accumulator overflow; under OverflowPolicy::FailFast the
    /// client fails with it.
    void ReportOverflow(Error error);

    IEventLoop& loop_;
    TransportConfig config_;

private:
    struct Consumer {
        MessageCallback on_message;
        EndCallback on_end;
    };

    void SetState(ConnectionState next);
    void HandleRecord(LineAccumulator::Record record);
    // Ends the current cycle: settles the pending connect and the consumer.
    // `failure` empty means a clean end (disconnected).
    void Terminate(std::optional<Error> failure, Error connect_error);

    ConnectionState state_;
    Endpoint endpoint_;
    uint64_t generation_ = 0;  // bumps on every Connect/Disconnect

    LineAccumulator accumulator_;
    StreamMessageDecoder decoder_;
    Timer connect_timer_;

    ConnectCallback connect_cb_;
    std::optional<Consumer> consumer_;
    std::deque<Message> unclaimed_;
    bool stream_ended_ = false;
    std::optional<Error> end_reason_;

    StateCallback on_state_ = [](const ConnectionState&) {};
    DiagnosticCallback on_diagnostic_;

    TransportCounters counters_;
};

}  // namespace jsonl_pipe
