// SPDX-License-Identifier: MIT

// src/websocket_client.hpp
#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/endpoint.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/http_response_reader.hpp"
#include "lib/stream/stream_connection.hpp"
#include "lib/stream/timer.hpp"
#include "src/transport_client.hpp"
#include "src/websocket_frame.hpp"

namespace jsonl_pipe {

// WebSocketClient - duplex transport over RFC 6455
//
// Connect sends the HTTP upgrade; a valid 101 response moves the client to
// connected. Every text or binary message carries one or more JSONL records
// and feeds the shared receive pipeline. Control frames stay in this class:
// ping is answered with pong, a close frame is echoed and ends the stream
// cleanly.
//
// Keepalive: while connected a ping goes out every keepalive_interval. Any
// frame from the server counts as proof of life; if none arrived since the
// previous ping the client fails with KeepaliveTimeout.
//
// Architecture: TcpSocket -> [TlsTransport] -> HttpResponseReader -> Sink
class WebSocketClient : public TransportClient {
public:
    static std::shared_ptr<WebSocketClient> Create(IEventLoop& loop,
                                                   TransportConfig config = {}) {
        struct MakeSharedEnabler : public WebSocketClient {
            MakeSharedEnabler(IEventLoop& l, TransportConfig c)
                : WebSocketClient(l, std::move(c)) {}
        };
        return std::make_shared<MakeSharedEnabler>(loop, std::move(config));
    }

    ~WebSocketClient() override;

    std::string_view Name() const override { return "websocket"; }

    uint64_t PingsSent() const { return pings_sent_; }
    uint64_t PongsReceived() const { return pongs_received_; }

    // Bridges the upgraded stream back to the client
    class Sink {
    public:
        explicit Sink(WebSocketClient* client) : client_(client) {}

        void Invalidate() { valid_ = false; }

        void OnHeaders(int status, const HttpHeaders& headers);
        void OnData(BufferChain& chain);
        void OnError(const Error& e);
        void OnDone();

    private:
        WebSocketClient* client_;
        bool valid_ = true;
    };

    using ReaderType = HttpResponseReader<Sink>;

protected:
    WebSocketClient(IEventLoop& loop, TransportConfig config);

    std::expected<void, Error> OpenTransport(const Endpoint& endpoint) override;
    void CloseTransport(bool graceful) override;
    void SendPayload(std::string payload, SendCallback on_sent) override;
    void OnConnected() override;

private:
    void SendUpgradeRequest();
    void HandleHeaders(int status, const HttpHeaders& headers);
    void HandleFrames(BufferChain& chain);
    void HandleMessage(WsMessage message);
    void HandleStreamError(const Error& e);
    void HandleStreamEnd();
    void KeepaliveTick();
    std::expected<void, Error> WriteFrame(WsOpcode opcode, std::string_view payload);
    void Teardown();

    std::shared_ptr<Sink> sink_;
    std::shared_ptr<ReaderType> reader_;
    std::unique_ptr<StreamConnection<ReaderType>> connection_;

    WsFrameDecoder frames_;
    std::string handshake_key_;
    bool upgraded_ = false;
    bool close_sent_ = false;

    Timer keepalive_;
    bool awaiting_pong_ = false;
    uint64_t pings_sent_ = 0;
    uint64_t pongs_received_ = 0;
};

}  // namespace jsonl_pipe
