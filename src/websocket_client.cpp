// SPDX-License-Identifier: MIT

// src/websocket_client.cpp
#include "src/websocket_client.hpp"

#include <utility>

#include <fmt/format.h>

#include "src/websocket_handshake.hpp"

namespace jsonl_pipe {

// Sink

void WebSocketClient::Sink::OnHeaders(int status, const HttpHeaders& headers) {
    if (!valid_) return;
    client_->HandleHeaders(status, headers);
}

void WebSocketClient::Sink::OnData(BufferChain& chain) {
    if (!valid_) {
        chain.Clear();
        return;
    }
    client_->HandleFrames(chain);
}

void WebSocketClient::Sink::OnError(const Error& e) {
    if (!valid_) return;
    client_->HandleStreamError(e);
}

void WebSocketClient::Sink::OnDone() {
    if (!valid_) return;
    client_->HandleStreamEnd();
}

// WebSocketClient

WebSocketClient::WebSocketClient(IEventLoop& loop, TransportConfig config)
    : TransportClient(loop, std::move(config)), keepalive_(loop) {
    keepalive_.OnTimer([this]() { KeepaliveTick(); });
}

WebSocketClient::~WebSocketClient() {
    Teardown();
}

std::expected<void, Error> WebSocketClient::OpenTransport(const Endpoint& endpoint) {
    Teardown();
    auto key = GenerateWebSocketKey();
    if (!key) {
        return std::unexpected(std::move(key.error()));
    }
    handshake_key_ = std::move(*key);
    close_sent_ = false;
    awaiting_pong_ = false;

    sink_ = std::make_shared<Sink>(this);
    reader_ = ReaderType::Create(loop_, sink_);
    std::weak_ptr<Sink> weak_sink = sink_;
    reader_->OnHeaders([weak_sink](int status, const HttpHeaders& headers) {
        if (auto sink = weak_sink.lock()) {
            sink->OnHeaders(status, headers);
        }
    });

    connection_ = std::make_unique<StreamConnection<ReaderType>>(loop_, reader_, config_.tls);
    return connection_->Open(endpoint, [this]() { SendUpgradeRequest(); });
}

void WebSocketClient::CloseTransport(bool graceful) {
    keepalive_.Stop();
    if (graceful && upgraded_ && !close_sent_) {
        auto sent = WriteFrame(WsOpcode::Close, ClosePayload(ws_close::kNormal, "client disconnect"));
        if (!sent) Diagnose(std::move(sent.error()));
    }
    Teardown();
}

void WebSocketClient::Teardown() {
    keepalive_.Stop();
    awaiting_pong_ = false;
    upgraded_ = false;
    if (sink_) sink_->Invalidate();
    if (reader_) reader_->RequestClose();
    connection_.reset();
    reader_.reset();
    sink_.reset();
    // No further frames from a Feed() that is still running
    frames_.Reset();
}

void WebSocketClient::SendUpgradeRequest() {
    connection_->Write(BuildUpgradeRequest(CurrentEndpoint(), handshake_key_, config_.headers));
}

void WebSocketClient::HandleHeaders(int status, const HttpHeaders& headers) {
    if (status == 101) {
        auto valid = ValidateUpgradeResponse(status, headers, handshake_key_);
        if (!valid) {
            Fail(std::move(valid.error()));
            return;
        }
        upgraded_ = true;
        MarkConnected();
        return;
    }
    if (status < 300) {
        Fail(Error{ErrorCode::HandshakeFailed,
                   fmt::format("Server did not upgrade the connection (status {})", status)});
    }
    // Error statuses are reported by the reader once the body is in
}

void WebSocketClient::HandleFrames(BufferChain& chain) {
    std::string bytes = chain.ToString();
    chain.Clear();

    auto fed = frames_.Feed(bytes, [this](WsMessage message) { HandleMessage(std::move(message)); });
    if (!fed) {
        auto sent = WriteFrame(WsOpcode::Close,
                               ClosePayload(frames_.FailureCloseCode(), fed.error().message));
        if (!sent) Diagnose(std::move(sent.error()));
        Fail(std::move(fed.error()));
    }
}

void WebSocketClient::HandleMessage(WsMessage message) {
    if (!connection_) return;
    awaiting_pong_ = false;

    switch (message.opcode) {
        case WsOpcode::Text:
        case WsOpcode::Binary:
            if (message.payload.empty()) return;
            if (message.payload.back() != '\n') {
                message.payload.push_back('\n');
            }
            DeliverBytes(message.payload);
            return;
        case WsOpcode::Ping:
            if (auto sent = WriteFrame(WsOpcode::Pong, message.payload); !sent) {
                Fail(std::move(sent.error()));
            }
            return;
        case WsOpcode::Pong:
            ++pongs_received_;
            return;
        case WsOpcode::Close: {
            auto [code, reason] = ParseClosePayload(message.payload);
            if (!close_sent_) {
                auto sent = WriteFrame(WsOpcode::Close,
                                       ClosePayload(code == 1005 ? ws_close::kNormal : code, {}));
                if (!sent) {
                    Fail(std::move(sent.error()));
                    return;
                }
            }
            if (code == ws_close::kNormal || code == 1001 || code == 1005) {
                PeerClosed();
            } else {
                Fail(Error{ErrorCode::ConnectionClosed,
                           fmt::format("Server closed with code {}{}{}", code,
                                       reason.empty() ? "" : ": ", reason)});
            }
            return;
        }
        case WsOpcode::Continuation:
            return;
    }
}

void WebSocketClient::HandleStreamError(const Error& e) {
    Fail(e);
}

void WebSocketClient::HandleStreamEnd() {
    Fail(Error{ErrorCode::ConnectionClosed, "Connection closed without a close frame"});
}

void WebSocketClient::OnConnected() {
    if (config_.keepalive_interval.count() > 0) {
        keepalive_.Start(config_.keepalive_interval, config_.keepalive_interval);
    }
}

void WebSocketClient::KeepaliveTick() {
    if (!State().Is(ConnectionState::Phase::Connected)) return;
    if (awaiting_pong_) {
        Fail(Error{ErrorCode::KeepaliveTimeout,
                   fmt::format("No frame from server within {} ms of ping",
                               config_.keepalive_interval.count())});
        return;
    }
    awaiting_pong_ = true;
    ++pings_sent_;
    if (auto sent = WriteFrame(WsOpcode::Ping, {}); !sent) {
        Fail(std::move(sent.error()));
    }
}

void WebSocketClient::SendPayload(std::string payload, SendCallback on_sent) {
    if (!connection_ || !upgraded_) {
        loop_.Defer([cb = std::move(on_sent)]() {
            cb(std::unexpected(Error{ErrorCode::NotConnected, "WebSocket is not open"}));
        });
        return;
    }
    auto sent = WriteFrame(WsOpcode::Text, payload);
    // Handed to the socket; frames carry no acknowledgement
    loop_.Defer([cb = std::move(on_sent), sent = std::move(sent)]() { cb(sent); });
}

std::expected<void, Error> WebSocketClient::WriteFrame(WsOpcode opcode, std::string_view payload) {
    if (!connection_) return {};
    if (opcode == WsOpcode::Close) {
        if (close_sent_) return {};
        close_sent_ = true;
    }
    auto frame = EncodeClientFrame(opcode, payload);
    if (!frame) {
        return std::unexpected(std::move(frame.error()));
    }
    connection_->Write(*frame);
    return {};
}

}  // namespace jsonl_pipe
