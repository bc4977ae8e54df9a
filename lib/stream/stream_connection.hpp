// SPDX-License-Identifier: MIT

// lib/stream/stream_connection.hpp
#pragma once

#include <expected>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string_view>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/component.hpp"
#include "lib/stream/dns_resolver.hpp"
#include "lib/stream/endpoint.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/tcp_socket.hpp"
#include "lib/stream/tls_transport.hpp"

namespace jsonl_pipe {

// StreamConnection - TCP (and optionally TLS) chain in front of a protocol stage
//
// Plain:  Network -> TcpSocket -> D
// Secure: Network -> TcpSocket -> TlsTransport -> D
//
// The ready callback fires once bytes can be exchanged with the peer: after
// TCP connect for plain endpoints, after the TLS handshake for secure ones.
// Connection failures reach D through OnError.
//
// Destroying or closing a StreamConnection is safe from inside any callback of
// its own chain; the sockets are released on the next loop iteration.
template <Downstream D>
class StreamConnection {
public:
    using ReadyCallback = std::function<void()>;

    StreamConnection(IEventLoop& loop, std::shared_ptr<D> downstream, TlsConfig tls = {})
        : loop_(loop), downstream_(std::move(downstream)), tls_config_(std::move(tls)) {}

    ~StreamConnection() { Close(); }

    StreamConnection(const StreamConnection&) = delete;
    StreamConnection& operator=(const StreamConnection&) = delete;

    // Resolve the host and start connecting. Errors returned here happened
    // before any socket existed; later failures go to D::OnError.
    std::expected<void, Error> Open(const Endpoint& endpoint, ReadyCallback on_ready) {
        if (plain_tcp_ || secure_tcp_) {
            return std::unexpected(Error{ErrorCode::InvalidState, "Connection already opened"});
        }
        auto addr = ResolveHostname(endpoint.host, endpoint.port);
        if (!addr) {
            return std::unexpected(addr.error());
        }

        if (!endpoint.IsSecure()) {
            plain_tcp_ = TcpSocket<D>::Create(loop_, downstream_);
            plain_tcp_->OnConnect([this, on_ready = std::move(on_ready)]() {
                ready_ = true;
                on_ready();
            });
            plain_tcp_->Connect(*addr);
            return {};
        }

        try {
            tls_ = TlsTransport<D>::Create(loop_, downstream_, tls_config_);
        } catch (const std::runtime_error& e) {
            return std::unexpected(Error{ErrorCode::TlsHandshakeFailed, e.what()});
        }
        tls_->SetHostname(endpoint.host);
        WireTlsWritePath();
        tls_->SetHandshakeCompleteCallback([this, on_ready = std::move(on_ready)]() {
            ready_ = true;
            on_ready();
        });

        secure_tcp_ = TcpSocket<TlsTransport<D>>::Create(loop_, tls_);
        std::weak_ptr<TlsTransport<D>> weak_tls = tls_;
        secure_tcp_->OnConnect([weak_tls]() {
            if (auto tls = weak_tls.lock()) {
                tls->StartHandshake();
            }
        });
        secure_tcp_->Connect(*addr);
        return {};
    }

    // Send bytes to the peer (encrypted when secure)
    void Write(BufferChain data) {
        if (closed_) return;
        if (tls_) {
            tls_->Write(std::move(data));
        } else if (plain_tcp_) {
            plain_tcp_->Write(std::move(data));
        }
    }

    void Write(std::string_view text) { Write(BufferChain::FromString(text)); }

    // Stop all I/O. No callbacks reach D after this returns.
    void Close() {
        if (closed_) return;
        closed_ = true;
        ready_ = false;
        if (tls_) tls_->Close();
        if (plain_tcp_) plain_tcp_->Close();
        if (secure_tcp_) secure_tcp_->Close();

        // We may be inside one of these objects' callbacks
        auto plain = std::move(plain_tcp_);
        auto secure = std::move(secure_tcp_);
        auto tls = std::move(tls_);
        if (plain || secure || tls) {
            loop_.Defer([plain, secure, tls]() {});
        }
    }

    bool IsReady() const { return ready_; }
    bool IsClosed() const { return closed_; }
    bool IsSecure() const { return secure_tcp_ != nullptr; }

private:
    // D writes through TLS rather than straight to the socket
    void WireTlsWritePath() {
        if constexpr (requires(D& d) {
            d.SetUpstreamWriteCallback(std::function<void(BufferChain)>{});
        }) {
            std::weak_ptr<TlsTransport<D>> weak_tls = tls_;
            downstream_->SetUpstreamWriteCallback([weak_tls](BufferChain data) {
                if (auto tls = weak_tls.lock()) {
                    tls->Write(std::move(data));
                }
            });
        }
    }

    IEventLoop& loop_;
    std::shared_ptr<D> downstream_;
    TlsConfig tls_config_;

    std::shared_ptr<TcpSocket<D>> plain_tcp_;
    std::shared_ptr<TcpSocket<TlsTransport<D>>> secure_tcp_;
    std::shared_ptr<TlsTransport<D>> tls_;

    bool ready_ = false;
    bool closed_ = false;
};

}  // namespace jsonl_pipe
