// SPDX-License-Identifier: MIT

// lib/stream/tls_transport.hpp
#pragma once

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/component.hpp"
#include "lib/stream/error.hpp"

namespace jsonl_pipe {

/// TLS client settings.
struct TlsConfig {
    bool verify_peer = true;   ///< Verify certificate chain and hostname
    std::string ca_file;       ///< Extra CA bundle (PEM); empty = system defaults
};

enum class TlsHandshakeState { NotStarted, InProgress, Complete };

// TlsTransport encrypts/decrypts with OpenSSL memory BIOs.
// Sits between TcpSocket (upstream) and the plaintext stage (downstream).
//
// Template parameter D must satisfy the Downstream concept.
template <Downstream D>
class TlsTransport : public PipelineComponent<TlsTransport<D>, D>,
                     public std::enable_shared_from_this<TlsTransport<D>> {
public:
    using UpstreamWriteCallback = std::function<void(BufferChain)>;

    static std::shared_ptr<TlsTransport> Create(IEventLoop& loop,
                                                std::shared_ptr<D> downstream,
                                                const TlsConfig& config = {}) {
        struct MakeSharedEnabler : public TlsTransport {
            MakeSharedEnabler(IEventLoop& l, std::shared_ptr<D> ds, const TlsConfig& c)
                : TlsTransport(l, std::move(ds), c) {}
        };
        return std::make_shared<MakeSharedEnabler>(loop, std::move(downstream), config);
    }

    ~TlsTransport() { Cleanup(); }

    // Downstream interface: encrypted bytes from TcpSocket
    void OnData(BufferChain& chain) {
        auto guard = this->TryGuard();
        if (!guard) {
            chain.Clear();
            return;
        }
        if (!FeedReadBio(chain)) return;

        if (handshake_state_ != TlsHandshakeState::Complete) {
            ProcessHandshake();
            return;
        }
        DrainPlaintext();
    }

    void OnError(const Error& e) { this->PropagateError(e); }

    void OnDone() {
        auto guard = this->TryGuard();
        if (!guard) return;
        if (handshake_state_ != TlsHandshakeState::Complete) {
            this->EmitError(Error{ErrorCode::TlsHandshakeFailed,
                                  "Connection closed during TLS handshake"});
        } else {
            this->ForwardData(plaintext_);
            this->EmitDone();
        }
        this->RequestClose();
    }

    // Upstream interface: plaintext to encrypt and send
    void Write(BufferChain data);

    void Close() { this->RequestClose(); }

    void StartHandshake() {
        if (handshake_state_ != TlsHandshakeState::NotStarted) return;
        handshake_state_ = TlsHandshakeState::InProgress;
        ProcessHandshake();
    }

    bool IsHandshakeComplete() const { return handshake_state_ == TlsHandshakeState::Complete; }

    // SNI and certificate hostname
    void SetHostname(const std::string& hostname) {
        if (!ssl_) return;
        SSL_set_tlsext_host_name(ssl_, hostname.c_str());
        if (verify_peer_) {
            SSL_set1_host(ssl_, hostname.c_str());
        }
    }

    void SetUpstreamWriteCallback(UpstreamWriteCallback cb) {
        upstream_write_ = std::move(cb);
    }

    void SetHandshakeCompleteCallback(std::function<void()> cb) {
        handshake_complete_cb_ = std::move(cb);
    }

    void DoClose() {
        if (ssl_ && handshake_state_ == TlsHandshakeState::Complete) {
            SSL_shutdown(ssl_);
            FlushWbio();
        }
        Cleanup();
        plaintext_.Clear();
        this->ResetDownstream();
    }

private:
    TlsTransport(IEventLoop& loop, std::shared_ptr<D> downstream, const TlsConfig& config);

    static void InitOpenSSL() {
        [[maybe_unused]] static bool initialized = []() {
            OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS |
                             OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
            return true;
        }();
    }

    bool FeedReadBio(BufferChain& chain);
    void ProcessHandshake();
    void DrainPlaintext();
    void FlushWbio();
    void HandleSSLError(int ssl_error, const char* operation);
    static std::string GetSSLErrorString();
    void Cleanup();

    UpstreamWriteCallback upstream_write_ = [](BufferChain) {};
    std::function<void()> handshake_complete_cb_;

    SSL_CTX* ctx_ = nullptr;
    SSL* ssl_ = nullptr;
    BIO* rbio_ = nullptr;  // encrypted input -> SSL
    BIO* wbio_ = nullptr;  // SSL -> encrypted output
    bool verify_peer_ = true;

    TlsHandshakeState handshake_state_ = TlsHandshakeState::NotStarted;

    // Plaintext written before the handshake finished
    BufferChain write_pending_;
    // Decrypted bytes not yet taken by downstream
    BufferChain plaintext_;

    static constexpr size_t kMaxRbioSize = 16 * 1024 * 1024;
    static constexpr size_t kMaxPendingWrite = 16 * 1024 * 1024;
};

// Implementation - must be in header due to template

template <Downstream D>
TlsTransport<D>::TlsTransport(IEventLoop& loop, std::shared_ptr<D> downstream,
                              const TlsConfig& config)
    : PipelineComponent<TlsTransport<D>, D>(loop), verify_peer_(config.verify_peer) {
    this->SetDownstream(std::move(downstream));
    InitOpenSSL();

    ctx_ = SSL_CTX_new(TLS_client_method());
    if (!ctx_) {
        throw std::runtime_error("Failed to create SSL_CTX: " + GetSSLErrorString());
    }

    SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
    SSL_CTX_set_options(ctx_, SSL_OP_NO_COMPRESSION);
    SSL_CTX_set_default_verify_paths(ctx_);
    if (!config.ca_file.empty() &&
        SSL_CTX_load_verify_locations(ctx_, config.ca_file.c_str(), nullptr) != 1) {
        std::string reason = GetSSLErrorString();
        SSL_CTX_free(ctx_);
        ctx_ = nullptr;
        throw std::runtime_error("Failed to load CA file " + config.ca_file + ": " + reason);
    }
    SSL_CTX_set_verify(ctx_, verify_peer_ ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);

    ssl_ = SSL_new(ctx_);
    if (!ssl_) {
        SSL_CTX_free(ctx_);
        ctx_ = nullptr;
        throw std::runtime_error("Failed to create SSL: " + GetSSLErrorString());
    }

    rbio_ = BIO_new(BIO_s_mem());
    wbio_ = BIO_new(BIO_s_mem());
    if (!rbio_ || !wbio_) {
        if (rbio_) BIO_free(rbio_);
        if (wbio_) BIO_free(wbio_);
        SSL_free(ssl_);
        SSL_CTX_free(ctx_);
        ssl_ = nullptr;
        ctx_ = nullptr;
        throw std::runtime_error("Failed to create BIOs");
    }

    // SSL takes ownership of both BIOs
    SSL_set_bio(ssl_, rbio_, wbio_);
    SSL_set_connect_state(ssl_);
}

template <Downstream D>
bool TlsTransport<D>::FeedReadBio(BufferChain& chain) {
    size_t rbio_pending = BIO_ctrl_pending(rbio_);
    if (rbio_pending >= kMaxRbioSize || chain.Size() > kMaxRbioSize - rbio_pending) {
        chain.Clear();
        this->EmitError(Error{ErrorCode::BufferOverflow, "TLS encrypted input buffer overflow"});
        this->RequestClose();
        return false;
    }

    while (!chain.Empty()) {
        size_t chunk_size = chain.ContiguousSize();
        int written = BIO_write(rbio_, chain.DataAt(0), static_cast<int>(chunk_size));
        if (written <= 0) {
            chain.Clear();
            this->EmitError(Error{ErrorCode::TlsHandshakeFailed, "BIO_write failed"});
            this->RequestClose();
            return false;
        }
        chain.Consume(static_cast<size_t>(written));
    }
    return true;
}

template <Downstream D>
void TlsTransport<D>::ProcessHandshake() {
    int ret = SSL_do_handshake(ssl_);
    if (ret == 1) {
        handshake_state_ = TlsHandshakeState::Complete;
        FlushWbio();

        if (!write_pending_.Empty()) {
            Write(std::move(write_pending_));
        }
        if (handshake_complete_cb_) {
            handshake_complete_cb_();
        }
        // Application data may have arrived with the final handshake flight
        if (!this->IsClosed()) {
            DrainPlaintext();
        }
        return;
    }

    int ssl_error = SSL_get_error(ssl_, ret);
    switch (ssl_error) {
        case SSL_ERROR_WANT_READ:
        case SSL_ERROR_WANT_WRITE:
            FlushWbio();
            break;
        case SSL_ERROR_ZERO_RETURN:
            this->EmitError(Error{ErrorCode::TlsHandshakeFailed,
                                  "Peer closed during TLS handshake"});
            this->RequestClose();
            break;
        default:
            HandleSSLError(ssl_error, "handshake");
            break;
    }
}

template <Downstream D>
void TlsTransport<D>::DrainPlaintext() {
    while (!this->IsClosed()) {
        auto seg = this->GetAllocator().Acquire();
        int n = SSL_read(ssl_, seg->data.data(), static_cast<int>(Segment::kSize));
        if (n > 0) {
            seg->size = static_cast<size_t>(n);
            plaintext_.Append(std::move(seg));
            continue;
        }

        int ssl_error = SSL_get_error(ssl_, n);
        switch (ssl_error) {
            case SSL_ERROR_WANT_READ:
                this->ForwardData(plaintext_);
                return;
            case SSL_ERROR_WANT_WRITE:
                this->ForwardData(plaintext_);
                FlushWbio();
                return;
            case SSL_ERROR_ZERO_RETURN:
                // close_notify from peer
                this->ForwardData(plaintext_);
                this->EmitDone();
                this->RequestClose();
                return;
            default:
                this->ForwardData(plaintext_);
                HandleSSLError(ssl_error, "SSL_read");
                return;
        }
    }
}

template <Downstream D>
void TlsTransport<D>::Write(BufferChain data) {
    auto guard = this->TryGuard();
    if (!guard) return;

    if (handshake_state_ != TlsHandshakeState::Complete) {
        if (write_pending_.WouldOverflow(data.Size(), kMaxPendingWrite)) {
            this->EmitError(Error{ErrorCode::BufferOverflow, "TLS write buffer overflow"});
            this->RequestClose();
            return;
        }
        std::string bytes = data.ToString();
        write_pending_.AppendBytes(bytes.data(), bytes.size());
        return;
    }

    while (!data.Empty()) {
        size_t chunk_size = data.ContiguousSize();
        int written = SSL_write(ssl_, data.DataAt(0), static_cast<int>(chunk_size));
        if (written <= 0) {
            // Memory BIOs never block on write, so any failure is fatal
            HandleSSLError(SSL_get_error(ssl_, written), "SSL_write");
            return;
        }
        data.Consume(static_cast<size_t>(written));
    }

    FlushWbio();
}

template <Downstream D>
void TlsTransport<D>::FlushWbio() {
    int pending = BIO_ctrl_pending(wbio_);
    if (pending <= 0) return;

    BufferChain chain;
    while (pending > 0) {
        auto seg = std::make_shared<Segment>();
        size_t to_read = std::min(static_cast<size_t>(pending), Segment::kSize);
        int read = BIO_read(wbio_, seg->data.data(), static_cast<int>(to_read));
        if (read <= 0) break;
        seg->size = static_cast<size_t>(read);
        chain.Append(std::move(seg));
        pending -= read;
    }

    if (!chain.Empty()) {
        upstream_write_(std::move(chain));
    }
}

template <Downstream D>
void TlsTransport<D>::HandleSSLError(int ssl_error, const char* operation) {
    std::string msg = std::string(operation) + " failed: ";

    switch (ssl_error) {
        case SSL_ERROR_SSL:
            msg += GetSSLErrorString();
            this->EmitError(Error{ErrorCode::TlsHandshakeFailed, std::move(msg)});
            break;
        case SSL_ERROR_SYSCALL: {
            int err = errno;
            msg += "system error: " + std::string(std::strerror(err));
            this->EmitError(Error{ErrorCode::ConnectionFailed, std::move(msg), err});
            break;
        }
        default:
            msg += "error code " + std::to_string(ssl_error);
            this->EmitError(Error{ErrorCode::TlsHandshakeFailed, std::move(msg)});
            break;
    }

    this->RequestClose();
}

template <Downstream D>
std::string TlsTransport<D>::GetSSLErrorString() {
    unsigned long err = ERR_get_error();
    if (err == 0) return "unknown error";

    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

template <Downstream D>
void TlsTransport<D>::Cleanup() {
    // SSL_free also frees the BIOs handed over by SSL_set_bio()
    if (ssl_) {
        SSL_free(ssl_);
        ssl_ = nullptr;
        rbio_ = nullptr;
        wbio_ = nullptr;
    }
    if (ctx_) {
        SSL_CTX_free(ctx_);
        ctx_ = nullptr;
    }
}

}  // namespace jsonl_pipe
