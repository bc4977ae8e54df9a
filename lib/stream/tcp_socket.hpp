// SPDX-License-Identifier: MIT

// lib/stream/tcp_socket.hpp
#pragma once

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <concepts>
#include <cstring>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/component.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"

namespace jsonl_pipe {

// TcpSocket - network socket at the head of a connection chain
//
// Data flow: Network -> TcpSocket -> Downstream
// Write path: Downstream -> TcpSocket (via SetUpstreamWriteCallback) or Write()
//
// Close() is safe from inside any downstream callback; the owner must keep
// the TcpSocket alive until that callback returns (owners release sockets
// through IEventLoop::Defer).
template <Downstream D>
class TcpSocket : public std::enable_shared_from_this<TcpSocket<D>> {
public:
    using ConnectCallback = std::function<void()>;

    TcpSocket(IEventLoop& loop, std::shared_ptr<D> downstream)
        : loop_(loop), downstream_(std::move(downstream)) {}

    ~TcpSocket() { Close(); }

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;
    TcpSocket(TcpSocket&&) = delete;
    TcpSocket& operator=(TcpSocket&&) = delete;

    // Factory; wires the downstream write path once shared_from_this works.
    static std::shared_ptr<TcpSocket> Create(IEventLoop& loop, std::shared_ptr<D> downstream) {
        auto tcp = std::make_shared<TcpSocket>(loop, std::move(downstream));
        tcp->WireDownstream();
        return tcp;
    }

    void WireDownstream() {
        if constexpr (requires(D& d) {
            d.SetUpstreamWriteCallback(std::function<void(BufferChain)>{});
        }) {
            std::weak_ptr<TcpSocket> weak_self = this->shared_from_this();
            downstream_->SetUpstreamWriteCallback([weak_self](BufferChain data) {
                if (auto self = weak_self.lock()) {
                    self->Write(std::move(data));
                }
            });
        }
    }

    // Connect to address (caller resolves the hostname). Failures are
    // reported to downstream as ConnectionFailed.
    void Connect(const sockaddr_storage& addr) {
        int family = addr.ss_family;
        int sock_fd = socket(family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        if (sock_fd < 0) {
            Fail(Error{ErrorCode::ConnectionFailed,
                       std::string("socket() failed: ") + std::strerror(errno), errno});
            return;
        }

        int opt = 1;
        setsockopt(sock_fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));

        socklen_t len = family == AF_INET6 ? sizeof(sockaddr_in6) : sizeof(sockaddr_in);
        int ret = connect(sock_fd, reinterpret_cast<const sockaddr*>(&addr), len);
        if (ret < 0 && errno != EINPROGRESS) {
            auto err = errno;
            ::close(sock_fd);
            Fail(Error{ErrorCode::ConnectionFailed,
                       std::string("connect() failed: ") + std::strerror(err), err});
            return;
        }

        // Watch read+write to detect connect completion and early errors
        fd_ = sock_fd;
        handle_ = loop_.Register(
            sock_fd,
            /*want_read=*/true,
            /*want_write=*/true,
            [this]() { HandleReadable(); },
            [this]() { HandleWritable(); },
            [this](int err) {
                Fail(Error{ErrorCode::ConnectionFailed,
                           std::string("socket error: ") + std::strerror(err), err});
            });
    }

    // Write data to socket (queued until connected / writable)
    void Write(BufferChain data) {
        if (!handle_) return;

        size_t offset = write_buffer_.size();
        write_buffer_.resize(offset + data.Size());
        data.CopyTo(0, data.Size(), write_buffer_.data() + offset);
        data.Clear();

        if (connected_ && !write_buffer_.empty()) {
            HandleWritable();
        }
    }

    void Write(std::string_view text) {
        Write(BufferChain::FromString(text));
    }

    // Release the fd; no downstream callbacks after this returns.
    void Close() {
        handle_.reset();
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
        connected_ = false;
        watching_write_ = false;
        write_buffer_.clear();
    }

    template <typename F>
        requires std::invocable<F>
    void OnConnect(F&& cb) { on_connect_ = std::forward<F>(cb); }

    bool IsConnected() const { return connected_; }
    bool IsOpen() const { return fd_ >= 0; }
    int fd() const { return fd_; }
    size_t PendingWriteBytes() const { return write_buffer_.size(); }

private:
    void Fail(const Error& e) {
        Close();
        auto downstream = downstream_;
        downstream->OnError(e);
    }

    void HandleReadable() {
        BufferChain chain;
        chain.SetRecycleCallback(segment_pool_.MakeRecycler());
        auto downstream = downstream_;

        while (fd_ >= 0) {
            auto seg = segment_pool_.Acquire();
            ssize_t n = read(fd_, seg->data.data(), Segment::kSize);
            if (n > 0) {
                seg->size = static_cast<size_t>(n);
                chain.Append(std::move(seg));
            } else if (n == 0) {
                // EOF - deliver accumulated data first, then signal done
                if (!chain.Empty()) {
                    downstream->OnData(chain);
                }
                if (fd_ < 0) return;  // Closed by downstream
                Close();
                downstream->OnDone();
                return;
            } else {
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    break;
                }
                int err = errno;
                if (!chain.Empty()) {
                    downstream->OnData(chain);
                }
                if (fd_ < 0) return;
                Fail(Error{ErrorCode::ConnectionFailed,
                           std::string("read() failed: ") + std::strerror(err), err});
                return;
            }
        }

        if (!chain.Empty()) {
            downstream->OnData(chain);
        }
    }

    void HandleWritable() {
        if (fd_ < 0) return;
        if (!connected_) {
            connected_ = true;
            // No EPOLLOUT unless writes are pending
            UpdateEpollFlags();
            on_connect_();
            if (fd_ < 0) return;  // Closed in connect callback
        }

        size_t written = 0;
        while (written < write_buffer_.size()) {
            ssize_t n = ::send(fd_, write_buffer_.data() + written,
                               write_buffer_.size() - written, MSG_NOSIGNAL);
            if (n > 0) {
                written += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                break;
            }
            int err = errno;
            Fail(Error{ErrorCode::ConnectionFailed,
                       std::string("send() failed: ") + std::strerror(err), err});
            return;
        }
        write_buffer_.erase(write_buffer_.begin(),
                            write_buffer_.begin() + static_cast<std::ptrdiff_t>(written));

        bool want_write = !write_buffer_.empty();
        if (want_write != watching_write_) {
            watching_write_ = want_write;
            UpdateEpollFlags();
        }
    }

    void UpdateEpollFlags() {
        if (!handle_ || !connected_) return;
        handle_->Update(true, watching_write_);
    }

    IEventLoop& loop_;
    std::shared_ptr<D> downstream_;
    std::unique_ptr<IEventHandle> handle_;
    int fd_ = -1;
    bool connected_ = false;
    bool watching_write_ = false;

    std::vector<std::byte> write_buffer_;
    SegmentPool segment_pool_{4};

    ConnectCallback on_connect_ = []() {};
};

}  // namespace jsonl_pipe
