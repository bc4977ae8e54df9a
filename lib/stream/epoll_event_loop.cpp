// SPDX-License-Identifier: MIT

// lib/stream/epoll_event_loop.cpp
#include "lib/stream/epoll_event_loop.hpp"

#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace jsonl_pipe {

namespace {

std::runtime_error SysError(const char* what) {
    return std::runtime_error(std::string(what) + " failed: " + std::strerror(errno));
}

}  // namespace

// EpollEventHandle

EpollEventHandle::EpollEventHandle(EpollEventLoop& loop, std::uint64_t id, int fd,
                                   bool want_read, bool want_write,
                                   IEventLoop::ReadCallback on_read,
                                   IEventLoop::WriteCallback on_write,
                                   IEventLoop::ErrorCallback on_error)
    : loop_(loop),
      id_(id),
      fd_(fd),
      on_read_(std::move(on_read)),
      on_write_(std::move(on_write)),
      on_error_(std::move(on_error)) {
    epoll_event ev{};
    ev.events = ComputeEpollFlags(want_read, want_write);
    ev.data.u64 = id_;

    if (epoll_ctl(loop_.epoll_fd(), EPOLL_CTL_ADD, fd_, &ev) < 0) {
        throw SysError("epoll_ctl ADD");
    }
}

EpollEventHandle::~EpollEventHandle() {
    // fd may already be closed; ENOENT/EBADF are expected then
    epoll_ctl(loop_.epoll_fd(), EPOLL_CTL_DEL, fd_, nullptr);
    loop_.Unregister(id_);
}

void EpollEventHandle::Update(bool want_read, bool want_write) {
    epoll_event ev{};
    ev.events = ComputeEpollFlags(want_read, want_write);
    ev.data.u64 = id_;

    if (epoll_ctl(loop_.epoll_fd(), EPOLL_CTL_MOD, fd_, &ev) < 0) {
        throw SysError("epoll_ctl MOD");
    }
}

uint32_t EpollEventHandle::ComputeEpollFlags(bool want_read, bool want_write) {
    uint32_t flags = EPOLLET;
    if (want_read) {
        flags |= EPOLLIN | EPOLLRDHUP;
    }
    if (want_write) {
        flags |= EPOLLOUT;
    }
    return flags;
}

// EpollEventLoop

EpollEventLoop::EpollEventLoop() : loop_thread_id_(std::this_thread::get_id()) {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        throw SysError("epoll_create1");
    }

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        auto err = SysError("eventfd");
        close(epoll_fd_);
        throw err;
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.u64 = kWakeId;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) < 0) {
        auto err = SysError("epoll_ctl ADD wake_fd");
        close(wake_fd_);
        close(epoll_fd_);
        throw err;
    }
}

EpollEventLoop::~EpollEventLoop() {
    std::unordered_map<TimerId, std::unique_ptr<TimerEntry>> timers;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        timers.swap(timers_);
    }
    for (auto& [id, entry] : timers) {
        entry->handle.reset();
        close(entry->fd);
    }

    if (wake_fd_ >= 0) {
        close(wake_fd_);
    }
    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
    }
}

std::unique_ptr<IEventHandle> EpollEventLoop::Register(
    int fd,
    bool want_read,
    bool want_write,
    ReadCallback on_read,
    WriteCallback on_write,
    ErrorCallback on_error) {
    std::uint64_t id;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        id = next_handle_id_++;
    }
    auto handle = std::make_unique<EpollEventHandle>(
        *this, id, fd, want_read, want_write,
        std::move(on_read), std::move(on_write), std::move(on_error));
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        handles_[id] = handle.get();
    }
    return handle;
}

void EpollEventLoop::Unregister(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    handles_.erase(id);
}

void EpollEventLoop::Dispatch(std::uint64_t id, uint32_t events) {
    // Callbacks are copied out before invocation: a callback may destroy
    // the handle it was registered with.
    auto lookup = [this](std::uint64_t key) -> EpollEventHandle* {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = handles_.find(key);
        return it == handles_.end() ? nullptr : it->second;
    };

    EpollEventHandle* handle = lookup(id);
    if (handle == nullptr) return;

    if ((events & EPOLLERR) != 0 ||
        ((events & EPOLLHUP) != 0 && (events & EPOLLIN) == 0)) {
        int error_code = 0;
        socklen_t len = sizeof(error_code);
        if (getsockopt(handle->fd(), SOL_SOCKET, SO_ERROR, &error_code, &len) < 0) {
            error_code = errno;
        }
        auto on_error = handle->on_error_;
        if (on_error) {
            on_error(error_code);
        }
        return;
    }

    // Peer hangup with data still queued is delivered as readable; the
    // reader sees EOF after draining.
    if ((events & (EPOLLIN | EPOLLRDHUP | EPOLLHUP)) != 0) {
        auto on_read = handle->on_read_;
        if (on_read) {
            on_read();
        }
    }

    if ((events & EPOLLOUT) != 0) {
        handle = lookup(id);
        if (handle == nullptr) return;
        auto on_write = handle->on_write_;
        if (on_write) {
            on_write();
        }
    }
}

void EpollEventLoop::Defer(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        deferred_callbacks_.push_back(std::move(fn));
    }

    if (!IsInEventLoopThread()) {
        Wake();
    }
}

TimerId EpollEventLoop::Schedule(std::chrono::milliseconds delay, TimerCallback fn) {
    int tfd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (tfd < 0) {
        throw SysError("timerfd_create");
    }

    // A zero it_value disarms a timerfd, so clamp to 1ns
    auto count = delay.count() < 0 ? 0 : delay.count();
    itimerspec ts{};
    ts.it_value.tv_sec = count / 1000;
    ts.it_value.tv_nsec = (count % 1000) * 1000000;
    if (count == 0) {
        ts.it_value.tv_nsec = 1;
    }

    if (timerfd_settime(tfd, 0, &ts, nullptr) < 0) {
        auto err = SysError("timerfd_settime");
        close(tfd);
        throw err;
    }

    TimerId id;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        id = next_timer_id_++;
    }

    auto entry = std::make_unique<TimerEntry>();
    entry->fd = tfd;
    entry->callback = std::move(fn);
    entry->handle = Register(
        tfd,
        /*want_read=*/true,
        /*want_write=*/false,
        [this, id]() { HandleTimerExpired(id); },
        nullptr,
        nullptr);

    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        timers_.emplace(id, std::move(entry));
    }
    return id;
}

void EpollEventLoop::Cancel(TimerId id) {
    std::unique_ptr<TimerEntry> entry;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = timers_.find(id);
        if (it == timers_.end()) return;
        entry = std::move(it->second);
        timers_.erase(it);
    }
    // Handle destructor takes registry_mutex_, so release outside the lock
    entry->handle.reset();
    close(entry->fd);
}

void EpollEventLoop::HandleTimerExpired(TimerId id) {
    std::unique_ptr<TimerEntry> entry;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = timers_.find(id);
        if (it == timers_.end()) return;
        entry = std::move(it->second);
        timers_.erase(it);
    }

    uint64_t expirations = 0;
    [[maybe_unused]] ssize_t n = read(entry->fd, &expirations, sizeof(expirations));

    auto callback = std::move(entry->callback);
    entry->handle.reset();
    close(entry->fd);

    if (callback) {
        callback();
    }
}

size_t EpollEventLoop::PendingTimers() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return timers_.size();
}

bool EpollEventLoop::IsInEventLoopThread() const {
    return std::this_thread::get_id() == loop_thread_id_.load();
}

void EpollEventLoop::Poll(int timeout_ms) {
    loop_thread_id_.store(std::this_thread::get_id());

    ProcessDeferredCallbacks();

    epoll_event events[kMaxEvents];
    int nfds = epoll_wait(epoll_fd_, events, kMaxEvents, timeout_ms);

    if (nfds < 0) {
        if (errno == EINTR) {
            return;
        }
        throw SysError("epoll_wait");
    }

    for (int i = 0; i < nfds; ++i) {
        if (events[i].data.u64 == kWakeId) {
            uint64_t val;
            [[maybe_unused]] ssize_t n = read(wake_fd_, &val, sizeof(val));
            continue;
        }
        Dispatch(events[i].data.u64, events[i].events);
    }

    ProcessDeferredCallbacks();
}

void EpollEventLoop::Run() {
    State expected = State::Idle;
    if (!state_.compare_exchange_strong(expected, State::Running)) {
        return;  // Already running or stopped
    }
    while (state_.load() == State::Running) {
        Poll(100);
    }
}

void EpollEventLoop::Stop() {
    state_.store(State::Stopped);
    Wake();
}

void EpollEventLoop::Wake() {
    uint64_t val = 1;
    [[maybe_unused]] ssize_t n = write(wake_fd_, &val, sizeof(val));
}

void EpollEventLoop::ProcessDeferredCallbacks() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        callbacks.swap(deferred_callbacks_);
    }

    for (auto& cb : callbacks) {
        if (cb) {
            cb();
        }
    }
}

}  // namespace jsonl_pipe
