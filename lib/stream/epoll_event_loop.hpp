// SPDX-License-Identifier: MIT

// lib/stream/epoll_event_loop.hpp
#pragma once

#include <sys/epoll.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "lib/stream/event_loop.hpp"

namespace jsonl_pipe {

class EpollEventLoop;

/// Handle for a registered file descriptor in the epoll event loop.
///
/// Returned by EpollEventLoop::Register(). Destroying the handle removes
/// the fd from the epoll set; events already harvested for it in the
/// current Poll() batch are dropped, so a callback may destroy its own
/// handle (or any other) safely.
class EpollEventHandle : public IEventHandle {
public:
    EpollEventHandle(EpollEventLoop& loop, std::uint64_t id, int fd,
                     bool want_read, bool want_write,
                     IEventLoop::ReadCallback on_read,
                     IEventLoop::WriteCallback on_write,
                     IEventLoop::ErrorCallback on_error);

    ~EpollEventHandle() override;

    EpollEventHandle(const EpollEventHandle&) = delete;
    EpollEventHandle& operator=(const EpollEventHandle&) = delete;
    EpollEventHandle(EpollEventHandle&&) = delete;
    EpollEventHandle& operator=(EpollEventHandle&&) = delete;

    void Update(bool want_read, bool want_write) override;

    int fd() const override { return fd_; }

private:
    friend class EpollEventLoop;

    static uint32_t ComputeEpollFlags(bool want_read, bool want_write);

    EpollEventLoop& loop_;
    std::uint64_t id_;
    int fd_;
    IEventLoop::ReadCallback on_read_;
    IEventLoop::WriteCallback on_write_;
    IEventLoop::ErrorCallback on_error_;
};

/// Epoll-based event loop for non-blocking I/O and timer scheduling.
///
/// Wraps Linux epoll to multiplex reads, writes, and timers (one timerfd
/// per scheduled callback) on a single thread. The thread that constructs
/// the loop counts as the loop thread until Poll() or Run() is entered
/// from another thread.
///
/// Thread safety: Defer(), Stop() and Wake() may be called from any thread.
/// Everything else belongs to the loop thread.
class EpollEventLoop : public IEventLoop {
public:
    EpollEventLoop();
    ~EpollEventLoop() override;

    EpollEventLoop(const EpollEventLoop&) = delete;
    EpollEventLoop& operator=(const EpollEventLoop&) = delete;
    EpollEventLoop(EpollEventLoop&&) = delete;
    EpollEventLoop& operator=(EpollEventLoop&&) = delete;

    std::unique_ptr<IEventHandle> Register(
        int fd,
        bool want_read,
        bool want_write,
        ReadCallback on_read,
        WriteCallback on_write,
        ErrorCallback on_error) override;

    void Defer(std::function<void()> fn) override;

    TimerId Schedule(std::chrono::milliseconds delay, TimerCallback fn) override;

    void Cancel(TimerId id) override;

    bool IsInEventLoopThread() const override;

    /// Poll for events with the given timeout (milliseconds). -1 blocks.
    void Poll(int timeout_ms);

    /// Run the event loop until Stop() is called.
    void Run();

    /// Signal the loop to exit after the current poll completes.
    void Stop();

    /// Wake the event loop from another thread (e.g. after Defer()).
    void Wake();

    /// Number of scheduled callbacks that have neither fired nor been cancelled.
    size_t PendingTimers() const;

    int epoll_fd() const { return epoll_fd_; }

private:
    friend class EpollEventHandle;

    struct TimerEntry {
        int fd = -1;
        TimerCallback callback;
        std::unique_ptr<IEventHandle> handle;
    };

    void Dispatch(std::uint64_t id, uint32_t events);
    void Unregister(std::uint64_t id);
    void ProcessDeferredCallbacks();
    void HandleTimerExpired(TimerId id);

    enum class State { Idle, Running, Stopped };

    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    std::atomic<State> state_{State::Idle};
    std::atomic<std::thread::id> loop_thread_id_;

    std::mutex deferred_mutex_;
    std::vector<std::function<void()>> deferred_callbacks_;

    // Live fd registrations and timers, keyed by id (0 is the wake fd)
    mutable std::mutex registry_mutex_;
    std::unordered_map<std::uint64_t, EpollEventHandle*> handles_;
    std::unordered_map<TimerId, std::unique_ptr<TimerEntry>> timers_;
    std::uint64_t next_handle_id_ = 1;
    TimerId next_timer_id_ = 1;

    static constexpr int kMaxEvents = 64;
    static constexpr std::uint64_t kWakeId = 0;
};

}  // namespace jsonl_pipe
