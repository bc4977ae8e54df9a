// SPDX-License-Identifier: MIT

// lib/stream/timer.hpp
#pragma once

#include <chrono>
#include <functional>
#include <memory>

#include "lib/stream/event_loop.hpp"

namespace jsonl_pipe {

/// One-shot or periodic timer built on IEventLoop::Schedule().
///
/// Stop() and destruction cancel the pending tick with IEventLoop::Cancel().
/// The alive flag additionally covers a tick that was already dequeued by
/// the loop when the timer went away.
///
/// @code
/// Timer keepalive(loop);
/// keepalive.OnTimer([&] { SendPing(); });
/// keepalive.Start(30s, 30s);
/// @endcode
class Timer {
public:
    using Callback = std::function<void()>;

    explicit Timer(IEventLoop& loop)
        : loop_(loop), alive_(std::make_shared<bool>(true)) {}

    ~Timer() {
        *alive_ = false;
        Stop();
    }

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;
    Timer(Timer&&) = delete;
    Timer& operator=(Timer&&) = delete;

    /// Set the callback invoked on each timer tick.
    void OnTimer(Callback cb) { callback_ = std::move(cb); }

    /// Arm the timer, replacing any pending tick.
    /// @param delay     Initial delay before first tick
    /// @param interval  Repeat interval (zero = one-shot)
    void Start(std::chrono::milliseconds delay,
               std::chrono::milliseconds interval = std::chrono::milliseconds{0}) {
        Stop();
        interval_ = interval;
        armed_ = true;
        ScheduleNext(delay);
    }

    /// Disarm the timer. No further callbacks will fire.
    void Stop() {
        armed_ = false;
        interval_ = std::chrono::milliseconds{0};
        if (pending_ != 0) {
            loop_.Cancel(pending_);
            pending_ = 0;
        }
    }

    bool IsArmed() const { return armed_; }

    std::chrono::milliseconds Interval() const { return interval_; }

private:
    void ScheduleNext(std::chrono::milliseconds delay) {
        std::shared_ptr<bool> alive = alive_;
        Timer* self = this;
        pending_ = loop_.Schedule(delay, [alive, self]() {
            if (*alive) {
                self->Fire();
            }
        });
    }

    void Fire() {
        pending_ = 0;
        if (!armed_) return;

        bool periodic = interval_.count() > 0;
        if (!periodic) {
            armed_ = false;
        }

        // Callback may Stop() or restart the timer, or destroy its owner
        std::shared_ptr<bool> alive = alive_;
        if (callback_) {
            Callback cb = callback_;
            cb();
        }
        if (!*alive) return;

        if (periodic && armed_ && pending_ == 0) {
            ScheduleNext(interval_);
        }
    }

    IEventLoop& loop_;
    Callback callback_;
    std::chrono::milliseconds interval_{0};
    bool armed_ = false;
    TimerId pending_ = 0;
    std::shared_ptr<bool> alive_;
};

}  // namespace jsonl_pipe
