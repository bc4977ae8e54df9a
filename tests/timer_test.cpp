// SPDX-License-Identifier: MIT

// tests/timer_test.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include "lib/stream/epoll_event_loop.hpp"
#include "lib/stream/timer.hpp"

using namespace jsonl_pipe;
using namespace std::chrono_literals;

TEST(TimerTest, OneShotFires) {
    EpollEventLoop loop;

    Timer timer(loop);

    bool fired = false;
    timer.OnTimer([&]() {
        fired = true;
        loop.Stop();
    });

    timer.Start(10ms);
    EXPECT_TRUE(timer.IsArmed());

    loop.Run();

    EXPECT_TRUE(fired);
    EXPECT_FALSE(timer.IsArmed());  // One-shot disarms after firing
}

TEST(TimerTest, RepeatingFires) {
    EpollEventLoop loop;

    Timer timer(loop);

    int count = 0;
    timer.OnTimer([&]() {
        count++;
        if (count >= 3) {
            timer.Stop();
            loop.Stop();
        }
    });

    timer.Start(10ms, 10ms);
    EXPECT_EQ(timer.Interval(), 10ms);

    loop.Run();

    EXPECT_EQ(count, 3);
    EXPECT_FALSE(timer.IsArmed());
}

TEST(TimerTest, StopPreventsCallback) {
    EpollEventLoop loop;

    Timer timer(loop);

    bool fired = false;
    timer.OnTimer([&]() { fired = true; });

    timer.Start(20ms);
    timer.Stop();
    EXPECT_FALSE(timer.IsArmed());
    EXPECT_EQ(loop.PendingTimers(), 0u);

    loop.Poll(60);

    EXPECT_FALSE(fired);
}

TEST(TimerTest, RestartReplacesPendingTick) {
    EpollEventLoop loop;

    Timer timer(loop);

    int count = 0;
    timer.OnTimer([&]() {
        ++count;
        loop.Stop();
    });

    timer.Start(500ms);
    timer.Start(5ms);
    EXPECT_EQ(loop.PendingTimers(), 1u);

    loop.Run();
    EXPECT_EQ(count, 1);
}

TEST(TimerTest, CallbackMayDestroyTimer) {
    EpollEventLoop loop;

    auto timer = std::make_unique<Timer>(loop);
    bool fired = false;
    timer->OnTimer([&]() {
        fired = true;
        timer.reset();
        loop.Stop();
    });
    timer->Start(5ms, 5ms);

    loop.Run();

    EXPECT_TRUE(fired);
    EXPECT_EQ(timer, nullptr);
    EXPECT_EQ(loop.PendingTimers(), 0u);
}

TEST(TimerTest, DestructionCancels) {
    EpollEventLoop loop;

    bool fired = false;
    {
        Timer timer(loop);
        timer.OnTimer([&]() { fired = true; });
        timer.Start(5ms);
    }
    EXPECT_EQ(loop.PendingTimers(), 0u);

    loop.Poll(30);
    EXPECT_FALSE(fired);
}
