// SPDX-License-Identifier: MIT

// lib/stream/event_loop.cpp
#include "lib/stream/event_loop.hpp"

#include <cstdio>
#include <exception>

#include "lib/stream/epoll_event_loop.hpp"

namespace jsonl_pipe {

struct EventLoop::Impl : EpollEventLoop {};

EventLoop::EventLoop() : impl_(std::make_unique<Impl>()) {}

EventLoop::~EventLoop() = default;

void EventLoop::Poll(int timeout_ms) {
    impl_->Poll(timeout_ms);
}

void EventLoop::Run() {
    impl_->Run();
}

void EventLoop::Stop() {
    impl_->Stop();
}

EventLoop::operator IEventLoop&() {
    return *impl_;
}

EventLoop::operator const IEventLoop&() const {
    return *impl_;
}

void RequireLoopThread(const IEventLoop& loop, const char* where) {
    if (!loop.IsInEventLoopThread()) {
        std::fprintf(stderr, "jsonl_pipe: %s called off the event loop thread\n", where);
        std::terminate();
    }
}

}  // namespace jsonl_pipe
