// SPDX-License-Identifier: MIT

// lib/stream/component.hpp
#pragma once

#include <concepts>
#include <memory>
#include <optional>
#include <string>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"

namespace jsonl_pipe {

// Downstream interface - receives bytes via BufferChain.
// Every stage of a connection chain (socket, TLS, HTTP reader, client sink)
// speaks this interface toward the next stage.
template<typename D>
concept Downstream = requires(D& d, BufferChain& chain, const Error& e) {
    { d.OnData(chain) } -> std::same_as<void>;
    { d.OnError(e) } -> std::same_as<void>;
    { d.OnDone() } -> std::same_as<void>;
};

// Upstream interface - write path flowing toward the socket
template<typename U>
concept Upstream = requires(U& u, BufferChain chain) {
    { u.Write(std::move(chain)) } -> std::same_as<void>;
    { u.Close() } -> std::same_as<void>;
};

// CRTP base for intermediate chain stages (TLS, HTTP reader).
//
// - Owns the downstream stage.
// - Reentrancy-safe close: RequestClose() inside a callback is deferred until
//   the outermost ProcessingGuard unwinds, then DoClose() runs on the next
//   loop iteration.
// - Exactly one terminal signal (OnError or OnDone) reaches downstream.
//
// Derived classes implement DoClose() and must inherit
// std::enable_shared_from_this<Derived>.
template<typename Derived, Downstream D>
class PipelineComponent {
public:
    explicit PipelineComponent(IEventLoop& loop) : loop_(loop) {}

    // RAII guard for reentrancy-safe processing
    class ProcessingGuard {
    public:
        explicit ProcessingGuard(PipelineComponent& c) : comp_(&c) {
            ++comp_->processing_count_;
        }
        ~ProcessingGuard() {
            if (comp_ && --comp_->processing_count_ == 0 && comp_->close_pending_) {
                comp_->ScheduleClose();
            }
        }
        ProcessingGuard(const ProcessingGuard&) = delete;
        ProcessingGuard& operator=(const ProcessingGuard&) = delete;
        ProcessingGuard(ProcessingGuard&& other) noexcept : comp_(other.comp_) {
            other.comp_ = nullptr;
        }
        ProcessingGuard& operator=(ProcessingGuard&&) = delete;

    private:
        PipelineComponent* comp_;
    };

    // Combines the closed check with guard creation
    [[nodiscard]] std::optional<ProcessingGuard> TryGuard() {
        if (closed_) return std::nullopt;
        return std::optional<ProcessingGuard>(std::in_place, *this);
    }

    void RequestClose() {
        if (closed_) return;
        closed_ = true;
        if (processing_count_ > 0) {
            close_pending_ = true;
            return;
        }
        ScheduleClose();
    }

    bool IsClosed() const { return closed_; }

    bool IsFinalized() const { return finalized_; }

    void SetDownstream(std::shared_ptr<D> downstream) { downstream_ = std::move(downstream); }
    D& GetDownstream() { return *downstream_; }
    bool HasDownstream() const { return downstream_ != nullptr; }
    void ResetDownstream() { downstream_.reset(); }

    // Terminal emission: the first of EmitError/EmitDone wins
    void EmitError(const Error& e) {
        if (finalized_ || !downstream_) return;
        finalized_ = true;
        ProcessingGuard guard(*this);
        auto downstream = downstream_;
        downstream->OnError(e);
    }

    void EmitDone() {
        if (finalized_ || !downstream_) return;
        finalized_ = true;
        ProcessingGuard guard(*this);
        auto downstream = downstream_;
        downstream->OnDone();
    }

    // Forward data if any; the downstream consumes what it can.
    void ForwardData(BufferChain& chain) {
        if (chain.Empty() || finalized_ || !downstream_) return;
        auto downstream = downstream_;
        downstream->OnData(chain);
    }

    // Common OnError pattern: emit once, then close.
    void PropagateError(const Error& e) {
        auto guard = TryGuard();
        if (!guard) return;
        EmitError(e);
        RequestClose();
    }

    SegmentPool& GetAllocator() { return pool_; }

protected:
    void ScheduleClose() {
        if (close_scheduled_) return;
        close_scheduled_ = true;
        close_pending_ = false;

        auto self = static_cast<Derived*>(this)->weak_from_this().lock();
        if (!self) {
            // Being destroyed; the destructor releases resources
            return;
        }
        loop_.Defer([self]() {
            self->DoClose();
        });
    }

    IEventLoop& loop_;

private:
    std::shared_ptr<D> downstream_;
    SegmentPool pool_{8};
    int processing_count_ = 0;
    bool close_pending_ = false;
    bool close_scheduled_ = false;
    bool closed_ = false;
    bool finalized_ = false;
};

}  // namespace jsonl_pipe
