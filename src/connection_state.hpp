// SPDX-License-Identifier: MIT

// src/connection_state.hpp
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "lib/stream/error.hpp"

namespace jsonl_pipe {

/// Connection state of a transport client.
///
/// disconnected -> connecting -> connected -> disconnecting -> disconnected,
/// with `failed(reason)` reachable from any phase. Both `disconnected` and
/// `failed` accept a new Connect(). Only the owning client constructs new
/// values; observers receive copies.
class ConnectionState {
public:
    enum class Phase { Disconnected, Connecting, Connected, Disconnecting, Failed };

    ConnectionState() = default;

    static ConnectionState Disconnected() { return ConnectionState(Phase::Disconnected); }
    static ConnectionState Connecting() { return ConnectionState(Phase::Connecting); }
    static ConnectionState Connected() { return ConnectionState(Phase::Connected); }
    static ConnectionState Disconnecting() { return ConnectionState(Phase::Disconnecting); }
    static ConnectionState Failed(Error reason) {
        ConnectionState s(Phase::Failed);
        s.reason_ = std::move(reason);
        return s;
    }

    Phase phase() const { return phase_; }

    /// Failure reason; null unless phase() is Failed.
    const Error* failure() const { return reason_ ? &*reason_ : nullptr; }

    bool Is(Phase p) const { return phase_ == p; }
    bool CanConnect() const { return phase_ == Phase::Disconnected || phase_ == Phase::Failed; }

    std::string ToString() const;

    friend bool operator==(const ConnectionState& a, Phase p) { return a.phase_ == p; }

private:
    explicit ConnectionState(Phase p) : phase_(p) {}

    Phase phase_ = Phase::Disconnected;
    std::optional<Error> reason_;
};

constexpr std::string_view to_string(ConnectionState::Phase phase) {
    switch (phase) {
        case ConnectionState::Phase::Disconnected: return "disconnected";
        case ConnectionState::Phase::Connecting: return "connecting";
        case ConnectionState::Phase::Connected: return "connected";
        case ConnectionState::Phase::Disconnecting: return "disconnecting";
        case ConnectionState::Phase::Failed: return "failed";
    }
    return "unknown";
}

inline std::string ConnectionState::ToString() const {
    std::string out(to_string(phase_));
    if (reason_) {
        out += "(";
        out += error_code_name(reason_->code);
        out += ": ";
        out += reason_->message;
        out += ")";
    }
    return out;
}

}  // namespace jsonl_pipe
