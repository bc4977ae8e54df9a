// SPDX-License-Identifier: MIT

// lib/stream/endpoint.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "lib/stream/error.hpp"

namespace jsonl_pipe {

enum class Scheme { Http, Https, Ws, Wss };

/// Parsed stream URL. Both transports accept any of the four schemes;
/// http/ws are plain TCP and https/wss are TLS.
struct Endpoint {
    Scheme scheme = Scheme::Http;
    std::string host;        ///< Hostname or IP literal (IPv6 without brackets)
    uint16_t port = 80;
    std::string target = "/";  ///< Path plus query, always starting with '/'

    bool IsSecure() const { return scheme == Scheme::Https || scheme == Scheme::Wss; }

    /// Reassemble as a URL (for logs).
    std::string ToString() const;
};

/// Parse `scheme://host[:port][/path][?query]`. Fragments are dropped.
/// Errors carry ErrorCode::InvalidEndpoint.
std::expected<Endpoint, Error> ParseEndpoint(std::string_view url);

std::string_view to_string(Scheme scheme);

}  // namespace jsonl_pipe
