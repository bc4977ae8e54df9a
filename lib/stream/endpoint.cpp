// SPDX-License-Identifier: MIT

// lib/stream/endpoint.cpp
#include "lib/stream/endpoint.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

#include <fmt/format.h>

namespace jsonl_pipe {

namespace {

std::unexpected<Error> Invalid(std::string_view url, std::string_view why) {
    return std::unexpected(Error{ErrorCode::InvalidEndpoint,
                                 fmt::format("Invalid endpoint '{}': {}", url, why)});
}

}  // namespace

std::string_view to_string(Scheme scheme) {
    switch (scheme) {
        case Scheme::Http: return "http";
        case Scheme::Https: return "https";
        case Scheme::Ws: return "ws";
        case Scheme::Wss: return "wss";
    }
    return "http";
}

std::string Endpoint::ToString() const {
    bool ipv6 = host.find(':') != std::string::npos;
    if (ipv6) {
        return fmt::format("{}://[{}]:{}{}", to_string(scheme), host, port, target);
    }
    return fmt::format("{}://{}:{}{}", to_string(scheme), host, port, target);
}

std::expected<Endpoint, Error> ParseEndpoint(std::string_view url) {
    Endpoint out;

    // 1) Scheme
    size_t sep = url.find("://");
    if (sep == std::string_view::npos) {
        return Invalid(url, "missing scheme");
    }
    std::string scheme(url.substr(0, sep));
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme == "http") {
        out.scheme = Scheme::Http;
    } else if (scheme == "https") {
        out.scheme = Scheme::Https;
    } else if (scheme == "ws") {
        out.scheme = Scheme::Ws;
    } else if (scheme == "wss") {
        out.scheme = Scheme::Wss;
    } else {
        return Invalid(url, "unsupported scheme");
    }
    out.port = out.IsSecure() ? 443 : 80;

    // 2) Authority runs to the first '/', '?' or '#'
    std::string_view rest = url.substr(sep + 3);
    size_t auth_end = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, auth_end);
    std::string_view tail = auth_end == std::string_view::npos ? std::string_view{}
                                                               : rest.substr(auth_end);
    if (authority.find('@') != std::string_view::npos) {
        return Invalid(url, "userinfo is not supported");
    }

    // 3) Host and optional port
    std::string_view port_text;
    if (!authority.empty() && authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string_view::npos) {
            return Invalid(url, "unterminated IPv6 literal");
        }
        out.host = std::string(authority.substr(1, close - 1));
        std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return Invalid(url, "unexpected text after IPv6 literal");
            }
            port_text = after.substr(1);
            if (port_text.empty()) {
                return Invalid(url, "empty port");
            }
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            out.host = std::string(authority.substr(0, colon));
            port_text = authority.substr(colon + 1);
            if (port_text.empty()) {
                return Invalid(url, "empty port");
            }
        } else {
            out.host = std::string(authority);
        }
    }
    if (out.host.empty()) {
        return Invalid(url, "empty host");
    }

    if (!port_text.empty()) {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(),
                                         port_text.data() + port_text.size(), value);
        if (ec != std::errc{} || ptr != port_text.data() + port_text.size() ||
            value == 0 || value > 65535) {
            return Invalid(url, "port must be 1-65535");
        }
        out.port = static_cast<uint16_t>(value);
    }

    // 4) Target: path plus query, fragment dropped
    size_t hash = tail.find('#');
    if (hash != std::string_view::npos) {
        tail = tail.substr(0, hash);
    }
    if (tail.empty()) {
        out.target = "/";
    } else if (tail.front() == '?') {
        out.target = "/" + std::string(tail);
    } else {
        out.target = std::string(tail);
    }
    if (out.target.find_first_of(" \r\n") != std::string::npos) {
        return Invalid(url, "whitespace in path");
    }

    return out;
}

}  // namespace jsonl_pipe
