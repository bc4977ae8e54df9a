// SPDX-License-Identifier: MIT

// lib/stream/dns_resolver.hpp
#pragma once

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <cstring>
#include <expected>
#include <string>
#include <string_view>

#include "lib/stream/error.hpp"

namespace jsonl_pipe {

// Resolve hostname to sockaddr_storage using getaddrinfo (blocking).
// IPv4 results are preferred when the name has both families.
inline std::expected<sockaddr_storage, Error> ResolveHostname(std::string_view hostname,
                                                              uint16_t port) {
    std::string host_str(hostname);

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    struct addrinfo* result = nullptr;
    int ret = getaddrinfo(host_str.c_str(), nullptr, &hints, &result);
    if (ret != 0 || result == nullptr) {
        return std::unexpected(Error{ErrorCode::DnsResolutionFailed,
                                     "Failed to resolve " + host_str + ": " + gai_strerror(ret)});
    }

    const addrinfo* chosen = result;
    for (const addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        if (ai->ai_family == AF_INET) {
            chosen = ai;
            break;
        }
    }

    sockaddr_storage addr{};
    std::memcpy(&addr, chosen->ai_addr, chosen->ai_addrlen);

    if (chosen->ai_family == AF_INET) {
        reinterpret_cast<sockaddr_in*>(&addr)->sin_port = htons(port);
    } else if (chosen->ai_family == AF_INET6) {
        reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port = htons(port);
    }

    freeaddrinfo(result);
    return addr;
}

}  // namespace jsonl_pipe
