// SPDX-License-Identifier: MIT

// src/websocket_handshake.cpp
#include "src/websocket_handshake.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>
#include <utility>

#include <fmt/format.h>

#include "lib/stream/http_request_builder.hpp"
#include "lib/stream/random_bytes.hpp"

namespace jsonl_pipe {

namespace {

constexpr std::string_view kAcceptGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

std::string Lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::unexpected<Error> Rejected(std::string message) {
    return std::unexpected(Error{ErrorCode::HandshakeFailed, std::move(message)});
}

}  // namespace

std::string Base64Encode(const unsigned char* data, size_t len) {
    // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a NUL
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data,
                                  static_cast<int>(len));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::expected<std::string, Error> GenerateWebSocketKey() {
    std::array<unsigned char, 16> nonce{};
    auto drawn = FillRandomBytes(nonce.data(), nonce.size(), ErrorCode::HandshakeFailed,
                                 "Sec-WebSocket-Key");
    if (!drawn) {
        return std::unexpected(std::move(drawn.error()));
    }
    return Base64Encode(nonce.data(), nonce.size());
}

std::string ComputeAcceptKey(std::string_view key) {
    std::string input(key);
    input.append(kAcceptGuid);
    std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
    SHA1(reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest.data());
    return Base64Encode(digest.data(), digest.size());
}

std::string BuildUpgradeRequest(const Endpoint& endpoint, std::string_view key,
                                const std::vector<std::pair<std::string, std::string>>& headers) {
    std::string request;
    HttpRequestBuilder builder(std::back_inserter(request));
    builder.Method("GET")
        .Target(endpoint.target)
        .Host(endpoint.host, endpoint.port, endpoint.IsSecure())
        .Header("Upgrade", "websocket")
        .Header("Connection", "Upgrade")
        .Header("Sec-WebSocket-Key", key)
        .Header("Sec-WebSocket-Version", "13");
    for (const auto& header : headers) {
        builder.Header(header.first, header.second);
    }
    builder.Finish();
    return request;
}

std::expected<void, Error> ValidateUpgradeResponse(int status, const HttpHeaders& headers,
                                                   std::string_view key) {
    if (status != 101) {
        return Rejected(fmt::format("Expected 101 Switching Protocols, got {}", status));
    }

    auto upgrade = headers.Get("upgrade");
    if (!upgrade || Lowercase(*upgrade) != "websocket") {
        return Rejected("Missing or invalid Upgrade header");
    }

    auto connection = headers.Get("connection");
    if (!connection || Lowercase(*connection).find("upgrade") == std::string::npos) {
        return Rejected("Missing or invalid Connection header");
    }

    auto accept = headers.Get("sec-websocket-accept");
    if (!accept) {
        return Rejected("Missing Sec-WebSocket-Accept header");
    }
    if (*accept != ComputeAcceptKey(key)) {
        return Rejected("Sec-WebSocket-Accept does not match the request key");
    }

    if (auto extensions = headers.Get("sec-websocket-extensions"); extensions && !extensions->empty()) {
        return Rejected(fmt::format("Unrequested extension '{}'", *extensions));
    }
    return {};
}

}  // namespace jsonl_pipe
