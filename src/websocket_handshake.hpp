// SPDX-License-Identifier: MIT

// src/websocket_handshake.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lib/stream/endpoint.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/http_response_reader.hpp"

namespace jsonl_pipe {

/// Standard base64 (with padding).
std::string Base64Encode(const unsigned char* data, size_t len);

/// Random 16-byte nonce, base64 encoded, for Sec-WebSocket-Key.
std::expected<std::string, Error> GenerateWebSocketKey();

/// base64(SHA-1(key + RFC 6455 GUID)), the expected Sec-WebSocket-Accept.
std::string ComputeAcceptKey(std::string_view key);

/// HTTP/1.1 upgrade request for `endpoint`.
std::string BuildUpgradeRequest(const Endpoint& endpoint, std::string_view key,
                                const std::vector<std::pair<std::string, std::string>>& headers);

/// Check a 101 response: Upgrade: websocket, Connection: upgrade and the
/// accept key. Failures carry HandshakeFailed.
std::expected<void, Error> ValidateUpgradeResponse(int status, const HttpHeaders& headers,
                                                   std::string_view key);

}  // namespace jsonl_pipe
