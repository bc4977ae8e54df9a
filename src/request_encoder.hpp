// SPDX-License-Identifier: MIT

// src/request_encoder.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "lib/stream/error.hpp"
#include "src/stream_message.hpp"

namespace jsonl_pipe {

/// Pre-encoded JSON inserted verbatim.
struct RawJson {
    std::string text;
};

/// Value of one request parameter. Timestamps are written as ISO-8601 UTC.
using ParamValue = std::variant<std::nullptr_t,
                                bool,
                                int64_t,
                                double,
                                std::string,
                                std::chrono::system_clock::time_point,
                                RawJson>;

/// Outbound request: `{"id":..,"method":..,"params":{..}}`.
struct StreamRequest {
    MessageId id;
    std::string method;
    std::vector<std::pair<std::string, ParamValue>> params;  ///< Written in order
};

/// Encode a request as one compact JSON document (no trailing newline).
/// Fails with EncodeError for an empty method, a non-finite double or
/// RawJson that is not a single valid JSON value.
std::expected<std::string, Error> EncodeRequest(const StreamRequest& request);

/// `2024-01-02T03:04:05.678Z`
std::string FormatIso8601(std::chrono::system_clock::time_point tp);

/// Random RFC 4122 version 4 UUID in canonical lowercase form.
std::expected<std::string, Error> GenerateRequestId();

}  // namespace jsonl_pipe
