// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace jsonl_pipe {

/// Error codes for transport, stream and queue operations.
enum class ErrorCode {
    // Connection
    ConnectionFailed,      ///< TCP connect/read/write failed
    ConnectionClosed,      ///< Remote peer closed the connection
    DnsResolutionFailed,   ///< Hostname could not be resolved
    Timeout,               ///< Operation did not complete in its window
    Cancelled,             ///< Operation abandoned by a local Disconnect()

    // TLS
    TlsHandshakeFailed,    ///< TLS handshake or record layer failure

    // HTTP
    HttpError,             ///< Malformed response or unexpected status
    RateLimited,           ///< HTTP 429
    ServerError,           ///< HTTP 5xx

    // WebSocket
    HandshakeFailed,       ///< Upgrade response rejected or invalid accept key
    ProtocolError,         ///< Invalid framing from the peer
    KeepaliveTimeout,      ///< Ping went unanswered for a full interval

    // Stream
    BufferOverflow,        ///< Pending bytes exceeded the configured limit
    ParseError,            ///< Record is not a valid message
    EncodeError,           ///< Outbound request could not be encoded

    // Queue
    CapacityExceeded,      ///< Bounded queue is full
    QueueClosed,           ///< Queue no longer accepts items

    // State / config
    InvalidState,          ///< Method called in wrong connection state
    NotConnected,          ///< Send attempted while not connected
    InvalidEndpoint,       ///< URL could not be parsed or has unsupported scheme
};

/// Error payload delivered to OnError callbacks and std::expected results.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
    int os_errno = 0;              ///< OS errno if applicable, 0 otherwise
    std::optional<std::chrono::milliseconds> retry_after = {};  ///< Server-requested delay
};

/// Return a short category string for an error code (e.g. "connection", "queue").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectionFailed:
        case ErrorCode::ConnectionClosed:
        case ErrorCode::DnsResolutionFailed:
        case ErrorCode::Timeout:
        case ErrorCode::Cancelled:
            return "connection";
        case ErrorCode::TlsHandshakeFailed:
            return "tls";
        case ErrorCode::HttpError:
        case ErrorCode::RateLimited:
        case ErrorCode::ServerError:
            return "http";
        case ErrorCode::HandshakeFailed:
        case ErrorCode::ProtocolError:
        case ErrorCode::KeepaliveTimeout:
            return "websocket";
        case ErrorCode::BufferOverflow:
        case ErrorCode::ParseError:
        case ErrorCode::EncodeError:
            return "stream";
        case ErrorCode::CapacityExceeded:
        case ErrorCode::QueueClosed:
            return "queue";
        case ErrorCode::InvalidState:
        case ErrorCode::NotConnected:
            return "state";
        case ErrorCode::InvalidEndpoint:
            return "config";
    }
    return "unknown";
}

/// Return the enumerator name of an error code.
constexpr std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectionFailed: return "ConnectionFailed";
        case ErrorCode::ConnectionClosed: return "ConnectionClosed";
        case ErrorCode::DnsResolutionFailed: return "DnsResolutionFailed";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::TlsHandshakeFailed: return "TlsHandshakeFailed";
        case ErrorCode::HttpError: return "HttpError";
        case ErrorCode::RateLimited: return "RateLimited";
        case ErrorCode::ServerError: return "ServerError";
        case ErrorCode::HandshakeFailed: return "HandshakeFailed";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::KeepaliveTimeout: return "KeepaliveTimeout";
        case ErrorCode::BufferOverflow: return "BufferOverflow";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::EncodeError: return "EncodeError";
        case ErrorCode::CapacityExceeded: return "CapacityExceeded";
        case ErrorCode::QueueClosed: return "QueueClosed";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::NotConnected: return "NotConnected";
        case ErrorCode::InvalidEndpoint: return "InvalidEndpoint";
    }
    return "Unknown";
}

/// True for failures of the connection itself (as opposed to per-record
/// or per-call problems). These move a transport client to `failed`.
constexpr bool IsConnectionError(ErrorCode code) {
    auto category = error_category(code);
    return category == "connection" || category == "tls" ||
           category == "http" || category == "websocket";
}

}  // namespace jsonl_pipe
