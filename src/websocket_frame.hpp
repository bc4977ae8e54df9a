// SPDX-License-Identifier: MIT

// src/websocket_frame.hpp
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "lib/stream/error.hpp"

namespace jsonl_pipe {

/// RFC 6455 opcodes.
enum class WsOpcode : uint8_t {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA,
};

constexpr bool IsControl(WsOpcode op) { return (static_cast<uint8_t>(op) & 0x8) != 0; }

/// Close status codes used by this client.
namespace ws_close {
constexpr uint16_t kNormal = 1000;
constexpr uint16_t kProtocolError = 1002;
constexpr uint16_t kMessageTooBig = 1009;
}  // namespace ws_close

using WsMaskKey = std::array<uint8_t, 4>;

/// Encode one frame. Client frames must pass a mask key; server frames none.
std::string EncodeFrame(WsOpcode opcode, std::string_view payload,
                        std::optional<WsMaskKey> mask, bool fin = true);

/// Encode a masked client frame with a random key.
std::expected<std::string, Error> EncodeClientFrame(WsOpcode opcode, std::string_view payload,
                                                    bool fin = true);

/// Close frame payload: big-endian status code followed by the reason.
std::string ClosePayload(uint16_t code, std::string_view reason);

/// Status code and reason from a close payload (1005 when empty).
std::pair<uint16_t, std::string> ParseClosePayload(std::string_view payload);

/// A reassembled data message or a control frame.
struct WsMessage {
    WsOpcode opcode;
    std::string payload;
};

// WsFrameDecoder - incremental RFC 6455 frame parser
//
// Feed() accepts arbitrary byte chunks and emits, in order, complete data
// messages (fragments joined; opcode Text or Binary) and control frames
// (which may arrive between fragments). Any framing violation returns
// ProtocolError and latches the decoder until Reset():
// - reserved bits set or unknown opcode
// - control frame fragmented or longer than 125 bytes
// - mask bit not matching the expected direction
// - continuation without a started message, or a new message mid-fragment
// - message larger than the configured maximum
class WsFrameDecoder {
public:
    using MessageCallback = std::function<void(WsMessage)>;

    static constexpr size_t kDefaultMaxMessageSize = 16 * 1024 * 1024;

    /// `expect_masked` is false for a client decoding server frames.
    explicit WsFrameDecoder(size_t max_message_size = kDefaultMaxMessageSize,
                            bool expect_masked = false)
        : max_message_size_(max_message_size), expect_masked_(expect_masked) {}

    std::expected<void, Error> Feed(std::string_view bytes, const MessageCallback& emit);

    void Reset();

    bool IsFailed() const { return failed_; }

    /// Bytes of an incomplete frame.
    size_t Pending() const { return buffer_.size() - offset_; }

    /// Status code to send in the close frame after a failure.
    uint16_t FailureCloseCode() const { return failure_close_code_; }

private:
    std::unexpected<Error> Violation(std::string message, uint16_t close_code);

    size_t max_message_size_;
    bool expect_masked_;

    std::string buffer_;
    size_t offset_ = 0;

    std::optional<WsOpcode> fragment_opcode_;
    std::string fragment_;

    bool failed_ = false;
    uint16_t failure_close_code_ = ws_close::kProtocolError;
};

}  // namespace jsonl_pipe
