// SPDX-License-Identifier: MIT

// src/websocket_frame.cpp
#include "src/websocket_frame.hpp"

#include <utility>

#include <fmt/format.h>

#include "lib/stream/random_bytes.hpp"

namespace jsonl_pipe {

std::string EncodeFrame(WsOpcode opcode, std::string_view payload,
                        std::optional<WsMaskKey> mask, bool fin) {
    std::string out;
    out.reserve(payload.size() + 14);

    out.push_back(static_cast<char>((fin ? 0x80 : 0x00) | static_cast<uint8_t>(opcode)));

    uint8_t mask_bit = mask ? 0x80 : 0x00;
    uint64_t len = payload.size();
    if (len <= 125) {
        out.push_back(static_cast<char>(mask_bit | static_cast<uint8_t>(len)));
    } else if (len <= 0xFFFF) {
        out.push_back(static_cast<char>(mask_bit | 126));
        out.push_back(static_cast<char>((len >> 8) & 0xFF));
        out.push_back(static_cast<char>(len & 0xFF));
    } else {
        out.push_back(static_cast<char>(mask_bit | 127));
        for (int shift = 56; shift >= 0; shift -= 8) {
            out.push_back(static_cast<char>((len >> shift) & 0xFF));
        }
    }

    if (!mask) {
        out.append(payload);
        return out;
    }

    for (uint8_t b : *mask) {
        out.push_back(static_cast<char>(b));
    }
    size_t start = out.size();
    out.append(payload);
    for (size_t i = 0; i < payload.size(); ++i) {
        out[start + i] = static_cast<char>(static_cast<uint8_t>(out[start + i]) ^ (*mask)[i % 4]);
    }
    return out;
}

std::expected<std::string, Error> EncodeClientFrame(WsOpcode opcode, std::string_view payload,
                                                    bool fin) {
    WsMaskKey key{};
    auto drawn = FillRandomBytes(key.data(), key.size(), ErrorCode::ProtocolError, "frame mask");
    if (!drawn) {
        return std::unexpected(std::move(drawn.error()));
    }
    return EncodeFrame(opcode, payload, key, fin);
}

std::string ClosePayload(uint16_t code, std::string_view reason) {
    std::string out;
    out.push_back(static_cast<char>((code >> 8) & 0xFF));
    out.push_back(static_cast<char>(code & 0xFF));
    // Control payloads are limited to 125 bytes
    out.append(reason.substr(0, 123));
    return out;
}

std::pair<uint16_t, std::string> ParseClosePayload(std::string_view payload) {
    if (payload.size() < 2) {
        return {1005, {}};
    }
    uint16_t code = static_cast<uint16_t>((static_cast<uint8_t>(payload[0]) << 8) |
                                          static_cast<uint8_t>(payload[1]));
    return {code, std::string(payload.substr(2))};
}

std::unexpected<Error> WsFrameDecoder::Violation(std::string message, uint16_t close_code) {
    failed_ = true;
    failure_close_code_ = close_code;
    return std::unexpected(Error{ErrorCode::ProtocolError, std::move(message)});
}

void WsFrameDecoder::Reset() {
    buffer_.clear();
    offset_ = 0;
    fragment_opcode_.reset();
    fragment_.clear();
    failed_ = false;
    failure_close_code_ = ws_close::kProtocolError;
}

std::expected<void, Error> WsFrameDecoder::Feed(std::string_view bytes,
                                                const MessageCallback& emit) {
    if (failed_) {
        return std::unexpected(Error{ErrorCode::ProtocolError, "WebSocket decoder has failed"});
    }
    buffer_.append(bytes);

    while (true) {
        size_t avail = buffer_.size() - offset_;
        if (avail < 2) break;

        const auto* p = reinterpret_cast<const uint8_t*>(buffer_.data() + offset_);
        bool fin = (p[0] & 0x80) != 0;
        uint8_t rsv = p[0] & 0x70;
        uint8_t raw_opcode = p[0] & 0x0F;
        bool masked = (p[1] & 0x80) != 0;
        uint64_t len = p[1] & 0x7F;

        if (rsv != 0) {
            return Violation("Reserved bits set without a negotiated extension",
                             ws_close::kProtocolError);
        }
        if (raw_opcode > 0x2 && raw_opcode < 0x8) {
            return Violation(fmt::format("Unknown data opcode 0x{:x}", raw_opcode),
                             ws_close::kProtocolError);
        }
        if (raw_opcode > 0xA) {
            return Violation(fmt::format("Unknown control opcode 0x{:x}", raw_opcode),
                             ws_close::kProtocolError);
        }
        auto opcode = static_cast<WsOpcode>(raw_opcode);
        if (masked != expect_masked_) {
            return Violation(masked ? "Server frames must not be masked"
                                    : "Client frames must be masked",
                             ws_close::kProtocolError);
        }

        size_t header = 2;
        if (len == 126) {
            if (avail < 4) break;
            len = (static_cast<uint64_t>(p[2]) << 8) | p[3];
            header = 4;
        } else if (len == 127) {
            if (avail < 10) break;
            len = 0;
            for (int i = 0; i < 8; ++i) {
                len = (len << 8) | p[2 + i];
            }
            if (len >> 63) {
                return Violation("Frame length has the most significant bit set",
                                 ws_close::kProtocolError);
            }
            header = 10;
        }

        if (IsControl(opcode)) {
            if (!fin) {
                return Violation("Fragmented control frame", ws_close::kProtocolError);
            }
            if (len > 125) {
                return Violation("Control frame payload exceeds 125 bytes",
                                 ws_close::kProtocolError);
            }
        } else {
            size_t so_far = fragment_opcode_ ? fragment_.size() : 0;
            if (len > max_message_size_ || so_far + len > max_message_size_) {
                return Violation(fmt::format("Message exceeds {} bytes", max_message_size_),
                                 ws_close::kMessageTooBig);
            }
        }

        size_t mask_size = masked ? 4 : 0;
        if (avail < header + mask_size + len) break;

        std::string payload(buffer_.data() + offset_ + header + mask_size,
                            static_cast<size_t>(len));
        if (masked) {
            const uint8_t* key = p + header;
            for (size_t i = 0; i < payload.size(); ++i) {
                payload[i] = static_cast<char>(static_cast<uint8_t>(payload[i]) ^ key[i % 4]);
            }
        }
        offset_ += header + mask_size + static_cast<size_t>(len);

        if (IsControl(opcode)) {
            emit(WsMessage{opcode, std::move(payload)});
        } else if (opcode == WsOpcode::Continuation) {
            if (!fragment_opcode_) {
                return Violation("Continuation frame without a started message",
                                 ws_close::kProtocolError);
            }
            fragment_.append(payload);
            if (fin) {
                WsMessage message{*fragment_opcode_, std::move(fragment_)};
                fragment_.clear();
                fragment_opcode_.reset();
                emit(std::move(message));
            }
        } else {
            if (fragment_opcode_) {
                return Violation("New data frame while a fragmented message is open",
                                 ws_close::kProtocolError);
            }
            if (fin) {
                emit(WsMessage{opcode, std::move(payload)});
            } else {
                fragment_opcode_ = opcode;
                fragment_ = std::move(payload);
            }
        }
    }

    // Compact consumed bytes
    if (offset_ > 0) {
        buffer_.erase(0, offset_);
        offset_ = 0;
    }
    return {};
}

}  // namespace jsonl_pipe
