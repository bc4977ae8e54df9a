// SPDX-License-Identifier: MIT

// tests/websocket_frame_test.cpp
#include <gtest/gtest.h>

#include <array>
#include <string>
#include <vector>

#include "lib/stream/random_bytes.hpp"
#include "src/websocket_frame.hpp"

using namespace jsonl_pipe;

namespace {

const WsMaskKey kKey = {0x37, 0xfa, 0x21, 0x3d};

}  // namespace

class WsFrameDecoderTest : public ::testing::Test {
protected:
    std::expected<void, Error> Feed(std::string_view bytes) {
        return decoder_.Feed(bytes, [this](WsMessage m) { messages_.push_back(std::move(m)); });
    }

    WsFrameDecoder decoder_;
    std::vector<WsMessage> messages_;
};

TEST(WsFrameEncodeTest, ShortUnmaskedText) {
    // RFC 6455 5.7: single-frame unmasked "Hello"
    EXPECT_EQ(EncodeFrame(WsOpcode::Text, "Hello", std::nullopt),
              std::string("\x81\x05Hello"));
}

TEST(WsFrameEncodeTest, ShortMaskedText) {
    // RFC 6455 5.7: single-frame masked "Hello"
    EXPECT_EQ(EncodeFrame(WsOpcode::Text, "Hello", kKey),
              std::string("\x81\x85\x37\xfa\x21\x3d\x7f\x9f\x4d\x51\x58"));
}

TEST(WsFrameEncodeTest, ExtendedLengths) {
    std::string medium(200, 'm');
    auto frame = EncodeFrame(WsOpcode::Binary, medium, std::nullopt);
    ASSERT_EQ(frame.size(), 4u + 200u);
    EXPECT_EQ(static_cast<uint8_t>(frame[1]), 126);
    EXPECT_EQ(static_cast<uint8_t>(frame[2]), 0x00);
    EXPECT_EQ(static_cast<uint8_t>(frame[3]), 200);

    std::string large(70000, 'l');
    frame = EncodeFrame(WsOpcode::Binary, large, std::nullopt);
    ASSERT_EQ(frame.size(), 10u + 70000u);
    EXPECT_EQ(static_cast<uint8_t>(frame[1]), 127);
    EXPECT_EQ(static_cast<uint8_t>(frame[7]), 0x01);
    EXPECT_EQ(static_cast<uint8_t>(frame[8]), 0x11);
    EXPECT_EQ(static_cast<uint8_t>(frame[9]), 0x70);
}

TEST(WsFrameEncodeTest, ClientFramesAreMasked) {
    auto encoded = EncodeClientFrame(WsOpcode::Ping, "hb");
    ASSERT_TRUE(encoded.has_value()) << encoded.error().message;
    const std::string& frame = *encoded;
    ASSERT_EQ(frame.size(), 2u + 4u + 2u);
    EXPECT_EQ(static_cast<uint8_t>(frame[0]), 0x89);
    EXPECT_EQ(static_cast<uint8_t>(frame[1]), 0x82);

    WsFrameDecoder server_side(WsFrameDecoder::kDefaultMaxMessageSize, /*expect_masked=*/true);
    std::vector<WsMessage> got;
    ASSERT_TRUE(server_side.Feed(frame, [&](WsMessage m) { got.push_back(std::move(m)); }));
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].opcode, WsOpcode::Ping);
    EXPECT_EQ(got[0].payload, "hb");
}

TEST(WsFrameEncodeTest, EachClientFrameDrawsAFreshMask) {
    auto a = EncodeClientFrame(WsOpcode::Text, "same");
    auto b = EncodeClientFrame(WsOpcode::Text, "same");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_NE(a->substr(2, 4), b->substr(2, 4));

    std::array<unsigned char, 32> x{};
    std::array<unsigned char, 32> y{};
    ASSERT_TRUE(FillRandomBytes(x.data(), x.size(), ErrorCode::ProtocolError, "test").has_value());
    ASSERT_TRUE(FillRandomBytes(y.data(), y.size(), ErrorCode::ProtocolError, "test").has_value());
    EXPECT_NE(x, y);
}

TEST(WsFrameEncodeTest, ClosePayloadRoundTrip) {
    auto payload = ClosePayload(ws_close::kNormal, "bye");
    EXPECT_EQ(payload, std::string("\x03\xe8" "bye"));
    auto [code, reason] = ParseClosePayload(payload);
    EXPECT_EQ(code, 1000);
    EXPECT_EQ(reason, "bye");

    EXPECT_EQ(ParseClosePayload("").first, 1005);
    EXPECT_LE(ClosePayload(1001, std::string(300, 'r')).size(), 125u);
}

TEST_F(WsFrameDecoderTest, SingleFrame) {
    ASSERT_TRUE(Feed(std::string("\x81\x05Hello")));
    ASSERT_EQ(messages_.size(), 1u);
    EXPECT_EQ(messages_[0].opcode, WsOpcode::Text);
    EXPECT_EQ(messages_[0].payload, "Hello");
    EXPECT_EQ(decoder_.Pending(), 0u);
}

TEST_F(WsFrameDecoderTest, ByteAtATime) {
    std::string stream = EncodeFrame(WsOpcode::Text, std::string(300, 'x'), std::nullopt) +
                         EncodeFrame(WsOpcode::Text, "{\"id\":1}\n", std::nullopt);
    for (char c : stream) {
        ASSERT_TRUE(Feed(std::string_view(&c, 1)));
    }
    ASSERT_EQ(messages_.size(), 2u);
    EXPECT_EQ(messages_[0].payload.size(), 300u);
    EXPECT_EQ(messages_[1].payload, "{\"id\":1}\n");
}

TEST_F(WsFrameDecoderTest, FragmentsJoinedWithInterleavedControl) {
    // RFC 6455 5.7: fragmented "Hel" + "lo", with a ping in between
    std::string stream = std::string("\x01\x03Hel") +
                         EncodeFrame(WsOpcode::Ping, "p", std::nullopt) +
                         std::string("\x80\x02lo");
    ASSERT_TRUE(Feed(stream));
    ASSERT_EQ(messages_.size(), 2u);
    EXPECT_EQ(messages_[0].opcode, WsOpcode::Ping);
    EXPECT_EQ(messages_[1].opcode, WsOpcode::Text);
    EXPECT_EQ(messages_[1].payload, "Hello");
}

TEST_F(WsFrameDecoderTest, MaskedServerFrameRejected) {
    auto result = Feed(EncodeFrame(WsOpcode::Text, "x", kKey));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ProtocolError);
    EXPECT_TRUE(decoder_.IsFailed());
    EXPECT_EQ(decoder_.FailureCloseCode(), ws_close::kProtocolError);

    // Latched until Reset()
    EXPECT_FALSE(Feed(std::string("\x81\x01y")).has_value());
    decoder_.Reset();
    EXPECT_TRUE(Feed(std::string("\x81\x01y")).has_value());
    ASSERT_EQ(messages_.size(), 1u);
}

TEST_F(WsFrameDecoderTest, ReservedBitsRejected) {
    EXPECT_FALSE(Feed(std::string("\xC1\x01x")).has_value());
}

TEST_F(WsFrameDecoderTest, UnknownOpcodeRejected) {
    EXPECT_FALSE(Feed(std::string("\x83\x00", 2)).has_value());
    decoder_.Reset();
    EXPECT_FALSE(Feed(std::string("\x8B\x00", 2)).has_value());
}

TEST_F(WsFrameDecoderTest, ControlFrameRules) {
    EXPECT_FALSE(Feed(std::string("\x09\x00", 2)).has_value());  // fragmented ping
    decoder_.Reset();
    EXPECT_FALSE(Feed(EncodeFrame(WsOpcode::Ping, std::string(126, 'p'), std::nullopt)).has_value());
}

TEST_F(WsFrameDecoderTest, ContinuationWithoutStartRejected) {
    EXPECT_FALSE(Feed(std::string("\x80\x01x")).has_value());
}

TEST_F(WsFrameDecoderTest, NewMessageMidFragmentRejected) {
    EXPECT_FALSE(Feed(std::string("\x01\x01" "a" "\x81\x01" "b")).has_value());
}

TEST_F(WsFrameDecoderTest, OversizedMessageRejected) {
    WsFrameDecoder small(8);
    auto result = small.Feed(EncodeFrame(WsOpcode::Text, "123456789", std::nullopt),
                             [](WsMessage) {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(small.FailureCloseCode(), ws_close::kMessageTooBig);

    // Limit applies to the reassembled message too
    WsFrameDecoder fragmented(8);
    std::string stream = EncodeFrame(WsOpcode::Text, "12345", std::nullopt, false) +
                         EncodeFrame(WsOpcode::Continuation, "6789", std::nullopt);
    EXPECT_FALSE(fragmented.Feed(stream, [](WsMessage) {}).has_value());
}

TEST_F(WsFrameDecoderTest, PartialHeaderWaits) {
    std::string frame = EncodeFrame(WsOpcode::Text, std::string(200, 'z'), std::nullopt);
    ASSERT_TRUE(Feed(frame.substr(0, 3)));
    EXPECT_TRUE(messages_.empty());
    EXPECT_EQ(decoder_.Pending(), 3u);
    ASSERT_TRUE(Feed(frame.substr(3)));
    ASSERT_EQ(messages_.size(), 1u);
}
