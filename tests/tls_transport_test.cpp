// SPDX-License-Identifier: MIT

// tests/tls_transport_test.cpp
#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/component.hpp"
#include "lib/stream/epoll_event_loop.hpp"
#include "lib/stream/tls_transport.hpp"

using namespace jsonl_pipe;

// Mock downstream that receives decrypted data
struct MockTlsDownstream {
    std::string received;
    std::optional<Error> last_error;
    bool done = false;

    void OnData(BufferChain& chain) {
        received += chain.ToString();
        chain.Clear();
    }
    void OnError(const Error& e) { last_error = e; }
    void OnDone() { done = true; }
};

static_assert(Downstream<MockTlsDownstream>);

TEST(TlsTransportTest, SatisfiesChainConcepts) {
    // Sits between TcpSocket and the HTTP reader
    static_assert(Upstream<TlsTransport<MockTlsDownstream>>);
    static_assert(Downstream<TlsTransport<MockTlsDownstream>>);
    SUCCEED();
}

TEST(TlsTransportTest, HandshakeNotCompleteInitially) {
    EpollEventLoop loop;
    auto downstream = std::make_shared<MockTlsDownstream>();
    auto tls = TlsTransport<MockTlsDownstream>::Create(loop, downstream);

    ASSERT_NE(tls, nullptr);
    EXPECT_FALSE(tls->IsHandshakeComplete());
    EXPECT_FALSE(tls->IsClosed());
}

TEST(TlsTransportTest, CloseMarksClosed) {
    EpollEventLoop loop;
    auto downstream = std::make_shared<MockTlsDownstream>();
    auto tls = TlsTransport<MockTlsDownstream>::Create(loop, downstream);

    tls->Close();
    EXPECT_TRUE(tls->IsClosed());
    loop.Poll(0);  // Runs the deferred DoClose
}

TEST(TlsTransportTest, StartHandshakeProducesClientHello) {
    EpollEventLoop loop;
    auto downstream = std::make_shared<MockTlsDownstream>();
    auto tls = TlsTransport<MockTlsDownstream>::Create(loop, downstream);

    tls->SetHostname("stream.example.com");

    std::string handshake_data;
    tls->SetUpstreamWriteCallback([&](BufferChain chain) {
        handshake_data += chain.ToString();
    });

    tls->StartHandshake();

    // TLS record header: handshake content type (0x16), version major 3
    ASSERT_GE(handshake_data.size(), 5u);
    EXPECT_EQ(static_cast<unsigned char>(handshake_data[0]), 0x16);
    EXPECT_EQ(static_cast<unsigned char>(handshake_data[1]), 0x03);
}

TEST(TlsTransportTest, PlaintextReplyFailsHandshake) {
    EpollEventLoop loop;
    auto downstream = std::make_shared<MockTlsDownstream>();
    auto tls = TlsTransport<MockTlsDownstream>::Create(loop, downstream);
    tls->StartHandshake();

    // A plain HTTP server answering a TLS client
    auto reply = BufferChain::FromString("HTTP/1.1 400 Bad Request\r\n\r\n");
    tls->OnData(reply);

    ASSERT_TRUE(downstream->last_error.has_value());
    EXPECT_EQ(downstream->last_error->code, ErrorCode::TlsHandshakeFailed);
    EXPECT_TRUE(tls->IsClosed());
    EXPECT_TRUE(downstream->received.empty());
}

TEST(TlsTransportTest, EofDuringHandshakeIsAnError) {
    EpollEventLoop loop;
    auto downstream = std::make_shared<MockTlsDownstream>();
    auto tls = TlsTransport<MockTlsDownstream>::Create(loop, downstream);
    tls->StartHandshake();

    tls->OnDone();

    ASSERT_TRUE(downstream->last_error.has_value());
    EXPECT_EQ(downstream->last_error->code, ErrorCode::TlsHandshakeFailed);
    EXPECT_FALSE(downstream->done);
}

TEST(TlsTransportTest, UpstreamErrorPropagatesOnce) {
    EpollEventLoop loop;
    auto downstream = std::make_shared<MockTlsDownstream>();
    auto tls = TlsTransport<MockTlsDownstream>::Create(loop, downstream);

    tls->OnError(Error{ErrorCode::ConnectionFailed, "reset"});
    tls->OnError(Error{ErrorCode::Timeout, "second"});

    ASSERT_TRUE(downstream->last_error.has_value());
    EXPECT_EQ(downstream->last_error->code, ErrorCode::ConnectionFailed);
}

TEST(TlsTransportTest, MissingCaFileThrows) {
    EpollEventLoop loop;
    auto downstream = std::make_shared<MockTlsDownstream>();
    TlsConfig config;
    config.ca_file = "/nonexistent/ca-bundle.pem";
    EXPECT_THROW(TlsTransport<MockTlsDownstream>::Create(loop, downstream, config),
                 std::runtime_error);
}
