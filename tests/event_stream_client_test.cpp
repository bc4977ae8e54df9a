// SPDX-License-Identifier: MIT

// tests/event_stream_client_test.cpp
#include <gtest/gtest.h>

#include <sys/socket.h>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "lib/stream/endpoint.hpp"
#include "lib/stream/epoll_event_loop.hpp"
#include "src/event_stream_client.hpp"
#include "tests/loopback_server.hpp"

using namespace jsonl_pipe;
using namespace jsonl_pipe::testing_support;

namespace {

constexpr std::string_view kStreamHeaders =
    "HTTP/1.1 200 OK\r\nContent-Type: text/event-stream\r\nCache-Control: no-cache\r\n\r\n";

bool RunUntil(EpollEventLoop& loop, const std::function<bool()>& done,
              std::chrono::milliseconds timeout = std::chrono::seconds{5}) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        loop.Poll(10);
    }
    return true;
}

Endpoint MustParse(const std::string& url) {
    auto ep = ParseEndpoint(url);
    EXPECT_TRUE(ep.has_value());
    return *ep;
}

}  // namespace

class EventStreamClientTest : public ::testing::Test {
protected:
    void Connect(std::shared_ptr<EventStreamClient>& client) {
        client->Connect(MustParse(server_.Url("http", "/events?topic=t")),
                        [this](std::expected<void, Error> r) { connect_result_ = r; });
    }

    EpollEventLoop loop_;
    LoopbackServer server_;
    std::optional<std::expected<void, Error>> connect_result_;
};

TEST_F(EventStreamClientTest, ReceivesMessagesFromEvents) {
    std::string request;
    server_.Serve([&](int fd) {
        request = ReadUntil(fd, "\r\n\r\n");
        WriteAll(fd, kStreamHeaders);
        WriteAll(fd, "data: {\"id\":1,\"result\":true}\n\n");
        WriteAll(fd, ": heartbeat\n\n");
        WriteAll(fd, "event: batch\ndata: {\"method\":\"tick\"}\ndata: {\"method\":\"tock\"}\n\n");
        WaitForPeerClose(fd);
    });

    TransportConfig config;
    config.headers = {{"Authorization", "Bearer k"}};
    auto client = EventStreamClient::Create(loop_, config);
    EXPECT_EQ(client->Name(), "sse");

    std::vector<TransportClient::Message> messages;
    std::optional<std::optional<Error>> ended;
    Connect(client);
    ASSERT_TRUE(RunUntil(loop_, [&] { return connect_result_.has_value(); }));
    ASSERT_TRUE(connect_result_->has_value());
    EXPECT_TRUE(client->State().Is(ConnectionState::Phase::Connected));

    ASSERT_TRUE(client->ReceiveStream(
        [&](TransportClient::Message m) { messages.push_back(std::move(m)); },
        [&](std::optional<Error> e) { ended = std::move(e); }).has_value());
    ASSERT_TRUE(RunUntil(loop_, [&] { return messages.size() == 3; }));

    EXPECT_TRUE(messages[0].value.IsResponse());
    EXPECT_EQ(*messages[1].value.method, "tick");
    EXPECT_EQ(*messages[2].value.method, "tock");
    EXPECT_EQ(client->Counters().messages_decoded, 3u);

    client->Disconnect();
    EXPECT_TRUE(client->State().Is(ConnectionState::Phase::Disconnected));
    ASSERT_TRUE(ended.has_value());
    EXPECT_FALSE(ended->has_value());

    server_.Stop();
    EXPECT_NE(request.find("GET /events?topic=t HTTP/1.1\r\n"), std::string::npos);
    EXPECT_NE(request.find("Accept: text/event-stream\r\n"), std::string::npos);
    EXPECT_NE(request.find("Authorization: Bearer k\r\n"), std::string::npos);
}

TEST_F(EventStreamClientTest, MessagesBeforeConsumerAreHeld) {
    server_.Serve([&](int fd) {
        ReadUntil(fd, "\r\n\r\n");
        WriteAll(fd, kStreamHeaders);
        WriteAll(fd, "data: {\"id\":1}\n\ndata: {\"id\":2}\n\n");
        WaitForPeerClose(fd);
    });

    auto client = EventStreamClient::Create(loop_);
    Connect(client);
    ASSERT_TRUE(RunUntil(loop_, [&] { return client->Counters().messages_decoded == 2; }));

    std::vector<int64_t> ids;
    ASSERT_TRUE(client->ReceiveStream(
        [&](TransportClient::Message m) { ids.push_back(std::get<int64_t>(*m.value.id)); },
        [](std::optional<Error>) {}).has_value());
    EXPECT_EQ(ids, (std::vector<int64_t>{1, 2}));

    auto second = client->ReceiveStream([](TransportClient::Message) {},
                                        [](std::optional<Error>) {});
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, ErrorCode::InvalidState);
    client->Disconnect();
}

TEST_F(EventStreamClientTest, MalformedRecordIsDiagnosedAndSkipped) {
    server_.Serve([&](int fd) {
        ReadUntil(fd, "\r\n\r\n");
        WriteAll(fd, kStreamHeaders);
        WriteAll(fd, "data: {\"id\":1}\n\ndata: {broken\n\ndata: {\"id\":2}\n\n");
        WaitForPeerClose(fd);
    });

    auto client = EventStreamClient::Create(loop_);
    std::vector<StreamDiagnostic> diagnostics;
    client->OnDiagnostic([&](const StreamDiagnostic& d) { diagnostics.push_back(d); });

    std::vector<int64_t> ids;
    Connect(client);
    ASSERT_TRUE(RunUntil(loop_, [&] { return connect_result_.has_value(); }));
    ASSERT_TRUE(client->ReceiveStream(
        [&](TransportClient::Message m) { ids.push_back(std::get<int64_t>(*m.value.id)); },
        [](std::optional<Error>) {}).has_value());
    ASSERT_TRUE(RunUntil(loop_, [&] { return ids.size() == 2; }));

    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].error.code, ErrorCode::ParseError);
    EXPECT_EQ(diagnostics[0].raw_line, "{broken");
    EXPECT_EQ(client->Counters().decode_failures, 1u);
    EXPECT_TRUE(client->State().Is(ConnectionState::Phase::Connected));
    client->Disconnect();
}

TEST_F(EventStreamClientTest, OversizedLineIsDroppedAndStreamContinues) {
    server_.Serve([&](int fd) {
        ReadUntil(fd, "\r\n\r\n");
        WriteAll(fd, kStreamHeaders);
        WriteAll(fd, "data: {\"id\":1}\n\n");
        WriteAll(fd, "data: " + std::string(4096, 'x'));
        WriteAll(fd, "\n\ndata: {\"id\":2}\n\n");
        WaitForPeerClose(fd);
    });

    TransportConfig config;
    config.line.max_buffer_size = 256;
    auto client = EventStreamClient::Create(loop_, config);
    std::vector<StreamDiagnostic> diagnostics;
    client->OnDiagnostic([&](const StreamDiagnostic& d) { diagnostics.push_back(d); });

    std::vector<int64_t> ids;
    Connect(client);
    ASSERT_TRUE(RunUntil(loop_, [&] { return connect_result_.has_value(); }));
    ASSERT_TRUE(client->ReceiveStream(
        [&](TransportClient::Message m) { ids.push_back(std::get<int64_t>(*m.value.id)); },
        [](std::optional<Error>) {}).has_value());
    ASSERT_TRUE(RunUntil(loop_, [&] { return ids.size() == 2; }));

    EXPECT_EQ(ids, (std::vector<int64_t>{1, 2}));
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].error.code, ErrorCode::BufferOverflow);
    EXPECT_EQ(client->Counters().overflows, 1u);
    EXPECT_TRUE(client->State().Is(ConnectionState::Phase::Connected));
    client->Disconnect();
}

TEST_F(EventStreamClientTest, EventWithoutTerminatorIsDropped) {
    server_.Serve([&](int fd) {
        ReadUntil(fd, "\r\n\r\n");
        WriteAll(fd, kStreamHeaders);
        std::string endless;
        for (int i = 0; i < 200; ++i) endless += "data: {\"id\":1}\n";
        WriteAll(fd, endless);
        WriteAll(fd, "\ndata: {\"id\":2}\n\n");
        WaitForPeerClose(fd);
    });

    TransportConfig config;
    config.line.max_buffer_size = 256;
    auto client = EventStreamClient::Create(loop_, config);
    std::vector<StreamDiagnostic> diagnostics;
    client->OnDiagnostic([&](const StreamDiagnostic& d) { diagnostics.push_back(d); });

    std::vector<int64_t> ids;
    Connect(client);
    ASSERT_TRUE(RunUntil(loop_, [&] { return connect_result_.has_value(); }));
    ASSERT_TRUE(client->ReceiveStream(
        [&](TransportClient::Message m) { ids.push_back(std::get<int64_t>(*m.value.id)); },
        [](std::optional<Error>) {}).has_value());
    ASSERT_TRUE(RunUntil(loop_, [&] { return !ids.empty(); }));

    EXPECT_EQ(ids, (std::vector<int64_t>{2}));
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics[0].error.code, ErrorCode::BufferOverflow);
    client->Disconnect();
}

TEST_F(EventStreamClientTest, OversizedLineFailsUnderFailFast) {
    server_.Serve([&](int fd) {
        ReadUntil(fd, "\r\n\r\n");
        WriteAll(fd, kStreamHeaders);
        WriteAll(fd, "data: " + std::string(4096, 'x'));
        WaitForPeerClose(fd);
    });

    TransportConfig config;
    config.line.max_buffer_size = 256;
    config.line.overflow_policy = OverflowPolicy::FailFast;
    auto client = EventStreamClient::Create(loop_, config);
    client->OnDiagnostic([](const StreamDiagnostic&) {});

    std::optional<std::optional<Error>> ended;
    Connect(client);
    ASSERT_TRUE(RunUntil(loop_, [&] { return connect_result_.has_value(); }));
    ASSERT_TRUE(client->ReceiveStream([](TransportClient::Message) {},
                                      [&](std::optional<Error> e) { ended = std::move(e); })
                    .has_value());
    ASSERT_TRUE(RunUntil(loop_, [&] { return ended.has_value(); }));

    ASSERT_TRUE(ended->has_value());
    EXPECT_EQ((*ended)->code, ErrorCode::BufferOverflow);
    EXPECT_TRUE(client->State().Is(ConnectionState::Phase::Failed));
}

TEST_F(EventStreamClientTest, ServerCloseFailsWithRetryHint) {
    server_.Serve([&](int fd) {
        ReadUntil(fd, "\r\n\r\n");
        WriteAll(fd, kStreamHeaders);
        WriteAll(fd, "retry: 1500\ndata: {\"id\":1}\n\n");
        // Returning closes the stream
    });

    auto client = EventStreamClient::Create(loop_);
    std::optional<std::optional<Error>> ended;
    int messages = 0;
    Connect(client);
    ASSERT_TRUE(RunUntil(loop_, [&] { return connect_result_.has_value(); }));
    ASSERT_TRUE(client->ReceiveStream([&](TransportClient::Message) { ++messages; },
                                      [&](std::optional<Error> e) { ended = std::move(e); })
                    .has_value());
    ASSERT_TRUE(RunUntil(loop_, [&] { return ended.has_value(); }));

    EXPECT_EQ(messages, 1);
    ASSERT_TRUE(ended->has_value());
    EXPECT_EQ((*ended)->code, ErrorCode::ConnectionClosed);
    ASSERT_TRUE((*ended)->retry_after.has_value());
    EXPECT_EQ(*(*ended)->retry_after, std::chrono::milliseconds{1500});

    ASSERT_NE(client->State().failure(), nullptr);
    EXPECT_EQ(client->State().failure()->code, ErrorCode::ConnectionClosed);
    EXPECT_TRUE(client->State().CanConnect());
}

TEST_F(EventStreamClientTest, ErrorStatusFailsConnect) {
    server_.Serve([&](int fd) {
        ReadUntil(fd, "\r\n\r\n");
        WriteAll(fd, "HTTP/1.1 503 Service Unavailable\r\nContent-Length: 4\r\n\r\nbusy");
        WaitForPeerClose(fd, std::chrono::milliseconds{500});
    });

    auto client = EventStreamClient::Create(loop_);
    Connect(client);
    ASSERT_TRUE(RunUntil(loop_, [&] { return connect_result_.has_value(); }));
    ASSERT_FALSE(connect_result_->has_value());
    EXPECT_EQ(connect_result_->error().code, ErrorCode::ServerError);
    EXPECT_TRUE(client->State().Is(ConnectionState::Phase::Failed));
}

TEST_F(EventStreamClientTest, WrongContentTypeRejected) {
    server_.Serve([&](int fd) {
        ReadUntil(fd, "\r\n\r\n");
        WriteAll(fd, "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\n\r\n{}");
        WaitForPeerClose(fd, std::chrono::milliseconds{500});
    });

    auto client = EventStreamClient::Create(loop_);
    Connect(client);
    ASSERT_TRUE(RunUntil(loop_, [&] { return connect_result_.has_value(); }));
    ASSERT_FALSE(connect_result_->has_value());
    EXPECT_EQ(connect_result_->error().code, ErrorCode::HttpError);
}

TEST_F(EventStreamClientTest, SilentServerTimesOut) {
    server_.Serve([&](int fd) { WaitForPeerClose(fd); });

    TransportConfig config;
    config.connect_timeout = std::chrono::milliseconds{100};
    auto client = EventStreamClient::Create(loop_, config);
    Connect(client);
    ASSERT_TRUE(RunUntil(loop_, [&] { return connect_result_.has_value(); }));
    ASSERT_FALSE(connect_result_->has_value());
    EXPECT_EQ(connect_result_->error().code, ErrorCode::Timeout);
    EXPECT_TRUE(client->State().Is(ConnectionState::Phase::Failed));
}

TEST_F(EventStreamClientTest, DisconnectWhileConnectingCancels) {
    server_.Serve([&](int fd) { WaitForPeerClose(fd); });

    auto client = EventStreamClient::Create(loop_);
    Connect(client);
    client->Disconnect();
    ASSERT_TRUE(connect_result_.has_value());
    ASSERT_FALSE(connect_result_->has_value());
    EXPECT_EQ(connect_result_->error().code, ErrorCode::Cancelled);
    EXPECT_TRUE(client->State().Is(ConnectionState::Phase::Disconnected));
}

TEST_F(EventStreamClientTest, DoubleDisconnectIsNoop) {
    server_.Serve([&](int fd) {
        ReadUntil(fd, "\r\n\r\n");
        WriteAll(fd, kStreamHeaders);
        WaitForPeerClose(fd);
    });

    auto client = EventStreamClient::Create(loop_);
    std::vector<std::string> transitions;
    client->OnStateChange([&](const ConnectionState& s) { transitions.push_back(s.ToString()); });

    Connect(client);
    ASSERT_TRUE(RunUntil(loop_, [&] { return connect_result_.has_value(); }));
    client->Disconnect();
    client->Disconnect();

    EXPECT_EQ(transitions, (std::vector<std::string>{"connecting", "connected",
                                                     "disconnecting", "disconnected"}));
}

TEST_F(EventStreamClientTest, SendRequiresConnection) {
    auto client = EventStreamClient::Create(loop_);
    StreamRequest request{.id = MessageId(int64_t{1}), .method = "ping", .params = {}};
    auto sent = client->Send(request);
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, ErrorCode::NotConnected);
}

TEST_F(EventStreamClientTest, ConnectTwiceRejected) {
    server_.Serve([&](int fd) { WaitForPeerClose(fd); });

    auto client = EventStreamClient::Create(loop_);
    Connect(client);
    std::optional<std::expected<void, Error>> second;
    client->Connect(MustParse(server_.Url("http")),
                    [&](std::expected<void, Error> r) { second = r; });
    ASSERT_TRUE(RunUntil(loop_, [&] { return second.has_value(); }));
    ASSERT_FALSE(second->has_value());
    EXPECT_EQ(second->error().code, ErrorCode::InvalidState);
    EXPECT_TRUE(client->State().Is(ConnectionState::Phase::Connecting));
    client->Disconnect();
}

TEST_F(EventStreamClientTest, SendPostsRequestOnItsOwnConnection) {
    std::string post;
    server_.Serve([&](int fd) {
        ReadUntil(fd, "\r\n\r\n");
        WriteAll(fd, kStreamHeaders);

        // The POST arrives on a second connection while the stream stays open
        pollfd pfd{server_.listen_fd(), POLLIN, 0};
        if (poll(&pfd, 1, 5000) > 0) {
            int post_fd = accept(server_.listen_fd(), nullptr, nullptr);
            if (post_fd >= 0) {
                post = ReadUntil(post_fd, "}}");
                WriteAll(post_fd, "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\n{}");
                WaitForPeerClose(post_fd, std::chrono::milliseconds{500});
                ::close(post_fd);
            }
        }
        WaitForPeerClose(fd);
    });

    auto client = EventStreamClient::Create(loop_);
    Connect(client);
    ASSERT_TRUE(RunUntil(loop_, [&] { return connect_result_.has_value(); }));
    ASSERT_TRUE(connect_result_->has_value());

    std::optional<std::expected<void, Error>> sent;
    StreamRequest request{.id = MessageId(int64_t{5}),
                          .method = "subscribe",
                          .params = {{"topic", std::string("t")}}};
    ASSERT_TRUE(client->Send(request, [&](std::expected<void, Error> r) { sent = r; }).has_value());
    EXPECT_EQ(client->PendingSends(), 1u);
    ASSERT_TRUE(RunUntil(loop_, [&] { return sent.has_value(); }));
    EXPECT_TRUE(sent->has_value());
    EXPECT_EQ(client->PendingSends(), 0u);
    EXPECT_EQ(client->Counters().requests_sent, 1u);

    client->Disconnect();
    server_.Stop();
    EXPECT_NE(post.find("POST /events?topic=t HTTP/1.1\r\n"), std::string::npos);
    EXPECT_NE(post.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_NE(post.find(R"({"id":5,"method":"subscribe","params":{"topic":"t"}})"),
              std::string::npos);
}
