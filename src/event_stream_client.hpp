// SPDX-License-Identifier: MIT

// src/event_stream_client.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/endpoint.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/http_response_reader.hpp"
#include "lib/stream/stream_connection.hpp"
#include "lib/stream/timer.hpp"
#include "src/event_stream_framer.hpp"
#include "src/transport_client.hpp"

namespace jsonl_pipe {

// EventStreamClient - server-sent events transport
//
// Receive: GET <target> with Accept: text/event-stream. A 200 response moves
// the client to connected; the body is framed into events and each event's
// data (one or more JSONL records) feeds the shared receive pipeline. The
// server closing the stream fails the client with ConnectionClosed, carrying
// the server's `retry:` hint as retry_after.
//
// Send: every request is POSTed to the same endpoint on its own connection;
// any 2xx response completes the send callback.
//
// Architecture: TcpSocket -> [TlsTransport] -> HttpResponseReader -> Sink
class EventStreamClient : public TransportClient {
public:
    static std::shared_ptr<EventStreamClient> Create(IEventLoop& loop,
                                                     TransportConfig config = {}) {
        struct MakeSharedEnabler : public EventStreamClient {
            MakeSharedEnabler(IEventLoop& l, TransportConfig c)
                : EventStreamClient(l, std::move(c)) {}
        };
        return std::make_shared<MakeSharedEnabler>(loop, std::move(config));
    }

    ~EventStreamClient() override;

    std::string_view Name() const override { return "sse"; }

    /// Id of the last event seen; sent as Last-Event-ID on the next connect.
    const std::string& LastEventId() const { return framer_.LastEventId(); }

    /// Requests still waiting for their response.
    size_t PendingSends() const { return exchanges_.size(); }

    // Bridges the stream's reader back to the client
    class Sink {
    public:
        explicit Sink(EventStreamClient* client) : client_(client) {}

        void Invalidate() { valid_ = false; }

        void OnHeaders(int status, const HttpHeaders& headers);
        void OnData(BufferChain& chain);
        void OnError(const Error& e);
        void OnDone();

    private:
        EventStreamClient* client_;
        bool valid_ = true;
    };

    // Completes one POST exchange
    class ExchangeSink {
    public:
        ExchangeSink(EventStreamClient* client, uint64_t id) : client_(client), id_(id) {}

        void Invalidate() { valid_ = false; }

        void OnData(BufferChain& chain) { chain.Clear(); }
        void OnError(const Error& e);
        void OnDone();

    private:
        EventStreamClient* client_;
        uint64_t id_;
        bool valid_ = true;
    };

    using ReaderType = HttpResponseReader<Sink>;
    using ExchangeReaderType = HttpResponseReader<ExchangeSink>;

protected:
    EventStreamClient(IEventLoop& loop, TransportConfig config);

    std::expected<void, Error> OpenTransport(const Endpoint& endpoint) override;
    void CloseTransport(bool graceful) override;
    void SendPayload(std::string payload, SendCallback on_sent) override;

private:
    struct Exchange {
        std::shared_ptr<ExchangeSink> sink;
        std::shared_ptr<ExchangeReaderType> reader;
        std::unique_ptr<StreamConnection<ExchangeReaderType>> connection;
        std::unique_ptr<Timer> timeout;
        SendCallback on_sent;
    };

    void SendStreamRequest();
    void HandleHeaders(int status, const HttpHeaders& headers);
    void HandleBody(BufferChain& chain);
    void HandleStreamError(const Error& e);
    void HandleStreamEnd();
    void Teardown();

    void CompleteExchange(uint64_t id, std::expected<void, Error> result);
    void AbortExchanges(const Error& e, bool notify);

    std::shared_ptr<Sink> sink_;
    std::shared_ptr<ReaderType> reader_;
    std::unique_ptr<StreamConnection<ReaderType>> connection_;
    EventStreamFramer framer_;

    uint64_t next_exchange_id_ = 1;
    std::unordered_map<uint64_t, std::unique_ptr<Exchange>> exchanges_;
};

}  // namespace jsonl_pipe
