// SPDX-License-Identifier: MIT

// src/event_stream_client.cpp
#include "src/event_stream_client.hpp"

#include <iterator>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/http_request_builder.hpp"

namespace jsonl_pipe {

// Sink

void EventStreamClient::Sink::OnHeaders(int status, const HttpHeaders& headers) {
    if (!valid_) return;
    client_->HandleHeaders(status, headers);
}

void EventStreamClient::Sink::OnData(BufferChain& chain) {
    if (!valid_) {
        chain.Clear();
        return;
    }
    client_->HandleBody(chain);
}

void EventStreamClient::Sink::OnError(const Error& e) {
    if (!valid_) return;
    client_->HandleStreamError(e);
}

void EventStreamClient::Sink::OnDone() {
    if (!valid_) return;
    client_->HandleStreamEnd();
}

void EventStreamClient::ExchangeSink::OnError(const Error& e) {
    if (!valid_) return;
    client_->CompleteExchange(id_, std::unexpected(e));
}

void EventStreamClient::ExchangeSink::OnDone() {
    if (!valid_) return;
    client_->CompleteExchange(id_, {});
}

// EventStreamClient

EventStreamClient::EventStreamClient(IEventLoop& loop, TransportConfig config)
    : TransportClient(loop, std::move(config)), framer_(config_.line.max_buffer_size) {}

EventStreamClient::~EventStreamClient() {
    Teardown();
    AbortExchanges(Error{ErrorCode::Cancelled, "Client destroyed"}, /*notify=*/false);
}

std::expected<void, Error> EventStreamClient::OpenTransport(const Endpoint& endpoint) {
    Teardown();
    framer_.Reset();

    sink_ = std::make_shared<Sink>(this);
    reader_ = ReaderType::Create(loop_, sink_);
    std::weak_ptr<Sink> weak_sink = sink_;
    reader_->OnHeaders([weak_sink](int status, const HttpHeaders& headers) {
        if (auto sink = weak_sink.lock()) {
            sink->OnHeaders(status, headers);
        }
    });

    connection_ = std::make_unique<StreamConnection<ReaderType>>(loop_, reader_, config_.tls);
    return connection_->Open(endpoint, [this]() { SendStreamRequest(); });
}

void EventStreamClient::CloseTransport(bool graceful) {
    Teardown();
    if (graceful) {
        AbortExchanges(Error{ErrorCode::Cancelled, "Client disconnected"}, /*notify=*/true);
    } else {
        AbortExchanges(Error{ErrorCode::ConnectionClosed, "Event stream failed"}, /*notify=*/true);
    }
}

void EventStreamClient::Teardown() {
    if (sink_) sink_->Invalidate();
    if (reader_) reader_->RequestClose();
    connection_.reset();
    reader_.reset();
    sink_.reset();
}

void EventStreamClient::SendStreamRequest() {
    const Endpoint& ep = CurrentEndpoint();
    std::string request;
    HttpRequestBuilder builder(std::back_inserter(request));
    builder.Method("GET")
        .Target(ep.target)
        .Host(ep.host, ep.port, ep.IsSecure())
        .Header("Accept", "text/event-stream")
        .Header("Cache-Control", "no-cache")
        .Header("Connection", "keep-alive");
    if (!framer_.LastEventId().empty()) {
        builder.Header("Last-Event-ID", framer_.LastEventId());
    }
    for (const auto& header : config_.headers) {
        builder.Header(header.first, header.second);
    }
    builder.Finish();
    connection_->Write(request);
}

void EventStreamClient::HandleHeaders(int status, const HttpHeaders& headers) {
    if (status == 200) {
        auto content_type = headers.Get("content-type");
        if (content_type && content_type->find("text/event-stream") == std::string_view::npos) {
            Fail(Error{ErrorCode::HttpError,
                       fmt::format("Unexpected Content-Type '{}' for event stream", *content_type)});
            return;
        }
        MarkConnected();
        return;
    }
    if (status < 300) {
        Fail(Error{ErrorCode::HttpError,
                   fmt::format("Unexpected status {} for event stream", status)});
    }
    // Error statuses are reported by the reader once the body is in
}

void EventStreamClient::HandleBody(BufferChain& chain) {
    // Copy out: a consumer may tear the connection down mid-chunk
    std::string bytes = chain.ToString();
    chain.Clear();

    framer_.Feed(
        bytes,
        [this](ServerEvent event) {
            if (event.data.empty()) return;
            event.data.push_back('\n');
            DeliverBytes(event.data);
        },
        [this](Error overflow) { ReportOverflow(std::move(overflow)); });
}

void EventStreamClient::HandleStreamError(const Error& e) {
    Fail(e);
}

void EventStreamClient::HandleStreamEnd() {
    Fail(Error{ErrorCode::ConnectionClosed, "Event stream closed by server", 0,
               framer_.RetryHint()});
}

void EventStreamClient::SendPayload(std::string payload, SendCallback on_sent) {
    uint64_t id = next_exchange_id_++;

    auto exchange = std::make_unique<Exchange>();
    exchange->sink = std::make_shared<ExchangeSink>(this, id);
    exchange->reader = ExchangeReaderType::Create(loop_, exchange->sink);
    exchange->connection = std::make_unique<StreamConnection<ExchangeReaderType>>(
        loop_, exchange->reader, config_.tls);
    exchange->on_sent = std::move(on_sent);
    exchange->timeout = std::make_unique<Timer>(loop_);
    exchange->timeout->OnTimer([this, id]() {
        CompleteExchange(id, std::unexpected(Error{ErrorCode::Timeout, "Request timed out"}));
    });

    const Endpoint& ep = CurrentEndpoint();
    std::string request;
    HttpRequestBuilder builder(std::back_inserter(request));
    builder.Method("POST")
        .Target(ep.target)
        .Host(ep.host, ep.port, ep.IsSecure())
        .Header("Accept", "application/json")
        .Header("Connection", "close");
    for (const auto& header : config_.headers) {
        builder.Header(header.first, header.second);
    }
    builder.JsonBody(payload).Finish();

    auto* connection = exchange->connection.get();
    auto opened = connection->Open(ep, [connection, request = std::move(request)]() {
        connection->Write(request);
    });

    Exchange* raw = exchange.get();
    exchanges_.emplace(id, std::move(exchange));

    if (!opened) {
        std::weak_ptr<TransportClient> weak_self = weak_from_this();
        loop_.Defer([weak_self, id, e = std::move(opened.error())]() {
            if (auto self = weak_self.lock()) {
                std::static_pointer_cast<EventStreamClient>(self)->CompleteExchange(
                    id, std::unexpected(e));
            }
        });
        return;
    }
    raw->timeout->Start(config_.connect_timeout);
}

void EventStreamClient::CompleteExchange(uint64_t id, std::expected<void, Error> result) {
    auto it = exchanges_.find(id);
    if (it == exchanges_.end()) return;

    std::shared_ptr<Exchange> exchange(std::move(it->second));
    exchanges_.erase(it);

    exchange->sink->Invalidate();
    exchange->timeout->Stop();
    exchange->reader->RequestClose();
    exchange->connection->Close();
    auto on_sent = std::move(exchange->on_sent);

    // May be inside one of the exchange's own callbacks
    loop_.Defer([exchange]() {});

    on_sent(std::move(result));
}

void EventStreamClient::AbortExchanges(const Error& e, bool notify) {
    if (exchanges_.empty()) return;

    std::vector<SendCallback> callbacks;
    std::vector<std::shared_ptr<Exchange>> retired;
    for (auto& [id, exchange] : exchanges_) {
        exchange->sink->Invalidate();
        exchange->timeout->Stop();
        exchange->reader->RequestClose();
        exchange->connection->Close();
        callbacks.push_back(std::move(exchange->on_sent));
        retired.emplace_back(std::move(exchange));
    }
    exchanges_.clear();

    if (!notify) {
        callbacks.clear();
    }
    loop_.Defer([retired = std::move(retired), callbacks = std::move(callbacks), e]() {
        for (const auto& cb : callbacks) {
            cb(std::unexpected(e));
        }
    });
}

}  // namespace jsonl_pipe
