// SPDX-License-Identifier: MIT

// lib/stream/http_response_reader.hpp
#pragma once

#include <llhttp.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/component.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"

namespace jsonl_pipe {

/// Response headers with lowercased names, in arrival order.
class HttpHeaders {
public:
    void Add(std::string name, std::string value) {
        entries_.emplace_back(std::move(name), std::move(value));
    }

    /// First value for a (lowercase) header name.
    std::optional<std::string_view> Get(std::string_view name) const {
        for (const auto& [key, value] : entries_) {
            if (key == name) return std::string_view(value);
        }
        return std::nullopt;
    }

    bool Contains(std::string_view name) const { return Get(name).has_value(); }

    size_t Size() const { return entries_.size(); }

    void Clear() { entries_.clear(); }

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

// HttpResponseReader parses one HTTP/1.1 response with llhttp.
//
// - Status line and headers are reported through the headers callback.
// - Body bytes of 2xx responses stream to downstream as they arrive
//   (chunked, content-length and close-delimited bodies).
// - Status >= 300: the body (capped) becomes the message of an error
//   classified by StatusToErrorCode(), honouring Retry-After.
// - 101 Switching Protocols: every byte after the headers is passed to
//   downstream untouched.
//
// Template parameter D must satisfy the Downstream concept.
template <Downstream D>
class HttpResponseReader : public PipelineComponent<HttpResponseReader<D>, D>,
                           public std::enable_shared_from_this<HttpResponseReader<D>> {
public:
    using HeadersCallback = std::function<void(int status, const HttpHeaders& headers)>;
    using UpstreamWriteCallback = std::function<void(BufferChain)>;

    static std::shared_ptr<HttpResponseReader> Create(IEventLoop& loop,
                                                      std::shared_ptr<D> downstream) {
        struct MakeSharedEnabler : public HttpResponseReader {
            MakeSharedEnabler(IEventLoop& l, std::shared_ptr<D> ds)
                : HttpResponseReader(l, std::move(ds)) {}
        };
        return std::make_shared<MakeSharedEnabler>(loop, std::move(downstream));
    }

    void OnData(BufferChain& data);
    void OnError(const Error& e) { this->PropagateError(e); }
    void OnDone();

    // Requests travel upstream untouched
    void SetUpstreamWriteCallback(UpstreamWriteCallback cb) { upstream_write_ = std::move(cb); }
    void Write(BufferChain data) { upstream_write_(std::move(data)); }

    void OnHeaders(HeadersCallback cb) { on_headers_ = std::move(cb); }

    void DoClose() {
        body_.Clear();
        this->ResetDownstream();
    }

    int StatusCode() const { return status_code_; }
    bool IsMessageComplete() const { return message_complete_; }
    bool IsUpgraded() const { return upgraded_; }
    const HttpHeaders& Headers() const { return headers_; }

    // Map HTTP status code to ErrorCode
    static ErrorCode StatusToErrorCode(int status) {
        if (status == 429) return ErrorCode::RateLimited;
        if (status >= 500) return ErrorCode::ServerError;
        return ErrorCode::HttpError;
    }

private:
    HttpResponseReader(IEventLoop& loop, std::shared_ptr<D> downstream);

    static int OnStatus(llhttp_t* parser, const char* at, size_t len);
    static int OnHeaderField(llhttp_t* parser, const char* at, size_t len);
    static int OnHeaderValue(llhttp_t* parser, const char* at, size_t len);
    static int OnHeadersComplete(llhttp_t* parser);
    static int OnBody(llhttp_t* parser, const char* at, size_t len);
    static int OnMessageComplete(llhttp_t* parser);

    void FinishHeader() {
        if (current_field_.empty()) return;
        if (current_field_ == "retry-after") {
            int seconds = 0;
            auto [ptr, ec] = std::from_chars(current_value_.data(),
                                             current_value_.data() + current_value_.size(),
                                             seconds);
            if (ec == std::errc{} && seconds >= 0) {
                retry_after_ = std::chrono::seconds(seconds);
            }
        }
        headers_.Add(std::move(current_field_), std::move(current_value_));
        current_field_.clear();
        current_value_.clear();
    }

    void EmitHttpStatusError() {
        std::string msg = "HTTP " + std::to_string(status_code_);
        if (!error_body_.empty()) {
            msg += ": " + error_body_;
        }
        this->EmitError(Error{StatusToErrorCode(status_code_), std::move(msg), 0, retry_after_});
        this->RequestClose();
    }

    // Returns true if processing must stop
    bool HandleParseError(llhttp_errno_t err) {
        if (err == HPE_OK) return false;
        // A callback stopped the parser after emitting or closing
        if (err == HPE_USER || this->IsClosed() || this->IsFinalized()) return true;
        std::string msg = std::string("HTTP parse error: ") + llhttp_errno_name(err);
        if (const char* reason = llhttp_get_error_reason(&parser_)) {
            msg += std::string(" (") + reason + ")";
        }
        this->EmitError(Error{ErrorCode::HttpError, std::move(msg)});
        this->RequestClose();
        return true;
    }

    llhttp_t parser_;
    llhttp_settings_t settings_;

    int status_code_ = 0;
    bool headers_complete_ = false;
    bool message_complete_ = false;
    bool upgraded_ = false;

    enum class HeaderState { None, Field, Value };
    HeaderState header_state_ = HeaderState::None;
    std::string current_field_;
    std::string current_value_;
    HttpHeaders headers_;
    std::optional<std::chrono::milliseconds> retry_after_;

    HeadersCallback on_headers_ = [](int, const HttpHeaders&) {};
    UpstreamWriteCallback upstream_write_ = [](BufferChain) {};

    BufferChain body_;
    std::string error_body_;

    static constexpr size_t kMaxErrorBodySize = 4096;
};

// Implementation - must be in header due to template

template <Downstream D>
HttpResponseReader<D>::HttpResponseReader(IEventLoop& loop, std::shared_ptr<D> downstream)
    : PipelineComponent<HttpResponseReader<D>, D>(loop) {
    this->SetDownstream(std::move(downstream));
    llhttp_settings_init(&settings_);
    settings_.on_status = OnStatus;
    settings_.on_header_field = OnHeaderField;
    settings_.on_header_value = OnHeaderValue;
    settings_.on_headers_complete = OnHeadersComplete;
    settings_.on_body = OnBody;
    settings_.on_message_complete = OnMessageComplete;

    llhttp_init(&parser_, HTTP_RESPONSE, &settings_);
    parser_.data = this;
}

template <Downstream D>
void HttpResponseReader<D>::OnData(BufferChain& data) {
    auto guard = this->TryGuard();
    if (!guard) {
        data.Clear();
        return;
    }

    if (upgraded_) {
        this->ForwardData(data);
        data.Clear();
        return;
    }

    while (!data.Empty() && !this->IsClosed()) {
        size_t chunk_size = data.ContiguousSize();
        const char* chunk_ptr = reinterpret_cast<const char*>(data.DataAt(0));

        auto err = llhttp_execute(&parser_, chunk_ptr, chunk_size);

        if (err == HPE_PAUSED_UPGRADE) {
            // Everything after the headers belongs to the upgraded protocol
            const char* pos = llhttp_get_error_pos(&parser_);
            data.Consume(static_cast<size_t>(pos - chunk_ptr));
            upgraded_ = true;
            this->ForwardData(data);
            data.Clear();
            return;
        }

        if (HandleParseError(err)) {
            data.Clear();
            return;
        }
        data.Consume(chunk_size);
    }
    data.Clear();
}

template <Downstream D>
void HttpResponseReader<D>::OnDone() {
    auto guard = this->TryGuard();
    if (!guard) return;

    if (upgraded_) {
        this->EmitDone();
        this->RequestClose();
        return;
    }

    if (!message_complete_) {
        // Close-delimited bodies end here; anything else is truncated
        llhttp_errno_t err = llhttp_finish(&parser_);
        if (HandleParseError(err)) return;
        if (!headers_complete_) {
            this->EmitError(Error{ErrorCode::ConnectionClosed,
                                  "Connection closed before HTTP response headers"});
            this->RequestClose();
            return;
        }
    }

    if (status_code_ >= 300) {
        EmitHttpStatusError();
        return;
    }

    this->EmitDone();
    this->RequestClose();
}

// llhttp callbacks

template <Downstream D>
int HttpResponseReader<D>::OnStatus(llhttp_t* parser, const char*, size_t) {
    auto* self = static_cast<HttpResponseReader*>(parser->data);
    self->status_code_ = static_cast<int>(parser->status_code);
    return 0;
}

template <Downstream D>
int HttpResponseReader<D>::OnHeaderField(llhttp_t* parser, const char* at, size_t len) {
    auto* self = static_cast<HttpResponseReader*>(parser->data);

    if (self->header_state_ == HeaderState::Value) {
        self->FinishHeader();
    }
    // llhttp may split a field across calls
    for (size_t i = 0; i < len; ++i) {
        self->current_field_.push_back(
            static_cast<char>(std::tolower(static_cast<unsigned char>(at[i]))));
    }
    self->header_state_ = HeaderState::Field;
    return 0;
}

template <Downstream D>
int HttpResponseReader<D>::OnHeaderValue(llhttp_t* parser, const char* at, size_t len) {
    auto* self = static_cast<HttpResponseReader*>(parser->data);
    self->current_value_.append(at, len);
    self->header_state_ = HeaderState::Value;
    return 0;
}

template <Downstream D>
int HttpResponseReader<D>::OnHeadersComplete(llhttp_t* parser) {
    auto* self = static_cast<HttpResponseReader*>(parser->data);

    if (self->header_state_ == HeaderState::Value) {
        self->FinishHeader();
    }
    self->header_state_ = HeaderState::None;
    self->headers_complete_ = true;
    self->status_code_ = static_cast<int>(parser->status_code);

    auto on_headers = self->on_headers_;
    on_headers(self->status_code_, self->headers_);
    if (self->IsClosed()) {
        return HPE_USER;  // Owner tore the connection down
    }
    return 0;
}

template <Downstream D>
int HttpResponseReader<D>::OnBody(llhttp_t* parser, const char* at, size_t len) {
    auto* self = static_cast<HttpResponseReader*>(parser->data);

    if (self->status_code_ >= 300) {
        size_t remaining = kMaxErrorBodySize - self->error_body_.size();
        self->error_body_.append(at, std::min(len, remaining));
        return 0;
    }

    self->body_.AppendBytes(at, len, &self->GetAllocator());
    self->ForwardData(self->body_);
    self->body_.Clear();
    return self->IsClosed() ? HPE_USER : 0;
}

template <Downstream D>
int HttpResponseReader<D>::OnMessageComplete(llhttp_t* parser) {
    auto* self = static_cast<HttpResponseReader*>(parser->data);
    self->message_complete_ = true;

    if (self->status_code_ == 101) {
        return 0;  // llhttp pauses with HPE_PAUSED_UPGRADE next
    }
    if (self->status_code_ >= 300) {
        self->EmitHttpStatusError();
        return HPE_USER;
    }

    self->EmitDone();
    self->RequestClose();
    return HPE_USER;  // One response per reader
}

}  // namespace jsonl_pipe
