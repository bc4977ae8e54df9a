// SPDX-License-Identifier: MIT

// lib/stream/http_request_builder.hpp
#pragma once

#include <cstdint>
#include <iterator>
#include <string_view>

#include <fmt/format.h>

namespace jsonl_pipe {

// HttpRequestBuilder - Builds HTTP/1.1 requests to any output iterator
//
// Template parameter OutputIt must be an output iterator accepting char.
//
// Usage:
//   std::string out;
//   HttpRequestBuilder(std::back_inserter(out))
//       .Method("GET")
//       .Target("/v1/stream?cursor=42")
//       .Host("events.example.com", 443, /*secure=*/true)
//       .Header("Accept", "text/event-stream")
//       .Finish();
//
template<typename OutputIt>
class HttpRequestBuilder {
public:
    explicit HttpRequestBuilder(OutputIt out) : out_(out) {}

    HttpRequestBuilder& Method(std::string_view method) {
        out_ = fmt::format_to(out_, "{}", method);
        return *this;
    }

    // Request target (origin-form: path plus optional query)
    HttpRequestBuilder& Target(std::string_view target) {
        out_ = fmt::format_to(out_, " {}", target.empty() ? std::string_view("/") : target);
        return *this;
    }

    HttpRequestBuilder& Host(std::string_view host) {
        EnsureHeadersStarted();
        out_ = fmt::format_to(out_, "Host: {}\r\n", host);
        return *this;
    }

    // Host header omitting the scheme's default port
    HttpRequestBuilder& Host(std::string_view host, uint16_t port, bool secure) {
        EnsureHeadersStarted();
        bool bracket = host.find(':') != std::string_view::npos;  // IPv6 literal
        std::string_view open = bracket ? "[" : "";
        std::string_view close = bracket ? "]" : "";
        if (port == (secure ? 443 : 80)) {
            out_ = fmt::format_to(out_, "Host: {}{}{}\r\n", open, host, close);
        } else {
            out_ = fmt::format_to(out_, "Host: {}{}{}:{}\r\n", open, host, close, port);
        }
        return *this;
    }

    HttpRequestBuilder& Header(std::string_view name, std::string_view value) {
        EnsureHeadersStarted();
        out_ = fmt::format_to(out_, "{}: {}\r\n", name, value);
        return *this;
    }

    // JSON body: writes Content-Type and Content-Length, then the body
    HttpRequestBuilder& JsonBody(std::string_view body) {
        EnsureHeadersStarted();
        out_ = fmt::format_to(out_, "Content-Type: application/json\r\n");
        out_ = fmt::format_to(out_, "Content-Length: {}\r\n\r\n", body.size());
        out_ = fmt::format_to(out_, "{}", body);
        body_written_ = true;
        return *this;
    }

    // Finish the request (writes the blank line if no body was written)
    void Finish() {
        EnsureHeadersStarted();
        if (!body_written_) {
            out_ = fmt::format_to(out_, "\r\n");
        }
    }

    OutputIt GetIterator() const { return out_; }

private:
    void EnsureHeadersStarted() {
        if (!headers_started_) {
            out_ = fmt::format_to(out_, " HTTP/1.1\r\n");
            headers_started_ = true;
        }
    }

    OutputIt out_;
    bool headers_started_ = false;
    bool body_written_ = false;
};

template<typename OutputIt>
HttpRequestBuilder(OutputIt) -> HttpRequestBuilder<OutputIt>;

}  // namespace jsonl_pipe
