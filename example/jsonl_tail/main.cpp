// SPDX-License-Identifier: MIT

// example/jsonl_tail/main.cpp
//
// Tail a JSONL stream over SSE or WebSocket and print each message.
//
//   jsonl_tail https://host/events
//   jsonl_tail wss://host/stream --max-pending 5000 -H "Authorization: Bearer x"

#include <signal.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include "lib/stream/endpoint.hpp"
#include "lib/stream/event_loop.hpp"
#include "src/stream_session.hpp"

using namespace jsonl_pipe;

namespace {

std::string Describe(const StreamMessage& message) {
    std::string out;
    if (message.id) out += fmt::format("id={} ", to_string(*message.id));
    if (message.method) out += fmt::format("method={} ", *message.method);
    if (message.params) out += fmt::format("params={} ", *message.params);
    if (message.result) out += fmt::format("result={} ", *message.result);
    if (message.error) {
        out += fmt::format("error={}:{} ", message.error->code, message.error->message);
    }
    if (!out.empty()) out.pop_back();
    return out;
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"jsonl_tail - print a JSONL event stream"};

    std::string url;
    std::string transport;
    size_t max_pending = 1000;
    int interval_us = 1000;
    int connect_timeout_ms = 10000;
    int keepalive_ms = 30000;
    int metrics_ms = 5000;
    uint32_t retries = RetryConfig::ReconnectDefaults().max_retries;
    bool insecure = false;
    std::vector<std::string> headers;

    app.add_option("url", url, "Stream URL (http, https, ws, wss)")->required();
    app.add_option("-t,--transport", transport, "sse | ws (default: from the URL scheme)")
        ->check(CLI::IsMember({"sse", "ws"}));
    app.add_option("--max-pending", max_pending, "Queue capacity before messages are shed")
        ->default_val(max_pending);
    app.add_option("--interval-us", interval_us, "Minimum spacing between consumed messages")
        ->default_val(interval_us);
    app.add_option("--connect-timeout", connect_timeout_ms, "Connect timeout in ms")
        ->default_val(connect_timeout_ms);
    app.add_option("--keepalive", keepalive_ms, "WebSocket ping interval in ms (0 = off)")
        ->default_val(keepalive_ms);
    app.add_option("--metrics", metrics_ms, "Metrics log interval in ms (0 = off)")
        ->default_val(metrics_ms);
    app.add_option("--retries", retries, "Reconnect attempts before giving up")
        ->default_val(retries);
    app.add_option("-H,--header", headers, "Extra request header, \"Name: value\"");
    app.add_flag("--insecure", insecure, "Skip TLS certificate verification");

    CLI11_PARSE(app, argc, argv);

    auto endpoint = ParseEndpoint(url);
    if (!endpoint) {
        fmt::print(stderr, "{}\n", endpoint.error().message);
        return 2;
    }

    SessionConfig config;
    if (transport.empty()) {
        bool ws = endpoint->scheme == Scheme::Ws || endpoint->scheme == Scheme::Wss;
        config.transport = ws ? TransportKind::WebSocket : TransportKind::EventStream;
    } else {
        config.transport = transport == "ws" ? TransportKind::WebSocket : TransportKind::EventStream;
    }
    config.client.connect_timeout = std::chrono::milliseconds{connect_timeout_ms};
    config.client.keepalive_interval = std::chrono::milliseconds{keepalive_ms};
    config.client.tls.verify_peer = !insecure;
    for (const auto& header : headers) {
        auto colon = header.find(':');
        if (colon == std::string::npos || colon == 0) {
            fmt::print(stderr, "Ignoring malformed header '{}'\n", header);
            continue;
        }
        std::string value = header.substr(colon + 1);
        value.erase(0, value.find_first_not_of(' '));
        config.client.headers.emplace_back(header.substr(0, colon), value);
    }
    config.queue.max_pending = max_pending;
    config.queue.processing_interval = std::chrono::microseconds{interval_us};
    if (metrics_ms > 0) {
        config.metrics.sample_interval = std::chrono::milliseconds{metrics_ms};
    }
    config.retry.max_retries = retries;

    // Signals are taken by a dedicated thread
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    EventLoop loop;
    auto session = StreamSession::Create(loop, *endpoint, config);

    session->OnStatus([](const SessionStatus& status) {
        fmt::print(stderr, "[session] {}\n", to_string(status));
    });
    if (metrics_ms > 0) {
        session->OnSample([](const MetricsSample& s) {
            fmt::print(stderr,
                       "[metrics] in={:.1f}/s out={:.1f}/s latency={:.2f}ms queue={} "
                       "failures={} dropped={} health={}{}{}\n",
                       s.ingest_rate, s.consume_rate, s.mean_latency_ms, s.queue_depth,
                       s.decode_failures, s.dropped, to_string(s.health),
                       s.health_reason.empty() ? "" : " ", s.health_reason);
        });
    }

    std::atomic<bool> done{false};

    std::thread consumer([&]() {
        while (auto entry = session->Next()) {
            if (auto* message = std::get_if<DecodedMessage<StreamMessage>>(&*entry)) {
                fmt::print("{}\n", Describe(message->value));
                std::fflush(stdout);
            } else {
                const auto& end = std::get<StreamEnd>(*entry);
                if (end.error) {
                    fmt::print(stderr, "[stream] ended: {}: {}\n",
                               error_code_name(end.error->code), end.error->message);
                } else {
                    fmt::print(stderr, "[stream] ended\n");
                }
            }
        }
        done.store(true);
        loop.Stop();
    });

    std::thread signal_waiter([&]() {
        timespec tick{0, 200 * 1000 * 1000};
        while (!done.load()) {
            int sig = sigtimedwait(&signals, nullptr, &tick);
            if (sig == SIGINT || sig == SIGTERM) {
                fmt::print(stderr, "[jsonl_tail] signal {}, stopping\n", sig);
                session->Stop();
                return;
            }
        }
    });

    session->Start();
    loop.Run();

    done.store(true);
    session->Stop();
    consumer.join();
    signal_waiter.join();

    auto status = session->Status();
    fmt::print(stderr, "[jsonl_tail] {} messages, {} shed, final status: {}\n",
               session->Client().Counters().messages_decoded, session->Rejected(),
               to_string(status));
    return status.phase == SessionStatus::Phase::GaveUp ? 1 : 0;
}
