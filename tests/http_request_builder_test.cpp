// SPDX-License-Identifier: MIT

// tests/http_request_builder_test.cpp
#include <gtest/gtest.h>

#include <iterator>
#include <string>

#include "lib/stream/http_request_builder.hpp"

using namespace jsonl_pipe;

TEST(HttpRequestBuilderTest, SimpleGetRequest) {
    std::string out;
    HttpRequestBuilder(std::back_inserter(out))
        .Method("GET")
        .Target("/v1/events")
        .Host("stream.example.com")
        .Header("Accept", "text/event-stream")
        .Finish();

    std::string expected =
        "GET /v1/events HTTP/1.1\r\n"
        "Host: stream.example.com\r\n"
        "Accept: text/event-stream\r\n"
        "\r\n";

    EXPECT_EQ(out, expected);
}

TEST(HttpRequestBuilderTest, TargetKeepsQuery) {
    std::string out;
    HttpRequestBuilder(std::back_inserter(out))
        .Method("GET")
        .Target("/feed?topic=trades&since=42")
        .Host("example.com")
        .Finish();

    EXPECT_EQ(out,
              "GET /feed?topic=trades&since=42 HTTP/1.1\r\n"
              "Host: example.com\r\n"
              "\r\n");
}

TEST(HttpRequestBuilderTest, EmptyTargetBecomesRoot) {
    std::string out;
    HttpRequestBuilder(std::back_inserter(out)).Method("GET").Target("").Finish();
    EXPECT_EQ(out, "GET / HTTP/1.1\r\n\r\n");
}

TEST(HttpRequestBuilderTest, HostOmitsDefaultPort) {
    std::string plain;
    HttpRequestBuilder(std::back_inserter(plain))
        .Method("GET").Target("/").Host("example.com", 80, false).Finish();
    EXPECT_NE(plain.find("Host: example.com\r\n"), std::string::npos);

    std::string secure;
    HttpRequestBuilder(std::back_inserter(secure))
        .Method("GET").Target("/").Host("example.com", 443, true).Finish();
    EXPECT_NE(secure.find("Host: example.com\r\n"), std::string::npos);
}

TEST(HttpRequestBuilderTest, HostKeepsCustomPort) {
    std::string out;
    HttpRequestBuilder(std::back_inserter(out))
        .Method("GET").Target("/").Host("127.0.0.1", 8443, true).Finish();
    EXPECT_NE(out.find("Host: 127.0.0.1:8443\r\n"), std::string::npos);
}

TEST(HttpRequestBuilderTest, HostBracketsIpv6) {
    std::string out;
    HttpRequestBuilder(std::back_inserter(out))
        .Method("GET").Target("/").Host("::1", 9000, false).Finish();
    EXPECT_NE(out.find("Host: [::1]:9000\r\n"), std::string::npos);
}

TEST(HttpRequestBuilderTest, PostWithJsonBody) {
    std::string body = R"({"id":1,"method":"subscribe"})";
    std::string out;
    HttpRequestBuilder(std::back_inserter(out))
        .Method("POST")
        .Target("/rpc")
        .Host("example.com")
        .JsonBody(body);

    std::string expected =
        "POST /rpc HTTP/1.1\r\n"
        "Host: example.com\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "\r\n" + body;

    EXPECT_EQ(out, expected);
}

TEST(HttpRequestBuilderTest, FinishAfterBodyAddsNothing) {
    std::string out;
    HttpRequestBuilder builder(std::back_inserter(out));
    builder.Method("POST").Target("/").JsonBody("{}");
    size_t before = out.size();
    builder.Finish();
    EXPECT_EQ(out.size(), before);
}
