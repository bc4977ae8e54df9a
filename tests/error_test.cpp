// SPDX-License-Identifier: MIT

// tests/error_test.cpp
#include <cerrno>

#include <gtest/gtest.h>

#include "lib/stream/error.hpp"

using namespace jsonl_pipe;

TEST(ErrorTest, Construction) {
    Error err{ErrorCode::ConnectionFailed, "connection refused"};
    EXPECT_EQ(err.code, ErrorCode::ConnectionFailed);
    EXPECT_EQ(err.message, "connection refused");
    EXPECT_EQ(err.os_errno, 0);
    EXPECT_FALSE(err.retry_after.has_value());
}

TEST(ErrorTest, WithErrno) {
    Error err{ErrorCode::ConnectionFailed, "connection refused", ECONNREFUSED};
    EXPECT_EQ(err.os_errno, ECONNREFUSED);
}

TEST(ErrorTest, CategoryString) {
    EXPECT_EQ(error_category(ErrorCode::ConnectionFailed), "connection");
    EXPECT_EQ(error_category(ErrorCode::Timeout), "connection");
    EXPECT_EQ(error_category(ErrorCode::Cancelled), "connection");

    EXPECT_EQ(error_category(ErrorCode::TlsHandshakeFailed), "tls");

    EXPECT_EQ(error_category(ErrorCode::HttpError), "http");
    EXPECT_EQ(error_category(ErrorCode::RateLimited), "http");

    EXPECT_EQ(error_category(ErrorCode::HandshakeFailed), "websocket");
    EXPECT_EQ(error_category(ErrorCode::KeepaliveTimeout), "websocket");

    EXPECT_EQ(error_category(ErrorCode::BufferOverflow), "stream");
    EXPECT_EQ(error_category(ErrorCode::ParseError), "stream");

    EXPECT_EQ(error_category(ErrorCode::CapacityExceeded), "queue");
    EXPECT_EQ(error_category(ErrorCode::QueueClosed), "queue");

    EXPECT_EQ(error_category(ErrorCode::NotConnected), "state");
    EXPECT_EQ(error_category(ErrorCode::InvalidEndpoint), "config");
}

TEST(ErrorTest, CodeName) {
    EXPECT_EQ(error_code_name(ErrorCode::KeepaliveTimeout), "KeepaliveTimeout");
    EXPECT_EQ(error_code_name(ErrorCode::CapacityExceeded), "CapacityExceeded");
}

TEST(ErrorTest, ConnectionErrorsFailTheTransport) {
    EXPECT_TRUE(IsConnectionError(ErrorCode::ConnectionClosed));
    EXPECT_TRUE(IsConnectionError(ErrorCode::TlsHandshakeFailed));
    EXPECT_TRUE(IsConnectionError(ErrorCode::ServerError));
    EXPECT_TRUE(IsConnectionError(ErrorCode::ProtocolError));

    EXPECT_FALSE(IsConnectionError(ErrorCode::ParseError));
    EXPECT_FALSE(IsConnectionError(ErrorCode::BufferOverflow));
    EXPECT_FALSE(IsConnectionError(ErrorCode::CapacityExceeded));
    EXPECT_FALSE(IsConnectionError(ErrorCode::NotConnected));
}
