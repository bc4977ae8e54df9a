// SPDX-License-Identifier: MIT

// src/request_encoder.cpp
#include "src/request_encoder.hpp"

#include <array>
#include <cmath>
#include <ctime>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>

#include <fmt/format.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "lib/stream/random_bytes.hpp"

namespace jsonl_pipe {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

std::unexpected<Error> EncodeFailure(std::string message) {
    return std::unexpected(Error{ErrorCode::EncodeError, std::move(message)});
}

void WriteString(JsonWriter& writer, std::string_view text) {
    writer.String(text.data(), static_cast<rapidjson::SizeType>(text.size()));
}

}  // namespace

std::string FormatIso8601(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    auto since_epoch = tp.time_since_epoch();
    auto secs = duration_cast<seconds>(since_epoch);
    auto millis = duration_cast<milliseconds>(since_epoch - secs).count();
    if (millis < 0) {
        // Pre-epoch times round toward the earlier second
        secs -= seconds{1};
        millis += 1000;
    }

    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm utc{};
    gmtime_r(&t, &utc);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                       utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
}

std::expected<std::string, Error> GenerateRequestId() {
    std::array<unsigned char, 16> bytes{};
    auto drawn = FillRandomBytes(bytes.data(), bytes.size(), ErrorCode::EncodeError, "request id");
    if (!drawn) {
        return std::unexpected(std::move(drawn.error()));
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);  // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);  // RFC 4122 variant

    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        fmt::format_to(std::back_inserter(out), "{:02x}", bytes[i]);
    }
    return out;
}

std::expected<std::string, Error> EncodeRequest(const StreamRequest& request) {
    if (request.method.empty()) {
        return EncodeFailure("Request method is empty");
    }

    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    writer.Key("id");
    if (const auto* n = std::get_if<int64_t>(&request.id)) {
        writer.Int64(*n);
    } else {
        WriteString(writer, std::get<std::string>(request.id));
    }
    writer.Key("method");
    WriteString(writer, request.method);

    writer.Key("params");
    writer.StartObject();
    for (const auto& param : request.params) {
        const std::string& name = param.first;
        WriteString(writer, name);

        std::optional<Error> failure;
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                writer.Null();
            } else if constexpr (std::is_same_v<T, bool>) {
                writer.Bool(v);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                writer.Int64(v);
            } else if constexpr (std::is_same_v<T, double>) {
                if (!std::isfinite(v)) {
                    failure = Error{ErrorCode::EncodeError,
                                    "Parameter '" + name + "' is not a finite number"};
                    return;
                }
                writer.Double(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                WriteString(writer, v);
            } else if constexpr (std::is_same_v<T, std::chrono::system_clock::time_point>) {
                WriteString(writer, FormatIso8601(v));
            } else {
                rapidjson::Document check;
                check.Parse(v.text.data(), v.text.size());
                if (check.HasParseError()) {
                    failure = Error{ErrorCode::EncodeError,
                                    "Parameter '" + name + "' holds invalid JSON: " +
                                        rapidjson::GetParseError_En(check.GetParseError())};
                    return;
                }
                writer.RawValue(v.text.data(), v.text.size(), check.GetType());
            }
        }, param.second);

        if (failure) {
            return std::unexpected(std::move(*failure));
        }
    }
    writer.EndObject();
    writer.EndObject();

    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace jsonl_pipe
