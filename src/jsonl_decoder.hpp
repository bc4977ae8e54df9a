// SPDX-License-Identifier: MIT

// src/jsonl_decoder.hpp
#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include <rapidjson/error/en.h>
#include <rapidjson/memorystream.h>
#include <rapidjson/reader.h>

namespace jsonl_pipe {

// Builder concept - types that can incrementally build a result from JSON events.
// A builder may reject the document by returning an error from Build().
template <typename B>
concept JsonBuilder = std::default_initializable<B> &&
                      requires(B& b, std::string_view sv, int64_t i, uint64_t u,
                               double d, bool bl) {
    typename B::Result;
    { b.OnKey(sv) } -> std::same_as<void>;
    { b.OnString(sv) } -> std::same_as<void>;
    { b.OnInt(i) } -> std::same_as<void>;
    { b.OnUint(u) } -> std::same_as<void>;
    { b.OnDouble(d) } -> std::same_as<void>;
    { b.OnBool(bl) } -> std::same_as<void>;
    { b.OnNull() } -> std::same_as<void>;
    { b.OnStartObject() } -> std::same_as<void>;
    { b.OnEndObject() } -> std::same_as<void>;
    { b.OnStartArray() } -> std::same_as<void>;
    { b.OnEndArray() } -> std::same_as<void>;
    { b.Build() } -> std::same_as<std::expected<typename B::Result, std::string>>;
};

/// A message that decoded cleanly, stamped when decoding finished.
template <typename T>
struct DecodedMessage {
    T value;
    std::chrono::system_clock::time_point decoded_at;
};

/// A record that did not decode. Surfaced to diagnostics, never retried.
struct DecodeFailure {
    std::string raw_line;
    std::string diagnostic;
};

// RapidJSON SAX handler that forwards to a Builder
template <JsonBuilder Builder>
struct SaxHandler : public rapidjson::BaseReaderHandler<rapidjson::UTF8<>, SaxHandler<Builder>> {
    Builder& builder;

    explicit SaxHandler(Builder& b) : builder(b) {}

    bool Null() {
        builder.OnNull();
        return true;
    }
    bool Bool(bool b) {
        builder.OnBool(b);
        return true;
    }
    bool Int(int i) {
        builder.OnInt(static_cast<int64_t>(i));
        return true;
    }
    bool Uint(unsigned u) {
        builder.OnUint(static_cast<uint64_t>(u));
        return true;
    }
    bool Int64(int64_t i) {
        builder.OnInt(i);
        return true;
    }
    bool Uint64(uint64_t u) {
        builder.OnUint(u);
        return true;
    }
    bool Double(double d) {
        builder.OnDouble(d);
        return true;
    }
    bool String(const char* str, rapidjson::SizeType length, bool /*copy*/) {
        builder.OnString(std::string_view(str, length));
        return true;
    }
    bool Key(const char* str, rapidjson::SizeType length, bool /*copy*/) {
        builder.OnKey(std::string_view(str, length));
        return true;
    }
    bool StartObject() {
        builder.OnStartObject();
        return true;
    }
    bool EndObject(rapidjson::SizeType /*memberCount*/) {
        builder.OnEndObject();
        return true;
    }
    bool StartArray() {
        builder.OnStartArray();
        return true;
    }
    bool EndArray(rapidjson::SizeType /*elementCount*/) {
        builder.OnEndArray();
        return true;
    }
};

// JsonlDecoder - turns one JSONL record into a typed message
//
// Each call parses with a fresh Builder, so Decode() is const and may run
// concurrently on different lines. A record must hold exactly one JSON value;
// trailing content, malformed UTF-8 in a string or a Builder rejection all yield
// a DecodeFailure carrying the original line.
template <JsonBuilder Builder>
class JsonlDecoder {
public:
    using Result = typename Builder::Result;
    using Decoded = DecodedMessage<Result>;

    static constexpr size_t kDefaultMaxLineSize = 1024 * 1024;

    explicit JsonlDecoder(size_t max_line_size = kDefaultMaxLineSize)
        : max_line_size_(max_line_size) {}

    std::expected<Decoded, DecodeFailure> Decode(std::string_view line) const {
        if (line.size() > max_line_size_) {
            return std::unexpected(DecodeFailure{
                std::string(line),
                "Record of " + std::to_string(line.size()) + " bytes exceeds limit of " +
                    std::to_string(max_line_size_)});
        }

        Builder builder;
        SaxHandler<Builder> handler(builder);
        rapidjson::Reader reader;
        rapidjson::MemoryStream stream(line.data(), line.size());

        // Trailing non-whitespace is reported as kParseErrorDocumentRootNotSingular,
        // malformed UTF-8 inside strings as kParseErrorStringInvalidEncoding
        auto result = reader.Parse<rapidjson::kParseValidateEncodingFlag>(stream, handler);
        if (result.IsError()) {
            return std::unexpected(DecodeFailure{
                std::string(line),
                std::string("Parse error at offset ") + std::to_string(result.Offset()) +
                    ": " + rapidjson::GetParseError_En(result.Code())});
        }

        auto built = builder.Build();
        if (!built) {
            return std::unexpected(DecodeFailure{std::string(line), std::move(built.error())});
        }
        return Decoded{std::move(*built), std::chrono::system_clock::now()};
    }

    size_t MaxLineSize() const { return max_line_size_; }

private:
    size_t max_line_size_;
};

}  // namespace jsonl_pipe
