// SPDX-License-Identifier: MIT

// src/stream_message.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "src/jsonl_decoder.hpp"

namespace jsonl_pipe {

/// Request/response correlation id: integer or string.
using MessageId = std::variant<int64_t, std::string>;

std::string to_string(const MessageId& id);

/// Error member of a response.
struct StreamError {
    int64_t code = 0;
    std::string message;
    std::optional<std::string> data;  ///< Raw JSON text
};

/// One application message from the stream.
///
/// Notifications carry `method` (and usually `params`), responses carry `id`
/// plus `result` or `error`. `params`, `result` and `error.data` hold the raw
/// JSON text of those members, ready for a second-stage decode.
struct StreamMessage {
    std::optional<MessageId> id;
    std::optional<std::string> method;
    std::optional<std::string> params;
    std::optional<std::string> result;
    std::optional<StreamError> error;

    bool IsNotification() const { return method.has_value() && !id.has_value(); }
    bool IsRequest() const { return method.has_value() && id.has_value(); }
    bool IsResponse() const { return !method.has_value() && (result || error); }
};

// StreamMessageBuilder - JsonBuilder producing StreamMessage
//
// - The root must be a JSON object.
// - Unknown members are ignored, whatever their shape.
// - A repeated member overwrites the earlier one.
// - `id` must be an integer, a string or null; `method` a string; `error` an
//   object with integer `code` and string `message`, or null.
class StreamMessageBuilder {
public:
    using Result = StreamMessage;

    void OnKey(std::string_view key);
    void OnString(std::string_view value);
    void OnInt(int64_t value);
    void OnUint(uint64_t value);
    void OnDouble(double value);
    void OnBool(bool value);
    void OnNull();
    void OnStartObject();
    void OnEndObject();
    void OnStartArray();
    void OnEndArray();

    std::expected<StreamMessage, std::string> Build();

private:
    enum class Field {
        None,
        Ignored,
        Id,
        Method,
        Params,
        Result,
        Error,
        ErrorCode,
        ErrorMessage,
        ErrorData,
    };

    // False (and records the error) for a scalar or array at the root
    bool InsideRoot();
    void BeginNested(bool is_array);
    void BeginCapture(Field target);
    void FinishCapture();
    bool IsCapturedField(Field field) const {
        return field == Field::Params || field == Field::Result || field == Field::ErrorData;
    }
    void SetError(std::string message) {
        if (error_.empty()) error_ = std::move(message);
    }

    StreamMessage message_;
    StreamError pending_error_;
    bool has_error_code_ = false;
    bool has_error_message_ = false;

    int depth_ = 0;  // 1 = root object, 2 = inside "error"
    bool root_object_ = false;
    Field field_ = Field::None;

    // Raw JSON capture for nested values
    bool capturing_ = false;
    int capture_depth_ = 0;
    Field capture_target_ = Field::None;
    rapidjson::StringBuffer capture_buffer_;
    rapidjson::Writer<rapidjson::StringBuffer> writer_;

    std::string error_;
};

using StreamMessageDecoder = JsonlDecoder<StreamMessageBuilder>;

}  // namespace jsonl_pipe
