// SPDX-License-Identifier: MIT

// src/stream_message.cpp
#include "src/stream_message.hpp"

#include <limits>

namespace jsonl_pipe {

namespace {

constexpr uint64_t kMaxInt64 = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

}  // namespace

std::string to_string(const MessageId& id) {
    if (const auto* n = std::get_if<int64_t>(&id)) {
        return std::to_string(*n);
    }
    return std::get<std::string>(id);
}

bool StreamMessageBuilder::InsideRoot() {
    if (depth_ == 0) {
        SetError("root must be a JSON object");
        return false;
    }
    return true;
}

void StreamMessageBuilder::BeginCapture(Field target) {
    capture_buffer_.Clear();
    writer_.Reset(capture_buffer_);
    capturing_ = true;
    capture_depth_ = 0;
    capture_target_ = target;
}

void StreamMessageBuilder::FinishCapture() {
    capturing_ = false;
    std::string raw(capture_buffer_.GetString(), capture_buffer_.GetSize());
    switch (capture_target_) {
        case Field::Params:
            message_.params = std::move(raw);
            break;
        case Field::Result:
            message_.result = std::move(raw);
            break;
        case Field::ErrorData:
            pending_error_.data = std::move(raw);
            break;
        default:
            break;
    }
    capture_target_ = Field::None;
}

void StreamMessageBuilder::BeginNested(bool is_array) {
    Field target = Field::Ignored;
    if (depth_ == 0) {
        SetError("root must be a JSON object");
    } else if (IsCapturedField(field_)) {
        target = field_;
    } else {
        switch (field_) {
            case Field::Id:
                SetError("id must be an integer, string or null");
                break;
            case Field::Method:
                SetError("method must be a string");
                break;
            case Field::Error:
                SetError("error must be an object or null");
                break;
            case Field::ErrorCode:
                SetError("error.code must be an integer");
                break;
            case Field::ErrorMessage:
                SetError("error.message must be a string");
                break;
            default:
                break;
        }
    }

    BeginCapture(target);
    if (is_array) {
        writer_.StartArray();
    } else {
        writer_.StartObject();
    }
    capture_depth_ = 1;
}

void StreamMessageBuilder::OnKey(std::string_view key) {
    if (capturing_) {
        writer_.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
        return;
    }
    if (depth_ == 1) {
        if (key == "id") {
            field_ = Field::Id;
        } else if (key == "method") {
            field_ = Field::Method;
        } else if (key == "params") {
            field_ = Field::Params;
        } else if (key == "result") {
            field_ = Field::Result;
        } else if (key == "error") {
            field_ = Field::Error;
        } else {
            field_ = Field::Ignored;
        }
    } else {
        if (key == "code") {
            field_ = Field::ErrorCode;
        } else if (key == "message") {
            field_ = Field::ErrorMessage;
        } else if (key == "data") {
            field_ = Field::ErrorData;
        } else {
            field_ = Field::Ignored;
        }
    }
}

void StreamMessageBuilder::OnString(std::string_view value) {
    if (capturing_) {
        writer_.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
        return;
    }
    if (!InsideRoot()) return;

    switch (field_) {
        case Field::Id:
            message_.id = MessageId(std::string(value));
            break;
        case Field::Method:
            message_.method = std::string(value);
            break;
        case Field::ErrorMessage:
            pending_error_.message = std::string(value);
            has_error_message_ = true;
            break;
        case Field::Params:
        case Field::Result:
        case Field::ErrorData:
            BeginCapture(field_);
            writer_.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
            FinishCapture();
            break;
        case Field::Error:
            SetError("error must be an object or null");
            break;
        case Field::ErrorCode:
            SetError("error.code must be an integer");
            break;
        default:
            break;
    }
}

void StreamMessageBuilder::OnInt(int64_t value) {
    if (capturing_) {
        writer_.Int64(value);
        return;
    }
    if (!InsideRoot()) return;

    switch (field_) {
        case Field::Id:
            message_.id = MessageId(value);
            break;
        case Field::ErrorCode:
            pending_error_.code = value;
            has_error_code_ = true;
            break;
        case Field::Params:
        case Field::Result:
        case Field::ErrorData:
            BeginCapture(field_);
            writer_.Int64(value);
            FinishCapture();
            break;
        case Field::Method:
            SetError("method must be a string");
            break;
        case Field::Error:
            SetError("error must be an object or null");
            break;
        case Field::ErrorMessage:
            SetError("error.message must be a string");
            break;
        default:
            break;
    }
}

void StreamMessageBuilder::OnUint(uint64_t value) {
    if (capturing_) {
        writer_.Uint64(value);
        return;
    }
    if (!InsideRoot()) return;

    if (field_ == Field::Params || field_ == Field::Result || field_ == Field::ErrorData) {
        BeginCapture(field_);
        writer_.Uint64(value);
        FinishCapture();
        return;
    }
    if ((field_ == Field::Id || field_ == Field::ErrorCode) && value > kMaxInt64) {
        SetError(field_ == Field::Id ? "id out of range" : "error.code out of range");
        return;
    }
    OnInt(static_cast<int64_t>(value));
}

void StreamMessageBuilder::OnDouble(double value) {
    if (capturing_) {
        writer_.Double(value);
        return;
    }
    if (!InsideRoot()) return;

    switch (field_) {
        case Field::Params:
        case Field::Result:
        case Field::ErrorData:
            BeginCapture(field_);
            writer_.Double(value);
            FinishCapture();
            break;
        case Field::Id:
            SetError("id must be an integer, string or null");
            break;
        case Field::Method:
            SetError("method must be a string");
            break;
        case Field::Error:
            SetError("error must be an object or null");
            break;
        case Field::ErrorCode:
            SetError("error.code must be an integer");
            break;
        case Field::ErrorMessage:
            SetError("error.message must be a string");
            break;
        default:
            break;
    }
}

void StreamMessageBuilder::OnBool(bool value) {
    if (capturing_) {
        writer_.Bool(value);
        return;
    }
    if (!InsideRoot()) return;

    switch (field_) {
        case Field::Params:
        case Field::Result:
        case Field::ErrorData:
            BeginCapture(field_);
            writer_.Bool(value);
            FinishCapture();
            break;
        case Field::Id:
            SetError("id must be an integer, string or null");
            break;
        case Field::Method:
            SetError("method must be a string");
            break;
        case Field::Error:
            SetError("error must be an object or null");
            break;
        case Field::ErrorCode:
            SetError("error.code must be an integer");
            break;
        case Field::ErrorMessage:
            SetError("error.message must be a string");
            break;
        default:
            break;
    }
}

void StreamMessageBuilder::OnNull() {
    if (capturing_) {
        writer_.Null();
        return;
    }
    if (!InsideRoot()) return;

    switch (field_) {
        case Field::Id:
            message_.id.reset();
            break;
        case Field::Method:
            message_.method.reset();
            break;
        case Field::Error:
            message_.error.reset();
            break;
        case Field::Params:
        case Field::Result:
        case Field::ErrorData:
            BeginCapture(field_);
            writer_.Null();
            FinishCapture();
            break;
        case Field::ErrorCode:
            SetError("error.code must be an integer");
            break;
        case Field::ErrorMessage:
            SetError("error.message must be a string");
            break;
        default:
            break;
    }
}

void StreamMessageBuilder::OnStartObject() {
    if (capturing_) {
        writer_.StartObject();
        ++capture_depth_;
        return;
    }
    if (depth_ == 0) {
        root_object_ = true;
        depth_ = 1;
        field_ = Field::None;
        return;
    }
    if (depth_ == 1 && field_ == Field::Error) {
        depth_ = 2;
        pending_error_ = StreamError{};
        has_error_code_ = false;
        has_error_message_ = false;
        field_ = Field::None;
        return;
    }
    BeginNested(false);
}

void StreamMessageBuilder::OnEndObject() {
    if (capturing_) {
        writer_.EndObject();
        if (--capture_depth_ == 0) {
            FinishCapture();
        }
        return;
    }
    if (depth_ == 2) {
        if (!has_error_code_ || !has_error_message_) {
            SetError("error object requires code and message");
        }
        message_.error = std::move(pending_error_);
        pending_error_ = StreamError{};
        depth_ = 1;
        field_ = Field::None;
        return;
    }
    depth_ = 0;
    field_ = Field::None;
}

void StreamMessageBuilder::OnStartArray() {
    if (capturing_) {
        writer_.StartArray();
        ++capture_depth_;
        return;
    }
    BeginNested(true);
}

void StreamMessageBuilder::OnEndArray() {
    if (capturing_) {
        writer_.EndArray();
        if (--capture_depth_ == 0) {
            FinishCapture();
        }
    }
}

std::expected<StreamMessage, std::string> StreamMessageBuilder::Build() {
    if (!error_.empty()) {
        return std::unexpected(error_);
    }
    if (!root_object_) {
        return std::unexpected(std::string("root must be a JSON object"));
    }
    return std::move(message_);
}

}  // namespace jsonl_pipe
