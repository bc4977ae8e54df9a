// SPDX-License-Identifier: MIT

// src/event_stream_framer.cpp
#include "src/event_stream_framer.hpp"

#include <algorithm>
#include <charconv>

#include <fmt/format.h>

namespace jsonl_pipe {

namespace {

constexpr std::string_view kBom = "\xEF\xBB\xBF";

}  // namespace

void EventStreamFramer::Feed(std::string_view bytes, const EventCallback& on_event,
                             const OverflowCallback& on_overflow) {
    if (at_stream_start_) {
        // The BOM may be split across chunks
        std::string head = line_ + std::string(bytes.substr(0, kBom.size()));
        if (head.size() < kBom.size() && kBom.starts_with(head)) {
            line_ = std::move(head);
            return;
        }
        at_stream_start_ = false;
        if (head.starts_with(kBom)) {
            size_t from_bytes = kBom.size() - line_.size();
            line_.clear();
            bytes.remove_prefix(from_bytes);
        }
    }

    size_t pos = 0;
    if (pending_cr_ && !bytes.empty()) {
        pending_cr_ = false;
        if (bytes.front() == '\n') {
            pos = 1;
        }
    }

    while (pos < bytes.size()) {
        size_t end = bytes.find_first_of("\r\n", pos);
        if (end == std::string_view::npos) {
            if (skip_line_) return;
            line_.append(bytes.substr(pos));
            if (line_.size() > max_pending_) {
                size_t dropped = line_.size();
                line_.clear();
                line_.shrink_to_fit();
                skip_line_ = true;
                // The event the line belonged to is incomplete now
                data_.clear();
                has_data_ = false;
                skip_event_ = true;
                Overflow("line", dropped, on_overflow);
            }
            return;
        }

        std::string_view piece = bytes.substr(pos, end - pos);
        if (skip_line_) {
            skip_line_ = false;
        } else if (line_.empty()) {
            ProcessLine(piece, on_event, on_overflow);
        } else {
            line_.append(piece);
            std::string line = std::move(line_);
            line_.clear();
            ProcessLine(line, on_event, on_overflow);
        }

        pos = end + 1;
        if (bytes[end] == '\r') {
            if (pos < bytes.size()) {
                if (bytes[pos] == '\n') ++pos;
            } else {
                pending_cr_ = true;
            }
        }
    }
}

void EventStreamFramer::Reset() {
    line_.clear();
    pending_cr_ = false;
    at_stream_start_ = true;
    skip_line_ = false;
    skip_event_ = false;
    data_.clear();
    type_.clear();
    has_data_ = false;
}

void EventStreamFramer::ProcessLine(std::string_view line, const EventCallback& on_event,
                                    const OverflowCallback& on_overflow) {
    if (line.empty()) {
        if (skip_event_) {
            skip_event_ = false;
            type_.clear();
            return;
        }
        Dispatch(on_event);
        return;
    }
    if (line.front() == ':') {
        return;  // comment / heartbeat
    }

    std::string_view field = line;
    std::string_view value;
    size_t colon = line.find(':');
    if (colon != std::string_view::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.remove_prefix(1);
        }
    }

    if (field == "data") {
        if (skip_event_) return;
        if (has_data_) {
            data_.push_back('\n');
        }
        data_.append(value);
        has_data_ = true;
        if (data_.size() > max_pending_) {
            size_t dropped = data_.size();
            data_.clear();
            data_.shrink_to_fit();
            has_data_ = false;
            skip_event_ = true;
            Overflow("event", dropped, on_overflow);
        }
    } else if (field == "event") {
        type_ = std::string(value);
    } else if (field == "id") {
        if (value.find('\0') == std::string_view::npos) {
            last_event_id_ = std::string(value);
        }
    } else if (field == "retry") {
        bool digits = !value.empty() &&
                      std::all_of(value.begin(), value.end(),
                                  [](char c) { return c >= '0' && c <= '9'; });
        if (digits) {
            long long ms = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), ms);
            if (ec == std::errc{}) {
                retry_ = std::chrono::milliseconds(ms);
            }
        }
    }
}

void EventStreamFramer::Overflow(std::string_view what, size_t dropped,
                                 const OverflowCallback& on_overflow) {
    ++overflows_;
    if (!on_overflow) return;
    on_overflow(Error{ErrorCode::BufferOverflow,
                      fmt::format("Pending event-stream {} exceeds {} bytes; dropped {} bytes",
                                  what, max_pending_, dropped)});
}

void EventStreamFramer::Dispatch(const EventCallback& on_event) {
    if (!has_data_) {
        type_.clear();
        return;
    }

    ServerEvent event;
    event.type = type_.empty() ? "message" : std::move(type_);
    event.data = std::move(data_);
    event.id = last_event_id_;

    data_.clear();
    type_.clear();
    has_data_ = false;

    on_event(std::move(event));
}

}  // namespace jsonl_pipe
