// SPDX-License-Identifier: MIT

// src/event_stream_framer.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "lib/stream/error.hpp"

namespace jsonl_pipe {

/// One dispatched text/event-stream event.
struct ServerEvent {
    std::string type = "message";
    std::string data;  ///< `data:` lines joined with '\n'
    std::string id;    ///< Last event id in effect when dispatched
};

// EventStreamFramer - incremental text/event-stream parser
//
// Accepts arbitrary chunks. Lines end with CR, LF or CRLF (a CR at the end of
// a chunk is matched against a following LF). A blank line dispatches the
// event if it carried data. Comment lines (leading ':') and unknown fields are
// ignored. `retry:` with a non-numeric value is ignored; `id:` containing NUL
// is ignored. A UTF-8 BOM at the start of the stream is skipped.
//
// Memory is bounded by max_pending: an unterminated line or an undispatched
// event's data growing past it is dropped and reported once through
// `on_overflow` as BufferOverflow. The rest of that line and of its event is
// skipped up to the next blank line.
class EventStreamFramer {
public:
    using EventCallback = std::function<void(ServerEvent)>;
    using OverflowCallback = std::function<void(Error)>;

    static constexpr size_t kDefaultMaxPending = 1024 * 1024;

    explicit EventStreamFramer(size_t max_pending = kDefaultMaxPending)
        : max_pending_(max_pending) {}

    void Feed(std::string_view bytes, const EventCallback& on_event,
              const OverflowCallback& on_overflow = {});

    /// Forget partial lines and fields. The last event id and the retry hint
    /// survive; they apply to the next connection.
    void Reset();

    const std::string& LastEventId() const { return last_event_id_; }
    std::optional<std::chrono::milliseconds> RetryHint() const { return retry_; }

    /// Bytes of an unterminated line.
    size_t Pending() const { return line_.size(); }

    /// Bytes of data held for the next dispatch.
    size_t PendingData() const { return data_.size(); }

    size_t MaxPending() const { return max_pending_; }
    uint64_t Overflows() const { return overflows_; }

private:
    void ProcessLine(std::string_view line, const EventCallback& on_event,
                     const OverflowCallback& on_overflow);
    void Dispatch(const EventCallback& on_event);
    void Overflow(std::string_view what, size_t dropped, const OverflowCallback& on_overflow);

    size_t max_pending_;
    uint64_t overflows_ = 0;

    std::string line_;
    bool pending_cr_ = false;
    bool at_stream_start_ = true;
    bool skip_line_ = false;   // Rest of an oversized line
    bool skip_event_ = false;  // Remaining data of an oversized event

    std::string data_;
    std::string type_;
    bool has_data_ = false;

    std::string last_event_id_;
    std::optional<std::chrono::milliseconds> retry_;
};

}  // namespace jsonl_pipe
