#pragma once

#include "evstream/io/byte_reader.hpp"
#include "evstream/stream/event.hpp"
#include "evstream/stream_error.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace evstream {

struct EventReaderConfig {
    /// A single line longer than this fails the read with LineTooLong
    std::size_t max_line_size{1024 * 1024};

    /// Events whose data grows past this are dropped without dispatch
    std::size_t max_event_size{512 * 1024};

    /// Bytes requested from the source per read
    std::size_t read_chunk_size{4096};
};

/// Pull-based decoder for the event stream wire format.
///
/// Each next() call reads lines from the source until a blank line completes
/// an event that carried at least one data field, and returns it. Events
/// without data are dropped. If the source ends before the terminating blank
/// line, the partial event is discarded and EndOfStream is returned.
///
/// Line endings are '\n'; a '\r' directly before it is stripped, so CRLF
/// framed streams yield the same values as LF framed ones.
///
/// The reader owns only its accumulator, the bytes it buffered, and the last
/// seen id. It never closes or retries its source. Not thread-safe.
///
/// Usage:
///   StringReader source("id: 1\ndata: hello\n\n");
///   EventReader reader(source);
///   auto event = reader.next();   // Event{"1", "", "hello"}
///   auto end = reader.next();     // StreamError::Code::EndOfStream
///
class EventReader {
public:
    /// `last_event_id` seeds the id given to events that do not carry one.
    explicit EventReader(
        IByteReader& source,
        EventReaderConfig config = {},
        std::string last_event_id = {}
    );

    EventReader(const EventReader&) = delete;
    EventReader& operator=(const EventReader&) = delete;

    [[nodiscard]] StreamResult<Event> next();

    /// Id inherited by the next event that omits the id field.
    [[nodiscard]] const std::string& last_event_id() const noexcept { return last_id_; }

    [[nodiscard]] const EventReaderConfig& config() const noexcept { return config_; }

    [[nodiscard]] std::size_t buffered_bytes() const noexcept { return buffer_.size() - buffer_pos_; }

private:
    /// Pull one chunk from the source into buffer_. Returns bytes read.
    StreamResult<std::size_t> fill();

    /// Apply one complete line (terminator removed).
    /// Returns true if the line was blank, i.e. the event is complete.
    bool process_line(std::string_view line);

    /// Build the pending event and reset the accumulator.
    /// Returns nullopt when the event must not be dispatched.
    std::optional<Event> dispatch();

    void reset_pending();

    void maybe_compact_buffer();

    IByteReader& source_;
    EventReaderConfig config_;
    std::string last_id_;

    std::string buffer_;          // Raw bytes from the source
    std::size_t buffer_pos_{0};   // Start of the current unread line
    std::size_t scan_pos_{0};     // Where the newline search resumes

    // Accumulator for the event being assembled
    std::string pending_data_;
    std::string pending_id_;
    bool id_present_{false};      // Distinguishes "id:" (empty) from no id line
    std::string pending_name_;
    std::optional<std::chrono::milliseconds> pending_retry_;
    bool oversized_{false};
};

}  // namespace evstream
