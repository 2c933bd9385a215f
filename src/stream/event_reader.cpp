#include "evstream/stream/event_reader.hpp"
#include "evstream/log/logger.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>

namespace evstream {

// Compact buffer when the consumed prefix exceeds this (avoids O(n) erase per line)
constexpr std::size_t buffer_compact_threshold = 4096;

EventReader::EventReader(IByteReader& source, EventReaderConfig config, std::string last_event_id)
    : source_(source)
    , config_(config)
    , last_id_(std::move(last_event_id))
{
    config_.read_chunk_size = std::max<std::size_t>(config_.read_chunk_size, 1);
}

StreamResult<Event> EventReader::next() {
    while (true) {
        const std::size_t newline_pos = buffer_.find('\n', scan_pos_);

        if (newline_pos == std::string::npos) {
            const std::size_t partial_size = buffer_.size() - buffer_pos_;
            if (partial_size > config_.max_line_size) {
                buffer_.clear();
                buffer_pos_ = 0;
                scan_pos_ = 0;
                reset_pending();
                return tl::unexpected(StreamError::line_too_long(partial_size, config_.max_line_size));
            }

            scan_pos_ = buffer_.size();
            auto filled = fill();
            if (filled.has_value() == false) {
                reset_pending();
                return tl::unexpected(filled.error());
            }

            const bool source_ended = (*filled == 0);
            if (source_ended) {
                // Never hand out a half-assembled event
                buffer_.clear();
                buffer_pos_ = 0;
                scan_pos_ = 0;
                reset_pending();
                return tl::unexpected(StreamError::end_of_stream());
            }
            continue;
        }

        std::string_view line(buffer_.data() + buffer_pos_, newline_pos - buffer_pos_);
        if ((line.empty() == false) && (line.back() == '\r')) {
            line.remove_suffix(1);
        }

        buffer_pos_ = newline_pos + 1;
        scan_pos_ = buffer_pos_;

        const bool event_complete = process_line(line);
        if (event_complete) {
            auto event = dispatch();
            if (event.has_value()) {
                return std::move(*event);
            }
        }
    }
}

StreamResult<std::size_t> EventReader::fill() {
    maybe_compact_buffer();

    const std::size_t old_size = buffer_.size();
    buffer_.resize(old_size + config_.read_chunk_size);

    auto result = source_.read(buffer_.data() + old_size, config_.read_chunk_size);
    if (result.has_value() == false) {
        buffer_.resize(old_size);
        return result;
    }

    buffer_.resize(old_size + *result);
    return result;
}

void EventReader::maybe_compact_buffer() {
    if (buffer_pos_ > buffer_compact_threshold) {
        buffer_.erase(0, buffer_pos_);
        scan_pos_ -= buffer_pos_;
        buffer_pos_ = 0;
    }
}

bool EventReader::process_line(std::string_view line) {
    if (line.empty()) {
        return true;
    }

    const bool is_comment = (line.front() == ':');
    if (is_comment) {
        return false;
    }

    std::string_view field_name;
    std::string_view field_value;

    const std::size_t colon_pos = line.find(':');
    if (colon_pos == std::string_view::npos) {
        // "data" alone is the field name with an empty value
        field_name = line;
    } else {
        field_name = line.substr(0, colon_pos);
        std::size_t value_start = colon_pos + 1;

        // Exactly one leading space belongs to the framing
        const bool has_space_after_colon =
            (value_start < line.size()) && (line[value_start] == ' ');
        if (has_space_after_colon) {
            value_start += 1;
        }
        field_value = line.substr(value_start);
    }

    if (field_name == "data") {
        if (oversized_) {
            return false;
        }
        const std::size_t new_size = pending_data_.size() + field_value.size() + 1;
        if (new_size > config_.max_event_size + 1) {
            oversized_ = true;
            pending_data_.clear();
            return false;
        }
        pending_data_ += field_value;
        pending_data_ += '\n';
    }
    else if (field_name == "id") {
        pending_id_ = std::string(field_value);
        id_present_ = true;
    }
    else if (field_name == "event") {
        pending_name_ = std::string(field_value);
    }
    else if (field_name == "retry") {
        // Digits only, in milliseconds; anything else is ignored
        std::uint32_t retry_ms = 0;
        const char* first = field_value.data();
        const char* last = field_value.data() + field_value.size();
        auto [ptr, ec] = std::from_chars(first, last, retry_ms);
        const bool parsed_fully = (ec == std::errc{}) && (ptr == last) && (field_value.empty() == false);
        if (parsed_fully) {
            pending_retry_ = std::chrono::milliseconds{retry_ms};
        }
    }

    return false;
}

std::optional<Event> EventReader::dispatch() {
    if (oversized_) {
        get_logger().trace_fmt("Dropping event larger than {} bytes", config_.max_event_size);
        reset_pending();
        return std::nullopt;
    }

    if (pending_data_.empty()) {
        EVSTREAM_LOG_TRACE("Dropping event without data");
        reset_pending();
        return std::nullopt;
    }

    if (id_present_) {
        last_id_ = pending_id_;
    }

    Event event;
    event.id = last_id_;
    event.name = std::move(pending_name_);
    event.data = std::move(pending_data_);
    event.data.pop_back();  // trailing '\n' from the last data line
    event.retry = pending_retry_;

    reset_pending();
    return event;
}

void EventReader::reset_pending() {
    pending_data_.clear();
    pending_id_.clear();
    id_present_ = false;
    pending_name_.clear();
    pending_retry_ = std::nullopt;
    oversized_ = false;
}

}  // namespace evstream
