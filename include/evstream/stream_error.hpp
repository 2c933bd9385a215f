#ifndef EVSTREAM_STREAM_ERROR_HPP
#define EVSTREAM_STREAM_ERROR_HPP

#include "evstream/transport/http_types.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace evstream {

// ─────────────────────────────────────────────────────────────────────────────
// Stream Error Types
// ─────────────────────────────────────────────────────────────────────────────
// Only BadResponse, Closed and EndOfStream ever leave EventSource::next().
// The transport-level codes are absorbed by the reconnect loop.

struct StreamError {
    enum class Code {
        EndOfStream,       // Remote side finished the body cleanly
        Closed,            // Source closed, or a read was interrupted by close()
        BadResponse,       // Non-retryable status; `response` holds the head
        CloseFailed,       // Releasing the transport failed
        ConnectionFailed,  // Could not reach the endpoint
        Timeout,           // Connect or idle timeout
        SslError,          // TLS handshake or verification failed
        ReadFailed,        // Body read broke mid-stream
        LineTooLong        // A single line exceeded the reader limit
    };

    Code code;
    std::string message;
    std::optional<HttpResponseHead> response;  // BadResponse only

    [[nodiscard]] bool is(Code c) const noexcept { return code == c; }

    static StreamError end_of_stream() {
        return {Code::EndOfStream, "End of stream", std::nullopt};
    }

    static StreamError closed() {
        return {Code::Closed, "Read from closed event source", std::nullopt};
    }

    static StreamError bad_response(HttpResponseHead head) {
        std::string msg = "Bad response from event source: " + std::to_string(head.status_code);
        if (head.reason.empty() == false) {
            msg += " " + head.reason;
        }
        return {Code::BadResponse, std::move(msg), std::move(head)};
    }

    static StreamError close_failed(const std::string& msg) {
        return {Code::CloseFailed, msg, std::nullopt};
    }

    static StreamError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg, std::nullopt};
    }

    static StreamError timeout(const std::string& msg) {
        return {Code::Timeout, msg, std::nullopt};
    }

    static StreamError ssl_error(const std::string& msg) {
        return {Code::SslError, msg, std::nullopt};
    }

    static StreamError read_failed(const std::string& msg) {
        return {Code::ReadFailed, msg, std::nullopt};
    }

    static StreamError line_too_long(std::size_t size, std::size_t limit) {
        return {Code::LineTooLong,
                "Line of " + std::to_string(size) + " bytes exceeds limit of " +
                    std::to_string(limit),
                std::nullopt};
    }
};

[[nodiscard]] constexpr std::string_view to_string(StreamError::Code code) noexcept {
    switch (code) {
        case StreamError::Code::EndOfStream:      return "EndOfStream";
        case StreamError::Code::Closed:           return "Closed";
        case StreamError::Code::BadResponse:      return "BadResponse";
        case StreamError::Code::CloseFailed:      return "CloseFailed";
        case StreamError::Code::ConnectionFailed: return "ConnectionFailed";
        case StreamError::Code::Timeout:          return "Timeout";
        case StreamError::Code::SslError:         return "SslError";
        case StreamError::Code::ReadFailed:       return "ReadFailed";
        case StreamError::Code::LineTooLong:      return "LineTooLong";
    }
    return "Unknown";
}

template <typename T>
using StreamResult = tl::expected<T, StreamError>;

}  // namespace evstream

#endif  // EVSTREAM_STREAM_ERROR_HPP
