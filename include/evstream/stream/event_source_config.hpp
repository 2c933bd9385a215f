#ifndef EVSTREAM_STREAM_EVENT_SOURCE_CONFIG_HPP
#define EVSTREAM_STREAM_EVENT_SOURCE_CONFIG_HPP

#include "evstream/stream/event_reader.hpp"
#include "evstream/stream_error.hpp"
#include "evstream/transport/http_types.hpp"
#include "evstream/transport/retry_policy.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace evstream {

/// Produces a fresh request for every connection attempt.
using RequestFactory = std::function<HttpRequest()>;

/// Invoked right before each backoff wait with the delay about to be slept
/// and the failure that caused it. Runs without any EventSource lock held.
using ReconnectCallback = std::function<void(std::chrono::milliseconds delay, const StreamError& cause)>;

// ─────────────────────────────────────────────────────────────────────────────
// EventSourceOptions
// ─────────────────────────────────────────────────────────────────────────────
// Session behaviour independent of how requests are built or sent.

struct EventSourceOptions {
    // Delay between reconnection attempts until the stream sends its own
    // "retry:" directive. Zero falls back to one second.
    std::chrono::milliseconds default_retry_interval{0};

    // Resumption token sent on the first connection attempt.
    std::string last_event_id;

    EventReaderConfig reader;

    RetryPolicy retry_policy;

    ReconnectCallback on_reconnect;
};

// ─────────────────────────────────────────────────────────────────────────────
// EventSourceConfig
// ─────────────────────────────────────────────────────────────────────────────
// Everything needed to follow a stream at a URL with the default client.

struct EventSourceConfig {
    // Absolute http:// or https:// URL of the stream.
    std::string url;

    HttpMethod method{HttpMethod::Get};

    // Request body, POST only.
    std::optional<std::string> body;

    // Sent with every request. Last-Event-ID is always overwritten.
    HeaderMap default_headers{
        {"Accept", "text/event-stream"},
        {"Cache-Control", "no-cache"}
    };

    // ─────────────────────────────────────────────────────────────────────────
    // Transport
    // ─────────────────────────────────────────────────────────────────────────

    std::chrono::milliseconds connect_timeout{10'000};

    // Idle limit between body bytes. Zero: wait forever (typical for streams
    // whose server sends no keep-alive comments).
    std::chrono::milliseconds read_timeout{0};

    // WARNING: disabling verification is only for local testing.
    bool verify_ssl{true};

    EventSourceOptions options;

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────

    EventSourceConfig& with_bearer_token(const std::string& token);
    EventSourceConfig& with_header(const std::string& name, const std::string& value);
    EventSourceConfig& with_connect_timeout(std::chrono::milliseconds timeout);
    EventSourceConfig& with_read_timeout(std::chrono::milliseconds timeout);
    EventSourceConfig& with_default_retry_interval(std::chrono::milliseconds interval);
    EventSourceConfig& with_last_event_id(const std::string& id);
    EventSourceConfig& with_post_body(const std::string& content);

    /// Throws std::invalid_argument if the URL is not an absolute http(s) URL.
    void validate() const;

    /// Factory building the configured request. Headers are copied into each
    /// request so the session may overwrite Last-Event-ID freely.
    [[nodiscard]] RequestFactory make_request_factory() const;
};

}  // namespace evstream

#endif  // EVSTREAM_STREAM_EVENT_SOURCE_CONFIG_HPP
