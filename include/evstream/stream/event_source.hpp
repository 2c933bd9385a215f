#pragma once

#include "evstream/stream/event.hpp"
#include "evstream/stream/event_reader.hpp"
#include "evstream/stream/event_source_config.hpp"
#include "evstream/stream_error.hpp"
#include "evstream/transport/http_client.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace evstream {

enum class SourceState {
    Disconnected,  // Open, no stream held; next() will connect
    Connected,     // Open, stream held
    Closed         // next() fails until connect() is called
};

[[nodiscard]] constexpr std::string_view to_string(SourceState state) noexcept {
    switch (state) {
        case SourceState::Disconnected: return "Disconnected";
        case SourceState::Connected:    return "Connected";
        case SourceState::Closed:       return "Closed";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// EventSource
// ─────────────────────────────────────────────────────────────────────────────
// Reconnecting client for an event stream.
//
// next() connects on demand, returns events one at a time and reconnects
// transparently when the connection breaks, sending the last seen event id
// as Last-Event-ID so the server can resume. Connection failures and
// retryable statuses are retried forever at a constant interval: the
// stream's latest non-zero "retry:" directive, else the configured default,
// else one second.
//
// next() returns only:
//   - an Event
//   - BadResponse: the server answered with a non-retryable status
//   - EndOfStream: the server finished the body; the source is now closed
//   - Closed: the source was closed, possibly while next() was blocked
//
// Once closed, next() fails immediately without touching the network until
// connect() is called again.
//
// Thread safety: one thread may block in next() while another calls close();
// close() makes the blocked read fail and next() return Closed. All state is
// guarded by a single mutex that is never held across network I/O or while
// a response body is being closed.
//
// Usage:
//   EventSourceConfig config;
//   config.url = "https://example.com/events";
//   config.with_default_retry_interval(std::chrono::milliseconds{500});
//
//   EventSource source(config);
//   std::thread reader([&] {
//       while (auto event = source.next()) {
//           handle(*event);
//       }
//   });
//   ...
//   source.close();
//   reader.join();

class EventSource {
public:
    /// Core constructor: the caller supplies transport and request factory.
    EventSource(
        std::shared_ptr<IHttpClient> client,
        RequestFactory factory,
        EventSourceOptions options = {}
    );

    /// Follow config.url with the default cpr client.
    explicit EventSource(const EventSourceConfig& config);

    /// Follow config.url with a custom client (configured from `config`).
    EventSource(const EventSourceConfig& config, std::shared_ptr<IHttpClient> client);

    ~EventSource();

    EventSource(const EventSource&) = delete;
    EventSource& operator=(const EventSource&) = delete;
    EventSource(EventSource&&) = delete;
    EventSource& operator=(EventSource&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Operations
    // ─────────────────────────────────────────────────────────────────────────

    /// Open a stream if none is held, retrying through failures.
    /// Reopens a closed source. Fails with BadResponse, or with Closed if
    /// close() is called while connecting.
    StreamResult<void> connect();

    /// Block until the next event.
    [[nodiscard]] StreamResult<Event> next();

    /// Close the source and release the stream. Idempotent.
    StreamResult<void> close();

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::string last_event_id() const;

    /// Interval the next reconnect would wait.
    [[nodiscard]] std::chrono::milliseconds retry_interval() const;

    [[nodiscard]] SourceState state() const;

    [[nodiscard]] bool is_closed() const;

    static constexpr std::chrono::milliseconds fallback_retry_interval{1000};
    static constexpr const char* last_event_id_header = "Last-Event-ID";

private:
    // Body plus the reader decoding it. Shared so a reader thread can finish
    // its read on a stream that close() has already released.
    struct ActiveStream {
        std::unique_ptr<IResponseBody> body;
        EventReader reader;

        ActiveStream(
            std::unique_ptr<IResponseBody> response_body,
            const EventReaderConfig& config,
            std::string last_event_id
        )
            : body(std::move(response_body))
            , reader(*body, config, std::move(last_event_id))
        {}
    };

    // Connection loop shared by connect() and next(). Aborts with Closed if
    // close() runs after `generation` was sampled.
    StreamResult<void> connect_loop(std::uint64_t generation);

    // Sleep the backoff interval, waking early on close().
    // Returns false if the source was closed meanwhile.
    bool wait_for_retry(std::uint64_t generation, const StreamError& cause);

    // Close `body` and log (not propagate) a failure; used for discarded bodies.
    static void discard_body(IResponseBody& body, std::string_view why);

    [[nodiscard]] std::chrono::milliseconds retry_interval_locked() const;

    std::shared_ptr<IHttpClient> client_;
    RequestFactory factory_;
    EventSourceOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable retry_cv_;
    std::shared_ptr<ActiveStream> current_;
    std::string last_event_id_;
    std::optional<std::chrono::milliseconds> retry_interval_;
    bool closed_{false};
    std::uint64_t close_generation_{0};
};

}  // namespace evstream
