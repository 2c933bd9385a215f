#include "evstream/stream/event_source.hpp"
#include "evstream/log/logger.hpp"

#include <stdexcept>

namespace evstream {

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

EventSource::EventSource(
    std::shared_ptr<IHttpClient> client,
    RequestFactory factory,
    EventSourceOptions options
)
    : client_(std::move(client))
    , factory_(std::move(factory))
    , options_(std::move(options))
    , last_event_id_(options_.last_event_id)
{
    if (client_ == nullptr) {
        throw std::invalid_argument("EventSource: client cannot be null");
    }
    if (!factory_) {
        throw std::invalid_argument("EventSource: request factory cannot be empty");
    }
    if (options_.default_retry_interval.count() < 0) {
        throw std::invalid_argument("EventSource: negative retry interval");
    }
}

EventSource::EventSource(const EventSourceConfig& config)
    : EventSource(config, std::shared_ptr<IHttpClient>(make_http_client()))
{}

EventSource::EventSource(const EventSourceConfig& config, std::shared_ptr<IHttpClient> client)
    : EventSource(
          [&config, &client]() {
              config.validate();
              if (client == nullptr) {
                  throw std::invalid_argument("EventSource: client cannot be null");
              }
              client->set_connect_timeout(config.connect_timeout);
              client->set_read_timeout(config.read_timeout);
              client->set_verify_ssl(config.verify_ssl);
              return std::move(client);
          }(),
          config.make_request_factory(),
          config.options
      )
{}

EventSource::~EventSource() {
    auto result = close();
    if (result.has_value() == false) {
        get_logger().warn_fmt("Closing event source on destruction failed: {}", result.error().message);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Connect
// ─────────────────────────────────────────────────────────────────────────────

StreamResult<void> EventSource::connect() {
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_ != nullptr) {
            return {};
        }
        generation = close_generation_;
    }
    return connect_loop(generation);
}

StreamResult<void> EventSource::connect_loop(std::uint64_t generation) {
    while (true) {
        HttpRequest request = factory_();

        std::string last_id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation != close_generation_) {
                return tl::unexpected(StreamError::closed());
            }
            if (current_ != nullptr) {
                return {};
            }
            last_id = last_event_id_;
        }

        set_header(request.headers, last_event_id_header, last_id);
        get_logger().debug_fmt("Connecting to {} (Last-Event-ID: '{}')", request.url, last_id);

        auto response = client_->send(request);
        if (response.has_value() == false) {
            const StreamError cause = to_stream_error(response.error());
            get_logger().warn_fmt("Connection to {} failed: {}", request.url, cause.message);
            if (wait_for_retry(generation, cause) == false) {
                return tl::unexpected(StreamError::closed());
            }
            continue;
        }

        const int status = response->status_code();
        switch (options_.retry_policy.classify(status)) {
            case StatusClass::Success: {
                auto stream = std::make_shared<ActiveStream>(
                    std::move(response->body), options_.reader, last_id
                );

                std::unique_lock<std::mutex> lock(mutex_);
                if (generation != close_generation_) {
                    lock.unlock();
                    discard_body(*stream->body, "closed while connecting");
                    return tl::unexpected(StreamError::closed());
                }
                if (current_ != nullptr) {
                    // A concurrent connect won; keep its stream
                    lock.unlock();
                    discard_body(*stream->body, "concurrent connect already holds a stream");
                    return {};
                }
                current_ = std::move(stream);
                closed_ = false;
                lock.unlock();

                get_logger().debug_fmt("Event stream open ({})", status);
                return {};
            }

            case StatusClass::Retry: {
                discard_body(*response->body, "retryable status");
                HttpResponseHead head = response->head;
                const StreamError cause = StreamError::bad_response(std::move(head));
                get_logger().warn_fmt("Retryable response from {}: {}", request.url, status);
                if (wait_for_retry(generation, cause) == false) {
                    return tl::unexpected(StreamError::closed());
                }
                continue;
            }

            case StatusClass::Fail:
                break;
        }

        discard_body(*response->body, "bad response");
        get_logger().error_fmt("Bad response from {}: {} {}", request.url, status, response->head.reason);
        return tl::unexpected(StreamError::bad_response(std::move(response->head)));
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Next
// ─────────────────────────────────────────────────────────────────────────────

StreamResult<Event> EventSource::next() {
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return tl::unexpected(StreamError::closed());
        }
        generation = close_generation_;
    }

    while (true) {
        auto connected = connect_loop(generation);
        if (connected.has_value() == false) {
            return tl::unexpected(connected.error());
        }

        std::shared_ptr<ActiveStream> stream;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation != close_generation_) {
                return tl::unexpected(StreamError::closed());
            }
            stream = current_;
        }
        if (stream == nullptr) {
            continue;  // discarded by another reader in between
        }

        // Blocking read, no lock held
        auto event = stream->reader.next();

        if (event.has_value()) {
            std::lock_guard<std::mutex> lock(mutex_);
            last_event_id_ = event->id;
            // retry: 0 is no directive
            if (event->retry.has_value() && (event->retry->count() > 0)) {
                retry_interval_ = *event->retry;
            }
            return event;
        }

        if (event.error().is(StreamError::Code::EndOfStream)) {
            EVSTREAM_LOG_DEBUG("Event stream ended by server");
            auto closed = close();
            if (closed.has_value() == false) {
                get_logger().warn_fmt("Releasing finished stream failed: {}", closed.error().message);
            }
            return tl::unexpected(StreamError::end_of_stream());
        }

        const StreamError cause = event.error();
        std::shared_ptr<ActiveStream> broken;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || (generation != close_generation_)) {
                return tl::unexpected(StreamError::closed());
            }
            if (current_ == stream) {
                broken = std::move(current_);
                current_.reset();
            }
        }

        if (broken != nullptr) {
            discard_body(*broken->body, "broken stream");
            broken.reset();
        }

        get_logger().warn_fmt("Event stream broke ({}): {}", to_string(cause.code), cause.message);
        if (wait_for_retry(generation, cause) == false) {
            return tl::unexpected(StreamError::closed());
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Close
// ─────────────────────────────────────────────────────────────────────────────

StreamResult<void> EventSource::close() {
    std::shared_ptr<ActiveStream> released;
    StreamResult<void> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        ++close_generation_;
        released = std::move(current_);
        current_.reset();
    }
    retry_cv_.notify_all();

    if (released != nullptr) {
        // Unblocks a reader still inside released->reader.next()
        auto body_closed = released->body->close();
        if (body_closed.has_value() == false) {
            result = tl::unexpected(StreamError::close_failed(body_closed.error().message));
        }
        EVSTREAM_LOG_DEBUG("Event source closed, stream released");
    }
    return result;
}

// ─────────────────────────────────────────────────────────────────────────────
// Backoff
// ─────────────────────────────────────────────────────────────────────────────

bool EventSource::wait_for_retry(std::uint64_t generation, const StreamError& cause) {
    std::chrono::milliseconds delay{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != close_generation_) {
            return false;
        }
        delay = retry_interval_locked();
    }

    if (options_.on_reconnect) {
        options_.on_reconnect(delay, cause);
    }
    get_logger().info_fmt("Reconnecting in {}ms", delay.count());

    std::unique_lock<std::mutex> lock(mutex_);
    retry_cv_.wait_for(lock, delay, [this, generation] {
        return generation != close_generation_;
    });
    return generation == close_generation_;
}

std::chrono::milliseconds EventSource::retry_interval_locked() const {
    if (retry_interval_.has_value()) {
        return *retry_interval_;
    }
    if (options_.default_retry_interval.count() > 0) {
        return options_.default_retry_interval;
    }
    return fallback_retry_interval;
}

void EventSource::discard_body(IResponseBody& body, std::string_view why) {
    auto result = body.close();
    if (result.has_value() == false) {
        get_logger().warn_fmt("Discarding response body ({}) failed: {}", why, result.error().message);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

std::string EventSource::last_event_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_event_id_;
}

std::chrono::milliseconds EventSource::retry_interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retry_interval_locked();
}

SourceState EventSource::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return SourceState::Closed;
    }
    if (current_ != nullptr) {
        return SourceState::Connected;
    }
    return SourceState::Disconnected;
}

bool EventSource::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

}  // namespace evstream
