#pragma once

#include "evstream/io/byte_reader.hpp"
#include "evstream/stream_error.hpp"
#include "evstream/transport/http_types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace evstream {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────
// Failure to obtain a response head at all. Statuses, good or bad, are not
// errors at this layer.

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        SslError,
        Cancelled,
        Unknown
    };

    Code code;
    std::string message;

    static HttpClientError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg};
    }
    static HttpClientError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }
    static HttpClientError ssl_error(const std::string& msg) {
        return {Code::SslError, msg};
    }
    static HttpClientError cancelled() {
        return {Code::Cancelled, "Request cancelled"};
    }
    static HttpClientError unknown(const std::string& msg) {
        return {Code::Unknown, msg};
    }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

/// Map a client failure onto the stream error taxonomy.
inline StreamError to_stream_error(const HttpClientError& err) {
    switch (err.code) {
        case HttpClientError::Code::ConnectionFailed:
            return StreamError::connection_failed(err.message);
        case HttpClientError::Code::Timeout:
            return StreamError::timeout(err.message);
        case HttpClientError::Code::SslError:
            return StreamError::ssl_error(err.message);
        case HttpClientError::Code::Cancelled:
            return StreamError::closed();
        default:
            return StreamError::connection_failed(err.message);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// IResponseBody
// ─────────────────────────────────────────────────────────────────────────────
// Readable, independently closable response body.
//
// close() may be called from any thread and must make a read() blocked in
// another thread return promptly with StreamError::Code::Closed. Calling
// close() more than once is allowed.

class IResponseBody : public IByteReader {
public:
    virtual StreamResult<void> close() = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// HttpStreamResponse
// ─────────────────────────────────────────────────────────────────────────────

struct HttpStreamResponse {
    HttpResponseHead head;
    std::unique_ptr<IResponseBody> body;

    [[nodiscard]] int status_code() const noexcept { return head.status_code; }
};

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient Interface
// ─────────────────────────────────────────────────────────────────────────────
// Executes one request and hands back the head as soon as it is known; the
// body keeps streaming through the returned IResponseBody. Implementations
// must tolerate send() being called from several threads.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Headers sent with every request (request headers win on conflict)
    virtual void set_default_headers(const HeaderMap& headers) = 0;

    // Maximum time to establish the connection
    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;

    // Maximum idle time between body bytes; zero disables the limit
    virtual void set_read_timeout(std::chrono::milliseconds timeout) = 0;

    virtual void set_verify_ssl(bool verify) = 0;

    // Blocks until the response head arrives or the request fails
    [[nodiscard]] virtual HttpClientResult<HttpStreamResponse> send(const HttpRequest& request) = 0;
};

/// Default streaming client (cpr / libcurl).
std::unique_ptr<IHttpClient> make_http_client();

}  // namespace evstream
