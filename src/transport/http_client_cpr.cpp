#include "evstream/transport/http_client.hpp"
#include "evstream/transport/pipe_body.hpp"
#include "evstream/log/logger.hpp"

#include <cpr/cpr.h>

#include <atomic>
#include <charconv>
#include <cstdint>
#include <future>
#include <mutex>
#include <thread>

namespace evstream {

namespace {

using SteadyClock = std::chrono::steady_clock;

[[nodiscard]] std::int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        SteadyClock::now().time_since_epoch()
    ).count();
}

[[nodiscard]] std::string_view trim_crlf(std::string_view line) {
    while ((line.empty() == false) && ((line.back() == '\n') || (line.back() == '\r'))) {
        line.remove_suffix(1);
    }
    return line;
}

[[nodiscard]] std::string_view trim_spaces(std::string_view text) {
    while ((text.empty() == false) && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while ((text.empty() == false) && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    return text;
}

// ─────────────────────────────────────────────────────────────────────────────
// TransferState
// ─────────────────────────────────────────────────────────────────────────────
// Shared between the caller of send(), the cpr worker thread and the body.
// The head is collected from header callbacks and published exactly once.

struct TransferState {
    std::shared_ptr<PipeBody> pipe = std::make_shared<PipeBody>();

    std::mutex head_mutex;
    std::promise<HttpClientResult<HttpResponseHead>> head_promise;
    HttpResponseHead pending_head;
    bool head_published{false};

    std::atomic<std::int64_t> last_activity_ms{now_ms()};
    std::atomic<bool> timed_out{false};

    void publish_head() {
        std::lock_guard<std::mutex> lock(head_mutex);
        if (head_published) {
            return;
        }
        head_published = true;
        head_promise.set_value(pending_head);
    }

    // Returns false if the head had already been published
    bool publish_error(HttpClientError error) {
        std::lock_guard<std::mutex> lock(head_mutex);
        if (head_published) {
            return false;
        }
        head_published = true;
        head_promise.set_value(tl::unexpected(std::move(error)));
        return true;
    }

    // Feed one raw header line ("HTTP/1.1 200 OK\r\n", "Name: value\r\n", "\r\n")
    void on_header_line(std::string_view raw) {
        last_activity_ms.store(now_ms());
        const std::string_view line = trim_crlf(raw);

        std::unique_lock<std::mutex> lock(head_mutex);
        if (head_published) {
            return;
        }

        if (line.starts_with("HTTP/")) {
            // New status line (also after a redirect or 100 Continue)
            pending_head = HttpResponseHead{};
            const auto space = line.find(' ');
            if (space == std::string_view::npos) {
                return;
            }
            std::string_view rest = line.substr(space + 1);
            int status = 0;
            std::from_chars(rest.data(), rest.data() + rest.size(), status);
            pending_head.status_code = status;
            const auto reason_pos = rest.find(' ');
            if (reason_pos != std::string_view::npos) {
                pending_head.reason = std::string(trim_spaces(rest.substr(reason_pos + 1)));
            }
            return;
        }

        if (line.empty()) {
            const int status = pending_head.status_code;
            const bool interim = (status < 200);
            const bool redirect = (status >= 300) && (status < 400) &&
                                  get_header(pending_head.headers, "Location").has_value();
            if (interim || redirect) {
                return;  // curl keeps going; wait for the final head
            }
            lock.unlock();
            publish_head();
            return;
        }

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return;
        }
        const std::string name(trim_spaces(line.substr(0, colon)));
        const std::string value(trim_spaces(line.substr(colon + 1)));
        pending_head.headers[name] = value;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// CprResponseBody
// ─────────────────────────────────────────────────────────────────────────────
// Owns the worker thread running the transfer. Closing the pipe makes the
// next cpr callback abort the transfer, after which the thread exits.

class CprResponseBody final : public IResponseBody {
public:
    CprResponseBody(std::shared_ptr<TransferState> state, std::thread worker)
        : state_(std::move(state))
        , worker_(std::move(worker))
    {}

    ~CprResponseBody() override {
        (void)state_->pipe->close();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    CprResponseBody(const CprResponseBody&) = delete;
    CprResponseBody& operator=(const CprResponseBody&) = delete;

    StreamResult<std::size_t> read(char* dest, std::size_t max_bytes) override {
        return state_->pipe->read(dest, max_bytes);
    }

    StreamResult<void> close() override {
        return state_->pipe->close();
    }

private:
    std::shared_ptr<TransferState> state_;
    std::thread worker_;
};

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// cpr (C++ Requests) over libcurl. Each send() runs a blocking cpr transfer on
// its own thread; header, write and progress callbacks feed the shared
// TransferState so the caller gets the head early and the body incrementally.

class CprHttpClient final : public IHttpClient {
public:
    CprHttpClient() = default;
    ~CprHttpClient() override = default;

    void set_default_headers(const HeaderMap& headers) override {
        std::lock_guard<std::mutex> lock(config_mutex_);
        default_headers_ = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(config_mutex_);
        connect_timeout_ = timeout;
    }

    void set_read_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(config_mutex_);
        read_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        std::lock_guard<std::mutex> lock(config_mutex_);
        verify_ssl_ = verify;
    }

    HttpClientResult<HttpStreamResponse> send(const HttpRequest& request) override {
        auto state = std::make_shared<TransferState>();
        auto head_future = state->head_promise.get_future();

        cpr::Header headers;
        std::chrono::milliseconds connect_timeout{};
        std::chrono::milliseconds read_timeout{};
        bool verify_ssl = true;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            for (const auto& [name, value] : default_headers_) {
                if (find_header(request.headers, name) == request.headers.end()) {
                    headers[name] = value;
                }
            }
            connect_timeout = connect_timeout_;
            read_timeout = read_timeout_;
            verify_ssl = verify_ssl_;
        }
        for (const auto& [name, value] : request.headers) {
            headers[name] = value;
        }

        get_logger().trace_fmt("{} {}", to_string(request.method), request.url);

        std::thread worker([state, request, headers, connect_timeout, read_timeout, verify_ssl]() {
            run_transfer(*state, request, headers, connect_timeout, read_timeout, verify_ssl);
        });

        auto head = head_future.get();
        if (head.has_value() == false) {
            worker.join();
            return tl::unexpected(head.error());
        }

        HttpStreamResponse response;
        response.head = std::move(*head);
        response.body = std::make_unique<CprResponseBody>(state, std::move(worker));
        return response;
    }

private:
    static void run_transfer(
        TransferState& state,
        const HttpRequest& request,
        const cpr::Header& headers,
        std::chrono::milliseconds connect_timeout,
        std::chrono::milliseconds read_timeout,
        bool verify_ssl
    ) {
        cpr::Session session;
        session.SetUrl(cpr::Url{request.url});
        session.SetHeader(headers);
        session.SetConnectTimeout(cpr::ConnectTimeout{connect_timeout});
        session.SetVerifySsl(cpr::VerifySsl{verify_ssl});

        session.SetHeaderCallback(cpr::HeaderCallback{
            [&state](const auto& header, std::intptr_t) -> bool {
                state.on_header_line(std::string_view(header));
                return state.pipe->is_closed() == false;
            }
        });

        session.SetWriteCallback(cpr::WriteCallback{
            [&state](const auto& data, std::intptr_t) -> bool {
                state.last_activity_ms.store(now_ms());
                state.publish_head();
                return state.pipe->write(std::string_view(data));
            }
        });

        // Called periodically even while idle: the only hook that lets a
        // close() or an idle timeout abort a silent connection.
        session.SetProgressCallback(cpr::ProgressCallback{
            [&state, read_timeout](auto&&...) -> bool {
                if (state.pipe->is_closed()) {
                    return false;
                }
                const bool has_idle_limit = (read_timeout.count() > 0);
                if (has_idle_limit) {
                    const auto idle = now_ms() - state.last_activity_ms.load();
                    if (idle > read_timeout.count()) {
                        state.timed_out.store(true);
                        return false;
                    }
                }
                return true;
            }
        });

        cpr::Response response;
        if (request.method == HttpMethod::Post) {
            session.SetBody(cpr::Body{request.body.value_or("")});
            response = session.Post();
        } else {
            response = session.Get();
        }

        const bool has_error = (response.error.code != cpr::ErrorCode::OK);
        if (has_error == false) {
            // Body-less responses never hit the write callback
            {
                std::lock_guard<std::mutex> lock(state.head_mutex);
                if (state.head_published == false && state.pending_head.status_code == 0) {
                    state.pending_head.status_code = static_cast<int>(response.status_code);
                    for (const auto& [name, value] : response.header) {
                        state.pending_head.headers[name] = value;
                    }
                }
            }
            state.publish_head();
            state.pipe->finish();
            return;
        }

        if (state.pipe->is_closed()) {
            // Aborted on purpose; only unblocks send() if it is still waiting
            (void)state.publish_error(HttpClientError::cancelled());
            return;
        }

        const bool timed_out = state.timed_out.load();
        const HttpClientError client_error =
            timed_out ? HttpClientError::timeout("No data received within read timeout")
                      : map_error(response.error);

        const bool failed_before_head = state.publish_error(client_error);
        if (failed_before_head == false) {
            StreamError stream_error = timed_out
                ? StreamError::timeout(client_error.message)
                : StreamError::read_failed(client_error.message);
            state.pipe->fail(std::move(stream_error));
        }
    }

    static HttpClientError map_error(const cpr::Error& error) {
        const std::string& msg = error.message;
        const bool is_ssl_error =
            (msg.find("SSL") != std::string::npos) ||
            (msg.find("ssl") != std::string::npos) ||
            (msg.find("certificate") != std::string::npos) ||
            (msg.find("TLS") != std::string::npos);

        if (is_ssl_error) {
            return HttpClientError::ssl_error(msg);
        }

        switch (error.code) {
            case cpr::ErrorCode::OK:
                return HttpClientError::unknown("No error");

            case cpr::ErrorCode::OPERATION_TIMEDOUT:
                return HttpClientError::timeout(msg);

            case cpr::ErrorCode::SSL_CONNECT_ERROR:
                return HttpClientError::ssl_error(msg);

            default:
                return HttpClientError::connection_failed(msg);
        }
    }

    std::mutex config_mutex_;
    HeaderMap default_headers_;
    std::chrono::milliseconds connect_timeout_{10'000};
    std::chrono::milliseconds read_timeout_{0};
    bool verify_ssl_{true};
};

}  // namespace

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace evstream
