#pragma once

#include "evstream/transport/http_client.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace evstream {

// ─────────────────────────────────────────────────────────────────────────────
// PipeBody
// ─────────────────────────────────────────────────────────────────────────────
// In-memory response body with a producer side and a consumer side.
//
// Producer: write() appends bytes, finish() marks a clean end, fail() marks a
// broken stream. Consumer: read() blocks until bytes, end or failure;
// close() discards everything and wakes any blocked reader with Closed.
//
// Buffered bytes are always delivered before the end or failure is reported.
// All members are thread-safe.

class PipeBody final : public IResponseBody {
public:
    PipeBody() = default;

    PipeBody(const PipeBody&) = delete;
    PipeBody& operator=(const PipeBody&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Producer side
    // ─────────────────────────────────────────────────────────────────────────

    /// Append bytes. Returns false once the consumer has closed the body.
    bool write(std::string_view chunk);

    /// Signal a clean end of the body.
    void finish();

    /// Signal that the body broke; the error is reported after buffered bytes.
    void fail(StreamError error);

    // ─────────────────────────────────────────────────────────────────────────
    // Consumer side
    // ─────────────────────────────────────────────────────────────────────────

    StreamResult<std::size_t> read(char* dest, std::size_t max_bytes) override;

    StreamResult<void> close() override;

    [[nodiscard]] bool is_closed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::string buffer_;
    std::size_t read_pos_{0};
    bool finished_{false};
    bool closed_{false};
    std::optional<StreamError> failure_;
};

}  // namespace evstream
