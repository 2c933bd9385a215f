#pragma once

#include "evstream/stream_error.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>

namespace evstream {

// ─────────────────────────────────────────────────────────────────────────────
// IByteReader
// ─────────────────────────────────────────────────────────────────────────────
// Pull-based byte source. read() blocks until at least one byte is available,
// the source ends (returns 0), or the source fails.

class IByteReader {
public:
    virtual ~IByteReader() = default;

    [[nodiscard]] virtual StreamResult<std::size_t> read(char* dest, std::size_t max_bytes) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// StringReader
// ─────────────────────────────────────────────────────────────────────────────
// Serves an in-memory buffer, optionally in fixed-size slices so callers can
// exercise chunk boundaries.

class StringReader final : public IByteReader {
public:
    explicit StringReader(std::string content, std::size_t max_chunk = 0)
        : content_(std::move(content))
        , max_chunk_(max_chunk)
    {}

    StreamResult<std::size_t> read(char* dest, std::size_t max_bytes) override {
        const std::size_t remaining = content_.size() - pos_;
        std::size_t n = std::min(remaining, max_bytes);
        if (max_chunk_ > 0) {
            n = std::min(n, max_chunk_);
        }
        std::copy_n(content_.data() + pos_, n, dest);
        pos_ += n;
        return n;
    }

    [[nodiscard]] std::size_t remaining() const noexcept { return content_.size() - pos_; }

private:
    std::string content_;
    std::size_t max_chunk_;
    std::size_t pos_{0};
};

}  // namespace evstream
