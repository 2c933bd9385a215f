#include "evstream/transport/pipe_body.hpp"

#include <algorithm>

namespace evstream {

// Compact once this much of the buffer has been consumed
constexpr std::size_t pipe_compact_threshold = 4096;

bool PipeBody::write(std::string_view chunk) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        const bool ended = finished_ || failure_.has_value();
        if (ended) {
            return true;  // late bytes after the end are dropped
        }
        buffer_.append(chunk.data(), chunk.size());
    }
    cv_.notify_all();
    return true;
}

void PipeBody::finish() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    cv_.notify_all();
}

void PipeBody::fail(StreamError error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool already_ended = finished_ || failure_.has_value();
        if (already_ended == false) {
            failure_ = std::move(error);
        }
    }
    cv_.notify_all();
}

StreamResult<std::size_t> PipeBody::read(char* dest, std::size_t max_bytes) {
    std::unique_lock<std::mutex> lock(mutex_);

    cv_.wait(lock, [this] {
        const bool has_bytes = (read_pos_ < buffer_.size());
        return closed_ || has_bytes || finished_ || failure_.has_value();
    });

    if (closed_) {
        return tl::unexpected(StreamError::closed());
    }

    const std::size_t available = buffer_.size() - read_pos_;
    if (available > 0) {
        const std::size_t n = std::min(available, max_bytes);
        std::copy_n(buffer_.data() + read_pos_, n, dest);
        read_pos_ += n;
        if (read_pos_ > pipe_compact_threshold) {
            buffer_.erase(0, read_pos_);
            read_pos_ = 0;
        }
        return n;
    }

    if (failure_.has_value()) {
        return tl::unexpected(*failure_);
    }

    return std::size_t{0};
}

StreamResult<void> PipeBody::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        buffer_.clear();
        read_pos_ = 0;
    }
    cv_.notify_all();
    return {};
}

bool PipeBody::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

}  // namespace evstream
