#ifndef EVSTREAM_TRANSPORT_RETRY_POLICY_HPP
#define EVSTREAM_TRANSPORT_RETRY_POLICY_HPP

#include <set>
#include <string_view>

namespace evstream {

enum class StatusClass {
    Success,  // Open the stream
    Retry,    // Drop the body, wait, reconnect
    Fail      // Terminal: report a bad response
};

[[nodiscard]] constexpr std::string_view to_string(StatusClass status_class) noexcept {
    switch (status_class) {
        case StatusClass::Success: return "Success";
        case StatusClass::Retry:   return "Retry";
        case StatusClass::Fail:    return "Fail";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// RetryPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Decides what a response status means for an event stream connection.
//
// Default behavior:
// - 200 opens the stream
// - 500, 502, 503, 504 are retried after the backoff interval
// - everything else fails the connection
//
// Transport failures (no status at all) are always retried and never reach
// this class.
//
// Usage:
//   RetryPolicy policy;
//   policy.with_retryable_status(429)
//         .without_retryable_status(500);

class RetryPolicy {
public:
    RetryPolicy()
        : success_statuses_{200}
        , retryable_statuses_{500, 502, 503, 504}
    {}

    RetryPolicy& with_retryable_status(int status_code) {
        retryable_statuses_.insert(status_code);
        return *this;
    }

    RetryPolicy& without_retryable_status(int status_code) {
        retryable_statuses_.erase(status_code);
        return *this;
    }

    [[nodiscard]] StatusClass classify(int status_code) const {
        if (success_statuses_.contains(status_code)) {
            return StatusClass::Success;
        }
        if (retryable_statuses_.contains(status_code)) {
            return StatusClass::Retry;
        }
        return StatusClass::Fail;
    }

    [[nodiscard]] bool should_retry_http_status(int status_code) const {
        return classify(status_code) == StatusClass::Retry;
    }

    [[nodiscard]] const std::set<int>& retryable_statuses() const noexcept {
        return retryable_statuses_;
    }

private:
    std::set<int> success_statuses_;
    std::set<int> retryable_statuses_;
};

}  // namespace evstream

#endif  // EVSTREAM_TRANSPORT_RETRY_POLICY_HPP
