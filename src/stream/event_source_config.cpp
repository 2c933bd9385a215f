#include "evstream/stream/event_source_config.hpp"

#include <stdexcept>

namespace evstream {

EventSourceConfig& EventSourceConfig::with_bearer_token(const std::string& token) {
    set_header(default_headers, "Authorization", "Bearer " + token);
    return *this;
}

EventSourceConfig& EventSourceConfig::with_header(const std::string& name, const std::string& value) {
    set_header(default_headers, name, value);
    return *this;
}

EventSourceConfig& EventSourceConfig::with_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout = timeout;
    return *this;
}

EventSourceConfig& EventSourceConfig::with_read_timeout(std::chrono::milliseconds timeout) {
    read_timeout = timeout;
    return *this;
}

EventSourceConfig& EventSourceConfig::with_default_retry_interval(std::chrono::milliseconds interval) {
    options.default_retry_interval = interval;
    return *this;
}

EventSourceConfig& EventSourceConfig::with_last_event_id(const std::string& id) {
    options.last_event_id = id;
    return *this;
}

EventSourceConfig& EventSourceConfig::with_post_body(const std::string& content) {
    method = HttpMethod::Post;
    body = content;
    return *this;
}

void EventSourceConfig::validate() const {
    if (url.empty()) {
        throw std::invalid_argument("EventSourceConfig: url is required");
    }
    if (parse_url(url).has_value() == false) {
        throw std::invalid_argument("EventSourceConfig: not an http(s) URL: " + url);
    }
    if (options.default_retry_interval.count() < 0) {
        throw std::invalid_argument("EventSourceConfig: negative retry interval");
    }
}

RequestFactory EventSourceConfig::make_request_factory() const {
    HttpRequest prototype;
    prototype.method = method;
    prototype.url = url;
    prototype.headers = default_headers;
    if (method == HttpMethod::Post) {
        prototype.body = body.value_or("");
    }

    return [prototype]() {
        return prototype;
    };
}

}  // namespace evstream
