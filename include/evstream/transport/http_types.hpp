#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>

namespace evstream {

// ─────────────────────────────────────────────────────────────────────────────
// Case-Insensitive Header Lookup
// ─────────────────────────────────────────────────────────────────────────────
// HTTP header names are case-insensitive per RFC 7230.

using HeaderMap = std::unordered_map<std::string, std::string>;

[[nodiscard]] inline bool header_name_equals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::ranges::equal(a, b, [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

/// Find a header by name (case-insensitive).
inline HeaderMap::const_iterator find_header(const HeaderMap& headers, std::string_view name) {
    return std::ranges::find_if(headers, [&name](const auto& pair) {
        return header_name_equals(pair.first, name);
    });
}

/// Get header value by name (case-insensitive).
inline std::optional<std::string> get_header(const HeaderMap& headers, std::string_view name) {
    const auto it = find_header(headers, name);
    const bool found = (it != headers.end());
    if (found) {
        return it->second;
    }
    return std::nullopt;
}

/// Set a header, replacing any existing entry whose name differs only in case.
inline void set_header(HeaderMap& headers, const std::string& name, const std::string& value) {
    std::erase_if(headers, [&name](const auto& pair) {
        return header_name_equals(pair.first, name);
    });
    headers[name] = value;
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Method
// ─────────────────────────────────────────────────────────────────────────────

enum class HttpMethod {
    Get,
    Post
};

inline std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:  return "GET";
        case HttpMethod::Post: return "POST";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────────────────────────────────────────────
// HttpRequest
// ─────────────────────────────────────────────────────────────────────────────
// Outbound request descriptor. Produced fresh for every connection attempt by
// the caller's request factory.

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string url;                  // absolute, e.g. "https://host/events"
    HeaderMap headers;
    std::optional<std::string> body;  // only for POST

    HttpRequest& with_header(const std::string& name, const std::string& value) {
        set_header(headers, name, value);
        return *this;
    }

    HttpRequest& with_body(const std::string& content) {
        body = content;
        return *this;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// HttpResponseHead
// ─────────────────────────────────────────────────────────────────────────────
// Status line and headers of a response. The body is streamed separately.

struct HttpResponseHead {
    int status_code{0};
    std::string reason;   // e.g. "OK", "Not Found"
    HeaderMap headers;

    [[nodiscard]] bool is_event_stream() const {
        const auto content_type = get_header(headers, "Content-Type");
        if (content_type.has_value() == false) {
            return false;
        }
        return content_type->find("text/event-stream") != std::string::npos;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// URL Components
// ─────────────────────────────────────────────────────────────────────────────

struct UrlComponents {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::uint16_t port;   // explicit port, or the scheme default
    std::string path;     // always starts with '/'
    std::string query;    // includes leading '?', may be empty

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }
};

/// Parse an http(s) URL with ada-url. Returns nullopt for anything else.
std::optional<UrlComponents> parse_url(const std::string& url);

}  // namespace evstream
