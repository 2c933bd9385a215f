#pragma once

#include <chrono>
#include <optional>
#include <ostream>
#include <string>

namespace evstream {

/// A single dispatched event.
///
/// Wire format produced by encode() and consumed by EventReader:
///   id: <id>
///   event: <name>
///   data: <first line of data>
///   data: <next line ...>       (bare "data" for an empty line)
///   <blank line>
///
struct Event {
    std::string id;                                  // Defaults to the last known id
    std::string name;                                // Empty when the stream set none
    std::string data;                                // Lines joined by '\n'
    std::optional<std::chrono::milliseconds> retry;  // Only when the wire carried "retry:"

    /// Serialize to the wire format. The retry directive is not emitted.
    [[nodiscard]] std::string encode() const;

    /// Write encode() to a stream. Returns false if the stream failed.
    bool write(std::ostream& out) const;

    bool operator==(const Event&) const = default;
};

}  // namespace evstream
