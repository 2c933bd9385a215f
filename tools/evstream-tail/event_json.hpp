#ifndef EVSTREAM_TOOLS_EVSTREAM_TAIL_EVENT_JSON_HPP
#define EVSTREAM_TOOLS_EVSTREAM_TAIL_EVENT_JSON_HPP

#include "evstream/stream/event.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace evstream::tail {

// One JSON object per event for --json output. Event fields are raw bytes
// from the wire; invalid UTF-8 is written as U+FFFD instead of throwing.
inline std::string event_to_json_line(const Event& event) {
    nlohmann::json out = {
        {"id", event.id},
        {"event", event.name},
        {"data", event.data}
    };
    if (event.retry.has_value()) {
        out["retry"] = event.retry->count();
    }
    return out.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace evstream::tail

#endif  // EVSTREAM_TOOLS_EVSTREAM_TAIL_EVENT_JSON_HPP
