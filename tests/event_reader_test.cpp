#include <catch2/catch_test_macros.hpp>

#include "evstream/stream/event_reader.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace evstream;

namespace {

// Reads every event until the source ends or fails
std::vector<Event> read_all(EventReader& reader) {
    std::vector<Event> events;
    while (true) {
        auto event = reader.next();
        if (event.has_value() == false) {
            return events;
        }
        events.push_back(std::move(*event));
    }
}

// Yields scripted chunks, then a scripted error
class ScriptedReader final : public IByteReader {
public:
    ScriptedReader(std::vector<std::string> chunks, StreamError error)
        : chunks_(std::move(chunks))
        , error_(std::move(error))
    {}

    StreamResult<std::size_t> read(char* dest, std::size_t max_bytes) override {
        if (index_ >= chunks_.size()) {
            return tl::unexpected(error_);
        }
        const std::string& chunk = chunks_[index_++];
        const std::size_t n = std::min(chunk.size(), max_bytes);
        std::copy_n(chunk.data(), n, dest);
        return n;
    }

private:
    std::vector<std::string> chunks_;
    StreamError error_;
    std::size_t index_{0};
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Basic Framing
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("EventReader parses single event", "[reader]") {
    StringReader source("data: hello world\n\n");
    EventReader reader(source);

    auto event = reader.next();
    REQUIRE(event.has_value());
    REQUIRE(event->data == "hello world");
    REQUIRE(event->id.empty());
    REQUIRE(event->name.empty());
    REQUIRE(event->retry.has_value() == false);

    auto end = reader.next();
    REQUIRE(end.has_value() == false);
    REQUIRE(end.error().is(StreamError::Code::EndOfStream));
}

TEST_CASE("EventReader parses event with all fields", "[reader]") {
    StringReader source("event: update\nid: 42\ndata: {\"x\":1}\n\n");
    EventReader reader(source);

    auto event = reader.next();
    REQUIRE(event.has_value());
    REQUIRE(event->name == "update");
    REQUIRE(event->id == "42");
    REQUIRE(event->data == "{\"x\":1}");
    REQUIRE(reader.last_event_id() == "42");
}

TEST_CASE("EventReader joins multiple data lines with newline", "[reader]") {
    StringReader source("data: line one\ndata: line two\ndata: line three\n\n");
    EventReader reader(source);

    auto event = reader.next();
    REQUIRE(event.has_value());
    REQUIRE(event->data == "line one\nline two\nline three");
}

TEST_CASE("EventReader ignores comment lines", "[reader]") {
    StringReader source(": keep-alive\n:another\ndata: payload\n: trailing\n\n");
    EventReader reader(source);

    auto event = reader.next();
    REQUIRE(event.has_value());
    REQUIRE(event->data == "payload");
}

TEST_CASE("EventReader ignores unknown fields", "[reader]") {
    StringReader source("foo: bar\ndata: x\nbaz\n\n");
    EventReader reader(source);

    auto event = reader.next();
    REQUIRE(event.has_value());
    REQUIRE(event->data == "x");
}

TEST_CASE("EventReader strips exactly one space after the colon", "[reader]") {
    SECTION("No space") {
        StringReader source("data:value\n\n");
        EventReader reader(source);
        REQUIRE(reader.next()->data == "value");
    }

    SECTION("One space") {
        StringReader source("data: value\n\n");
        EventReader reader(source);
        REQUIRE(reader.next()->data == "value");
    }

    SECTION("Two spaces keep the second") {
        StringReader source("data:  value\n\n");
        EventReader reader(source);
        REQUIRE(reader.next()->data == " value");
    }

    SECTION("Trailing whitespace is preserved") {
        StringReader source("data: value  \n\n");
        EventReader reader(source);
        REQUIRE(reader.next()->data == "value  ");
    }
}

TEST_CASE("EventReader treats bare data as an empty line", "[reader]") {
    SECTION("Single bare data") {
        StringReader source("data\n\n");
        EventReader reader(source);

        auto event = reader.next();
        REQUIRE(event.has_value());
        REQUIRE(event->data.empty());
    }

    SECTION("Bare data between lines") {
        StringReader source("data: a\ndata\ndata: b\n\n");
        EventReader reader(source);
        REQUIRE(reader.next()->data == "a\n\nb");
    }

    SECTION("Empty value after colon") {
        StringReader source("data:\ndata:\n\n");
        EventReader reader(source);
        REQUIRE(reader.next()->data == "\n");
    }
}

TEST_CASE("EventReader handles CRLF line endings", "[reader]") {
    StringReader source("id: 7\r\nevent: tick\r\ndata: one\r\ndata: two\r\n\r\n");
    EventReader reader(source);

    auto event = reader.next();
    REQUIRE(event.has_value());
    REQUIRE(event->id == "7");
    REQUIRE(event->name == "tick");
    REQUIRE(event->data == "one\ntwo");
}

TEST_CASE("EventReader returns consecutive events in order", "[reader]") {
    StringReader source("data: first\n\ndata: second\n\ndata: third\n\n");
    EventReader reader(source);

    auto events = read_all(reader);
    REQUIRE(events.size() == 3);
    REQUIRE(events[0].data == "first");
    REQUIRE(events[1].data == "second");
    REQUIRE(events[2].data == "third");
}

// ═══════════════════════════════════════════════════════════════════════════
// Dispatch Rules
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("EventReader drops events without data", "[reader][dispatch]") {
    StringReader source("event: ping\n\nid: 5\n\ndata: real\n\n");
    EventReader reader(source);

    auto event = reader.next();
    REQUIRE(event.has_value());
    REQUIRE(event->data == "real");
    // Fields of dropped events do not leak into the next one
    REQUIRE(event->name.empty());
    REQUIRE(event->id.empty());
}

TEST_CASE("EventReader blank lines without an event are skipped", "[reader][dispatch]") {
    StringReader source("\n\n\ndata: x\n\n\n");
    EventReader reader(source);

    auto events = read_all(reader);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "x");
}

TEST_CASE("EventReader discards a partial event at end of stream", "[reader][dispatch]") {
    StringReader source("data: complete\n\ndata: partial\n");
    EventReader reader(source);

    auto first = reader.next();
    REQUIRE(first.has_value());
    REQUIRE(first->data == "complete");

    auto end = reader.next();
    REQUIRE(end.has_value() == false);
    REQUIRE(end.error().is(StreamError::Code::EndOfStream));
}

TEST_CASE("EventReader discards an unterminated line at end of stream", "[reader][dispatch]") {
    StringReader source("data: no newline");
    EventReader reader(source);

    auto end = reader.next();
    REQUIRE(end.has_value() == false);
    REQUIRE(end.error().is(StreamError::Code::EndOfStream));
    REQUIRE(reader.buffered_bytes() == 0);
}

TEST_CASE("EventReader comment-only source ends the stream", "[reader][dispatch]") {
    SECTION("Terminated comment") {
        StringReader source(": only a comment\n");
        EventReader reader(source);

        auto end = reader.next();
        REQUIRE(end.has_value() == false);
        REQUIRE(end.error().is(StreamError::Code::EndOfStream));
    }

    SECTION("Comment without newline") {
        StringReader source(": only a comment");
        EventReader reader(source);

        auto end = reader.next();
        REQUIRE(end.has_value() == false);
        REQUIRE(end.error().is(StreamError::Code::EndOfStream));
    }

    SECTION("Comment block closed by a blank line") {
        StringReader source(": keep-alive\n\n");
        EventReader reader(source);

        auto end = reader.next();
        REQUIRE(end.has_value() == false);
        REQUIRE(end.error().is(StreamError::Code::EndOfStream));
    }
}

TEST_CASE("EventReader empty source ends immediately", "[reader][dispatch]") {
    StringReader source("");
    EventReader reader(source);

    auto end = reader.next();
    REQUIRE(end.has_value() == false);
    REQUIRE(end.error().is(StreamError::Code::EndOfStream));
}

// ═══════════════════════════════════════════════════════════════════════════
// Event Id
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("EventReader id is sticky across events", "[reader][id]") {
    StringReader source("id: 1\ndata: a\n\ndata: b\n\nid: 2\ndata: c\n\n");
    EventReader reader(source);

    auto events = read_all(reader);
    REQUIRE(events.size() == 3);
    REQUIRE(events[0].id == "1");
    REQUIRE(events[1].id == "1");
    REQUIRE(events[2].id == "2");
}

TEST_CASE("EventReader empty id resets the last id", "[reader][id]") {
    StringReader source("id: 1\ndata: a\n\nid\ndata: b\n\ndata: c\n\n");
    EventReader reader(source);

    auto events = read_all(reader);
    REQUIRE(events.size() == 3);
    REQUIRE(events[0].id == "1");
    REQUIRE(events[1].id.empty());
    REQUIRE(events[2].id.empty());
    REQUIRE(reader.last_event_id().empty());
}

TEST_CASE("EventReader id of a dropped event is not remembered", "[reader][id]") {
    StringReader source("id: 1\ndata: a\n\nid: 99\n\ndata: b\n\n");
    EventReader reader(source);

    auto events = read_all(reader);
    REQUIRE(events.size() == 2);
    REQUIRE(events[1].id == "1");
}

TEST_CASE("EventReader seeds id from constructor", "[reader][id]") {
    StringReader source("data: resumed\n\n");
    EventReader reader(source, EventReaderConfig{}, "41");

    REQUIRE(reader.last_event_id() == "41");
    auto event = reader.next();
    REQUIRE(event.has_value());
    REQUIRE(event->id == "41");
}

TEST_CASE("EventReader last field occurrence wins", "[reader][id]") {
    StringReader source("id: a\nid: b\nevent: x\nevent: y\ndata: d\n\n");
    EventReader reader(source);

    auto event = reader.next();
    REQUIRE(event.has_value());
    REQUIRE(event->id == "b");
    REQUIRE(event->name == "y");
}

// ═══════════════════════════════════════════════════════════════════════════
// Retry Directive
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("EventReader parses retry directive", "[reader][retry]") {
    StringReader source("retry: 200\ndata: x\n\ndata: y\n\n");
    EventReader reader(source);

    auto first = reader.next();
    REQUIRE(first.has_value());
    REQUIRE(first->retry == std::chrono::milliseconds{200});

    // The directive belongs to one event only
    auto second = reader.next();
    REQUIRE(second.has_value());
    REQUIRE(second->retry.has_value() == false);
}

TEST_CASE("EventReader ignores malformed retry values", "[reader][retry]") {
    SECTION("Letters") {
        StringReader source("retry: soon\ndata: x\n\n");
        EventReader reader(source);
        REQUIRE(reader.next()->retry.has_value() == false);
    }

    SECTION("Trailing garbage") {
        StringReader source("retry: 100ms\ndata: x\n\n");
        EventReader reader(source);
        REQUIRE(reader.next()->retry.has_value() == false);
    }

    SECTION("Negative") {
        StringReader source("retry: -5\ndata: x\n\n");
        EventReader reader(source);
        REQUIRE(reader.next()->retry.has_value() == false);
    }

    SECTION("Empty") {
        StringReader source("retry:\ndata: x\n\n");
        EventReader reader(source);
        REQUIRE(reader.next()->retry.has_value() == false);
    }

    SECTION("Zero is valid") {
        StringReader source("retry: 0\ndata: x\n\n");
        EventReader reader(source);
        REQUIRE(reader.next()->retry == std::chrono::milliseconds{0});
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Chunking
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("EventReader handles one byte chunks", "[reader][chunked]") {
    const std::string wire = "id: 3\r\nevent: msg\r\ndata: hello\r\ndata: world\r\n\r\ndata: next\n\n";
    StringReader source(wire, 1);
    EventReader reader(source);

    auto events = read_all(reader);
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].id == "3");
    REQUIRE(events[0].name == "msg");
    REQUIRE(events[0].data == "hello\nworld");
    REQUIRE(events[1].data == "next");
    REQUIRE(events[1].id == "3");
}

TEST_CASE("EventReader CR and LF split across chunks", "[reader][chunked]") {
    ScriptedReader source({"data: a\r", "\n\r", "\n"}, StreamError::end_of_stream());
    EventReader reader(source);

    auto event = reader.next();
    REQUIRE(event.has_value());
    REQUIRE(event->data == "a");
}

TEST_CASE("EventReader handles data larger than a read chunk", "[reader][chunked]") {
    const std::string payload(8192, 'x');
    StringReader source("data: " + payload + "\n\ndata: after\n\n");
    EventReader reader(source);

    auto big = reader.next();
    REQUIRE(big.has_value());
    REQUIRE(big->data == payload);

    auto after = reader.next();
    REQUIRE(after.has_value());
    REQUIRE(after->data == "after");
}

TEST_CASE("EventReader handles many events past the compaction threshold", "[reader][chunked]") {
    std::string wire;
    for (int i = 0; i < 1000; ++i) {
        wire += "id: " + std::to_string(i) + "\ndata: event " + std::to_string(i) + "\n\n";
    }
    StringReader source(wire, 777);
    EventReader reader(source);

    auto events = read_all(reader);
    REQUIRE(events.size() == 1000);
    REQUIRE(events.front().data == "event 0");
    REQUIRE(events.back().id == "999");
    REQUIRE(events.back().data == "event 999");
}

// ═══════════════════════════════════════════════════════════════════════════
// Limits
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("EventReader fails on an overlong line", "[reader][limits]") {
    EventReaderConfig config;
    config.max_line_size = 64;
    config.read_chunk_size = 16;

    StringReader source("data: " + std::string(200, 'y') + "\n\n");
    EventReader reader(source, config);

    auto result = reader.next();
    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().is(StreamError::Code::LineTooLong));
}

TEST_CASE("EventReader drops an oversized event and continues", "[reader][limits]") {
    EventReaderConfig config;
    config.max_event_size = 10;

    StringReader source("data: 123456\ndata: 789012\n\ndata: small\n\n");
    EventReader reader(source, config);

    auto event = reader.next();
    REQUIRE(event.has_value());
    REQUIRE(event->data == "small");
}

TEST_CASE("EventReader accepts an event exactly at the size limit", "[reader][limits]") {
    EventReaderConfig config;
    config.max_event_size = 5;

    StringReader source("data: 12\ndata: 34\n\n");
    EventReader reader(source, config);

    auto event = reader.next();
    REQUIRE(event.has_value());
    REQUIRE(event->data == "12\n34");
}

// ═══════════════════════════════════════════════════════════════════════════
// Source Errors
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("EventReader propagates source errors", "[reader][errors]") {
    ScriptedReader source({"data: one\n\ndata: partial\n"}, StreamError::read_failed("reset"));
    EventReader reader(source);

    auto first = reader.next();
    REQUIRE(first.has_value());
    REQUIRE(first->data == "one");

    auto failed = reader.next();
    REQUIRE(failed.has_value() == false);
    REQUIRE(failed.error().is(StreamError::Code::ReadFailed));
    REQUIRE(failed.error().message == "reset");
}

TEST_CASE("EventReader partial event does not survive a source error", "[reader][errors]") {
    class FlakyReader final : public IByteReader {
    public:
        StreamResult<std::size_t> read(char* dest, std::size_t max_bytes) override {
            ++calls_;
            std::string chunk;
            if (calls_ == 1) {
                chunk = "event: lost\ndata: lost\n";
            } else if (calls_ == 2) {
                return tl::unexpected(StreamError::timeout("idle"));
            } else if (calls_ == 3) {
                chunk = "data: kept\n\n";
            } else {
                return std::size_t{0};
            }
            const std::size_t n = std::min(chunk.size(), max_bytes);
            std::copy_n(chunk.data(), n, dest);
            return n;
        }

    private:
        int calls_{0};
    };

    FlakyReader source;
    EventReader reader(source);

    auto failed = reader.next();
    REQUIRE(failed.has_value() == false);
    REQUIRE(failed.error().is(StreamError::Code::Timeout));

    auto event = reader.next();
    REQUIRE(event.has_value());
    REQUIRE(event->data == "kept");
    REQUIRE(event->name.empty());
}
