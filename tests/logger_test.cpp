#include <catch2/catch_test_macros.hpp>

#include "evstream/log/logger.hpp"
#include "evstream/stream/event_source.hpp"
#include "mocks/mock_http_client.hpp"

#include <algorithm>
#include <mutex>
#include <vector>

using namespace evstream;

// ─────────────────────────────────────────────────────────────────────────────
// Test Logger - Captures log messages for verification
// ─────────────────────────────────────────────────────────────────────────────

class TestLogger final : public ILogger {
public:
    explicit TestLogger(LogLevel min_level = LogLevel::Trace)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
    }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return level_at_least(level, min_level_);
    }

    [[nodiscard]] std::vector<LogRecord> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    [[nodiscard]] std::size_t count(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::ranges::count_if(records_, [level](const LogRecord& r) {
            return r.level == level;
        }));
    }

private:
    LogLevel min_level_;
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Tests
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("LogLevel to_string returns correct names", "[log]") {
    REQUIRE(to_string(LogLevel::Trace) == "TRACE");
    REQUIRE(to_string(LogLevel::Debug) == "DEBUG");
    REQUIRE(to_string(LogLevel::Info) == "INFO");
    REQUIRE(to_string(LogLevel::Warn) == "WARN");
    REQUIRE(to_string(LogLevel::Error) == "ERROR");
    REQUIRE(to_string(LogLevel::Fatal) == "FATAL");
    REQUIRE(to_string(LogLevel::Off) == "OFF");
}

TEST_CASE("parse_log_level accepts names in any case", "[log]") {
    REQUIRE(parse_log_level("trace") == LogLevel::Trace);
    REQUIRE(parse_log_level("DEBUG") == LogLevel::Debug);
    REQUIRE(parse_log_level("Warn") == LogLevel::Warn);
    REQUIRE(parse_log_level("error") == LogLevel::Error);
    REQUIRE(parse_log_level("WARNING") == LogLevel::Warn);
    REQUIRE(parse_log_level("off") == LogLevel::Off);
    REQUIRE(parse_log_level("chatty") == LogLevel::Info);
}

TEST_CASE("NullLogger discards all messages", "[log]") {
    NullLogger logger;

    REQUIRE(logger.should_log(LogLevel::Trace) == false);
    REQUIRE(logger.should_log(LogLevel::Fatal) == false);

    // Should not crash
    logger.trace("test");
    logger.info("test");
    logger.error("test");
}

TEST_CASE("TestLogger captures messages at or above min level", "[log]") {
    TestLogger logger(LogLevel::Warn);

    logger.trace("trace message");
    logger.debug("debug message");
    logger.info("info message");
    logger.warn("warn message");
    logger.error("error message");

    auto records = logger.records();
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].level == LogLevel::Warn);
    REQUIRE(records[0].message == "warn message");
    REQUIRE(records[1].level == LogLevel::Error);
}

TEST_CASE("Formatted helpers build the message", "[log]") {
    TestLogger logger;
    logger.info_fmt("Reconnecting in {}ms", 250);

    auto records = logger.records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].message == "Reconnecting in 250ms");
}

TEST_CASE("LogRecord captures source location", "[log]") {
    TestLogger logger;
    logger.info("test message");

    auto records = logger.records();
    REQUIRE(records.size() == 1);

    std::string_view filename(records[0].location.file_name());
    const bool has_test_filename = (filename.find("logger_test") != std::string_view::npos);
    REQUIRE(has_test_filename);
    REQUIRE(records[0].location.line() > 0);
}

TEST_CASE("level_at_least orders levels", "[log]") {
    REQUIRE(level_at_least(LogLevel::Error, LogLevel::Warn));
    REQUIRE(level_at_least(LogLevel::Warn, LogLevel::Warn));
    REQUIRE_FALSE(level_at_least(LogLevel::Debug, LogLevel::Info));
    REQUIRE_FALSE(level_at_least(LogLevel::Fatal, LogLevel::Off));
}

TEST_CASE("write routes an explicit level", "[log]") {
    TestLogger logger(LogLevel::Info);
    logger.write(LogLevel::Debug, "hidden");
    logger.write(LogLevel::Warn, "shown");
    logger.write_fmt(LogLevel::Error, "status {}", 404);

    auto records = logger.records();
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].level == LogLevel::Warn);
    REQUIRE(records[0].message == "shown");
    REQUIRE(records[1].message == "status 404");
}

TEST_CASE("Global logger defaults to NullLogger", "[log]") {
    set_logger(nullptr);

    REQUIRE(get_logger().should_log(LogLevel::Fatal) == false);
}

TEST_CASE("EVSTREAM_LOG macros filter by level", "[log]") {
    auto test_logger = std::make_unique<TestLogger>(LogLevel::Debug);
    auto* raw_ptr = test_logger.get();
    set_logger(std::move(test_logger));

    EVSTREAM_LOG_TRACE("trace");  // filtered
    EVSTREAM_LOG_DEBUG("debug");
    EVSTREAM_LOG_INFO("info");
    EVSTREAM_LOG_WARN("warn");
    EVSTREAM_LOG_ERROR("error");

    auto records = raw_ptr->records();
    REQUIRE(records.size() == 4);
    REQUIRE(records[0].level == LogLevel::Debug);
    REQUIRE(records[3].level == LogLevel::Error);

    set_logger(nullptr);
}

TEST_CASE("EventSource reports reconnects and failures through the logger", "[log][source]") {
    auto test_logger = std::make_unique<TestLogger>(LogLevel::Debug);
    auto* raw_ptr = test_logger.get();
    set_logger(std::move(test_logger));

    {
        auto mock = std::make_shared<testing::MockHttpClient>();
        mock->queue_status(503);
        mock->queue_status(400, "Bad Request");

        EventSourceConfig config;
        config.url = "http://localhost:8080/events";
        config.with_default_retry_interval(std::chrono::milliseconds{1});
        EventSource source(config, mock);

        auto result = source.next();
        REQUIRE(result.error().is(StreamError::Code::BadResponse));
    }

    REQUIRE(raw_ptr->count(LogLevel::Warn) == 1);   // retryable 503
    REQUIRE(raw_ptr->count(LogLevel::Info) == 1);   // reconnect wait
    REQUIRE(raw_ptr->count(LogLevel::Error) == 1);  // terminal 400
    REQUIRE(raw_ptr->count(LogLevel::Debug) >= 2);  // connect attempts

    set_logger(nullptr);
}
