#pragma once

#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace evstream {

// ─────────────────────────────────────────────────────────────────────────────
// Levels
// ─────────────────────────────────────────────────────────────────────────────
// What the library emits at each level:
//   Trace  dropped events, per-request detail from the transport
//   Debug  connect attempts, stream open/close
//   Info   reconnect waits
//   Warn   failed attempts and retryable statuses
//   Error  non-retryable statuses

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
    Fatal = 5,
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr bool level_at_least(LogLevel level, LogLevel threshold) noexcept {
    return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(threshold);
}

/// Parse a level name ("trace", "INFO", "warning", ...). Unknown names map to Info.
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// LogRecord
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────
// Backends implement log() and should_log(); everything else funnels into
// write() so a disabled level never builds its message.

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(LogLevel level, std::string_view msg,
               std::source_location loc = std::source_location::current()) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Trace, msg, loc);
    }
    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, msg, loc);
    }
    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, msg, loc);
    }
    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, msg, loc);
    }
    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, msg, loc);
    }

    template<typename... Args>
    void write_fmt(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
        if (should_log(level)) {
            log(LogRecord(level, fmt::format(format, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void trace_fmt(fmt::format_string<Args...> format, Args&&... args) {
        write_fmt(LogLevel::Trace, format, std::forward<Args>(args)...);
    }
    template<typename... Args>
    void debug_fmt(fmt::format_string<Args...> format, Args&&... args) {
        write_fmt(LogLevel::Debug, format, std::forward<Args>(args)...);
    }
    template<typename... Args>
    void info_fmt(fmt::format_string<Args...> format, Args&&... args) {
        write_fmt(LogLevel::Info, format, std::forward<Args>(args)...);
    }
    template<typename... Args>
    void warn_fmt(fmt::format_string<Args...> format, Args&&... args) {
        write_fmt(LogLevel::Warn, format, std::forward<Args>(args)...);
    }
    template<typename... Args>
    void error_fmt(fmt::format_string<Args...> format, Args&&... args) {
        write_fmt(LogLevel::Error, format, std::forward<Args>(args)...);
    }
};

/// Default backend: discards everything.
class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Process-wide logger
// ─────────────────────────────────────────────────────────────────────────────

// NullLogger until set_logger() installs a backend
[[nodiscard]] ILogger& get_logger() noexcept;

// Takes ownership; nullptr restores the NullLogger
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

#define EVSTREAM_LOG(level, msg) \
    do { ::evstream::ILogger& evstream_log_target_ = ::evstream::get_logger(); \
         if (evstream_log_target_.should_log(level)) \
             evstream_log_target_.write(level, msg); } while (false)

#define EVSTREAM_LOG_TRACE(msg) EVSTREAM_LOG(::evstream::LogLevel::Trace, msg)
#define EVSTREAM_LOG_DEBUG(msg) EVSTREAM_LOG(::evstream::LogLevel::Debug, msg)
#define EVSTREAM_LOG_INFO(msg)  EVSTREAM_LOG(::evstream::LogLevel::Info, msg)
#define EVSTREAM_LOG_WARN(msg)  EVSTREAM_LOG(::evstream::LogLevel::Warn, msg)
#define EVSTREAM_LOG_ERROR(msg) EVSTREAM_LOG(::evstream::LogLevel::Error, msg)

}  // namespace evstream
