#include "evstream/log/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <mutex>
#include <utility>

namespace evstream {

namespace {

constexpr std::array<std::pair<std::string_view, LogLevel>, 8> level_names{{
    {"trace",   LogLevel::Trace},
    {"debug",   LogLevel::Debug},
    {"info",    LogLevel::Info},
    {"warn",    LogLevel::Warn},
    {"warning", LogLevel::Warn},
    {"error",   LogLevel::Error},
    {"fatal",   LogLevel::Fatal},
    {"off",     LogLevel::Off},
}};

[[nodiscard]] bool equals_ignore_case(std::string_view lhs, std::string_view rhs) noexcept {
    return std::ranges::equal(lhs, rhs, [](unsigned char a, unsigned char b) {
        return std::tolower(a) == std::tolower(b);
    });
}

struct GlobalLogger {
    std::mutex mutex;
    std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
};

GlobalLogger& global_logger() {
    static GlobalLogger global;
    return global;
}

}  // namespace

LogLevel parse_log_level(std::string_view name) noexcept {
    const auto found = std::ranges::find_if(level_names, [name](const auto& entry) {
        return equals_ignore_case(entry.first, name);
    });
    return (found != level_names.end()) ? found->second : LogLevel::Info;
}

ILogger& get_logger() noexcept {
    GlobalLogger& global = global_logger();
    std::lock_guard<std::mutex> lock(global.mutex);
    return *global.instance;
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    GlobalLogger& global = global_logger();
    std::lock_guard<std::mutex> lock(global.mutex);
    if (logger == nullptr) {
        logger = std::make_unique<NullLogger>();
    }
    global.instance = std::move(logger);
}

}  // namespace evstream
