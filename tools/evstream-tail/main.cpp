// ─────────────────────────────────────────────────────────────────────────────
// evstream-tail - follow an event stream from the command line
// ─────────────────────────────────────────────────────────────────────────────
// Connects to an event stream, prints every event and reconnects through
// failures, resuming with Last-Event-ID.
//
// Usage:
//   evstream-tail --url http://localhost:8080/events
//   evstream-tail --url https://api.example.com/stream \
//                 --header "X-Tenant: acme" --bearer tok_xxx \
//                 --retry-ms 500 --json
//   evstream-tail --url http://localhost:8080/events --count 10 --log-level debug
//
// Exit codes:
//   0  stream ended or was interrupted
//   1  usage error
//   2  server rejected the stream (non-retryable status)

#include <cxxopts.hpp>

#include "event_json.hpp"
#include "evstream/log/logger.hpp"
#include "evstream/log/spdlog_logger.hpp"
#include "evstream/stream/event_source.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace evstream;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Signal Handling
// ═══════════════════════════════════════════════════════════════════════════

namespace {

std::atomic<bool> g_interrupted{false};

extern "C" void on_signal(int /*signum*/) {
    g_interrupted.store(true);
}

// Polls the interrupt flag and closes the source, which wakes the reader
class InterruptWatcher {
public:
    explicit InterruptWatcher(EventSource& source)
        : thread_([this, &source] { run(source); })
    {}

    ~InterruptWatcher() {
        done_.store(true);
        thread_.join();
    }

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    void run(EventSource& source) {
        while (done_.load() == false) {
            if (g_interrupted.load()) {
                auto closed = source.close();
                if (closed.has_value() == false) {
                    get_logger().warn_fmt("Close on interrupt failed: {}", closed.error().message);
                }
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{50});
        }
    }

    std::atomic<bool> done_{false};
    std::thread thread_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Output
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& message) {
    std::cerr << color::c(color::red) << "error: " << color::c(color::reset) << message << "\n";
}

void print_event(const Event& event, bool json_output) {
    if (json_output) {
        std::cout << tail::event_to_json_line(event) << std::endl;
        return;
    }

    std::cout << color::c(color::dim) << "id: " << color::c(color::reset) << event.id << "\n";
    if (event.name.empty() == false) {
        std::cout << color::c(color::cyan) << "event: " << color::c(color::reset) << event.name << "\n";
    }
    std::cout << color::c(color::green) << "data: " << color::c(color::reset) << event.data << "\n"
              << std::endl;
}

// Parse header string "Name: Value" into pair
std::pair<std::string, std::string> parse_header(const std::string& header) {
    auto colon_pos = header.find(':');
    if (colon_pos == std::string::npos) {
        return {header, ""};
    }
    std::string name = header.substr(0, colon_pos);
    std::string value = header.substr(colon_pos + 1);
    auto start = value.find_first_not_of(" \t");
    if (start != std::string::npos) {
        value = value.substr(start);
    } else {
        value.clear();
    }
    return {name, value};
}

void install_logger(const std::string& level_name, const std::string& log_file) {
    const LogLevel level = parse_log_level(level_name);
    if (log_file.empty()) {
        set_logger(make_spdlog_console_logger(level));
    } else {
        set_logger(make_spdlog_file_logger(log_file, level));
    }
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("evstream-tail", "Follow an event stream and print its events");

    options.add_options()
        ("u,url", "Stream URL (http or https)", cxxopts::value<std::string>())
        ("H,header", "HTTP header (can be repeated, format: 'Name: Value')", cxxopts::value<std::vector<std::string>>()->default_value(""))
        ("bearer", "Bearer token for Authorization header", cxxopts::value<std::string>())
        ("last-event-id", "Resume after this event id", cxxopts::value<std::string>()->default_value(""))
        ("retry-ms", "Reconnect interval until the server sends one (0 = 1000)", cxxopts::value<std::int64_t>()->default_value("0"))
        ("connect-timeout-ms", "Connect timeout", cxxopts::value<std::int64_t>()->default_value("10000"))
        ("insecure", "Skip TLS certificate verification")
        ("n,count", "Exit after this many events (0 = unlimited)", cxxopts::value<std::uint64_t>()->default_value("0"))
        ("json", "Print one JSON object per event")
        ("log-level", "trace, debug, info, warn, error or off", cxxopts::value<std::string>()->default_value("warn"))
        ("log-file", "Write logs to this file instead of stderr", cxxopts::value<std::string>()->default_value(""))
        ("no-color", "Disable colored output")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;
        if (json_output) {
            color::enabled = false;
        }

        if (result.count("url") == 0) {
            print_error("--url is required");
            std::cout << "\n" << options.help() << "\n";
            return 1;
        }

        install_logger(result["log-level"].as<std::string>(), result["log-file"].as<std::string>());

        EventSourceConfig config;
        config.url = result["url"].as<std::string>();
        config.verify_ssl = (result.count("insecure") == 0);
        config.with_connect_timeout(std::chrono::milliseconds{result["connect-timeout-ms"].as<std::int64_t>()})
              .with_default_retry_interval(std::chrono::milliseconds{result["retry-ms"].as<std::int64_t>()})
              .with_last_event_id(result["last-event-id"].as<std::string>());

        if (result.count("bearer")) {
            config.with_bearer_token(result["bearer"].as<std::string>());
        }

        for (const auto& header : result["header"].as<std::vector<std::string>>()) {
            if (header.empty()) {
                continue;
            }
            auto [name, value] = parse_header(header);
            config.with_header(name, value);
        }

        if (config.connect_timeout.count() <= 0) {
            print_error("--connect-timeout-ms must be positive");
            return 1;
        }

        const std::uint64_t max_events = result["count"].as<std::uint64_t>();

        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);

        int exit_code = 0;
        {
            EventSource source(config);
            InterruptWatcher watcher(source);

            std::uint64_t received = 0;
            while ((max_events == 0) || (received < max_events)) {
                auto event = source.next();
                if (event.has_value() == false) {
                    const StreamError& err = event.error();
                    if (err.is(StreamError::Code::BadResponse)) {
                        print_error(err.message);
                        exit_code = 2;
                    } else if (err.is(StreamError::Code::EndOfStream)) {
                        get_logger().info("Stream ended");
                    }
                    break;
                }
                print_event(*event, json_output);
                ++received;
            }

            auto closed = source.close();
            if (closed.has_value() == false) {
                get_logger().warn_fmt("Close failed: {}", closed.error().message);
            }

            if (source.last_event_id().empty() == false) {
                get_logger().info_fmt("Last event id: {}", source.last_event_id());
            }
        }

        set_logger(nullptr);
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        print_error(e.what());
        return 1;
    }
}
