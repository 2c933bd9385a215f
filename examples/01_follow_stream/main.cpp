// Example 01: Follow a Stream
//
// Reads events on a background thread with a caller-built request factory,
// logs every reconnect, and closes the source from the main thread after a
// fixed duration.

#include <evstream/log/spdlog_logger.hpp>
#include <evstream/stream/event_source.hpp>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace evstream;

int main(int argc, char* argv[]) {
    std::string url = "http://localhost:8080/events";
    int seconds = 10;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--url" && i + 1 < argc) {
            url = argv[++i];
        } else if (arg == "--seconds" && i + 1 < argc) {
            seconds = std::stoi(argv[++i]);
        }
    }

    std::cout << "=== Follow Stream Example ===\n\n";

    set_logger(make_spdlog_console_logger(LogLevel::Info));

    // 1. Build every request from scratch; the session adds Last-Event-ID
    RequestFactory factory = [url]() {
        HttpRequest request;
        request.url = url;
        request.with_header("Accept", "text/event-stream")
               .with_header("Cache-Control", "no-cache");
        return request;
    };

    // 2. Session options
    EventSourceOptions options;
    options.default_retry_interval = std::chrono::milliseconds{500};
    options.on_reconnect = [](std::chrono::milliseconds delay, const StreamError& cause) {
        std::cout << "-- reconnecting in " << delay.count() << "ms ("
                  << to_string(cause.code) << ")\n";
    };

    std::shared_ptr<IHttpClient> client = make_http_client();
    EventSource source(client, factory, options);

    // 3. Reader thread: runs until the stream ends or the source is closed
    std::thread reader([&source] {
        while (true) {
            auto event = source.next();
            if (event.has_value() == false) {
                std::cout << "-- reader stopped: " << event.error().message << "\n";
                return;
            }
            std::cout << "[" << event->id << "] "
                      << (event->name.empty() ? "message" : event->name)
                      << ": " << event->data << "\n";
        }
    });

    // 4. Close from another thread; the blocked next() returns Closed
    std::this_thread::sleep_for(std::chrono::seconds{seconds});
    auto closed = source.close();
    if (closed.has_value() == false) {
        std::cerr << "ERROR: close failed: " << closed.error().message << "\n";
    }
    reader.join();

    std::cout << "\nLast event id: '" << source.last_event_id() << "'\n";
    set_logger(nullptr);
    return 0;
}
