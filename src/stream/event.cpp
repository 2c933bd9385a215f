#include "evstream/stream/event.hpp"

#include <string_view>

namespace evstream {

namespace {

// Calls fn once per '\n'-separated fragment; "a\n" yields "a" and "".
template <typename Fn>
void for_each_data_line(std::string_view data, Fn&& fn) {
    std::size_t start = 0;
    while (true) {
        const std::size_t newline = data.find('\n', start);
        if (newline == std::string_view::npos) {
            fn(data.substr(start));
            return;
        }
        fn(data.substr(start, newline - start));
        start = newline + 1;
    }
}

}  // namespace

std::string Event::encode() const {
    std::string out;
    out.reserve(id.size() + name.size() + data.size() + 32);

    out += "id: ";
    out += id;
    out += "\nevent: ";
    out += name;
    out += '\n';

    for_each_data_line(data, [&out](std::string_view line) {
        if (line.empty()) {
            out += "data\n";
        } else {
            out += "data: ";
            out += line;
            out += '\n';
        }
    });

    out += '\n';
    return out;
}

bool Event::write(std::ostream& out) const {
    out << "id: " << id << '\n';
    out << "event: " << name << '\n';

    for_each_data_line(data, [&out](std::string_view line) {
        if (line.empty()) {
            out << "data\n";
        } else {
            out << "data: " << line << '\n';
        }
    });

    out << '\n';
    return out.good();
}

}  // namespace evstream
