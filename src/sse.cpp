#include "foundry/sse.hpp"

namespace foundry {

void SseParser::feed(std::string_view chunk, const Callback& on_event) {
    buffer_.append(chunk.data(), chunk.size());

    size_t start = 0;
    while (start < buffer_.size()) {
        size_t eol = buffer_.find_first_of("\r\n", start);
        if (eol == std::string::npos) break;
        // A lone CR at the end may be the first half of CRLF.
        if (buffer_[eol] == '\r' && eol + 1 == buffer_.size()) break;

        process_line(std::string_view(buffer_).substr(start, eol - start), on_event);
        start = eol + 1;
        if (buffer_[eol] == '\r' && buffer_[start] == '\n') ++start;
    }
    buffer_.erase(0, start);
}

void SseParser::finish(const Callback& on_event) {
    if (!buffer_.empty()) {
        std::string rest = std::move(buffer_);
        buffer_.clear();
        if (!rest.empty() && rest.back() == '\r') rest.pop_back();
        process_line(rest, on_event);
    }
    dispatch(on_event);
}

void SseParser::reset() {
    buffer_.clear();
    current_ = SseEvent{};
    has_data_ = false;
}

void SseParser::process_line(std::string_view line, const Callback& on_event) {
    if (line.empty()) {
        dispatch(on_event);
        return;
    }
    if (line.front() == ':') return;

    std::string_view field = line;
    std::string_view value;
    auto colon = line.find(':');
    if (colon != std::string_view::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') value.remove_prefix(1);
    }

    if (field == "event") {
        current_.event = std::string(value);
    } else if (field == "data") {
        if (has_data_) current_.data += '\n';
        current_.data.append(value.data(), value.size());
        has_data_ = true;
    } else if (field == "id") {
        current_.id = std::string(value);
    }
}

void SseParser::dispatch(const Callback& on_event) {
    if (has_data_) {
        if (current_.event.empty()) current_.event = "message";
        on_event(current_);
    }
    current_ = SseEvent{};
    has_data_ = false;
}

} // namespace foundry
