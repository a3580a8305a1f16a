#pragma once
#include <functional>
#include <string>
#include <string_view>

namespace foundry {

struct SseEvent {
    std::string event = "message";
    std::string data;
    std::string id;
};

/// Incremental text/event-stream parser. Bytes can be fed in arbitrary
/// chunks; each complete event (terminated by a blank line) is handed to
/// the callback. Comment lines (":") and unknown fields are ignored.
class SseParser {
public:
    using Callback = std::function<void(const SseEvent&)>;

    void feed(std::string_view chunk, const Callback& on_event);

    /// Dispatch a trailing event that was not followed by a blank line.
    void finish(const Callback& on_event);

    void reset();

private:
    void process_line(std::string_view line, const Callback& on_event);
    void dispatch(const Callback& on_event);

    std::string buffer_;
    SseEvent current_;
    bool has_data_ = false;
};

} // namespace foundry
