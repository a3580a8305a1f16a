#pragma once
#include "sse.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace foundry {

// ---------- Engine events ----------

struct TextDelta {
    std::string text;
};

struct ToolInvoked {
    std::string id;
    std::string name;
    nlohmann::json input;
};

struct ToolResult {
    std::string id;
    std::string name;
    nlohmann::json output;
    bool is_error = false;
};

struct Done {
    std::string session_id;
    std::string model;
    std::optional<std::string> conversation_id;
};

struct Error {
    std::string message;
};

using StreamEvent = std::variant<TextDelta, ToolInvoked, ToolResult, Done, Error>;

void to_json(nlohmann::json& j, const TextDelta& e);
void to_json(nlohmann::json& j, const ToolInvoked& e);
void to_json(nlohmann::json& j, const ToolResult& e);
void to_json(nlohmann::json& j, const Done& e);
void to_json(nlohmann::json& j, const Error& e);

/// Done and Error end a stream.
[[nodiscard]] bool is_terminal(const StreamEvent& event) noexcept;

// ---------- Wire encoding ----------

/// Maps engine events 1:1 onto SSE frames:
///
///   event: text         data: {"text"}
///   event: tool_use     data: {"id","name","input"}
///   event: tool_result  data: {"id","name","output","is_error"}
///   event: done         data: {"session_id","model","conversation_id"}
///   event: error        data: {"message"}
class StreamEncoder {
public:
    [[nodiscard]] static std::string event_name(const StreamEvent& event);
    [[nodiscard]] static nlohmann::json payload(const StreamEvent& event);

    /// One complete frame, terminated by a blank line.
    [[nodiscard]] static std::string encode(const StreamEvent& event);

    /// SSE comment frame sent while the stream is idle.
    [[nodiscard]] static std::string keepalive();
};

/// Inverse of StreamEncoder over an arbitrarily chunked byte stream.
/// Unknown event names and undecodable payloads are skipped.
class StreamDecoder {
public:
    std::vector<StreamEvent> feed(std::string_view chunk);
    std::vector<StreamEvent> finish();

    [[nodiscard]] static std::optional<StreamEvent> decode(const SseEvent& frame);

private:
    SseParser parser_;
};

} // namespace foundry
