#include "foundry/stream_encoder.hpp"
#include "foundry/codec.hpp"
#include "foundry/error.hpp"

namespace foundry {

void to_json(nlohmann::json& j, const TextDelta& e) {
    j = nlohmann::json{{"text", e.text}};
}

void to_json(nlohmann::json& j, const ToolInvoked& e) {
    j = nlohmann::json{{"id", e.id}, {"name", e.name}, {"input", e.input}};
}

void to_json(nlohmann::json& j, const ToolResult& e) {
    j = nlohmann::json{{"id", e.id}, {"name", e.name}, {"output", e.output}, {"is_error", e.is_error}};
}

void to_json(nlohmann::json& j, const Done& e) {
    j = nlohmann::json{{"session_id", e.session_id}, {"model", e.model}};
    j["conversation_id"] = e.conversation_id ? nlohmann::json(*e.conversation_id) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const Error& e) {
    j = nlohmann::json{{"message", e.message}};
}

bool is_terminal(const StreamEvent& event) noexcept {
    return std::holds_alternative<Done>(event) || std::holds_alternative<Error>(event);
}

// ---------- StreamEncoder ----------

std::string StreamEncoder::event_name(const StreamEvent& event) {
    static const char* const names[] = {"text", "tool_use", "tool_result", "done", "error"};
    return names[event.index()];
}

nlohmann::json StreamEncoder::payload(const StreamEvent& event) {
    nlohmann::json j;
    std::visit([&j](const auto& e) { to_json(j, e); }, event);
    return j;
}

std::string StreamEncoder::encode(const StreamEvent& event) {
    std::string frame = "event: ";
    frame += event_name(event);
    frame += "\ndata: ";
    // dump() never emits raw newlines, so one data line is enough.
    frame += payload(event).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    frame += "\n\n";
    return frame;
}

std::string StreamEncoder::keepalive() {
    return ": keepalive\n\n";
}

// ---------- StreamDecoder ----------

std::optional<StreamEvent> StreamDecoder::decode(const SseEvent& frame) {
    nlohmann::json j;
    try {
        j = Codec::parse_json(frame.data);
    } catch (const ParseError&) {
        return std::nullopt;
    }
    if (!j.is_object()) return std::nullopt;

    if (frame.event == "text") {
        return TextDelta{j.value("text", "")};
    }
    if (frame.event == "tool_use") {
        return ToolInvoked{j.value("id", ""), j.value("name", ""),
                           j.contains("input") ? j["input"] : nlohmann::json::object()};
    }
    if (frame.event == "tool_result") {
        return ToolResult{j.value("id", ""), j.value("name", ""),
                          j.contains("output") ? j["output"] : nlohmann::json(),
                          j.value("is_error", false)};
    }
    if (frame.event == "done") {
        Done d{j.value("session_id", ""), j.value("model", ""), std::nullopt};
        if (j.contains("conversation_id") && j["conversation_id"].is_string()) {
            d.conversation_id = j["conversation_id"].get<std::string>();
        }
        return d;
    }
    if (frame.event == "error") {
        return Error{j.value("message", "")};
    }
    return std::nullopt;
}

std::vector<StreamEvent> StreamDecoder::feed(std::string_view chunk) {
    std::vector<StreamEvent> out;
    parser_.feed(chunk, [&](const SseEvent& frame) {
        if (auto ev = decode(frame)) out.push_back(std::move(*ev));
    });
    return out;
}

std::vector<StreamEvent> StreamDecoder::finish() {
    std::vector<StreamEvent> out;
    parser_.finish([&](const SseEvent& frame) {
        if (auto ev = decode(frame)) out.push_back(std::move(*ev));
    });
    return out;
}

} // namespace foundry
