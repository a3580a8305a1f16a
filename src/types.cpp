#include "foundry/types.hpp"
#include <ctime>
#include <stdexcept>

namespace foundry {

// ---------- Tool names ----------

std::string namespaced_tool_name(const std::string& server_id, const std::string& tool) {
    return server_id + std::string(NAMESPACE_SEPARATOR) + tool;
}

std::optional<std::pair<std::string, std::string>> split_tool_name(const std::string& name) {
    auto pos = name.find(NAMESPACE_SEPARATOR);
    if (pos == std::string::npos || pos == 0 || pos + NAMESPACE_SEPARATOR.size() >= name.size()) {
        return std::nullopt;
    }
    return std::make_pair(name.substr(0, pos), name.substr(pos + NAMESPACE_SEPARATOR.size()));
}

std::string to_string(InvocationStatus s) {
    switch (s) {
        case InvocationStatus::Pending: return "pending";
        case InvocationStatus::Ok:      return "ok";
        case InvocationStatus::Error:   return "error";
        case InvocationStatus::Timeout: return "timeout";
    }
    return "pending";
}

std::string to_string(ToolErrorKind k) {
    switch (k) {
        case ToolErrorKind::None:        return "none";
        case ToolErrorKind::Unavailable: return "unavailable";
        case ToolErrorKind::InvalidArgs: return "invalid_args";
        case ToolErrorKind::Timeout:     return "timeout";
        case ToolErrorKind::Execution:   return "execution";
        case ToolErrorKind::Cancelled:   return "cancelled";
    }
    return "none";
}

// ---------- ToolInvocationResult ----------

nlohmann::json ToolInvocationResult::payload() const {
    if (status == InvocationStatus::Ok) return output;
    return nlohmann::json{{"error", error}};
}

std::string ToolInvocationResult::payload_text() const {
    auto p = payload();
    if (p.is_string()) return p.get<std::string>();
    return p.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

ToolInvocationResult ToolInvocationResult::success(nlohmann::json output) {
    ToolInvocationResult r;
    r.status = InvocationStatus::Ok;
    r.output = std::move(output);
    return r;
}

ToolInvocationResult ToolInvocationResult::failure(ToolErrorKind kind, std::string message) {
    ToolInvocationResult r;
    r.status = kind == ToolErrorKind::Timeout ? InvocationStatus::Timeout : InvocationStatus::Error;
    r.error_kind = kind;
    r.error = std::move(message);
    return r;
}

// ---------- ToolInvocation ----------

ToolInvocation::ToolInvocation(std::string id, std::string name, nlohmann::json input)
    : id_(std::move(id)), name_(std::move(name)), input_(std::move(input)) {}

bool ToolInvocation::resolve(const ToolInvocationResult& result) {
    if (resolved() || result.status == InvocationStatus::Pending) return false;
    status_ = result.status;
    error_kind_ = result.error_kind;
    if (result.status == InvocationStatus::Ok) {
        output_ = result.output;
    } else {
        error_ = result.error;
    }
    return true;
}

// ---------- Turn ----------

std::string to_string(Role r) {
    return r == Role::User ? "user" : "assistant";
}

Turn::Turn(Role role, std::string content, bool streaming)
    : role_(role), content_(std::move(content)), streaming_(streaming),
      created_at_(Clock::now()) {}

void Turn::require_open() const {
    if (!streaming_) throw std::logic_error("Turn is closed");
}

void Turn::append_text(const std::string& text) {
    require_open();
    content_ += text;
}

ToolInvocation& Turn::add_invocation(ToolInvocation inv) {
    require_open();
    invocations_.push_back(std::move(inv));
    return invocations_.back();
}

ToolInvocation* Turn::find_invocation(const std::string& id) {
    require_open();
    for (auto& inv : invocations_) {
        if (inv.id() == id) return &inv;
    }
    return nullptr;
}

void Turn::close(bool final, std::string stop_reason) {
    require_open();
    streaming_ = false;
    final_ = final;
    stop_reason_ = std::move(stop_reason);
}

// ---------- Transcript ----------

void to_json(nlohmann::json& j, const ContentBlock& b) {
    if (auto* t = std::get_if<TextBlock>(&b)) {
        j = {{"type", "text"}, {"text", t->text}};
    } else if (auto* u = std::get_if<ToolUseBlock>(&b)) {
        j = {{"type", "tool_use"}, {"id", u->id}, {"name", u->name}, {"input", u->input}};
    } else {
        const auto& r = std::get<ToolResultBlock>(b);
        j = {{"type", "tool_result"}, {"tool_use_id", r.tool_use_id}, {"content", r.content}};
        if (r.is_error) j["is_error"] = true;
    }
}

void to_json(nlohmann::json& j, const Message& m) {
    nlohmann::json blocks = nlohmann::json::array();
    for (const auto& b : m.content) {
        nlohmann::json bj;
        to_json(bj, b);
        blocks.push_back(std::move(bj));
    }
    j = {{"role", to_string(m.role)}, {"content", std::move(blocks)}};
}

bool Conversation::has_streaming_turn() const {
    for (const auto& t : turns) {
        if (t.streaming()) return true;
    }
    return false;
}

std::string format_timestamp(Clock::time_point tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

nlohmann::json conversation_summary_json(const Conversation& c) {
    nlohmann::json j = {
        {"id", c.id},
        {"project_id", c.project_id},
        {"title", c.title},
        {"model", c.model},
        {"message_count", c.turns.size()},
        {"created_at", format_timestamp(c.created_at)},
        {"updated_at", format_timestamp(c.updated_at)},
    };
    return j;
}

nlohmann::json conversation_detail_json(const Conversation& c) {
    nlohmann::json j = conversation_summary_json(c);
    nlohmann::json messages = nlohmann::json::array();
    for (const auto& t : c.turns) {
        nlohmann::json tools = nlohmann::json::array();
        for (const auto& inv : t.invocations()) {
            nlohmann::json ij = {
                {"id", inv.id()},
                {"name", inv.name()},
                {"input", inv.input()},
                {"status", to_string(inv.status())},
            };
            if (inv.output()) ij["output"] = *inv.output();
            if (!inv.error().empty()) {
                ij["error"] = inv.error();
                ij["error_kind"] = to_string(inv.error_kind());
            }
            tools.push_back(std::move(ij));
        }
        nlohmann::json tj = {
            {"role", to_string(t.role())},
            {"content", t.content()},
            {"streaming", t.streaming()},
            {"final", t.is_final()},
            {"tool_calls", std::move(tools)},
            {"created_at", format_timestamp(t.created_at())},
        };
        if (!t.stop_reason().empty()) tj["stop_reason"] = t.stop_reason();
        messages.push_back(std::move(tj));
    }
    j["messages"] = std::move(messages);
    if (c.continuation_token) j["continuation_token"] = *c.continuation_token;
    return j;
}

// ---------- Tool servers ----------

std::string to_string(ConnectionStatus s) {
    switch (s) {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting:   return "connecting";
        case ConnectionStatus::Connected:    return "connected";
        case ConnectionStatus::Failed:       return "failed";
    }
    return "disconnected";
}

void to_json(nlohmann::json& j, const ToolDescriptor& t) {
    j = {
        {"name", t.name},
        {"description", t.description},
        {"input_schema", t.input_schema},
        {"origin", t.origin == ToolOrigin::Builtin ? "builtin" : t.server_id},
    };
}

void to_json(nlohmann::json& j, const ServerStatus& s) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& t : s.tools) tools.push_back(t.remote_name);
    j = {
        {"name", s.config.id},
        {"command", s.config.command},
        {"args", s.config.args},
        {"enabled", s.config.enabled},
        {"status", to_string(s.status)},
        {"error", s.error ? nlohmann::json(*s.error) : nlohmann::json(nullptr)},
        {"tool_count", s.tools.size()},
        {"tools", std::move(tools)},
    };
}

} // namespace foundry
