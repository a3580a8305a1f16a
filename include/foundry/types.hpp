#pragma once
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace foundry {

using Clock = std::chrono::system_clock;

// ---------- Tools ----------

enum class ToolOrigin { Builtin, Server };

struct ToolDescriptor {
    std::string name;            // catalog name; "server__tool" for server tools
    std::string description;
    nlohmann::json input_schema;
    ToolOrigin origin = ToolOrigin::Builtin;
    std::string server_id;       // empty for built-ins
    std::string remote_name;     // the server's own name for the tool

    bool operator==(const ToolDescriptor& o) const {
        return name == o.name && description == o.description && input_schema == o.input_schema
               && origin == o.origin && server_id == o.server_id && remote_name == o.remote_name;
    }
};

/// Separator between server id and tool name in catalog names.
constexpr std::string_view NAMESPACE_SEPARATOR = "__";

[[nodiscard]] std::string namespaced_tool_name(const std::string& server_id, const std::string& tool);

/// Splits "server__tool" at the first separator. Returns nullopt for plain names.
[[nodiscard]] std::optional<std::pair<std::string, std::string>>
split_tool_name(const std::string& name);

enum class InvocationStatus { Pending, Ok, Error, Timeout };

enum class ToolErrorKind { None, Unavailable, InvalidArgs, Timeout, Execution, Cancelled };

std::string to_string(InvocationStatus s);
std::string to_string(ToolErrorKind k);

/// Normalized outcome of one tool call, whatever executed it.
struct ToolInvocationResult {
    InvocationStatus status = InvocationStatus::Pending;
    ToolErrorKind error_kind = ToolErrorKind::None;
    nlohmann::json output;       // structured result or text
    std::string error;

    [[nodiscard]] bool ok() const noexcept { return status == InvocationStatus::Ok; }

    /// Payload fed back to the model and to the client: the output on
    /// success, {"error": ...} otherwise.
    [[nodiscard]] nlohmann::json payload() const;

    /// payload() rendered as text for the completion service.
    [[nodiscard]] std::string payload_text() const;

    static ToolInvocationResult success(nlohmann::json output);
    static ToolInvocationResult failure(ToolErrorKind kind, std::string message);
};

class ToolInvocation {
public:
    ToolInvocation() = default;
    ToolInvocation(std::string id, std::string name, nlohmann::json input);

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const nlohmann::json& input() const noexcept { return input_; }
    [[nodiscard]] InvocationStatus status() const noexcept { return status_; }
    [[nodiscard]] ToolErrorKind error_kind() const noexcept { return error_kind_; }
    [[nodiscard]] const std::optional<nlohmann::json>& output() const noexcept { return output_; }
    [[nodiscard]] const std::string& error() const noexcept { return error_; }
    [[nodiscard]] bool resolved() const noexcept { return status_ != InvocationStatus::Pending; }

    /// Moves out of Pending exactly once. Returns false (and changes nothing)
    /// when the invocation is already resolved.
    bool resolve(const ToolInvocationResult& result);

private:
    std::string id_;
    std::string name_;
    nlohmann::json input_;
    InvocationStatus status_ = InvocationStatus::Pending;
    ToolErrorKind error_kind_ = ToolErrorKind::None;
    std::optional<nlohmann::json> output_;
    std::string error_;
};

// ---------- Conversation ----------

enum class Role { User, Assistant };

std::string to_string(Role r);

/// One message in the display history.
class Turn {
public:
    Turn(Role role, std::string content, bool streaming);

    [[nodiscard]] Role role() const noexcept { return role_; }
    [[nodiscard]] const std::string& content() const noexcept { return content_; }
    [[nodiscard]] bool streaming() const noexcept { return streaming_; }
    [[nodiscard]] bool is_final() const noexcept { return final_; }
    [[nodiscard]] const std::string& stop_reason() const noexcept { return stop_reason_; }
    [[nodiscard]] const std::vector<ToolInvocation>& invocations() const noexcept { return invocations_; }
    [[nodiscard]] Clock::time_point created_at() const noexcept { return created_at_; }

    // Mutators throw std::logic_error once the turn is closed.
    void append_text(const std::string& text);
    ToolInvocation& add_invocation(ToolInvocation inv);
    ToolInvocation* find_invocation(const std::string& id);
    void close(bool final, std::string stop_reason);

private:
    void require_open() const;

    Role role_;
    std::string content_;
    bool streaming_;
    bool final_ = true;
    std::string stop_reason_;
    std::vector<ToolInvocation> invocations_;
    Clock::time_point created_at_;
};

// Upstream transcript blocks, in the shape the completion service expects.

struct TextBlock {
    std::string text;
};

struct ToolUseBlock {
    std::string id;
    std::string name;
    nlohmann::json input;
};

struct ToolResultBlock {
    std::string tool_use_id;
    std::string content;
    bool is_error = false;
};

using ContentBlock = std::variant<TextBlock, ToolUseBlock, ToolResultBlock>;

struct Message {
    Role role = Role::User;
    std::vector<ContentBlock> content;
};

void to_json(nlohmann::json& j, const ContentBlock& b);
void to_json(nlohmann::json& j, const Message& m);

struct Conversation {
    std::string id;
    std::string session_key;
    std::string project_id;
    std::string title;
    std::string model;
    std::optional<std::string> continuation_token;
    Clock::time_point created_at;
    Clock::time_point updated_at;
    std::vector<Turn> turns;
    std::vector<Message> transcript;

    [[nodiscard]] bool has_streaming_turn() const;
};

/// Summary view: no turns.
nlohmann::json conversation_summary_json(const Conversation& c);
/// Full view including turns and their tool invocations.
nlohmann::json conversation_detail_json(const Conversation& c);

// ---------- Tool servers ----------

struct ServerConfig {
    std::string id;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool enabled = true;

    /// Same process would be launched.
    [[nodiscard]] bool same_launch(const ServerConfig& o) const {
        return command == o.command && args == o.args && env == o.env;
    }

    bool operator==(const ServerConfig& o) const {
        return id == o.id && same_launch(o) && enabled == o.enabled;
    }
};

enum class ConnectionStatus { Disconnected, Connecting, Connected, Failed };

std::string to_string(ConnectionStatus s);

/// Point-in-time view of one declared server.
struct ServerStatus {
    ServerConfig config;
    ConnectionStatus status = ConnectionStatus::Disconnected;
    std::optional<std::string> error;
    std::vector<ToolDescriptor> tools;
};

void to_json(nlohmann::json& j, const ToolDescriptor& t);
void to_json(nlohmann::json& j, const ServerStatus& s);

std::string format_timestamp(Clock::time_point tp);

} // namespace foundry
