#pragma once
#include "cancellation.hpp"
#include "completion_client.hpp"
#include "project_catalog.hpp"
#include "session_store.hpp"
#include "stream_encoder.hpp"
#include "tool_router.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace foundry {

/// Page the user is looking at; rendered as hints after the message.
struct ChatContext {
    std::optional<std::string> page;
    std::optional<std::string> canvas_id;
    std::optional<std::string> component_id;
    std::optional<std::string> idea_id;
};

void from_json(const nlohmann::json& j, ChatContext& c);

struct ChatRequest {
    std::string user_id = "local";
    std::string project_id;
    std::string message;
    ChatContext context;
    std::string model;                              // empty: engine default
    std::optional<std::string> conversation_id;
};

enum class EngineState { Idle, Generating, ToolPending, Completed, Aborted, Failed };

std::string to_string(EngineState s);

/// Receives events in order. Returning false means nobody is listening any
/// more; the engine treats it as a cancellation.
using EventSink = std::function<bool(StreamEvent)>;

/// Drives one user message through the bounded generate / tool / generate
/// loop and reports it as a StreamEvent sequence ending in Done or Error
/// (nothing at all after an abort).
class ConversationEngine {
public:
    struct Options {
        int max_tool_rounds = 25;
        int max_tokens = 4096;
        std::string default_model = "claude-opus-4-6";
        bool parallel_tool_calls = false;
        std::chrono::milliseconds cancel_poll{25};
    };

    /// A request bound to its conversation. Holding one keeps the
    /// conversation locked against other requests.
    struct Exchange {
        ChatRequest request;
        ProjectInfo project;
        std::string session_key;
        std::string model;
        SessionStore::Lease lease;

        [[nodiscard]] const std::string& conversation_id() const noexcept { return lease.id(); }
    };

    struct Outcome {
        EngineState state = EngineState::Idle;
        int tool_rounds = 0;
        std::string conversation_id;
        std::optional<std::string> error;
    };

    ConversationEngine(ICompletionClient& client, ToolRouter& router, SessionStore& sessions,
                       std::shared_ptr<const ProjectCatalog> catalog, Options opts);

    /// Resolve and lock the target conversation. Throws
    /// ConversationBusyError when another request is streaming into it.
    [[nodiscard]] Exchange begin(ChatRequest request);

    /// Run the loop to a terminal state. Never throws for upstream or tool
    /// failures; those surface as events and in the Outcome.
    Outcome run(Exchange& exchange, const CancelToken& cancel, const EventSink& sink);

    [[nodiscard]] const Options& options() const noexcept { return opts_; }

private:
    struct RunState;

    /// Returns false when the run was cancelled part way.
    bool execute_tools(RunState& rs, const std::vector<ToolUseBlock>& calls,
                       std::vector<ContentBlock>& results);
    std::optional<ToolInvocationResult> await_tool(RunState& rs,
                                                   std::future<ToolInvocationResult>& fut);
    Outcome complete(RunState& rs, std::string stop_reason);
    Outcome fail(RunState& rs, const std::string& message);
    Outcome abort(RunState& rs);

    ICompletionClient& client_;
    ToolRouter& router_;
    SessionStore& sessions_;
    std::shared_ptr<const ProjectCatalog> catalog_;
    Options opts_;
};

/// Project-scoped system prompt.
[[nodiscard]] std::string build_system_prompt(const ProjectInfo& project);

/// The message followed by one hint line per context field that is set.
[[nodiscard]] std::string augment_message(const std::string& message, const ChatContext& context);

} // namespace foundry
