#include "foundry/conversation_engine.hpp"
#include "foundry/error.hpp"
#include "foundry/logging.hpp"
#include <future>

namespace foundry {

namespace {

constexpr std::size_t TITLE_MAX = 60;

std::string make_title(const std::string& message) {
    if (message.size() <= TITLE_MAX) return message;
    std::size_t n = TITLE_MAX;
    // Do not cut a UTF-8 sequence in half.
    while (n > 0 && (static_cast<unsigned char>(message[n]) & 0xC0) == 0x80) --n;
    return message.substr(0, n) + "...";
}

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    auto s = it->get<std::string>();
    if (s.empty()) return std::nullopt;
    return s;
}

std::future<ToolInvocationResult> ready_future(ToolInvocationResult r) {
    std::promise<ToolInvocationResult> p;
    p.set_value(std::move(r));
    return p.get_future();
}

} // namespace

void from_json(const nlohmann::json& j, ChatContext& c) {
    if (!j.is_object()) return;
    c.page = optional_string(j, "page");
    c.canvas_id = optional_string(j, "canvas_id");
    c.component_id = optional_string(j, "component_id");
    c.idea_id = optional_string(j, "idea_id");
}

std::string to_string(EngineState s) {
    switch (s) {
        case EngineState::Idle:        return "idle";
        case EngineState::Generating:  return "generating";
        case EngineState::ToolPending: return "tool_pending";
        case EngineState::Completed:   return "completed";
        case EngineState::Aborted:     return "aborted";
        case EngineState::Failed:      return "failed";
    }
    return "idle";
}

std::string build_system_prompt(const ProjectInfo& project) {
    return "You are the AI assistant for Foundry, a collaborative software design tool.\n"
           "You have tools to query project data and connected tool servers.\n"
           "Current project: " + project.name + " (slug: " + project.slug + ", id: " + project.id + ")\n"
           "When tools require project_id, use: " + project.id + "\n"
           "When the user asks about architecture, use the canvas tools.\n"
           "Be concise and helpful. Use markdown for formatting.";
}

std::string augment_message(const std::string& message, const ChatContext& context) {
    std::string out = message;
    if (context.page) out += "\n\n[User is on the '" + *context.page + "' page]";
    if (context.canvas_id) out += "\n[Current canvas: " + *context.canvas_id + "]";
    if (context.component_id) out += "\n[Selected component: " + *context.component_id + "]";
    if (context.idea_id) out += "\n[Viewing idea: " + *context.idea_id + "]";
    return out;
}

// ---------- Run state ----------

struct ConversationEngine::RunState {
    Exchange& ex;
    CancelToken cancel;
    const EventSink& sink;
    EngineState state = EngineState::Idle;
    int rounds = 0;
    std::size_t transcript_checkpoint = 0;
    std::size_t turn_index = 0;

    /// Nothing goes out once cancelled; a consumer that hangs up cancels.
    bool emit(StreamEvent ev) {
        if (cancel.is_cancelled()) return false;
        if (!sink(std::move(ev))) {
            cancel.cancel();
            return false;
        }
        return true;
    }

    template <typename F>
    void with_turn(F&& fn) {
        ex.lease.with([&](Conversation& c) { fn(c.turns[turn_index]); });
    }
};

// ---------- ConversationEngine ----------

ConversationEngine::ConversationEngine(ICompletionClient& client, ToolRouter& router,
                                       SessionStore& sessions,
                                       std::shared_ptr<const ProjectCatalog> catalog,
                                       Options opts)
    : client_(client), router_(router), sessions_(sessions),
      catalog_(std::move(catalog)), opts_(std::move(opts)) {}

ConversationEngine::Exchange ConversationEngine::begin(ChatRequest request) {
    Exchange ex;
    ex.project = ProjectInfo{request.project_id, request.project_id, request.project_id};
    if (catalog_) {
        if (auto info = catalog_->find_project(request.project_id)) ex.project = *info;
    }
    ex.session_key = make_session_key(request.user_id, request.project_id);
    ex.model = request.model.empty() ? opts_.default_model : request.model;

    auto id = sessions_.open(ex.session_key, request.project_id, ex.model, request.conversation_id);
    ex.lease = sessions_.acquire(id);
    ex.request = std::move(request);
    return ex;
}

ConversationEngine::Outcome ConversationEngine::run(Exchange& ex, const CancelToken& cancel,
                                                    const EventSink& sink) {
    RunState rs{ex, cancel, sink};
    const std::string augmented = augment_message(ex.request.message, ex.request.context);

    ex.lease.with([&](Conversation& c) {
        rs.transcript_checkpoint = c.transcript.size();
        if (c.title.empty()) c.title = make_title(ex.request.message);
        c.model = ex.model;
        c.turns.emplace_back(Role::User, ex.request.message, false);
        c.turns.emplace_back(Role::Assistant, "", true);
        rs.turn_index = c.turns.size() - 1;
        c.transcript.push_back(Message{Role::User, {TextBlock{augmented}}});
        c.updated_at = Clock::now();
    });
    spdlog::info("chat {} started (project {}, model {})", ex.conversation_id(),
                 ex.request.project_id, ex.model);

    const std::string system = build_system_prompt(ex.project);

    for (;;) {
        rs.state = EngineState::Generating;

        CompletionRequest req;
        req.model = ex.model;
        req.system = system;
        req.max_tokens = opts_.max_tokens;
        req.tools = router_.catalog();
        ex.lease.with([&](Conversation& c) { req.messages = c.transcript; });

        auto on_chunk = [&rs](const CompletionChunk& chunk) -> bool {
            if (rs.cancel.is_cancelled()) return false;
            if (auto* text = std::get_if<TextChunk>(&chunk)) {
                rs.with_turn([&](Turn& t) { t.append_text(text->text); });
                return rs.emit(TextDelta{text->text});
            }
            return true;
        };

        CompletionResult result;
        try {
            result = client_.stream(req, on_chunk, rs.cancel);
        } catch (const UpstreamError& e) {
            if (rs.cancel.is_cancelled()) return abort(rs);
            return fail(rs, e.what());
        } catch (const std::exception& e) {
            if (rs.cancel.is_cancelled()) return abort(rs);
            return fail(rs, std::string("Completion service error: ") + e.what());
        }
        if (result.cancelled || rs.cancel.is_cancelled()) return abort(rs);

        std::vector<ToolUseBlock> calls;
        for (const auto& block : result.content) {
            if (auto* use = std::get_if<ToolUseBlock>(&block)) calls.push_back(*use);
        }

        ex.lease.with([&](Conversation& c) {
            if (!result.response_id.empty()) c.continuation_token = result.response_id;
            if (!result.content.empty()) {
                c.transcript.push_back(Message{Role::Assistant, result.content});
            }
            c.updated_at = Clock::now();
        });

        if (calls.empty()) {
            return complete(rs, result.stop_reason.empty() ? "end_turn" : result.stop_reason);
        }

        if (rs.rounds >= opts_.max_tool_rounds) {
            spdlog::warn("chat {}: tool round limit ({}) reached, {} call(s) not executed",
                         ex.conversation_id(), opts_.max_tool_rounds, calls.size());
            const std::string notice = "\n\n_Stopped after " + std::to_string(opts_.max_tool_rounds)
                                       + " tool rounds without a final answer._";
            Message skipped{Role::User, {}};
            for (const auto& call : calls) {
                skipped.content.push_back(ToolResultBlock{
                    call.id, "Tool call not executed: tool round limit reached", true});
            }
            ex.lease.with([&](Conversation& c) {
                c.transcript.push_back(std::move(skipped));
                c.transcript.push_back(Message{Role::Assistant, {TextBlock{notice}}});
                c.turns[rs.turn_index].append_text(notice);
            });
            rs.emit(TextDelta{notice});
            return complete(rs, "tool_round_limit");
        }

        ++rs.rounds;
        rs.state = EngineState::ToolPending;

        Message results{Role::User, {}};
        if (!execute_tools(rs, calls, results.content)) return abort(rs);
        ex.lease.with([&](Conversation& c) {
            c.transcript.push_back(std::move(results));
            c.updated_at = Clock::now();
        });
    }
}

bool ConversationEngine::execute_tools(RunState& rs, const std::vector<ToolUseBlock>& calls,
                                       std::vector<ContentBlock>& results) {
    auto start = [&](const ToolUseBlock& call) {
        rs.with_turn([&](Turn& t) { t.add_invocation(ToolInvocation(call.id, call.name, call.input)); });
        spdlog::info("chat {}: tool {} {}", rs.ex.conversation_id(), call.name,
                     summarize_for_log(call.input));
        return rs.emit(ToolInvoked{call.id, call.name, call.input});
    };

    auto dispatch = [&](const ToolUseBlock& call) {
        try {
            return router_.invoke_async(call.name, call.input);
        } catch (const FoundryError& e) {
            return ready_future(ToolInvocationResult::failure(ToolErrorKind::Execution, e.what()));
        }
    };

    auto finish = [&](const ToolUseBlock& call, const ToolInvocationResult& result) {
        rs.with_turn([&](Turn& t) {
            if (auto* inv = t.find_invocation(call.id)) inv->resolve(result);
        });
        if (!result.ok()) {
            spdlog::warn("chat {}: tool {} {}: {}", rs.ex.conversation_id(), call.name,
                         to_string(result.error_kind), result.error);
        }
        results.push_back(ToolResultBlock{call.id, result.payload_text(), !result.ok()});
        return rs.emit(ToolResult{call.id, call.name, result.payload(), !result.ok()});
    };

    if (!opts_.parallel_tool_calls) {
        for (const auto& call : calls) {
            if (!start(call)) return false;
            auto fut = dispatch(call);
            auto result = await_tool(rs, fut);
            if (!result) return false;
            if (!finish(call, *result)) return false;
        }
        return true;
    }

    for (const auto& call : calls) {
        if (!start(call)) return false;
    }
    std::vector<std::future<ToolInvocationResult>> futures;
    futures.reserve(calls.size());
    for (const auto& call : calls) futures.push_back(dispatch(call));
    for (std::size_t i = 0; i < calls.size(); ++i) {
        auto result = await_tool(rs, futures[i]);
        if (!result) return false;
        if (!finish(calls[i], *result)) return false;
    }
    return true;
}

std::optional<ToolInvocationResult> ConversationEngine::await_tool(
    RunState& rs, std::future<ToolInvocationResult>& fut) {
    // An abandoned call keeps running on the pool; its result is dropped.
    while (fut.wait_for(opts_.cancel_poll) != std::future_status::ready) {
        if (rs.cancel.is_cancelled()) return std::nullopt;
    }
    if (rs.cancel.is_cancelled()) return std::nullopt;
    try {
        return fut.get();
    } catch (const std::exception& e) {
        return ToolInvocationResult::failure(ToolErrorKind::Execution, e.what());
    }
}

ConversationEngine::Outcome ConversationEngine::complete(RunState& rs, std::string stop_reason) {
    rs.state = EngineState::Completed;
    rs.ex.lease.with([&](Conversation& c) {
        c.turns[rs.turn_index].close(true, stop_reason);
        c.updated_at = Clock::now();
    });
    spdlog::info("chat {} completed after {} tool round(s): {}", rs.ex.conversation_id(),
                 rs.rounds, stop_reason);
    rs.emit(Done{rs.ex.session_key, rs.ex.model, rs.ex.conversation_id()});
    return Outcome{rs.state, rs.rounds, rs.ex.conversation_id(), std::nullopt};
}

ConversationEngine::Outcome ConversationEngine::fail(RunState& rs, const std::string& message) {
    rs.state = EngineState::Failed;
    rs.ex.lease.with([&](Conversation& c) {
        c.turns[rs.turn_index].close(false, "upstream_error");
        c.transcript.erase(c.transcript.begin() + static_cast<std::ptrdiff_t>(rs.transcript_checkpoint),
                           c.transcript.end());
        c.updated_at = Clock::now();
    });
    spdlog::error("chat {} failed: {}", rs.ex.conversation_id(), message);
    rs.emit(Error{message});
    return Outcome{rs.state, rs.rounds, rs.ex.conversation_id(), message};
}

ConversationEngine::Outcome ConversationEngine::abort(RunState& rs) {
    rs.state = EngineState::Aborted;
    rs.ex.lease.with([&](Conversation& c) {
        Turn& turn = c.turns[rs.turn_index];
        std::vector<std::string> pending;
        for (const auto& inv : turn.invocations()) {
            if (!inv.resolved()) pending.push_back(inv.id());
        }
        for (const auto& id : pending) {
            turn.find_invocation(id)->resolve(
                ToolInvocationResult::failure(ToolErrorKind::Cancelled, "Cancelled by client"));
        }
        turn.close(false, "aborted");
        c.transcript.erase(c.transcript.begin() + static_cast<std::ptrdiff_t>(rs.transcript_checkpoint),
                           c.transcript.end());
        c.updated_at = Clock::now();
    });
    spdlog::info("chat {} aborted", rs.ex.conversation_id());
    return Outcome{rs.state, rs.rounds, rs.ex.conversation_id(), std::nullopt};
}

} // namespace foundry
