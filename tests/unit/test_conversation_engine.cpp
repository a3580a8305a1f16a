#include <gtest/gtest.h>
#include "foundry/builtin_tools.hpp"
#include "foundry/conversation_engine.hpp"
#include "foundry/error.hpp"
#include <mutex>
#include <thread>

using namespace foundry;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

struct ScriptedResponse {
    std::string text;
    std::vector<ToolUseBlock> calls;
    std::string id = "msg_1";
    std::vector<std::string> chunks_before_error;
    std::optional<UpstreamError> error;
};

ScriptedResponse say(std::string text, std::string id = "msg_1") {
    ScriptedResponse r;
    r.text = std::move(text);
    r.id = std::move(id);
    return r;
}

ScriptedResponse use(std::string text, std::vector<ToolUseBlock> calls, std::string id = "msg_1") {
    ScriptedResponse r;
    r.text = std::move(text);
    r.calls = std::move(calls);
    r.id = std::move(id);
    return r;
}

ScriptedResponse failure(int status, std::string message) {
    ScriptedResponse r;
    r.error = UpstreamError(status, message);
    return r;
}

/// Streams `chunks`, then the connection drops.
ScriptedResponse broken_stream(std::vector<std::string> chunks, std::string message) {
    ScriptedResponse r;
    r.chunks_before_error = std::move(chunks);
    r.error = UpstreamError(message);
    return r;
}

/// Plays back one scripted response per call; the last one repeats.
class ScriptedClient : public ICompletionClient {
public:
    explicit ScriptedClient(std::vector<ScriptedResponse> script) : script_(std::move(script)) {}

    CompletionResult stream(const CompletionRequest& request, const ChunkCallback& on_chunk,
                            const CancelToken& cancel) override {
        ScriptedResponse r;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            r = script_[std::min(calls_, script_.size() - 1)];
            ++calls_;
        }
        if (r.error) {
            for (const auto& chunk : r.chunks_before_error) {
                if (!on_chunk(TextChunk{chunk})) break;
            }
            throw *r.error;
        }

        CompletionResult result;
        result.response_id = r.id;
        if (!r.text.empty()) {
            if (!on_chunk(TextChunk{r.text}) || cancel.is_cancelled()) {
                result.cancelled = true;
                return result;
            }
            result.content.push_back(TextBlock{r.text});
        }
        for (const auto& call : r.calls) {
            result.content.push_back(call);
            if (!on_chunk(ToolCallChunk{call.id, call.name, call.input})) {
                result.cancelled = true;
                return result;
            }
        }
        result.stop_reason = r.calls.empty() ? "end_turn" : "tool_use";
        return result;
    }

    std::size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    CompletionRequest request(std::size_t i) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.at(i);
    }

private:
    mutable std::mutex mutex_;
    std::vector<ScriptedResponse> script_;
    std::vector<CompletionRequest> requests_;
    std::size_t calls_ = 0;
};

json project_document() {
    return json::parse(R"({"projects": [{
        "id": "p1", "name": "Atlas", "slug": "atlas",
        "canvases": [
            {"id": "c1", "name": "Backend", "components": [{"id": "k1"}]},
            {"id": "c2", "name": "Frontend", "components": []}
        ]
    }]})");
}

struct Recorder {
    std::vector<StreamEvent> events;
    bool hang_up_on_tool_use = false;

    EventSink sink() {
        return [this](StreamEvent ev) {
            bool is_tool_use = std::holds_alternative<ToolInvoked>(ev);
            events.push_back(std::move(ev));
            return !(hang_up_on_tool_use && is_tool_use);
        };
    }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        for (const auto& e : events) out.push_back(StreamEncoder::event_name(e));
        return out;
    }
};

class ConversationEngineTest : public ::testing::Test {
protected:
    ConversationEngineTest()
        : catalog_(std::make_shared<JsonProjectCatalog>(project_document())),
          servers_(ServerManager::Options{}) {
        register_project_tools(registry_, catalog_);
        registry_.add("wait_a_bit", "Sleeps for 300 ms", {{"type", "object"}},
                      [](const json&) -> json {
                          std::this_thread::sleep_for(300ms);
                          return "waited";
                      });
        registry_.seal();
        router_ = std::make_unique<ToolRouter>(registry_, servers_, ToolRouter::Options{});
    }

    ConversationEngine make_engine(ICompletionClient& client, int max_rounds = 25, bool parallel = false) {
        ConversationEngine::Options opts;
        opts.max_tool_rounds = max_rounds;
        opts.parallel_tool_calls = parallel;
        opts.cancel_poll = 5ms;
        return ConversationEngine(client, *router_, sessions_, catalog_, opts);
    }

    static ChatRequest request(std::string message) {
        ChatRequest r;
        r.user_id = "u1";
        r.project_id = "p1";
        r.message = std::move(message);
        return r;
    }

    std::shared_ptr<JsonProjectCatalog> catalog_;
    ToolRegistry registry_;
    ServerManager servers_;
    std::unique_ptr<ToolRouter> router_;
    SessionStore sessions_;
};

} // namespace

// ---- Prompt helpers ----

TEST(ConversationPrompt, SystemPromptNamesProject) {
    auto prompt = build_system_prompt(ProjectInfo{"p1", "Atlas", "atlas"});
    EXPECT_NE(prompt.find("Current project: Atlas (slug: atlas, id: p1)"), std::string::npos);
    EXPECT_NE(prompt.find("use: p1"), std::string::npos);
    EXPECT_EQ(prompt.find("project_slug"), std::string::npos);
}

TEST(ConversationPrompt, ContextHints) {
    ChatContext ctx;
    EXPECT_EQ(augment_message("hi", ctx), "hi");
    ctx = json{{"page", "canvas"}, {"canvas_id", "c1"}, {"component_id", ""}, {"idea_id", 5}}.get<ChatContext>();
    EXPECT_EQ(augment_message("hi", ctx), "hi\n\n[User is on the 'canvas' page]\n[Current canvas: c1]");
}

// ---- Loop ----

TEST_F(ConversationEngineTest, PlainAnswer) {
    ScriptedClient client({say("Hello!", "msg_a")});
    auto engine = make_engine(client);
    Recorder rec;

    auto ex = engine.begin(request("hi"));
    auto outcome = engine.run(ex, CancelToken{}, rec.sink());

    EXPECT_EQ(outcome.state, EngineState::Completed);
    EXPECT_EQ(outcome.tool_rounds, 0);
    EXPECT_EQ(rec.names(), (std::vector<std::string>{"text", "done"}));
    const auto& done = std::get<Done>(rec.events.back());
    EXPECT_EQ(done.session_id, "u1:p1");
    EXPECT_EQ(done.model, "claude-opus-4-6");
    EXPECT_EQ(done.conversation_id.value(), outcome.conversation_id);

    auto conv = sessions_.snapshot(outcome.conversation_id).value();
    EXPECT_EQ(conv.title, "hi");
    EXPECT_EQ(conv.continuation_token.value(), "msg_a");
    ASSERT_EQ(conv.turns.size(), 2u);
    EXPECT_EQ(conv.turns[1].content(), "Hello!");
    EXPECT_TRUE(conv.turns[1].is_final());
    EXPECT_FALSE(conv.turns[1].streaming());
    EXPECT_EQ(conv.transcript.size(), 2u);

    auto req = client.request(0);
    EXPECT_NE(req.system.find("Atlas"), std::string::npos);
    EXPECT_EQ(req.tools.size(), registry_.size());
}

TEST_F(ConversationEngineTest, ToolRoundTrip) {
    ScriptedClient client({
        use("Let me look.", {ToolUseBlock{"tu_1", "list_canvases", {{"project_id", "p1"}}}}, "msg_1"),
        say("You have 2 canvases.", "msg_2"),
    });
    auto engine = make_engine(client);
    Recorder rec;

    auto ex = engine.begin(request("What canvases do I have?"));
    auto outcome = engine.run(ex, CancelToken{}, rec.sink());

    EXPECT_EQ(outcome.state, EngineState::Completed);
    EXPECT_EQ(outcome.tool_rounds, 1);
    EXPECT_EQ(rec.names(), (std::vector<std::string>{"text", "tool_use", "tool_result", "text", "done"}));

    const auto& invoked = std::get<ToolInvoked>(rec.events[1]);
    EXPECT_EQ(invoked.id, "tu_1");
    EXPECT_EQ(invoked.name, "list_canvases");
    const auto& result = std::get<ToolResult>(rec.events[2]);
    EXPECT_FALSE(result.is_error);
    ASSERT_TRUE(result.output.is_array());
    EXPECT_EQ(result.output.size(), 2u);

    // The second request carries the tool result paired with its call.
    auto second = client.request(1);
    ASSERT_EQ(second.messages.size(), 3u);
    const auto& block = std::get<ToolResultBlock>(second.messages[2].content.at(0));
    EXPECT_EQ(block.tool_use_id, "tu_1");
    EXPECT_FALSE(block.is_error);

    auto conv = sessions_.snapshot(outcome.conversation_id).value();
    EXPECT_EQ(conv.continuation_token.value(), "msg_2");
    EXPECT_EQ(conv.transcript.size(), 4u);
    EXPECT_EQ(conv.turns[1].content(), "Let me look.You have 2 canvases.");
    ASSERT_EQ(conv.turns[1].invocations().size(), 1u);
    EXPECT_EQ(conv.turns[1].invocations()[0].status(), InvocationStatus::Ok);
}

TEST_F(ConversationEngineTest, FailedToolIsReportedAndLoopContinues) {
    ScriptedClient client({
        use("", {ToolUseBlock{"tu_1", "search__web_lookup", {{"q", "x"}}}}),
        say("That tool is unavailable."),
    });
    auto engine = make_engine(client);
    Recorder rec;

    auto ex = engine.begin(request("search the web"));
    auto outcome = engine.run(ex, CancelToken{}, rec.sink());

    EXPECT_EQ(outcome.state, EngineState::Completed);
    const auto& result = std::get<ToolResult>(rec.events[1]);
    EXPECT_TRUE(result.is_error);
    EXPECT_TRUE(result.output.contains("error"));

    auto conv = sessions_.snapshot(outcome.conversation_id).value();
    const auto& inv = conv.turns[1].invocations().at(0);
    EXPECT_EQ(inv.error_kind(), ToolErrorKind::Unavailable);
    const auto& block = std::get<ToolResultBlock>(client.request(1).messages[2].content.at(0));
    EXPECT_TRUE(block.is_error);
}

TEST_F(ConversationEngineTest, UpstreamFailureRollsBackTranscript) {
    ScriptedClient client({failure(529, "The completion service is overloaded. Please try again shortly.")});
    auto engine = make_engine(client);
    Recorder rec;

    auto ex = engine.begin(request("hi"));
    auto outcome = engine.run(ex, CancelToken{}, rec.sink());

    EXPECT_EQ(outcome.state, EngineState::Failed);
    ASSERT_TRUE(outcome.error.has_value());
    ASSERT_EQ(rec.events.size(), 1u);
    EXPECT_EQ(std::get<Error>(rec.events[0]).message,
              "The completion service is overloaded. Please try again shortly.");

    auto conv = sessions_.snapshot(outcome.conversation_id).value();
    EXPECT_TRUE(conv.transcript.empty());
    EXPECT_FALSE(conv.turns[1].is_final());
    EXPECT_EQ(conv.turns[1].stop_reason(), "upstream_error");
    EXPECT_FALSE(conv.has_streaming_turn());
}

TEST_F(ConversationEngineTest, StreamFailureKeepsPartialText) {
    ScriptedClient client({broken_stream({"Your canvases ", "are Backend ", "and"},
                                         "Completion stream ended before message_stop")});
    auto engine = make_engine(client);
    Recorder rec;

    auto ex = engine.begin(request("list my canvases"));
    auto outcome = engine.run(ex, CancelToken{}, rec.sink());

    EXPECT_EQ(outcome.state, EngineState::Failed);
    EXPECT_EQ(rec.names(), (std::vector<std::string>{"text", "text", "text", "error"}));
    EXPECT_EQ(std::get<Error>(rec.events.back()).message, "Completion stream ended before message_stop");

    auto conv = sessions_.snapshot(outcome.conversation_id).value();
    ASSERT_EQ(conv.turns.size(), 2u);
    EXPECT_EQ(conv.turns[1].content(), "Your canvases are Backend and");
    EXPECT_FALSE(conv.turns[1].is_final());
    EXPECT_FALSE(conv.turns[1].streaming());
    EXPECT_EQ(conv.turns[1].stop_reason(), "upstream_error");
    EXPECT_TRUE(conv.transcript.empty());
}

TEST_F(ConversationEngineTest, FailureAfterToolRoundKeepsEarlierHistory) {
    ScriptedClient first({say("first answer")});
    {
        auto engine = make_engine(first);
        Recorder rec;
        auto ex = engine.begin(request("one"));
        engine.run(ex, CancelToken{}, rec.sink());
    }
    ScriptedClient client({
        use("", {ToolUseBlock{"tu_1", "list_canvases", {{"project_id", "p1"}}}}),
        failure(500, "Completion service error (HTTP 500): boom"),
    });
    auto engine = make_engine(client);
    Recorder rec;
    auto ex = engine.begin(request("two"));
    auto outcome = engine.run(ex, CancelToken{}, rec.sink());

    EXPECT_EQ(outcome.state, EngineState::Failed);
    EXPECT_EQ(rec.names(), (std::vector<std::string>{"tool_use", "tool_result", "error"}));
    auto conv = sessions_.snapshot(outcome.conversation_id).value();
    ASSERT_EQ(conv.transcript.size(), 2u);
    EXPECT_EQ(std::get<TextBlock>(conv.transcript[1].content[0]).text, "first answer");
    EXPECT_EQ(conv.turns.size(), 4u);
}

TEST_F(ConversationEngineTest, ConsumerHangupAbortsSilently) {
    ScriptedClient client({use("Checking.", {ToolUseBlock{"tu_1", "list_canvases", {{"project_id", "p1"}}}})});
    auto engine = make_engine(client);
    Recorder rec;
    rec.hang_up_on_tool_use = true;

    auto ex = engine.begin(request("hi"));
    auto outcome = engine.run(ex, CancelToken{}, rec.sink());

    EXPECT_EQ(outcome.state, EngineState::Aborted);
    EXPECT_EQ(rec.names(), (std::vector<std::string>{"text", "tool_use"}));
    auto conv = sessions_.snapshot(outcome.conversation_id).value();
    EXPECT_TRUE(conv.transcript.empty());
    const auto& inv = conv.turns[1].invocations().at(0);
    EXPECT_EQ(inv.error_kind(), ToolErrorKind::Cancelled);
    EXPECT_EQ(conv.turns[1].stop_reason(), "aborted");
    EXPECT_EQ(client.calls(), 1u);
}

TEST_F(ConversationEngineTest, CancelDuringToolExecution) {
    ScriptedClient client({use("", {ToolUseBlock{"tu_1", "wait_a_bit", json::object()}})});
    auto engine = make_engine(client);
    Recorder rec;
    CancelToken cancel;

    auto ex = engine.begin(request("hi"));
    std::thread canceller([cancel]() mutable {
        std::this_thread::sleep_for(50ms);
        cancel.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    auto outcome = engine.run(ex, cancel, rec.sink());
    canceller.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, 250ms);
    EXPECT_EQ(outcome.state, EngineState::Aborted);
    EXPECT_EQ(rec.names(), (std::vector<std::string>{"tool_use"}));
}

TEST_F(ConversationEngineTest, AlreadyCancelledEmitsNothing) {
    ScriptedClient client({say("never seen")});
    auto engine = make_engine(client);
    Recorder rec;
    CancelToken cancel;
    cancel.cancel();

    auto ex = engine.begin(request("hi"));
    auto outcome = engine.run(ex, cancel, rec.sink());
    EXPECT_EQ(outcome.state, EngineState::Aborted);
    EXPECT_TRUE(rec.events.empty());
}

TEST_F(ConversationEngineTest, ToolRoundLimit) {
    ScriptedClient client({
        use("", {ToolUseBlock{"tu_1", "list_canvases", {{"project_id", "p1"}}}}),
        use("", {ToolUseBlock{"tu_2", "list_canvases", {{"project_id", "p1"}}}}),
        use("", {ToolUseBlock{"tu_3", "list_canvases", {{"project_id", "p1"}}}}),
    });
    auto engine = make_engine(client, 2);
    Recorder rec;

    auto ex = engine.begin(request("loop forever"));
    auto outcome = engine.run(ex, CancelToken{}, rec.sink());

    EXPECT_EQ(outcome.state, EngineState::Completed);
    EXPECT_EQ(outcome.tool_rounds, 2);
    EXPECT_EQ(client.calls(), 3u);
    EXPECT_EQ(rec.names(), (std::vector<std::string>{
        "tool_use", "tool_result", "tool_use", "tool_result", "text", "done"}));
    EXPECT_EQ(std::get<TextDelta>(rec.events[4]).text,
              "\n\n_Stopped after 2 tool rounds without a final answer._");

    auto conv = sessions_.snapshot(outcome.conversation_id).value();
    EXPECT_EQ(conv.turns[1].stop_reason(), "tool_round_limit");
    ASSERT_EQ(conv.turns[1].invocations().size(), 2u);
    EXPECT_EQ(conv.turns[1].invocations()[1].status(), InvocationStatus::Ok);
    // Every tool_use in the transcript has a paired result.
    const auto& last_results = conv.transcript[conv.transcript.size() - 2];
    EXPECT_TRUE(std::get<ToolResultBlock>(last_results.content.at(0)).is_error);
}

TEST_F(ConversationEngineTest, ParallelToolCallsAnnounceAllFirst) {
    ScriptedClient client({
        use("", {ToolUseBlock{"tu_1", "list_canvases", {{"project_id", "p1"}}},
                 ToolUseBlock{"tu_2", "get_project_summary", {{"project_id", "p1"}}}}),
        say("Done."),
    });
    auto engine = make_engine(client, 25, true);
    Recorder rec;

    auto ex = engine.begin(request("overview"));
    auto outcome = engine.run(ex, CancelToken{}, rec.sink());

    EXPECT_EQ(outcome.state, EngineState::Completed);
    EXPECT_EQ(rec.names(), (std::vector<std::string>{
        "tool_use", "tool_use", "tool_result", "tool_result", "text", "done"}));
    EXPECT_EQ(std::get<ToolResult>(rec.events[2]).id, "tu_1");
    EXPECT_EQ(std::get<ToolResult>(rec.events[3]).id, "tu_2");

    const auto& results = client.request(1).messages[2].content;
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(std::get<ToolResultBlock>(results[1]).tool_use_id, "tu_2");
}

TEST_F(ConversationEngineTest, SequentialToolCallsInterleave) {
    ScriptedClient client({
        use("", {ToolUseBlock{"tu_1", "list_canvases", {{"project_id", "p1"}}},
                 ToolUseBlock{"tu_2", "get_project_summary", {{"project_id", "p1"}}}}),
        say("Done."),
    });
    auto engine = make_engine(client);
    Recorder rec;
    auto ex = engine.begin(request("overview"));
    engine.run(ex, CancelToken{}, rec.sink());
    EXPECT_EQ(rec.names(), (std::vector<std::string>{
        "tool_use", "tool_result", "tool_use", "tool_result", "text", "done"}));
}

TEST_F(ConversationEngineTest, ConversationIsLockedWhileRunning) {
    ScriptedClient client({say("ok")});
    auto engine = make_engine(client);
    auto ex = engine.begin(request("first"));
    EXPECT_THROW((void)engine.begin(request("second")), ConversationBusyError);

    Recorder rec;
    engine.run(ex, CancelToken{}, rec.sink());
    ex.lease = SessionStore::Lease{};
    EXPECT_NO_THROW((void)engine.begin(request("second")));
}

TEST_F(ConversationEngineTest, FollowUpReusesConversation) {
    ScriptedClient client({say("one", "msg_1"), say("two", "msg_2")});
    auto engine = make_engine(client);
    std::string first_id;
    {
        Recorder rec;
        auto ex = engine.begin(request("hello"));
        first_id = engine.run(ex, CancelToken{}, rec.sink()).conversation_id;
    }
    Recorder rec;
    ChatRequest follow = request("and then?");
    follow.model = "claude-haiku-4-5-20251001";
    follow.context.page = "ideas";
    auto ex = engine.begin(follow);
    auto outcome = engine.run(ex, CancelToken{}, rec.sink());

    EXPECT_EQ(outcome.conversation_id, first_id);
    auto conv = sessions_.snapshot(first_id).value();
    EXPECT_EQ(conv.title, "hello");
    EXPECT_EQ(conv.model, "claude-haiku-4-5-20251001");
    EXPECT_EQ(conv.turns.size(), 4u);
    EXPECT_EQ(conv.turns[2].content(), "and then?");
    ASSERT_EQ(conv.transcript.size(), 4u);
    EXPECT_EQ(std::get<TextBlock>(conv.transcript[2].content[0]).text,
              "and then?\n\n[User is on the 'ideas' page]");
    EXPECT_EQ(client.request(1).model, "claude-haiku-4-5-20251001");
}

TEST_F(ConversationEngineTest, LongMessageTitleIsTruncated) {
    ScriptedClient client({say("ok")});
    auto engine = make_engine(client);
    Recorder rec;
    auto ex = engine.begin(request(std::string(100, 'a')));
    auto outcome = engine.run(ex, CancelToken{}, rec.sink());
    auto conv = sessions_.snapshot(outcome.conversation_id).value();
    EXPECT_EQ(conv.title, std::string(60, 'a') + "...");
}

TEST_F(ConversationEngineTest, UnknownProjectFallsBackToId) {
    ScriptedClient client({say("ok")});
    auto engine = make_engine(client);
    Recorder rec;
    ChatRequest r = request("hi");
    r.project_id = "p-unknown";
    auto ex = engine.begin(r);
    EXPECT_EQ(ex.project.name, "p-unknown");
    engine.run(ex, CancelToken{}, rec.sink());
    EXPECT_NE(client.request(0).system.find("id: p-unknown"), std::string::npos);
}
