#include "foundry/anthropic_client.hpp"
#include "foundry/codec.hpp"
#include "foundry/error.hpp"
#include <atomic>
#include <thread>
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace foundry {

// ---------- AnthropicStreamAssembler ----------

bool AnthropicStreamAssembler::on_event(const SseEvent& event, const ChunkCallback& on_chunk) {
    if (event.event == "ping") return true;

    nlohmann::json payload;
    try {
        payload = Codec::parse_json(event.data);
    } catch (const ParseError& e) {
        throw UpstreamError(std::string("Malformed stream event: ") + e.what());
    }
    if (!payload.is_object()) {
        throw UpstreamError("Malformed stream event: expected an object, got " + std::string(payload.type_name()));
    }
    try {
        return handle(payload, event.event, on_chunk);
    } catch (const nlohmann::json::exception& e) {
        throw UpstreamError(std::string("Malformed stream event '") + event.event + "': " + e.what());
    }
}

bool AnthropicStreamAssembler::handle(nlohmann::json& payload, const std::string& event_name,
                                      const ChunkCallback& on_chunk) {
    const std::string type = payload.value("type", event_name);

    if (type == "error") {
        const auto& err = payload.contains("error") ? payload.at("error") : payload;
        std::string kind = err.value("type", "error");
        int status = kind == "overloaded_error" ? 529 : kind == "rate_limit_error" ? 429 : 0;
        throw UpstreamError(status, "Completion service error (" + kind + "): " + err.value("message", ""));
    }
    if (type == "message_start") {
        if (payload.contains("message")) result_.response_id = payload["message"].value("id", "");
        return true;
    }
    if (type == "content_block_start") {
        int index = payload.value("index", 0);
        const auto& cb = payload.at("content_block");
        PendingBlock block;
        block.type = cb.value("type", "text");
        if (block.type == "tool_use") {
            block.id = cb.value("id", "");
            block.name = cb.value("name", "");
        } else if (block.type == "text") {
            // Some responses carry initial text in the start event.
            std::string initial = cb.value("text", "");
            if (!initial.empty()) {
                block.text = initial;
                if (!on_chunk(TextChunk{initial})) return false;
            }
        }
        blocks_[index] = std::move(block);
        return true;
    }
    if (type == "content_block_delta") {
        int index = payload.value("index", 0);
        auto it = blocks_.find(index);
        if (it == blocks_.end()) return true;
        const auto& delta = payload.at("delta");
        const std::string dtype = delta.value("type", "");
        if (dtype == "text_delta") {
            std::string text = delta.value("text", "");
            it->second.text += text;
            if (!text.empty() && !on_chunk(TextChunk{text})) return false;
        } else if (dtype == "input_json_delta") {
            it->second.partial_json += delta.value("partial_json", "");
        }
        return true;
    }
    if (type == "content_block_stop") {
        return close_block(payload.value("index", 0), on_chunk);
    }
    if (type == "message_delta") {
        if (payload.contains("delta") && payload["delta"].contains("stop_reason")
            && payload["delta"]["stop_reason"].is_string()) {
            result_.stop_reason = payload["delta"]["stop_reason"].get<std::string>();
        }
        return true;
    }
    if (type == "message_stop") {
        // Blocks never explicitly stopped still count.
        while (!blocks_.empty()) {
            if (!close_block(blocks_.begin()->first, on_chunk)) return false;
        }
        finished_ = true;
        return true;
    }
    return true;
}

bool AnthropicStreamAssembler::close_block(int index, const ChunkCallback& on_chunk) {
    auto it = blocks_.find(index);
    if (it == blocks_.end()) return true;
    PendingBlock block = std::move(it->second);
    blocks_.erase(it);

    if (block.type == "text") {
        if (!block.text.empty()) result_.content.push_back(TextBlock{block.text});
        return true;
    }
    if (block.type != "tool_use") return true;

    nlohmann::json input = nlohmann::json::object();
    if (!block.partial_json.empty()) {
        try {
            input = Codec::parse_json(block.partial_json);
        } catch (const ParseError& e) {
            throw UpstreamError(std::string("Malformed tool input for ") + block.name + ": " + e.what());
        }
    }
    result_.content.push_back(ToolUseBlock{block.id, block.name, input});
    return on_chunk(ToolCallChunk{block.id, block.name, std::move(input)});
}

// ---------- AnthropicClient ----------

AnthropicClient::AnthropicClient(Options opts) : opts_(std::move(opts)) {}

nlohmann::json AnthropicClient::build_body(const CompletionRequest& request) {
    nlohmann::json messages = nlohmann::json::array();
    for (const auto& m : request.messages) {
        nlohmann::json mj;
        to_json(mj, m);
        messages.push_back(std::move(mj));
    }
    nlohmann::json body = {
        {"model", request.model},
        {"max_tokens", request.max_tokens},
        {"messages", std::move(messages)},
        {"stream", true},
    };
    if (!request.system.empty()) body["system"] = request.system;
    if (!request.tools.empty()) {
        nlohmann::json tools = nlohmann::json::array();
        for (const auto& t : request.tools) {
            tools.push_back({
                {"name", t.name},
                {"description", t.description},
                {"input_schema", t.input_schema},
            });
        }
        body["tools"] = std::move(tools);
    }
    return body;
}

std::string AnthropicClient::describe_http_error(int status, const std::string& body) {
    std::string detail;
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.is_object() && j.contains("error") && j["error"].is_object()) {
        detail = j["error"].value("message", "");
    }
    if (detail.empty()) detail = body.substr(0, 300);

    switch (status) {
        case 401:
        case 403:
            return "Authentication with the completion service failed: " + detail;
        case 429:
            return "Rate limited by the completion service. Please wait a moment and try again.";
        case 529:
            return "The completion service is overloaded. Please try again shortly.";
        default:
            return "Completion service error (HTTP " + std::to_string(status) + "): " + detail;
    }
}

CompletionResult AnthropicClient::stream(const CompletionRequest& request,
                                         const ChunkCallback& on_chunk,
                                         const CancelToken& cancel) {
    if (opts_.api_key.empty()) {
        throw UpstreamError(401, "No API key configured for the completion service");
    }

    httplib::Client cli(opts_.base_url);
    cli.set_connection_timeout(static_cast<time_t>(opts_.connect_timeout.count()), 0);
    cli.set_read_timeout(static_cast<time_t>(opts_.read_timeout.count()), 0);
    cli.set_write_timeout(30, 0);

    httplib::Request req;
    req.method = "POST";
    req.path = "/v1/messages";
    req.headers = {
        {"x-api-key", opts_.api_key},
        {"anthropic-version", opts_.api_version},
        {"accept", "text/event-stream"},
        {"content-type", "application/json"},
    };
    req.body = build_body(request).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    AnthropicStreamAssembler assembler;
    SseParser parser;
    int status = 0;
    std::string error_body;
    bool stopped_by_consumer = false;
    std::exception_ptr stream_error;

    req.response_handler = [&](const httplib::Response& r) {
        status = r.status;
        return true;
    };
    req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
        if (cancel.is_cancelled()) return false;
        if (status < 200 || status >= 300) {
            if (error_body.size() < 64 * 1024) error_body.append(data, len);
            return true;
        }
        // Rethrown after send() returns; nothing may unwind through httplib.
        try {
            parser.feed(std::string_view(data, len), [&](const SseEvent& ev) {
                if (stopped_by_consumer) return;
                if (!assembler.on_event(ev, on_chunk)) stopped_by_consumer = true;
            });
        } catch (...) {
            stream_error = std::current_exception();
            return false;
        }
        return !stopped_by_consumer;
    };

    // Cancellation must also interrupt a request still waiting for headers.
    std::atomic<bool> done{false};
    std::thread watcher([&] {
        while (!done) {
            if (cancel.wait_for(std::chrono::milliseconds(50))) {
                cli.stop();
                return;
            }
        }
    });
    struct WatcherGuard {
        std::atomic<bool>& done;
        std::thread& thread;
        ~WatcherGuard() {
            done = true;
            if (thread.joinable()) thread.join();
        }
    };

    httplib::Result res;
    {
        WatcherGuard guard{done, watcher};
        res = cli.send(req);
    }

    if (stream_error) std::rethrow_exception(stream_error);

    CompletionResult& result = assembler.result();
    if (cancel.is_cancelled() || stopped_by_consumer) {
        result.cancelled = true;
        return std::move(result);
    }
    if (!res) {
        throw UpstreamError("Could not reach the completion service: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw UpstreamError(res->status, describe_http_error(res->status, error_body.empty() ? res->body : error_body));
    }

    parser.finish([&](const SseEvent& ev) { assembler.on_event(ev, on_chunk); });
    if (!assembler.finished()) {
        throw UpstreamError("Completion stream ended before message_stop");
    }
    spdlog::debug("completion {} finished: {}", result.response_id, result.stop_reason);
    return std::move(result);
}

} // namespace foundry
