#pragma once
#include "completion_client.hpp"
#include "sse.hpp"
#include <chrono>
#include <map>
#include <string>

namespace foundry {

/// Folds the Messages API event stream (message_start, content_block_*,
/// message_delta, message_stop, error) into chunks and a final result.
class AnthropicStreamAssembler {
public:
    /// Returns false once the callback asked to stop. Throws UpstreamError
    /// for an in-stream error event or an unparseable payload.
    bool on_event(const SseEvent& event, const ChunkCallback& on_chunk);

    [[nodiscard]] bool finished() const noexcept { return finished_; }
    [[nodiscard]] CompletionResult& result() noexcept { return result_; }

private:
    struct PendingBlock {
        std::string type;
        std::string text;
        std::string id;
        std::string name;
        std::string partial_json;
    };

    bool handle(nlohmann::json& payload, const std::string& event_name, const ChunkCallback& on_chunk);
    bool close_block(int index, const ChunkCallback& on_chunk);

    CompletionResult result_;
    std::map<int, PendingBlock> blocks_;
    bool finished_ = false;
};

/// Streaming client for the Anthropic Messages API.
class AnthropicClient : public ICompletionClient {
public:
    struct Options {
        std::string api_key;
        std::string base_url = "https://api.anthropic.com";
        std::string api_version = "2023-06-01";
        std::chrono::seconds connect_timeout{10};
        std::chrono::seconds read_timeout{300};
    };

    explicit AnthropicClient(Options opts);

    CompletionResult stream(const CompletionRequest& request,
                            const ChunkCallback& on_chunk,
                            const CancelToken& cancel) override;

    /// Request body for `request` (exposed for tests).
    [[nodiscard]] static nlohmann::json build_body(const CompletionRequest& request);

    /// Human-readable message for a non-2xx response.
    [[nodiscard]] static std::string describe_http_error(int status, const std::string& body);

private:
    Options opts_;
};

} // namespace foundry
