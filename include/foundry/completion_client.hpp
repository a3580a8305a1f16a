#pragma once
#include "cancellation.hpp"
#include "types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace foundry {

struct CompletionRequest {
    std::string model;
    std::string system;
    std::vector<Message> messages;
    std::vector<ToolDescriptor> tools;
    int max_tokens = 4096;
};

struct TextChunk {
    std::string text;
};

/// A complete tool-use request; emitted once its arguments are fully received.
struct ToolCallChunk {
    std::string id;
    std::string name;
    nlohmann::json input;
};

using CompletionChunk = std::variant<TextChunk, ToolCallChunk>;

/// Return false to stop consuming the stream (treated as cancellation).
using ChunkCallback = std::function<bool(const CompletionChunk&)>;

struct CompletionResult {
    std::string response_id;
    std::string stop_reason;                 // "end_turn", "tool_use", "max_tokens", ...
    std::vector<ContentBlock> content;       // assistant blocks in stream order
    bool cancelled = false;
};

/// Remote completion service. One call streams one assistant response.
class ICompletionClient {
public:
    virtual ~ICompletionClient() = default;

    /// Blocks until the response ends, the callback declines more chunks
    /// or `cancel` fires (result.cancelled). Throws UpstreamError on
    /// transport or service failure.
    virtual CompletionResult stream(const CompletionRequest& request,
                                    const ChunkCallback& on_chunk,
                                    const CancelToken& cancel) = 0;
};

} // namespace foundry
