#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string_view>

namespace foundry {

/// Line codec for the tool-server pipes: one JSON-RPC object per line.
class Codec {
public:
    /// Parse one frame. Throws ParseError on invalid JSON, a non-object
    /// payload or missing JSON-RPC fields.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Parse arbitrary JSON text through the same fast path.
    [[nodiscard]] static nlohmann::json parse_json(std::string_view raw);

    /// Serialize a message to a single line (no trailing newline).
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace foundry
