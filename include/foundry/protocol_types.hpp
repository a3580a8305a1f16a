#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace foundry {

// Wire types of the tool-server protocol (the subset this client speaks).

// ---------- Content ----------

struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const { return text == o.text; }
};

/// Image or audio payload. Only its MIME type is surfaced to the model.
struct BinaryContent {
    std::string type;       // "image" | "audio"
    std::string data;       // base64
    std::string mime_type;

    bool operator==(const BinaryContent& o) const {
        return type == o.type && data == o.data && mime_type == o.mime_type;
    }
};

struct EmbeddedResource {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;

    bool operator==(const EmbeddedResource& o) const {
        return uri == o.uri && mime_type == o.mime_type && text == o.text && blob == o.blob;
    }
};

/// Anything else a newer server might send; kept verbatim.
struct OpaqueContent {
    nlohmann::json raw;

    bool operator==(const OpaqueContent& o) const { return raw == o.raw; }
};

using Content = std::variant<TextContent, BinaryContent, EmbeddedResource, OpaqueContent>;

// ---------- Tools ----------

struct ToolDefinition {
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    nlohmann::json input_schema;

    bool operator==(const ToolDefinition& o) const {
        return name == o.name && title == o.title && description == o.description
               && input_schema == o.input_schema;
    }
};

struct CallToolResult {
    std::vector<Content> content;
    std::optional<nlohmann::json> structured_content;
    bool is_error = false;

    /// Text parts joined by newlines; binary parts become a placeholder.
    [[nodiscard]] std::string joined_text() const;

    bool operator==(const CallToolResult& o) const {
        return content == o.content && structured_content == o.structured_content
               && is_error == o.is_error;
    }
};

// ---------- Handshake ----------

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;
    std::optional<nlohmann::json> resources;
    std::optional<nlohmann::json> prompts;
    std::optional<nlohmann::json> logging;

    bool operator==(const ServerCapabilities& o) const {
        return tools == o.tools && resources == o.resources && prompts == o.prompts
               && logging == o.logging;
    }
};

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;
};

template <typename T>
struct Page {
    std::vector<T> items;
    std::optional<std::string> next_cursor;
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);

void to_json(nlohmann::json& j, const BinaryContent& t);
void from_json(const nlohmann::json& j, BinaryContent& t);

void to_json(nlohmann::json& j, const EmbeddedResource& t);
void from_json(const nlohmann::json& j, EmbeddedResource& t);

void to_json(nlohmann::json& j, const OpaqueContent& t);

void to_json(nlohmann::json& j, const Content& c);
void from_json(const nlohmann::json& j, Content& c);

void to_json(nlohmann::json& j, const ToolDefinition& t);
void from_json(const nlohmann::json& j, ToolDefinition& t);

void to_json(nlohmann::json& j, const CallToolResult& t);
void from_json(const nlohmann::json& j, CallToolResult& t);

void to_json(nlohmann::json& j, const ServerCapabilities& t);
void from_json(const nlohmann::json& j, ServerCapabilities& t);

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

void to_json(nlohmann::json& j, const InitializeResult& t);
void from_json(const nlohmann::json& j, InitializeResult& t);

} // namespace foundry
