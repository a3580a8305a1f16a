#include "foundry/protocol_types.hpp"

namespace foundry {

// ---------- Content ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    t.text = j.at("text").get<std::string>();
}

void to_json(nlohmann::json& j, const BinaryContent& t) {
    j = {{"type", t.type}, {"data", t.data}, {"mimeType", t.mime_type}};
}

void from_json(const nlohmann::json& j, BinaryContent& t) {
    t.type = j.at("type").get<std::string>();
    t.data = j.value("data", "");
    t.mime_type = j.value("mimeType", "unknown");
}

void to_json(nlohmann::json& j, const EmbeddedResource& t) {
    nlohmann::json resource;
    resource["uri"] = t.uri;
    if (t.mime_type) resource["mimeType"] = *t.mime_type;
    if (t.text) resource["text"] = *t.text;
    if (t.blob) resource["blob"] = *t.blob;
    j = {{"type", "resource"}, {"resource", resource}};
}

void from_json(const nlohmann::json& j, EmbeddedResource& t) {
    const auto& resource = j.at("resource");
    t.uri = resource.at("uri").get<std::string>();
    if (resource.contains("mimeType")) t.mime_type = resource.at("mimeType").get<std::string>();
    if (resource.contains("text")) t.text = resource.at("text").get<std::string>();
    if (resource.contains("blob")) t.blob = resource.at("blob").get<std::string>();
}

void to_json(nlohmann::json& j, const OpaqueContent& t) {
    j = t.raw;
}

void to_json(nlohmann::json& j, const Content& c) {
    std::visit([&j](const auto& v) { to_json(j, v); }, c);
}

void from_json(const nlohmann::json& j, Content& c) {
    const std::string type = j.value("type", "");
    if (type == "text") {
        c = j.get<TextContent>();
    } else if (type == "image" || type == "audio") {
        c = j.get<BinaryContent>();
    } else if (type == "resource") {
        c = j.get<EmbeddedResource>();
    } else {
        c = OpaqueContent{j};
    }
}

std::string CallToolResult::joined_text() const {
    std::string out;
    for (const auto& part : content) {
        if (!out.empty()) out += '\n';
        if (auto* t = std::get_if<TextContent>(&part)) {
            out += t->text;
        } else if (auto* b = std::get_if<BinaryContent>(&part)) {
            out += "[Binary data: " + b->mime_type + "]";
        } else if (auto* r = std::get_if<EmbeddedResource>(&part)) {
            if (r->text) {
                out += *r->text;
            } else {
                out += "[Binary data: " + r->mime_type.value_or("unknown") + "]";
            }
        } else {
            out += std::get<OpaqueContent>(part).raw.dump();
        }
    }
    return out;
}

// ---------- ToolDefinition ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"inputSchema", t.input_schema}};
    if (t.title) j["title"] = *t.title;
    if (t.description) j["description"] = *t.description;
}

void from_json(const nlohmann::json& j, ToolDefinition& t) {
    t.name = j.at("name").get<std::string>();
    t.input_schema = j.value("inputSchema", nlohmann::json{{"type", "object"}});
    if (j.contains("title") && j.at("title").is_string()) t.title = j.at("title").get<std::string>();
    if (j.contains("description") && j.at("description").is_string()) {
        t.description = j.at("description").get<std::string>();
    }
}

// ---------- CallToolResult ----------

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = nlohmann::json::array();
    for (const auto& c : t.content) {
        nlohmann::json cj;
        to_json(cj, c);
        j["content"].push_back(cj);
    }
    if (t.structured_content) j["structuredContent"] = *t.structured_content;
    if (t.is_error) j["isError"] = t.is_error;
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    if (j.contains("content")) {
        for (const auto& cj : j.at("content")) {
            Content c;
            from_json(cj, c);
            t.content.push_back(std::move(c));
        }
    }
    if (j.contains("structuredContent")) t.structured_content = j.at("structuredContent");
    if (j.contains("isError")) t.is_error = j.at("isError").get<bool>();
}

// ---------- Handshake ----------

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = *t.tools;
    if (t.resources) j["resources"] = *t.resources;
    if (t.prompts) j["prompts"] = *t.prompts;
    if (t.logging) j["logging"] = *t.logging;
}

void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    if (j.contains("tools")) t.tools = j.at("tools");
    if (j.contains("resources")) t.resources = j.at("resources");
    if (j.contains("prompts")) t.prompts = j.at("prompts");
    if (j.contains("logging")) t.logging = j.at("logging");
}

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.value("version", "");
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
    if (t.instructions) j["instructions"] = *t.instructions;
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    t.capabilities = j.value("capabilities", nlohmann::json::object()).get<ServerCapabilities>();
    t.server_info = j.at("serverInfo").get<Implementation>();
    if (j.contains("instructions") && j.at("instructions").is_string()) {
        t.instructions = j.at("instructions").get<std::string>();
    }
}

} // namespace foundry
