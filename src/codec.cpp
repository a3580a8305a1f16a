#include "foundry/codec.hpp"
#include "foundry/version.hpp"
#include <simdjson.h>
#include <string>

namespace foundry {

namespace {

nlohmann::json to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            auto as_int = val.get_int64();
            if (as_int.error() == simdjson::SUCCESS) return nlohmann::json(as_int.value());
            auto as_uint = val.get_uint64();
            if (as_uint.error() == simdjson::SUCCESS) return nlohmann::json(as_uint.value());
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
        default:
            return nlohmann::json(nullptr);
    }
}

// Scalars at the document root cannot be read through get_value() in
// simdjson's on-demand API, so those fall back to nlohmann.
nlohmann::json parse_document(std::string_view raw) {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto err = parser.iterate(padded).get(doc);
    if (err) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(err));
    }

    bool scalar = false;
    if (doc.is_scalar().get(scalar) != simdjson::SUCCESS || scalar) {
        auto j = nlohmann::json::parse(raw, nullptr, false);
        if (j.is_discarded()) throw ParseError("JSON parse error: invalid scalar document");
        return j;
    }

    try {
        simdjson::ondemand::value root;
        auto verr = doc.get_value().get(root);
        if (verr) throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(verr));
        auto j = to_nlohmann(root);
        if (!doc.at_end()) throw ParseError("JSON parse error: trailing content");
        return j;
    } catch (const simdjson::simdjson_error& e) {
        throw ParseError(std::string("JSON parse error: ") + e.what());
    }
}

} // anonymous namespace

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    auto version = j.find("jsonrpc");
    if (version == j.end()) {
        throw ParseError("Missing 'jsonrpc' field");
    }
    if (!version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
        throw ParseError("Invalid jsonrpc version, expected '2.0'");
    }

    const bool has_id = j.contains("id") && !j.at("id").is_null();
    const bool has_method = j.contains("method");

    try {
        if (has_method && has_id) {
            return j.get<JsonRpcRequest>();
        }
        if (has_method) {
            return j.get<JsonRpcNotification>();
        }
        if (has_id) {
            if (!j.contains("result") && !j.contains("error")) {
                throw ParseError("Response carries neither 'result' nor 'error'");
            }
            return j.get<JsonRpcResponse>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw ParseError(std::string("Malformed JSON-RPC message: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ParseError(std::string("Malformed JSON-RPC message: ") + e.what());
    }
    throw ParseError("Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty frame");
    }
    nlohmann::json j = parse_document(raw);
    if (!j.is_object()) {
        throw ParseError("Frame must be a JSON object");
    }
    return parse_object(j);
}

nlohmann::json Codec::parse_json(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty input");
    }
    return parse_document(raw);
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    // Invalid UTF-8 from a tool must not poison the frame.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace foundry
