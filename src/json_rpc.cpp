#include "foundry/json_rpc.hpp"
#include "foundry/version.hpp"
#include <stdexcept>

namespace foundry {

// ---- Ids and errors ----

void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw std::invalid_argument("Request id must be an integer or a string");
    }
}

std::string request_key(const RequestId& id) {
    if (auto* i = std::get_if<int64_t>(&id)) return std::to_string(*i);
    return "s:" + std::get<std::string>(id);
}

void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    e.data.reset();
    if (j.contains("data")) e.data = j.at("data");
}

// ---- Messages ----

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void from_json(const nlohmann::json& j, JsonRpcRequest& r) {
    from_json(j.at("id"), r.id);
    r.method = j.at("method").get<std::string>();
    if (j.contains("params")) r.params = j.at("params");
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["result"] = r.result ? *r.result : nlohmann::json::object();
    }
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    from_json(j.at("id"), r.id);
    if (j.contains("result")) r.result = j.at("result");
    if (j.contains("error")) r.error = j.at("error").get<JsonRpcError>();
}

void to_json(nlohmann::json& j, const JsonRpcNotification& n) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["method"] = n.method;
    if (n.params) j["params"] = *n.params;
}

void from_json(const nlohmann::json& j, JsonRpcNotification& n) {
    n.method = j.at("method").get<std::string>();
    if (j.contains("params")) n.params = j.at("params");
}

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

std::string describe(const JsonRpcMessage& m) {
    auto id_text = [](const RequestId& id) {
        if (auto* i = std::get_if<int64_t>(&id)) return std::to_string(*i);
        return "\"" + std::get<std::string>(id) + "\"";
    };
    if (auto* req = std::get_if<JsonRpcRequest>(&m)) {
        return "request " + id_text(req->id) + " " + req->method;
    }
    if (auto* resp = std::get_if<JsonRpcResponse>(&m)) {
        if (resp->error) return "response " + id_text(resp->id) + " error " + std::to_string(resp->error->code);
        return "response " + id_text(resp->id);
    }
    return "notification " + std::get<JsonRpcNotification>(m).method;
}

// ---- Builders ----

JsonRpcResponse make_result(const RequestId& id, nlohmann::json result) {
    JsonRpcResponse resp;
    resp.id = id;
    resp.result = std::move(result);
    return resp;
}

JsonRpcResponse make_error(const RequestId& id, int code, std::string message) {
    JsonRpcResponse resp;
    resp.id = id;
    resp.error = JsonRpcError{code, std::move(message), std::nullopt};
    return resp;
}

JsonRpcNotification make_notification(std::string method, std::optional<nlohmann::json> params) {
    JsonRpcNotification n;
    n.method = std::move(method);
    n.params = std::move(params);
    return n;
}

} // namespace foundry
