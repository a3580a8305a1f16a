#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace foundry {

using RequestId = std::variant<int64_t, std::string>;

void to_json(nlohmann::json& j, const RequestId& id);
/// Accepts an integer or a string; throws std::invalid_argument otherwise.
void from_json(const nlohmann::json& j, RequestId& id);

/// Stable map key for a request id ("7" and "s:7" never collide).
[[nodiscard]] std::string request_key(const RequestId& id);

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

void to_json(nlohmann::json& j, const JsonRpcError& e);
void from_json(const nlohmann::json& j, JsonRpcError& e);

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

struct JsonRpcResponse {
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

struct JsonRpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcNotification& o) const {
        return method == o.method && params == o.params;
    }
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcResponse, JsonRpcNotification>;

void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void from_json(const nlohmann::json& j, JsonRpcRequest& r);

void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void from_json(const nlohmann::json& j, JsonRpcResponse& r);

void to_json(nlohmann::json& j, const JsonRpcNotification& n);
void from_json(const nlohmann::json& j, JsonRpcNotification& n);

void to_json(nlohmann::json& j, const JsonRpcMessage& m);

/// Short label for logs: "request 7 tools/call", "response 7 error -32601",
/// "notification notifications/cancelled".
[[nodiscard]] std::string describe(const JsonRpcMessage& m);

// ---- Builders ----

[[nodiscard]] JsonRpcResponse make_result(const RequestId& id, nlohmann::json result);
[[nodiscard]] JsonRpcResponse make_error(const RequestId& id, int code, std::string message);
[[nodiscard]] JsonRpcNotification make_notification(std::string method,
                                                    std::optional<nlohmann::json> params = std::nullopt);

} // namespace foundry
