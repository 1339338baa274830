#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace linerpc {

/// Insertion-ordered JSON so echoed params and emitted envelopes keep their
/// member order on the wire.
using json = nlohmann::ordered_json;

/// Correlation id. Kept in the exact JSON type the peer sent.
using RequestId = std::variant<std::nullptr_t, int64_t, uint64_t, double, std::string>;

json id_to_json(const RequestId& id);

/// Returns nullopt when `j` is not a legal id (string, number or null).
std::optional<RequestId> id_from_json(const json& j);

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
    bool operator!=(const JsonRpcError& o) const { return !(*this == o); }
};

void to_json(json& j, const JsonRpcError& e);
void from_json(const json& j, JsonRpcError& e);

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    json params = json::object();

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

struct JsonRpcNotification {
    std::string method;
    json params = json::object();

    bool operator==(const JsonRpcNotification& o) const {
        return method == o.method && params == o.params;
    }
};

/// Exactly one of result/error is set.
struct JsonRpcResponse {
    RequestId id;
    std::optional<json> result;
    std::optional<JsonRpcError> error;

    static JsonRpcResponse success(RequestId id, json result);
    static JsonRpcResponse failure(RequestId id, JsonRpcError error);

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

/// Inbound messages a server acts on.
using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcNotification>;

void to_json(json& j, const JsonRpcRequest& r);
void to_json(json& j, const JsonRpcNotification& n);
void to_json(json& j, const JsonRpcResponse& r);

inline bool is_request(const JsonRpcMessage& m) {
    return std::holds_alternative<JsonRpcRequest>(m);
}

inline const std::string& method_of(const JsonRpcMessage& m) {
    return std::visit([](const auto& v) -> const std::string& { return v.method; }, m);
}

} // namespace linerpc
