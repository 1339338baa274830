#include "linerpc/json_rpc.hpp"
#include "linerpc/version.hpp"

namespace linerpc {

json id_to_json(const RequestId& id) {
    return std::visit([](const auto& v) { return json(v); }, id);
}

std::optional<RequestId> id_from_json(const json& j) {
    switch (j.type()) {
        case json::value_t::null:
            return RequestId{nullptr};
        case json::value_t::number_integer:
            return RequestId{j.get<int64_t>()};
        case json::value_t::number_unsigned:
            // Non-negative literals may arrive unsigned; normalize those that fit.
            if (j.get<uint64_t>() <= static_cast<uint64_t>(INT64_MAX)) {
                return RequestId{static_cast<int64_t>(j.get<uint64_t>())};
            }
            return RequestId{j.get<uint64_t>()};
        case json::value_t::number_float:
            return RequestId{j.get<double>()};
        case json::value_t::string:
            return RequestId{j.get<std::string>()};
        default:
            return std::nullopt;
    }
}

void to_json(json& j, const JsonRpcError& e) {
    j = json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

void from_json(const json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    if (j.contains("data")) e.data = j.at("data");
}

JsonRpcResponse JsonRpcResponse::success(RequestId id, json result) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.result = std::move(result);
    return resp;
}

JsonRpcResponse JsonRpcResponse::failure(RequestId id, JsonRpcError error) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.error = std::move(error);
    return resp;
}

void to_json(json& j, const JsonRpcRequest& r) {
    j = json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["method"] = r.method;
    j["params"] = r.params;
    j["id"] = id_to_json(r.id);
}

void to_json(json& j, const JsonRpcNotification& n) {
    j = json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["method"] = n.method;
    j["params"] = n.params;
}

void to_json(json& j, const JsonRpcResponse& r) {
    j = json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["result"] = r.result ? *r.result : json(nullptr);
    }
    j["id"] = id_to_json(r.id);
}

} // namespace linerpc
