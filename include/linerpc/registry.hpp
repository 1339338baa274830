#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace linerpc {

using HandlerResult = std::variant<json, JsonRpcError>;

/// Handler for one method. `id` is nullopt when invoked for a notification.
/// May return a JsonRpcError or throw RpcProtocolError for structured failures;
/// any other exception is reported as an internal error.
using Handler = std::function<HandlerResult(const json& params,
                                            const std::optional<RequestId>& id)>;

class HandlerRegistry {
public:
    /// Insert or overwrite the handler for `method`. Last registration wins.
    /// Throws std::invalid_argument for an empty method name or empty handler.
    void register_handler(const std::string& method, Handler handler);

    /// Returns false if nothing was registered under `method`.
    bool remove_handler(const std::string& method);

    [[nodiscard]] const Handler* lookup(const std::string& method) const;

    [[nodiscard]] bool has_handler(const std::string& method) const;

    /// Registered method names, sorted.
    [[nodiscard]] std::vector<std::string> methods() const;

    [[nodiscard]] size_t size() const { return handlers_.size(); }

private:
    std::unordered_map<std::string, Handler> handlers_;
};

} // namespace linerpc
