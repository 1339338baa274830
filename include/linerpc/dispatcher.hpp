#pragma once
#include "json_rpc.hpp"
#include "registry.hpp"
#include <optional>

namespace linerpc {

class Dispatcher {
public:
    explicit Dispatcher(const HandlerRegistry& registry) : registry_(registry) {}

    /// Run the handler for `msg`. A request always yields exactly one response
    /// carrying its id; a notification never yields one.
    [[nodiscard]] std::optional<JsonRpcResponse> dispatch(const JsonRpcMessage& msg) const;

private:
    JsonRpcResponse dispatch_request(const JsonRpcRequest& req) const;
    void dispatch_notification(const JsonRpcNotification& notif) const;

    const HandlerRegistry& registry_;
};

} // namespace linerpc
