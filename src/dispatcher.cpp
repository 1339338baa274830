#include "linerpc/dispatcher.hpp"
#include "linerpc/error.hpp"
#include "linerpc/logger.hpp"
#include <log4cplus/loggingmacros.h>
#include <exception>
#include <string>

namespace linerpc {

namespace {

JsonRpcError internal_error(const std::string& what) {
    return JsonRpcError{error::InternalError,
                        std::string(error::default_message(error::InternalError)),
                        json(what)};
}

// Sent as the handler chose; only logged.
void note_reserved_code(const std::string& method, int code) {
    if (error::is_unassigned_reserved_code(code)) {
        LOG4CPLUS_WARN(dispatch_logger(), "Handler for " << method
                       << " used unassigned reserved error code " << code);
    }
}

// Run the handler and fold every outcome into a HandlerResult.
HandlerResult invoke(const Handler& handler, const std::string& method,
                     const json& params, const std::optional<RequestId>& id) {
    try {
        return handler(params, id);
    } catch (const RpcProtocolError& e) {
        LOG4CPLUS_WARN(dispatch_logger(), "Handler error for " << method
                       << ": " << e.code << " " << e.what());
        return JsonRpcError{e.code, e.what(), e.data};
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(dispatch_logger(), "Handler failure for " << method << ": " << e.what());
        return internal_error(e.what());
    } catch (...) {
        LOG4CPLUS_ERROR(dispatch_logger(), "Handler failure for " << method << ": unknown exception");
        return internal_error("unknown exception");
    }
}

} // anonymous namespace

std::optional<JsonRpcResponse> Dispatcher::dispatch(const JsonRpcMessage& msg) const {
    LOG4CPLUS_DEBUG(dispatch_logger(), (is_request(msg) ? "Request " : "Notification ")
                    << method_of(msg));
    if (is_request(msg)) {
        return dispatch_request(std::get<JsonRpcRequest>(msg));
    }
    dispatch_notification(std::get<JsonRpcNotification>(msg));
    return std::nullopt;
}

JsonRpcResponse Dispatcher::dispatch_request(const JsonRpcRequest& req) const {
    LOG4CPLUS_INFO(dispatch_logger(), "Dispatch method: " << req.method);

    const Handler* found = registry_.lookup(req.method);
    if (!found) {
        LOG4CPLUS_WARN(dispatch_logger(), "No handler for method: " << req.method);
        return JsonRpcResponse::failure(req.id, JsonRpcError{
            error::MethodNotFound,
            std::string(error::default_message(error::MethodNotFound)),
            std::nullopt});
    }

    // Copy so a handler may replace its own registration while running
    Handler handler = *found;
    auto result = invoke(handler, req.method, req.params, req.id);

    if (auto* err = std::get_if<JsonRpcError>(&result)) {
        note_reserved_code(req.method, err->code);
        return JsonRpcResponse::failure(req.id, std::move(*err));
    }
    return JsonRpcResponse::success(req.id, std::move(std::get<json>(result)));
}

void Dispatcher::dispatch_notification(const JsonRpcNotification& notif) const {
    LOG4CPLUS_INFO(dispatch_logger(), "Dispatch notification: " << notif.method);

    const Handler* found = registry_.lookup(notif.method);
    if (!found) {
        LOG4CPLUS_WARN(dispatch_logger(), "No handler for notification: " << notif.method);
        return;
    }

    Handler handler = *found;
    auto result = invoke(handler, notif.method, notif.params, std::nullopt);
    if (auto* err = std::get_if<JsonRpcError>(&result)) {
        // Notifications never get a reply; the failure is only logged
        LOG4CPLUS_WARN(dispatch_logger(), "Notification " << notif.method << " failed: "
                       << err->code << " " << err->message);
    }
}

} // namespace linerpc
