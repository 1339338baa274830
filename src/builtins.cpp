#include "linerpc/builtins.hpp"
#include "linerpc/logger.hpp"
#include <log4cplus/loggingmacros.h>

namespace linerpc {

json make_initialize_result(const ServerInfo& info) {
    return json{
        {"protocol", {{"version", info.protocol_version}}},
        {"capabilities", {
            {"tools", json::object()},
            {"resources", json::object()},
            {"prompts", json::object()}
        }},
        {"serverInfo", {
            {"name", info.name},
            {"version", info.version}
        }}
    };
}

void register_builtin_handlers(HandlerRegistry& registry, const ServerInfo& info,
                               Session& session) {
    // initialize
    registry.register_handler("initialize",
        [info, &session](const json& params, const std::optional<RequestId>&) -> HandlerResult {
            LOG4CPLUS_INFO(server_logger(), "Handling initialize request");
            if (params.is_object()) {
                auto client = params.find("clientInfo");
                if (client != params.end() && client->is_object()) {
                    session.client_info() = *client;
                    auto name = client->find("name");
                    if (name != client->end() && name->is_string()) {
                        LOG4CPLUS_INFO(server_logger(), "Client: " << name->get<std::string>());
                    }
                }
            }
            session.set_state(SessionState::Initializing);
            return make_initialize_result(info);
        });

    // notifications/initialized
    registry.register_handler("notifications/initialized",
        [&session](const json&, const std::optional<RequestId>&) -> HandlerResult {
            LOG4CPLUS_INFO(server_logger(), "Received initialized notification");
            session.set_state(SessionState::Ready);
            return json(nullptr);
        });

    // ping
    registry.register_handler("ping",
        [](const json& params, const std::optional<RequestId>&) -> HandlerResult {
            LOG4CPLUS_DEBUG(server_logger(), "Handling ping request");
            return json{{"message", "pong"}, {"received_params", params}};
        });
}

} // namespace linerpc
