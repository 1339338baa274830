#include "linerpc/server.hpp"
#include "linerpc/error.hpp"
#include "linerpc/event_loop.hpp"
#include "linerpc/logger.hpp"
#include "linerpc/transport/stdio_transport.hpp"
#include <log4cplus/loggingmacros.h>
#include <exception>

namespace linerpc {

Server::Server() : Server(Options{}) {}

Server::Server(Options opts) : opts_(std::move(opts)) {
    register_builtin_handlers(registry_, opts_.server_info, session_);
}

void Server::register_handler(const std::string& method, Handler handler) {
    registry_.register_handler(method, std::move(handler));
    LOG4CPLUS_DEBUG(server_logger(), "Registered handler: " << method);
}

int Server::serve(ITransport& transport) {
    LOG4CPLUS_INFO(server_logger(), "Serving " << opts_.server_info.name << " "
                   << opts_.server_info.version << " with " << registry_.size() << " methods");

    EventLoop loop(registry_, transport);
    int status = 0;
    try {
        loop.run();
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(server_logger(), "Event loop stopped: " << e.what());
        status = 1;
    }

    LOG4CPLUS_INFO(server_logger(), "Cleaning up server resources (" << loop.lines_processed()
                   << " messages, session " << to_string(session_.state()) << ")");
    transport.close();
    return status;
}

int Server::serve_stdio() {
    StdioTransport transport;
    return serve(transport);
}

} // namespace linerpc
