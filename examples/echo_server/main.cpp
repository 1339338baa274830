/// Echo server: minimal linerpc server demonstrating handler registration.
/// Usage: ./echo_server
/// Communicates over stdio (newline-delimited JSON-RPC).

#include <linerpc/linerpc.hpp>
#include <log4cplus/initializer.h>

int main() {
    log4cplus::Initializer log_initializer;
    linerpc::init_logging("");

    linerpc::Server::Options opts;
    opts.server_info.name = "echo-server";
    opts.server_info.version = "1.0.0";

    linerpc::Server server{std::move(opts)};

    // echo: {"text": "..."} -> {"text": "..."}
    server.register_handler("echo",
        [](const linerpc::json& params, const std::optional<linerpc::RequestId>&)
            -> linerpc::HandlerResult {
            auto text = params.find("text");
            if (text == params.end() || !text->is_string()) {
                return linerpc::JsonRpcError{linerpc::error::InvalidParams,
                                             "Missing string field 'text'", std::nullopt};
            }
            return linerpc::json{{"text", *text}};
        });

    // Serve over stdio, blocks until end of input
    return server.serve_stdio();
}
