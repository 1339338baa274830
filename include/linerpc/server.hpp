#pragma once
#include "builtins.hpp"
#include "registry.hpp"
#include "session.hpp"
#include "transport/transport.hpp"
#include "version.hpp"
#include <string>

namespace linerpc {

class Server {
public:
    struct Options {
        ServerInfo server_info{std::string(DEFAULT_SERVER_NAME),
                               std::string(LIBRARY_VERSION),
                               std::string(PROTOCOL_VERSION)};
    };

    Server();
    explicit Server(Options opts);

    // Built-in handlers capture `this`
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Add or replace the handler for `method`, built-ins included.
    void register_handler(const std::string& method, Handler handler);

    HandlerRegistry& registry() { return registry_; }
    const HandlerRegistry& registry() const { return registry_; }
    const Session& session() const { return session_; }
    const Options& options() const { return opts_; }

    /// Run the event loop on `transport` until end-of-stream.
    /// Returns the process exit status: 0 on end-of-stream, 1 on transport failure.
    int serve(ITransport& transport);

    /// serve() on the process's stdin/stdout.
    int serve_stdio();

private:
    Options opts_;
    Session session_;
    HandlerRegistry registry_;
};

} // namespace linerpc
