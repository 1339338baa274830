/// linerpc_server: JSON-RPC 2.0 over stdio (newline-delimited).
/// Usage: ./linerpc_server [--log-config FILE] [--log-level LEVEL]
///                         [--name NAME] [--server-version VERSION]

#include <linerpc/linerpc.hpp>

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <csignal>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "  -h, --help                 Show this help and exit\n"
              << "  -v, --version              Show version and exit\n"
              << "  --log-config FILE          log4cplus properties file\n"
              << "  --log-level LEVEL          trace|debug|info|warn|error|fatal|off\n"
              << "  --name NAME                Server name reported by initialize\n"
              << "  --server-version VERSION   Server version reported by initialize\n";
}

// Matches "--flag value" and "--flag=value".
bool take_option(const char* flag, int argc, char** argv, int& i, std::string& out) {
    size_t len = std::strlen(flag);
    if (std::strcmp(argv[i], flag) == 0) {
        if (i + 1 >= argc) {
            throw std::invalid_argument(std::string("Missing value for ") + flag);
        }
        out = argv[++i];
        return true;
    }
    if (std::strncmp(argv[i], flag, len) == 0 && argv[i][len] == '=') {
        out = argv[i] + len + 1;
        return true;
    }
    return false;
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    linerpc::Server::Options opts;
    std::string log_config;
    std::string log_level;

    try {
        for (int i = 1; i < argc; ++i) {
            if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            }
            if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
                std::cout << "linerpc " << linerpc::LIBRARY_VERSION
                          << " (JSON-RPC " << linerpc::JSONRPC_VERSION << ")" << std::endl;
                return 0;
            }
            if (take_option("--log-config", argc, argv, i, log_config)) continue;
            if (take_option("--log-level", argc, argv, i, log_level)) continue;
            if (take_option("--name", argc, argv, i, opts.server_info.name)) continue;
            if (take_option("--server-version", argc, argv, i, opts.server_info.version)) continue;

            throw std::invalid_argument(std::string("Unknown option: ") + argv[i]);
        }
        if (!log_level.empty()) {
            linerpc::parse_log_level(log_level);
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }

    // A vanished peer must surface as a write error, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    linerpc::init_logging(log_config, log_level);
    LOG4CPLUS_INFO(linerpc::server_logger(), "Starting " << opts.server_info.name << "...");

    // Ctrl-C and SIGTERM end the input stream so serve() returns normally
    if (!linerpc::end_input_on_signal(SIGINT) || !linerpc::end_input_on_signal(SIGTERM)) {
        LOG4CPLUS_WARN(linerpc::server_logger(), "Signals will stop the server without cleanup");
    }

    linerpc::Server server{std::move(opts)};
    int status = server.serve_stdio();

    if (linerpc::input_interrupted()) {
        LOG4CPLUS_INFO(linerpc::server_logger(), "Interrupted, shutting down");
    }

    LOG4CPLUS_INFO(linerpc::server_logger(), "Server shut down with status " << status);
    return status;
}
