#pragma once
#include <string_view>

namespace linerpc {

constexpr std::string_view LIBRARY_VERSION     = "0.1.0";
constexpr std::string_view PROTOCOL_VERSION    = "1.0.0";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

constexpr std::string_view DEFAULT_SERVER_NAME = "linerpc-server";

} // namespace linerpc
