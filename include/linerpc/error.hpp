#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace linerpc {

class RpcError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed JSON text. Raised inside the codec only; Codec::decode turns it
/// into a -32700 failure.
class RpcParseError : public RpcError {
public:
    using RpcError::RpcError;
};

/// Structured failure raised by a handler. The dispatcher reports it with the
/// handler's code, message and data.
class RpcProtocolError : public RpcError {
public:
    int code;
    std::optional<nlohmann::ordered_json> data;

    RpcProtocolError(int code, const std::string& msg,
                     std::optional<nlohmann::ordered_json> data = std::nullopt)
        : RpcError(msg), code(code), data(std::move(data)) {}
};

/// Unrecoverable read/write failure. Stops the event loop.
class RpcTransportError : public RpcError {
public:
    using RpcError::RpcError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;

    // Implementation-defined server errors
    constexpr int ServerErrorFirst = -32099;
    constexpr int ServerErrorLast  = -32000;

    constexpr bool is_server_error_code(int code) {
        return code >= ServerErrorFirst && code <= ServerErrorLast;
    }

    constexpr bool is_reserved_code(int code) {
        return code >= -32768 && code <= -32000;
    }

    /// Canonical message for the predefined codes, empty for anything else.
    constexpr std::string_view default_message(int code) {
        switch (code) {
            case ParseError:     return "Parse error";
            case InvalidRequest: return "Invalid Request";
            case MethodNotFound: return "Method not found";
            case InvalidParams:  return "Invalid params";
            case InternalError:  return "Internal error";
            default:             return {};
        }
    }

    /// Reserved by JSON-RPC 2.0 but neither predefined nor in the server-error range.
    constexpr bool is_unassigned_reserved_code(int code) {
        return is_reserved_code(code) && !is_server_error_code(code) &&
               default_message(code).empty();
    }
} // namespace error

} // namespace linerpc
