#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace linerpc {

/// Inbound line that could not be turned into a Request or Notification.
struct DecodeFailure {
    JsonRpcError error;
    RequestId id = nullptr;
    /// The line was shaped like a notification: the failure is logged, never answered.
    bool from_notification = false;

    bool operator==(const DecodeFailure& o) const {
        return error == o.error && id == o.id && from_notification == o.from_notification;
    }
};

using DecodeResult = std::variant<JsonRpcRequest, JsonRpcNotification, DecodeFailure>;

class Codec {
public:
    /// Deepest object/array nesting accepted, well inside simdjson's own limit.
    static constexpr size_t MAX_DEPTH = 256;

    /// Decode and classify one line. Never throws for bad input: malformed JSON
    /// yields a -32700 failure, a malformed envelope -32600 or -32602. An
    /// integer id wider than 64 bits is rejected with -32600 and a null id.
    [[nodiscard]] static DecodeResult decode(std::string_view line);

    /// Parse raw JSON text into a JSON value.
    /// Throws RpcParseError on invalid JSON, trailing content or nesting
    /// deeper than MAX_DEPTH.
    [[nodiscard]] static json parse_json(std::string_view raw);

    /// Classify an already-parsed JSON value.
    [[nodiscard]] static DecodeResult classify(const json& j);

    /// Serialize a response to a single line (no terminator).
    /// Throws nlohmann::json::type_error if a string is not valid UTF-8.
    [[nodiscard]] static std::string serialize(const JsonRpcResponse& resp);
};

} // namespace linerpc
