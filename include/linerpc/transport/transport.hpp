#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace linerpc {

/// Line-oriented byte transport to the peer.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Next line without its terminator (a trailing '\r' is stripped too).
    /// Returns nullopt at end-of-stream. Throws RpcTransportError on failure.
    [[nodiscard]] virtual std::optional<std::string> read_line() = 0;

    /// Write `line` plus the line terminator and flush it to the peer.
    /// Throws RpcTransportError on failure.
    virtual void write_line(std::string_view line) = 0;

    /// Release the underlying channel. Further reads report end-of-stream.
    virtual void close() = 0;
};

} // namespace linerpc
