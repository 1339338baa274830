#pragma once
#include "dispatcher.hpp"
#include "response_writer.hpp"
#include "transport/transport.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace linerpc {

enum class LoopState {
    Running,
    Draining,
    Stopped
};

const char* to_string(LoopState s);

/// Single-threaded read -> decode -> dispatch -> write loop.
class EventLoop {
public:
    EventLoop(const HandlerRegistry& registry, ITransport& transport);

    /// Block until end-of-stream. Throws RpcTransportError on a read or
    /// write failure; the loop is Stopped either way.
    void run();

    /// Decode and dispatch one line. Returns the response to emit, or nullopt
    /// when the line gets no reply.
    [[nodiscard]] std::optional<JsonRpcResponse> handle_line(std::string_view line) const;

    LoopState state() const { return state_; }
    size_t lines_processed() const { return lines_processed_; }

private:
    ITransport& transport_;
    Dispatcher dispatcher_;
    ResponseWriter writer_;
    LoopState state_{LoopState::Stopped};
    size_t lines_processed_{0};
};

/// True for lines that contain only spaces, tabs and line breaks.
bool is_blank(std::string_view line);

} // namespace linerpc
