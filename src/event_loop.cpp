#include "linerpc/event_loop.hpp"
#include "linerpc/codec.hpp"
#include "linerpc/error.hpp"
#include "linerpc/logger.hpp"
#include <log4cplus/loggingmacros.h>
#include <exception>

namespace linerpc {

const char* to_string(LoopState s) {
    switch (s) {
        case LoopState::Running:  return "running";
        case LoopState::Draining: return "draining";
        case LoopState::Stopped:  return "stopped";
    }
    return "unknown";
}

bool is_blank(std::string_view line) {
    return line.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

EventLoop::EventLoop(const HandlerRegistry& registry, ITransport& transport)
    : transport_(transport), dispatcher_(registry), writer_(transport) {
}

std::optional<JsonRpcResponse> EventLoop::handle_line(std::string_view line) const {
    auto decoded = Codec::decode(line);

    if (auto* failure = std::get_if<DecodeFailure>(&decoded)) {
        LOG4CPLUS_ERROR(server_logger(), "Rejected message (" << failure->error.code << " "
                        << failure->error.message << "): " << line.substr(0, 100));
        if (failure->from_notification) return std::nullopt;
        return JsonRpcResponse::failure(std::move(failure->id), std::move(failure->error));
    }

    if (auto* req = std::get_if<JsonRpcRequest>(&decoded)) {
        return dispatcher_.dispatch(JsonRpcMessage{std::move(*req)});
    }
    return dispatcher_.dispatch(JsonRpcMessage{std::get<JsonRpcNotification>(std::move(decoded))});
}

void EventLoop::run() {
    LOG4CPLUS_INFO(server_logger(), "Starting event loop");
    state_ = LoopState::Running;

    try {
        while (state_ == LoopState::Running) {
            auto line = transport_.read_line();
            if (!line) {
                LOG4CPLUS_INFO(server_logger(), "EOF reached on input, shutting down");
                state_ = LoopState::Draining;
                // Processing is synchronous: nothing is left in flight to drain
                state_ = LoopState::Stopped;
                break;
            }

            if (is_blank(*line)) {
                LOG4CPLUS_DEBUG(server_logger(), "Skipping empty line");
                continue;
            }

            LOG4CPLUS_DEBUG(server_logger(), "Read line: " << line->substr(0, 100));
            ++lines_processed_;
            writer_.write(handle_line(*line));
        }
    } catch (const RpcTransportError& e) {
        LOG4CPLUS_ERROR(server_logger(), "Transport failure: " << e.what());
        state_ = LoopState::Stopped;
        throw;
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(server_logger(), "Unexpected error in the event loop: " << e.what());
        state_ = LoopState::Stopped;
        throw;
    }
}

} // namespace linerpc
