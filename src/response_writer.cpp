#include "linerpc/response_writer.hpp"
#include "linerpc/codec.hpp"
#include "linerpc/error.hpp"
#include "linerpc/logger.hpp"
#include <log4cplus/loggingmacros.h>
#include <string>

namespace linerpc {

bool ResponseWriter::write(const std::optional<JsonRpcResponse>& resp) {
    if (!resp) return false;

    std::string line;
    try {
        line = Codec::serialize(*resp);
    } catch (const json::exception& e) {
        LOG4CPLUS_ERROR(transport_logger(), "Error serializing response: " << e.what());
        auto fallback = JsonRpcResponse::failure(resp->id, JsonRpcError{
            error::InternalError, "Response serialization failed", std::nullopt});
        try {
            line = Codec::serialize(fallback);
        } catch (const json::exception&) {
            fallback.id = nullptr;
            line = Codec::serialize(fallback);
        }
    }

    transport_.write_line(line);
    LOG4CPLUS_DEBUG(transport_logger(), "Sent response: " << line.substr(0, 100));
    return true;
}

} // namespace linerpc
