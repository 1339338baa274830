#pragma once
#include "json_rpc.hpp"
#include "transport/transport.hpp"
#include <optional>

namespace linerpc {

class ResponseWriter {
public:
    explicit ResponseWriter(ITransport& transport) : transport_(transport) {}

    /// Emit `resp` as one line, or nothing when absent.
    /// Returns true if a line was written.
    bool write(const std::optional<JsonRpcResponse>& resp);

private:
    ITransport& transport_;
};

} // namespace linerpc
