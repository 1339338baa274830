#pragma once
#include "json_rpc.hpp"
#include <optional>

namespace linerpc {

enum class SessionState {
    Uninitialized,
    Initializing,
    Ready
};

const char* to_string(SessionState s);

/// Handshake progress with the peer. Informational only: dispatch is never
/// gated on it.
class Session {
public:
    SessionState state() const { return state_; }
    void set_state(SessionState s) { state_ = s; }

    std::optional<json>& client_info() { return client_info_; }
    const std::optional<json>& client_info() const { return client_info_; }

private:
    SessionState state_{SessionState::Uninitialized};
    std::optional<json> client_info_;
};

} // namespace linerpc
