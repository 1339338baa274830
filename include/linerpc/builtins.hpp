#pragma once
#include "registry.hpp"
#include "session.hpp"
#include <string>

namespace linerpc {

struct ServerInfo {
    std::string name;
    std::string version;
    std::string protocol_version;
};

/// Capability payload returned by `initialize`.
json make_initialize_result(const ServerInfo& info);

/// Install `initialize`, `notifications/initialized` and `ping`.
/// `session` must outlive the registry entries.
void register_builtin_handlers(HandlerRegistry& registry, const ServerInfo& info,
                               Session& session);

} // namespace linerpc
