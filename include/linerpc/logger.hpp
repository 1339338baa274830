#pragma once

#include <string>
#include <log4cplus/logger.h>

namespace linerpc {

log4cplus::Logger& server_logger();
log4cplus::Logger& dispatch_logger();
log4cplus::Logger& transport_logger();

/// Configure log4cplus from `config_path` when that file exists, otherwise log
/// to stderr at INFO. A non-empty `level` overrides the root level.
/// Never writes to stdout: stdout carries protocol traffic only.
void init_logging(const std::string& config_path, const std::string& level = "");

/// Maps "trace".."fatal", "off" to a log4cplus level. Throws std::invalid_argument.
int parse_log_level(const std::string& name);

} // namespace linerpc
