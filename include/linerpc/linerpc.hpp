#pragma once

/// Umbrella header for the linerpc JSON-RPC 2.0 engine.

#include "version.hpp"
#include "error.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "registry.hpp"
#include "session.hpp"
#include "builtins.hpp"
#include "dispatcher.hpp"
#include "response_writer.hpp"
#include "event_loop.hpp"
#include "server.hpp"
#include "logger.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
