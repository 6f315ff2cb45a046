#pragma once

/// Umbrella header for the mcplink JSON-RPC / MCP messaging library.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "cancellation.hpp"
#include "session.hpp"
#include "router.hpp"
#include "handlers.hpp"
#include "server.hpp"
#include "client.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
