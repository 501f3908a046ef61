#pragma once

/// Umbrella header for the mcpecho MCP server library.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "router.hpp"
#include "server.hpp"
#include "echo_tool.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
