#pragma once
#include "types.hpp"

namespace mcpecho {

class McpServer;

/// Descriptor advertised by tools/list for the "echo" tool.
[[nodiscard]] ToolDefinition echo_tool_definition();

/// Returns "Echo: <message>"; a missing message echoes the empty string.
/// Throws McpProtocolError(InvalidParams) when message is not a string.
CallToolResult echo_tool(const nlohmann::json& arguments);

/// Register the echo tool on a server.
void add_echo_tool(McpServer& server);

} // namespace mcpecho
