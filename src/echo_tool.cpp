#include "mcpecho/echo_tool.hpp"
#include "mcpecho/server.hpp"
#include <string>

namespace mcpecho {

ToolDefinition echo_tool_definition() {
    ToolDefinition def;
    def.name = "echo";
    def.description = "Echoes back the provided message. Use this to test MCP connectivity.";
    def.input_schema = {
        {"type", "object"},
        {"properties", {
            {"message", {{"type", "string"}, {"description", "The message to echo back"}}}
        }},
        {"required", {"message"}}
    };
    return def;
}

CallToolResult echo_tool(const nlohmann::json& arguments) {
    // Non-string messages are echoed as their JSON text
    std::string message;
    if (arguments.contains("message") && !arguments.at("message").is_null()) {
        const auto& value = arguments.at("message");
        message = value.is_string() ? value.get<std::string>() : value.dump();
    }

    CallToolResult result;
    result.content.push_back(TextContent{"Echo: " + message});
    return result;
}

void add_echo_tool(McpServer& server) {
    server.add_tool(echo_tool_definition(), echo_tool);
}

} // namespace mcpecho
