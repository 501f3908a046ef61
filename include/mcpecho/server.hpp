#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "version.hpp"
#include "transport/transport.hpp"
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <optional>

namespace mcpecho {

/// Callback types
using ToolHandler = std::function<CallToolResult(const nlohmann::json& arguments)>;

/// MCP server core: maps one decoded message to a response or to nothing.
/// Handling is stateless; the dispatch and tool tables are fixed once
/// serving starts.
class McpServer {
public:
    struct Options {
        Implementation server_info{std::string(SERVER_NAME), std::string(SERVER_VERSION)};
        std::string protocol_version{PROTOCOL_VERSION};
    };

    McpServer();
    explicit McpServer(Options opts);
    ~McpServer();

    // Non-copyable, non-movable
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // ---- Tool registration ----
    void add_tool(ToolDefinition def, ToolHandler handler);

    // ---- Message handling ----

    /// Handle a classified message. Returns nullopt for one-way messages.
    [[nodiscard]] std::optional<JsonRpcResponse> handle(const JsonRpcMessage& msg);

    /// Handle an already-decoded JSON value. Values that are not JSON-RPC
    /// objects get an error response with a null id.
    [[nodiscard]] std::optional<JsonRpcResponse> handle(const nlohmann::json& message);

    /// Handle one raw input line. Text that is not valid JSON gets a
    /// -32700 error response with a null id.
    [[nodiscard]] std::optional<JsonRpcResponse> handle_line(std::string_view line);

    // ---- Transport ----

    /// Serve until end of input or shutdown(). Transport failures are
    /// rethrown as McpTransportError.
    void serve(std::unique_ptr<ITransport> transport);

    /// stdout carries the protocol: the default spdlog logger must point at
    /// stderr before this is called.
    void serve_stdio();
    void shutdown();

    bool is_running() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcpecho
