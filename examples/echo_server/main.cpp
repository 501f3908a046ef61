/// Echo server: MCP server exposing a single "echo" tool.
/// Usage: ./echo-server
/// Communicates over stdio (newline-delimited JSON-RPC) until end of input.
/// Diagnostics go to stderr; set SPDLOG_LEVEL (e.g. SPDLOG_LEVEL=debug) to
/// change verbosity.

#include <mcpecho/mcpecho.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>

int main() {
    // stdout carries the protocol, so log to stderr only
    spdlog::set_default_logger(spdlog::stderr_color_mt("echo-server"));
    spdlog::set_level(spdlog::level::warn);
    spdlog::cfg::load_env_levels();

    // A closed stdout must surface as a write error, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    mcpecho::McpServer::Options opts;
    opts.server_info = {std::string(mcpecho::SERVER_NAME), std::string(mcpecho::SERVER_VERSION)};

    mcpecho::McpServer server{std::move(opts)};
    mcpecho::add_echo_tool(server);

    try {
        // Blocks until stdin is closed
        server.serve_stdio();
    } catch (const mcpecho::McpError& e) {
        spdlog::error("fatal: {}", e.what());
        return 1;
    }
    return 0;
}
