#include "mcpecho/server.hpp"
#include "mcpecho/codec.hpp"
#include "mcpecho/router.hpp"
#include "mcpecho/error.hpp"
#include "mcpecho/transport/stdio_transport.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcpecho {

namespace {

// Render a JSON value for an error message: strings verbatim, anything
// else as JSON text.
std::string display_name(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

} // anonymous namespace

// ----------- McpServer::Impl -----------

struct McpServer::Impl {
    Options opts;
    Router router;

    // Tool storage, in registration order
    std::mutex store_mutex;
    std::vector<ToolDefinition> tools;
    std::unordered_map<std::string, ToolHandler> tool_handlers;

    ITransport* transport{nullptr};
    std::mutex transport_mutex;

    std::atomic<bool> running{false};

    explicit Impl(Options o) : opts(std::move(o)) {}

    void setup_handlers() {
        // initialize: a fixed capability announcement; params are not negotiated
        router.on_request("initialize", [this](const nlohmann::json&) -> HandlerResult {
            InitializeResult result;
            result.protocol_version = opts.protocol_version;
            result.capabilities.tools = nlohmann::json::object();
            result.server_info = opts.server_info;

            nlohmann::json j;
            to_json(j, result);
            return j;
        });

        // notifications/initialized
        router.on_notification("notifications/initialized", [](const nlohmann::json&) {
            spdlog::info("client initialized");
        });

        // tools/list
        router.on_request("tools/list", [this](const nlohmann::json&) -> HandlerResult {
            std::lock_guard<std::mutex> lock(store_mutex);
            return nlohmann::json{{"tools", tools}};
        });

        // tools/call
        router.on_request("tools/call", [this](const nlohmann::json& params) -> HandlerResult {
            if (!params.is_object()) {
                throw McpProtocolError(error::InvalidParams,
                                       "Invalid params: 'params' must be an object");
            }

            // Absent name reads as null: "Unknown tool: null"
            std::string name = display_name(params.contains("name") ? params.at("name")
                                                                    : nlohmann::json(nullptr));

            nlohmann::json arguments = nlohmann::json::object();
            if (params.contains("arguments") && !params.at("arguments").is_null()) {
                arguments = params.at("arguments");
            }
            if (!arguments.is_object()) {
                throw McpProtocolError(error::InvalidParams,
                                       "Invalid params: 'arguments' must be an object");
            }

            ToolHandler handler;
            {
                std::lock_guard<std::mutex> lock(store_mutex);
                auto it = tool_handlers.find(name);
                if (it != tool_handlers.end()) {
                    handler = it->second;
                }
            }

            if (!handler) {
                return JsonRpcError{error::MethodNotFound, "Unknown tool: " + name, std::nullopt};
            }

            CallToolResult tool_result;
            try {
                tool_result = handler(arguments);
            } catch (const McpProtocolError&) {
                throw;
            } catch (const std::exception& e) {
                // Tool failures are results, not protocol errors
                spdlog::warn("tool '{}' failed: {}", name, e.what());
                tool_result = CallToolResult{};
                tool_result.is_error = true;
                tool_result.content.push_back(TextContent{e.what()});
            }
            nlohmann::json j;
            to_json(j, tool_result);
            return j;
        });
    }
};

// ----------- McpServer -----------

McpServer::McpServer()
    : McpServer(Options{}) {
}

McpServer::McpServer(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {
    impl_->setup_handlers();
}

McpServer::~McpServer() = default;

void McpServer::add_tool(ToolDefinition def, ToolHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->store_mutex);
    // Remove existing tool with same name
    auto& items = impl_->tools;
    items.erase(std::remove_if(items.begin(), items.end(),
        [&def](const ToolDefinition& t) { return t.name == def.name; }), items.end());
    impl_->tool_handlers[def.name] = std::move(handler);
    items.push_back(std::move(def));
}

std::optional<JsonRpcResponse> McpServer::handle(const JsonRpcMessage& msg) {
    return impl_->router.dispatch(msg);
}

std::optional<JsonRpcResponse> McpServer::handle(const nlohmann::json& message) {
    JsonRpcMessage msg;
    try {
        msg = Codec::decode(message);
    } catch (const McpProtocolError& e) {
        spdlog::warn("rejecting message: {}", e.what());
        return make_error_response(nullptr, e.code, e.what());
    }
    return handle(msg);
}

std::optional<JsonRpcResponse> McpServer::handle_line(std::string_view line) {
    nlohmann::json message;
    try {
        message = Codec::parse_json(line);
    } catch (const McpParseError& e) {
        spdlog::warn("parse error: {}", e.what());
        return make_error_response(nullptr, error::ParseError,
                                   std::string("Parse error: ") + e.what());
    }
    return handle(message);
}

void McpServer::serve(std::unique_ptr<ITransport> transport) {
    auto* t = transport.get();
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = t;
    }
    impl_->running = true;
    spdlog::info("{} {} serving (protocol {})", impl_->opts.server_info.name,
                 impl_->opts.server_info.version, impl_->opts.protocol_version);

    std::exception_ptr transport_error;
    auto on_line = [this, t](const std::string& line) {
        auto response = handle_line(line);
        if (response) {
            t->send(*response);
        }
    };
    auto on_error = [&transport_error](std::exception_ptr e) {
        transport_error = std::move(e);
    };

    auto detach = [this]() {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->running = false;
        impl_->transport = nullptr;
    };

    try {
        t->start(on_line, on_error);
    } catch (const std::exception& e) {
        spdlog::error("transport failure: {}", e.what());
        detach();
        throw;
    }
    detach();

    // Read errors are reported through on_error and end the session
    if (transport_error) {
        std::rethrow_exception(transport_error);
    }
}

void McpServer::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void McpServer::shutdown() {
    impl_->running = false;
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    if (impl_->transport) {
        impl_->transport->shutdown();
    }
}

bool McpServer::is_running() const {
    return impl_->running;
}

} // namespace mcpecho
