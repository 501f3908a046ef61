#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <optional>
#include <unordered_map>
#include <string>
#include <mutex>

namespace mcpecho {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

class Router {
public:
    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a one-way handler. A method registered here never gets a
    /// response, even when the peer attaches an id to it.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Dispatch an incoming message. Returns the response, or nullopt when
    /// the message is one-way.
    [[nodiscard]] std::optional<JsonRpcResponse> dispatch(const JsonRpcMessage& msg);

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    void notify(const NotificationHandler& handler, const std::string& method,
                const nlohmann::json& params);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
};

} // namespace mcpecho
