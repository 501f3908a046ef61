#include "mcpecho/router.hpp"
#include "mcpecho/error.hpp"
#include <spdlog/spdlog.h>

namespace mcpecho {

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

void Router::notify(const NotificationHandler& handler, const std::string& method,
                    const nlohmann::json& params) {
    try {
        handler(params);
    } catch (const std::exception& e) {
        // Notifications have nobody to report to
        spdlog::warn("notification handler for '{}' failed: {}", method, e.what());
    }
}

std::optional<JsonRpcResponse> Router::dispatch(const JsonRpcMessage& msg) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        RequestHandler handler;
        NotificationHandler one_way;
        nlohmann::json params = req->params ? *req->params : nlohmann::json::object();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = request_handlers_.find(req->method);
            if (it != request_handlers_.end()) {
                handler = it->second;
            } else {
                auto nit = notification_handlers_.find(req->method);
                if (nit == notification_handlers_.end()) {
                    return make_error_response(req->id, error::MethodNotFound,
                                               "Method not found: " + req->method);
                }
                one_way = nit->second;
            }
        }

        if (one_way) {
            spdlog::debug("'{}' is one-way; dropping id {}", req->method, req->id.dump());
            notify(one_way, req->method, params);
            return std::nullopt;
        }

        // Call handler without holding the lock
        try {
            auto result = handler(params);

            JsonRpcResponse resp;
            resp.id = req->id;
            if (auto* ok = std::get_if<nlohmann::json>(&result)) {
                resp.result = std::move(*ok);
            } else if (auto* err = std::get_if<JsonRpcError>(&result)) {
                resp.error = std::move(*err);
            }
            return resp;
        } catch (const McpProtocolError& e) {
            return make_error_response(req->id, e.code, e.what());
        } catch (const std::exception& e) {
            spdlog::error("handler for '{}' failed: {}", req->method, e.what());
            return make_error_response(req->id, error::InternalError, e.what());
        }
    } else if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        NotificationHandler handler;
        nlohmann::json params = notif->params ? *notif->params : nlohmann::json::object();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = notification_handlers_.find(notif->method);
            if (it == notification_handlers_.end()) {
                // Request methods sent without an id are not answered either
                spdlog::debug("ignoring notification '{}'", notif->method);
                return std::nullopt;
            }
            handler = it->second;
        }

        notify(handler, notif->method, params);
        return std::nullopt;
    }

    return std::nullopt;
}

} // namespace mcpecho
