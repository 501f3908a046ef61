#pragma once
#include <string>
#include <variant>
#include <optional>
#include <type_traits>
#include <nlohmann/json.hpp>

namespace mcpecho {

/// Request ids are opaque: the JSON value the peer sent (number, string,
/// even null) is echoed back unchanged.
using RequestId = nlohmann::json;

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
    bool operator!=(const JsonRpcError& o) const { return !(*this == o); }
};

inline void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

inline void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    if (j.contains("data")) e.data = j.at("data");
}

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

struct JsonRpcResponse {
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

struct JsonRpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcNotification& o) const {
        return method == o.method && params == o.params;
    }
};

/// Inbound messages. Peers never send us responses, so a message without
/// a method is classified as a request for the empty method.
using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcNotification>;

/// Build an error response for the given id.
JsonRpcResponse make_error_response(RequestId id, int code, std::string message);

void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void from_json(const nlohmann::json& j, JsonRpcRequest& r);

void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void from_json(const nlohmann::json& j, JsonRpcResponse& r);

void to_json(nlohmann::json& j, const JsonRpcNotification& n);
void from_json(const nlohmann::json& j, JsonRpcNotification& n);

template <typename T, std::enable_if_t<std::is_same_v<T, JsonRpcMessage>, int> = 0>
void to_json(nlohmann::json& j, const T& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

} // namespace mcpecho
