#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace mcpecho {

class Codec {
public:
    /// Parse raw JSON text (one transport line) into a JSON value.
    /// Throws McpParseError when the text is not a single valid JSON value;
    /// the exception message carries the parser's details.
    [[nodiscard]] static nlohmann::json parse_json(std::string_view raw);

    /// Classify a decoded JSON value as a request or a notification.
    /// Throws McpProtocolError(InvalidRequest) when the value is not an object.
    [[nodiscard]] static JsonRpcMessage decode(const nlohmann::json& j);

    /// parse_json() followed by decode().
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Serialize a response to a single line of JSON (no trailing newline).
    [[nodiscard]] static std::string serialize(const JsonRpcResponse& resp);

    /// Serialize an inbound-style message; used by tests and benchmarks.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);
};

} // namespace mcpecho
