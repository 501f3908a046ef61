#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>
#include <string>

namespace mcpecho {

/// Callback for each complete, trimmed, non-empty input line
using LineCallback = std::function<void(const std::string& line)>;
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Abstract transport interface
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start the transport. Blocks until end of input or shutdown().
    virtual void start(LineCallback on_line,
                       ErrorCallback on_error = nullptr) = 0;

    /// Serialize a response and write it out as one line.
    virtual void send(const JsonRpcResponse& resp) = 0;

    /// Graceful shutdown.
    virtual void shutdown() = 0;

    /// Check if transport is connected.
    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace mcpecho
