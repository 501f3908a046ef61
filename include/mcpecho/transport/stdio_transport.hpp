#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <mutex>

namespace mcpecho {

/// StdioTransport reads newline-delimited JSON from stdin and writes to stdout.
/// Lines are handled one at a time on the calling thread; each response is
/// written with a direct write(2), so nothing sits in a user-space buffer.
class StdioTransport : public ITransport {
public:
    /// Create transport using system stdin/stdout.
    StdioTransport();

    /// Create transport using specified file descriptors (for testing).
    /// The transport takes ownership and closes them.
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start(LineCallback on_line, ErrorCallback on_error = nullptr) override;
    void send(const JsonRpcResponse& resp) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void read_loop(const LineCallback& on_line, const ErrorCallback& on_error);
    void write_line(std::string line);

    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::mutex write_mutex_;

    int wakeup_pipe_[2]{-1, -1};  // pipe for interrupting poll() on shutdown
};

} // namespace mcpecho
