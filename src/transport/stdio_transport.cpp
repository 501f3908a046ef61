#include "mcpecho/transport/stdio_transport.hpp"
#include "mcpecho/error.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <string>

namespace mcpecho {

namespace {

constexpr const char* kWhitespace = " \t\r\n\f\v";

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(kWhitespace);
    if (begin == std::string::npos) return {};
    size_t end = s.find_last_not_of(kWhitespace);
    return s.substr(begin, end - begin + 1);
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : StdioTransport(STDIN_FILENO, STDOUT_FILENO) {
    owns_fds_ = false;
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true) {
    if (::pipe(wakeup_pipe_) < 0) {
        throw McpTransportError(std::string("Failed to create wakeup pipe: ") + strerror(errno));
    }
    // Set non-blocking on write end of wakeup pipe
    int flags = fcntl(wakeup_pipe_[1], F_GETFL, 0);
    fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(LineCallback on_line, ErrorCallback on_error) {
    // If shutdown() was called before start(), don't block; exit immediately.
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        return; // already running
    }
    // shutdown() may have landed between the check above and the exchange
    if (shutdown_requested_.load()) {
        running_ = false;
        return;
    }
    connected_ = true;

    try {
        read_loop(on_line, on_error);
    } catch (...) {
        // A failing callback (usually send()) ends the session; the caller
        // gets the original exception.
        running_ = false;
        connected_ = false;
        throw;
    }
    running_ = false;
    connected_ = false;
}

void StdioTransport::read_loop(const LineCallback& on_line, const ErrorCallback& on_error) {
    std::string buffer;
    buffer.reserve(4096);

    char chunk[4096];

    auto deliver = [&on_line](const std::string& raw) {
        std::string line = trim(raw);
        if (line.empty()) return;
        spdlog::debug("<- {}", line);
        on_line(line);
    };

    while (running_) {
        // Use poll() so that shutdown() can interrupt the blocking read
        // via the wakeup pipe.
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            if (on_error) {
                on_error(std::make_exception_ptr(
                    McpTransportError(std::string("Poll error: ") + strerror(errno))));
            }
            break;
        }

        // Wakeup pipe has data: shutdown() was called, exit cleanly
        if (fds[1].revents & POLLIN) break;

        // POLLHUP without POLLIN still needs a read() to observe EOF
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (!running_) break;
            if (on_error) {
                on_error(std::make_exception_ptr(
                    McpTransportError(std::string("Read error: ") + strerror(errno))));
            }
            break;
        }
        if (n == 0) {
            // EOF: a final line without a newline still counts
            if (!buffer.empty()) {
                deliver(buffer);
                buffer.clear();
            }
            spdlog::info("end of input");
            break;
        }

        buffer.append(chunk, static_cast<size_t>(n));

        // Process complete lines
        size_t pos = 0;
        while (running_) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;

            std::string line = buffer.substr(pos, nl - pos);
            pos = nl + 1;
            deliver(line);
        }

        if (pos > 0) {
            buffer.erase(0, pos);
        }
    }
}

void StdioTransport::write_line(std::string line) {
    line += '\n';
    const char* data = line.data();
    size_t remaining = line.size();

    std::lock_guard<std::mutex> lock(write_mutex_);
    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            connected_ = false;
            throw McpTransportError(std::string("Write error: ") + strerror(errno));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

void StdioTransport::send(const JsonRpcResponse& resp) {
    if (shutdown_requested_.load()) {
        throw McpTransportError("Transport shut down");
    }
    std::string serialized = Codec::serialize(resp);
    spdlog::debug("-> {}", serialized);
    write_line(std::move(serialized));
}

void StdioTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) {
        return;
    }
    running_ = false;
    connected_ = false;
    // The wakeup byte stays in the pipe, so a reader that has not reached
    // poll() yet still sees it.
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
            spdlog::warn("failed to wake reader: {}", strerror(errno));
        }
    }
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace mcpecho
