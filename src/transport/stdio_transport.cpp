#include "mcplink/transport/stdio_transport.hpp"
#include "mcplink/error.hpp"
#include "mcplink/log.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <string>

namespace mcplink {

namespace {

std::string errno_text(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw TransportError(errno_text("Failed to set O_NONBLOCK"));
    }
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : StdioTransport(STDIN_FILENO, STDOUT_FILENO, false) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd, bool owns_fds)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(owns_fds) {
    if (::pipe(wakeup_pipe_) < 0) {
        throw TransportError(errno_text("Failed to create wakeup pipe"));
    }
    set_nonblocking(wakeup_pipe_[0]);
    set_nonblocking(wakeup_pipe_[1]);
    buffer_.reserve(4096);
}

StdioTransport::~StdioTransport() {
    if (owns_fds_) {
        if (read_fd_ >= 0) ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

bool StdioTransport::take_buffered_line(std::string& line) {
    while (true) {
        size_t nl = buffer_.find('\n');
        if (nl == std::string::npos) return false;

        line.assign(buffer_, 0, nl);
        buffer_.erase(0, nl + 1);

        // Remove trailing \r if present (CRLF)
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) return true;
    }
}

void StdioTransport::drain_wakeup() {
    char sink[64];
    while (::read(wakeup_pipe_[0], sink, sizeof(sink)) > 0) {
    }
}

ReadStatus StdioTransport::read_line(std::string& line) {
    char chunk[4096];

    while (true) {
        if (take_buffered_line(line)) return ReadStatus::Line;

        if (eof_) {
            // A final fragment without a terminator still counts as a line.
            if (!buffer_.empty()) {
                line = std::move(buffer_);
                buffer_.clear();
                if (!line.empty() && line.back() == '\r') line.pop_back();
                if (!line.empty()) return ReadStatus::Line;
            }
            return ReadStatus::Eof;
        }

        // poll() on the input and the wakeup pipe, so interrupt() can break
        // a blocking wait without touching buffered data.
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
            throw TransportError(errno_text("poll failed"));
        }

        if (fds[1].revents & POLLIN) {
            drain_wakeup();
            return ReadStatus::Interrupted;
        }

        if (fds[0].revents & POLLNVAL) {
            throw TransportError("Read descriptor is not open");
        }
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            throw TransportError(errno_text("Read error"));
        }
        if (n == 0) {
            log::logger()->debug("stdio transport: end of input");
            eof_ = true;
            continue;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

void StdioTransport::write_line(std::string_view line) {
    std::string out;
    out.reserve(line.size() + 1);
    out.append(line.data(), line.size());
    out.push_back('\n');

    // One lock per line: concurrent writers never interleave partial lines.
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (write_closed_) {
        throw ConnectionClosedError("Transport closed for writing");
    }

    const char* data = out.data();
    size_t remaining = out.size();
    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            if (errno == EPIPE) {
                throw ConnectionClosedError("Peer closed the stream");
            }
            throw TransportError(errno_text("Write error"));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

void StdioTransport::interrupt() {
    char b = 1;
    // A full pipe already holds a pending wakeup.
    if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
        throw TransportError(errno_text("Failed to signal wakeup pipe"));
    }
}

void StdioTransport::close_write() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (write_closed_) return;
    write_closed_ = true;
    if (owns_fds_ && write_fd_ >= 0) {
        ::close(write_fd_);
        write_fd_ = -1;
    }
}

} // namespace mcplink
