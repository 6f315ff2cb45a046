#pragma once
#include "transport.hpp"
#include <mutex>
#include <string>

namespace mcplink {

/// StdioTransport reads newline-delimited text from one fd and writes to
/// another. By default those are stdin/stdout; any pair (e.g. pipes to a
/// child process) may be given instead.
class StdioTransport : public LineTransport {
public:
    /// Create transport using system stdin/stdout (not closed on destruction).
    StdioTransport();

    /// Create transport over the given descriptors. When `owns_fds` is set
    /// they are closed on destruction.
    StdioTransport(int read_fd, int write_fd, bool owns_fds = true);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    ReadStatus read_line(std::string& line) override;
    void write_line(std::string_view line) override;
    void interrupt() override;
    void close_write() override;

private:
    bool take_buffered_line(std::string& line);
    void drain_wakeup();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::string buffer_;
    bool eof_{false};

    std::mutex write_mutex_;
    bool write_closed_{false};

    int wakeup_pipe_[2]{-1, -1};  // self-pipe that interrupts poll()
};

} // namespace mcplink
