#pragma once
#include <string>
#include <string_view>

namespace mcplink {

enum class ReadStatus {
    Line,           // a complete line was stored in the out parameter
    Eof,            // the peer closed its end; no further lines
    Interrupted     // interrupt() was called; buffered input is kept
};

/// Newline-delimited framing over a duplex byte stream. Knows nothing
/// about JSON-RPC.
class LineTransport {
public:
    virtual ~LineTransport() = default;

    /// Block until one full line is available (without its terminator), the
    /// stream ends, or interrupt() is called. Throws TransportError on I/O
    /// failure. Only one thread may read at a time.
    virtual ReadStatus read_line(std::string& line) = 0;

    /// Write `line` followed by '\n' as one unit. Safe to call from several
    /// threads at once. Throws ConnectionClosedError if the peer is gone and
    /// TransportError on other failures.
    virtual void write_line(std::string_view line) = 0;

    /// Wake a blocked read_line(), which then returns Interrupted. If no read
    /// is blocked, the next read_line() that would block returns Interrupted.
    /// Complete lines already buffered stay readable.
    virtual void interrupt() = 0;

    /// Close the outbound direction so the peer sees EOF.
    virtual void close_write() = 0;
};

} // namespace mcplink
