#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace mcplink {

class Codec {
public:
    /// Decode one line into an envelope. Only the envelope shape is checked;
    /// `params`, `result` and `error.data` are kept as raw JSON text.
    /// Throws RpcEnvelopeError with code ParseError (not JSON) or
    /// InvalidRequest (JSON, but not a JSON-RPC 2.0 envelope).
    [[nodiscard]] static JsonRpcMessage decode(std::string_view raw);

    /// Encode an envelope as a single line of JSON, without the trailing
    /// newline. The result never contains a raw '\n'.
    [[nodiscard]] static std::string encode(const JsonRpcMessage& msg);
};

} // namespace mcplink
