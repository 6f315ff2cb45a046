#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "json_rpc.hpp"

namespace mcplink {

class RpcError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A JSON-RPC error object. Handlers throw it to pick the error code sent
/// back to the peer; the client throws it when a Response carries `error`.
class RpcProtocolError : public RpcError {
public:
    int code;
    std::optional<nlohmann::json> data;

    RpcProtocolError(int code, const std::string& msg,
                     std::optional<nlohmann::json> data = std::nullopt)
        : RpcError(msg), code(code), data(std::move(data)) {}
};

/// Thrown by Codec::decode. `id` is whatever could be recovered from the
/// envelope before it was rejected (null when nothing usable was found).
class RpcEnvelopeError : public RpcProtocolError {
public:
    RequestId id;

    RpcEnvelopeError(int code, const std::string& msg,
                     RequestId id = nullptr)
        : RpcProtocolError(code, msg), id(std::move(id)) {}
};

class TransportError : public RpcError {
public:
    using RpcError::RpcError;
};

/// The peer closed the stream (EOF, broken pipe) or the connection was shut down.
class ConnectionClosedError : public TransportError {
public:
    using TransportError::TransportError;
};

/// Client-local: the caller retracted the request before its response arrived.
class CancelledError : public RpcError {
public:
    using RpcError::RpcError;
};

class TimeoutError : public CancelledError {
public:
    using CancelledError::CancelledError;
};

class NotInitializedError : public RpcError {
public:
    using RpcError::RpcError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
    constexpr int ResourceNotFound = -32002;
} // namespace error

} // namespace mcplink
