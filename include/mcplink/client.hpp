#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "session.hpp"
#include "cancellation.hpp"
#include "transport/transport.hpp"
#include "version.hpp"
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace mcplink {

/// Client side of a connection: issues requests with fresh integer ids and
/// hands each response to the caller waiting on that id, in whatever order
/// responses arrive. One background thread owns reading from the transport.
class Client {
public:
    struct Options {
        Implementation client_info{"mcplink-client", std::nullopt, std::string(LIBRARY_VERSION)};
        nlohmann::json capabilities = nlohmann::json::object();
        /// Per-request timeout applied by await(); zero disables it.
        std::chrono::milliseconds request_timeout{30000};
    };

    using NotificationCallback = std::function<void(const Notification&)>;

    /// An issued request whose response has not been collected yet.
    struct PendingCall {
        int64_t id;
        std::string method;
        std::future<JsonRpcResponse> response;
    };

    explicit Client(std::unique_ptr<LineTransport> transport);
    Client(std::unique_ptr<LineTransport> transport, Options opts);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /// Route server notifications for `method` to `callback`. Only allowed
    /// before start(); the callback runs on the reader thread.
    void on_notification(std::string method, NotificationCallback callback);

    /// Launch the reader thread. Called implicitly by the first send.
    void start();

    // ---- Correlation ----

    /// Register a pending entry and write the request. Fails fast with
    /// NotInitializedError before the handshake (except for "initialize")
    /// and with ConnectionClosedError once the connection is gone.
    [[nodiscard]] PendingCall send(const std::string& method,
                                   std::optional<RawJson> params = std::nullopt);

    /// Block until the response for `call` arrives and return its result.
    /// Throws RpcProtocolError for an error response, CancelledError when
    /// `cancel` fires first, TimeoutError when the request timeout expires
    /// and ConnectionClosedError when the connection drops.
    RawJson await(PendingCall& call, const CancellationToken& cancel = {});

    /// send() followed by await().
    RawJson call(const std::string& method, std::optional<RawJson> params = std::nullopt,
                 const CancellationToken& cancel = {});

    void notify(const std::string& method, std::optional<RawJson> params = std::nullopt);

    // ---- Lifecycle ----

    /// Perform the initialize handshake, then send notifications/initialized.
    /// Returns the server's initialize result.
    nlohmann::json initialize(const CancellationToken& cancel = {});

    /// Stop reading, close the outbound stream and fail every pending call
    /// with ConnectionClosedError. Idempotent.
    void close();

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] size_t pending_count() const;
    /// The result of a successful initialize (null before that).
    [[nodiscard]] nlohmann::json server_info() const;

    // ---- MCP methods ----

    void ping(const CancellationToken& cancel = {});
    void set_logging_level(LogLevel level, const CancellationToken& cancel = {});
    nlohmann::json complete(const nlohmann::json& ref, const CompletionArgument& argument,
                            const CancellationToken& cancel = {});

    nlohmann::json list_resources(std::optional<std::string> cursor = std::nullopt,
                                  const CancellationToken& cancel = {});
    nlohmann::json read_resource(const std::string& uri, const CancellationToken& cancel = {});
    void subscribe_resource(const std::string& uri, const CancellationToken& cancel = {});
    void unsubscribe_resource(const std::string& uri, const CancellationToken& cancel = {});

    nlohmann::json list_prompts(std::optional<std::string> cursor = std::nullopt,
                                const CancellationToken& cancel = {});
    nlohmann::json get_prompt(const std::string& name,
                              const std::map<std::string, std::string>& arguments = {},
                              const CancellationToken& cancel = {});

    nlohmann::json list_tools(std::optional<std::string> cursor = std::nullopt,
                              const CancellationToken& cancel = {});
    nlohmann::json call_tool(const std::string& name,
                             const nlohmann::json& arguments = nlohmann::json::object(),
                             const CancellationToken& cancel = {});

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcplink
