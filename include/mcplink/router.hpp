#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include "types.hpp"
#include "cancellation.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mcplink {

using RequestHandler = std::function<nlohmann::json(const RawJson& params,
                                                    const CancellationToken& cancel)>;
using NotificationRoute = std::function<void(const Notification& notification,
                                             const CancellationToken& cancel)>;

/// Outcome of dispatching one inbound message. `response` is set for every
/// request (and for lines that could not be decoded); notifications never
/// produce one. `failure` carries a notification handler's error, which is
/// reported to the caller but never written to the peer.
struct DispatchResult {
    std::optional<JsonRpcResponse> response;
    std::optional<std::string> failure;
};

/// Method route table. Built once by Router::Builder and read-only afterwards,
/// so dispatch needs no locking.
class Router {
public:
    class Builder {
    public:
        /// Register a request route. A later registration for the same method
        /// replaces the earlier one.
        Builder& on_request(std::string method, RequestHandler handler);
        Builder& on_notification(std::string method, NotificationRoute handler);
        /// Route for notifications with no exact match. Without one they are dropped.
        Builder& on_unhandled_notification(NotificationRoute handler);

        [[nodiscard]] Router build();

    private:
        std::unordered_map<std::string, RequestHandler> request_routes_;
        std::unordered_map<std::string, NotificationRoute> notification_routes_;
        NotificationRoute unhandled_notification_;
    };

    /// Decode one line and dispatch it. Decoding failures are answered with
    /// ParseError (null id) or InvalidRequest (best-effort id).
    [[nodiscard]] DispatchResult dispatch_line(std::string_view line,
                                               const CancellationToken& cancel = {}) const;

    [[nodiscard]] DispatchResult dispatch(const JsonRpcMessage& msg,
                                          const CancellationToken& cancel = {}) const;

    [[nodiscard]] bool has_request_route(const std::string& method) const;
    [[nodiscard]] bool has_notification_route(const std::string& method) const;

    /// Methods under this prefix are notifications even if they carry an id.
    static constexpr std::string_view notification_prefix = "notifications/";

private:
    Router(std::unordered_map<std::string, RequestHandler> request_routes,
           std::unordered_map<std::string, NotificationRoute> notification_routes,
           NotificationRoute unhandled_notification);

    DispatchResult dispatch_request(const JsonRpcRequest& req,
                                    const CancellationToken& cancel) const;
    DispatchResult dispatch_notification(const std::string& method,
                                         const std::optional<RawJson>& params,
                                         const CancellationToken& cancel) const;

    std::unordered_map<std::string, RequestHandler> request_routes_;
    std::unordered_map<std::string, NotificationRoute> notification_routes_;
    NotificationRoute unhandled_notification_;
};

/// Adapt a handler taking decoded parameters into a RequestHandler. Params
/// that fail to decode into `Params` are reported as InvalidParams.
template <typename Params>
RequestHandler typed_route(
    std::function<nlohmann::json(const Params&, const CancellationToken&)> fn) {
    return [fn = std::move(fn)](const RawJson& raw, const CancellationToken& cancel) {
        Params params;
        try {
            params = raw.parse().get<Params>();
        } catch (const std::exception& e) {
            throw RpcProtocolError(error::InvalidParams,
                                   std::string("Invalid params: ") + e.what());
        }
        return fn(params, cancel);
    };
}

} // namespace mcplink
