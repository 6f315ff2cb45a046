#include "mcplink/router.hpp"
#include "mcplink/codec.hpp"
#include "mcplink/log.hpp"

namespace mcplink {

Router::Builder& Router::Builder::on_request(std::string method, RequestHandler handler) {
    request_routes_[std::move(method)] = std::move(handler);
    return *this;
}

Router::Builder& Router::Builder::on_notification(std::string method, NotificationRoute handler) {
    notification_routes_[std::move(method)] = std::move(handler);
    return *this;
}

Router::Builder& Router::Builder::on_unhandled_notification(NotificationRoute handler) {
    unhandled_notification_ = std::move(handler);
    return *this;
}

Router Router::Builder::build() {
    return Router(std::move(request_routes_), std::move(notification_routes_),
                  std::move(unhandled_notification_));
}

Router::Router(std::unordered_map<std::string, RequestHandler> request_routes,
               std::unordered_map<std::string, NotificationRoute> notification_routes,
               NotificationRoute unhandled_notification)
    : request_routes_(std::move(request_routes)),
      notification_routes_(std::move(notification_routes)),
      unhandled_notification_(std::move(unhandled_notification)) {
}

bool Router::has_request_route(const std::string& method) const {
    return request_routes_.count(method) > 0;
}

bool Router::has_notification_route(const std::string& method) const {
    return notification_routes_.count(method) > 0;
}

DispatchResult Router::dispatch_line(std::string_view line, const CancellationToken& cancel) const {
    try {
        return dispatch(Codec::decode(line), cancel);
    } catch (const RpcEnvelopeError& e) {
        log::logger()->debug("rejecting inbound line ({}): {}", e.code, e.what());
        DispatchResult result;
        result.response = make_error(e.id, e.code, e.what());
        return result;
    }
}

DispatchResult Router::dispatch(const JsonRpcMessage& msg, const CancellationToken& cancel) const {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        if (req->method.compare(0, notification_prefix.size(), notification_prefix) == 0) {
            return dispatch_notification(req->method, req->params, cancel);
        }
        return dispatch_request(*req, cancel);
    }
    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        return dispatch_notification(notif->method, notif->params, cancel);
    }
    // The server issues no requests of its own, so a response has nothing to match.
    const auto& resp = std::get<JsonRpcResponse>(msg);
    log::logger()->warn("ignoring unexpected response (id {})", to_string(resp.id));
    return {};
}

DispatchResult Router::dispatch_request(const JsonRpcRequest& req,
                                        const CancellationToken& cancel) const {
    DispatchResult result;

    auto it = request_routes_.find(req.method);
    if (it == request_routes_.end()) {
        log::logger()->debug("no route for {}", req.method);
        result.response = make_error(req.id, error::MethodNotFound,
                                     "method not found: " + req.method);
        return result;
    }

    const RawJson params = req.params ? *req.params : RawJson();
    try {
        result.response = make_result(req.id, it->second(params, cancel));
    } catch (const RpcProtocolError& e) {
        log::logger()->debug("{} (id {}) failed with {}: {}",
                             req.method, to_string(req.id), e.code, e.what());
        result.response = make_error(req.id, e.code, e.what(), e.data);
    } catch (const std::exception& e) {
        log::logger()->debug("{} (id {}) failed: {}", req.method, to_string(req.id), e.what());
        result.response = make_error(req.id, error::InternalError, e.what());
    }
    return result;
}

DispatchResult Router::dispatch_notification(const std::string& method,
                                             const std::optional<RawJson>& params,
                                             const CancellationToken& cancel) const {
    DispatchResult result;

    const NotificationRoute* route = &unhandled_notification_;
    auto it = notification_routes_.find(method);
    if (it != notification_routes_.end()) {
        route = &it->second;
    } else if (!unhandled_notification_) {
        log::logger()->debug("no handler for notification {}", method);
        return result;
    }

    try {
        Notification notification;
        notification.method = method;
        if (params) {
            notification.params = params->parse();
            if (notification.params.is_null()) notification.params = nlohmann::json::object();
        }
        (*route)(notification, cancel);
    } catch (const std::exception& e) {
        log::logger()->warn("notification handler for {} failed: {}", method, e.what());
        result.failure = e.what();
    }
    return result;
}

} // namespace mcplink
