#include "mcplink/client.hpp"
#include "mcplink/codec.hpp"
#include "mcplink/error.hpp"
#include "mcplink/log.hpp"
#include "mcplink/router.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace mcplink {

struct Client::Impl {
    Options opts;
    std::unique_ptr<LineTransport> transport;
    Session session;

    // Fixed once the reader starts; read without locking afterwards.
    std::map<std::string, NotificationCallback> notification_callbacks;

    mutable std::mutex lifecycle_mutex;
    std::thread reader;
    bool started{false};
    bool closed{false};
    std::atomic<bool> stopping{false};
    nlohmann::json server_result;

    Impl(std::unique_ptr<LineTransport> t, Options o)
        : opts(std::move(o)), transport(std::move(t)) {
        if (!transport) {
            throw std::invalid_argument("Client requires a transport");
        }
    }

    void read_loop() {
        auto lg = log::logger();
        std::string reason = "Connection closed by peer";
        std::string line;
        try {
            while (true) {
                ReadStatus status = transport->read_line(line);
                if (status == ReadStatus::Eof) {
                    lg->info("server closed the stream");
                    break;
                }
                if (status == ReadStatus::Interrupted) {
                    if (stopping) {
                        reason = "Client closed";
                        break;
                    }
                    continue;
                }
                handle_line(line);
            }
        } catch (const TransportError& e) {
            lg->error("transport read failed: {}", e.what());
            reason = e.what();
        }
        session.fail_all(reason);
    }

    void handle_line(const std::string& line) {
        auto lg = log::logger();
        JsonRpcMessage msg;
        try {
            msg = Codec::decode(line);
        } catch (const RpcEnvelopeError& e) {
            lg->warn("skipping malformed line from server: {}", e.what());
            return;
        }

        if (const auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
            if (!session.complete_request(resp->id, *resp)) {
                lg->debug("dropping response for id {} with no pending request",
                          to_string(resp->id));
            }
        } else if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
            deliver_notification(notif->method, notif->params);
        } else {
            const auto& req = std::get<JsonRpcRequest>(msg);
            if (req.method.compare(0, Router::notification_prefix.size(),
                                   Router::notification_prefix) == 0) {
                deliver_notification(req.method, req.params);
                return;
            }
            // No server-to-client capabilities are offered.
            lg->debug("rejecting server request {} (id {})", req.method, to_string(req.id));
            try {
                transport->write_line(Codec::encode(
                    make_error(req.id, error::MethodNotFound, "method not found: " + req.method)));
            } catch (const TransportError& e) {
                lg->warn("failed to answer server request: {}", e.what());
            }
        }
    }

    void deliver_notification(const std::string& method, const std::optional<RawJson>& params) {
        auto it = notification_callbacks.find(method);
        if (it == notification_callbacks.end()) {
            log::logger()->debug("unhandled notification {}", method);
            return;
        }
        try {
            Notification notification;
            notification.method = method;
            if (params) {
                notification.params = params->parse();
                if (notification.params.is_null()) notification.params = nlohmann::json::object();
            }
            it->second(notification);
        } catch (const std::exception& e) {
            log::logger()->warn("notification callback for {} failed: {}", method, e.what());
        }
    }
};

Client::Client(std::unique_ptr<LineTransport> transport)
    : Client(std::move(transport), Options{}) {
}

Client::Client(std::unique_ptr<LineTransport> transport, Options opts)
    : impl_(std::make_unique<Impl>(std::move(transport), std::move(opts))) {
}

Client::~Client() {
    close();
}

void Client::on_notification(std::string method, NotificationCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
    if (impl_->started) {
        throw std::logic_error("Notification callbacks must be registered before start()");
    }
    impl_->notification_callbacks[std::move(method)] = std::move(callback);
}

void Client::start() {
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
    if (impl_->started) return;
    if (impl_->closed) {
        throw ConnectionClosedError("Client closed");
    }
    impl_->started = true;
    impl_->reader = std::thread([this] { impl_->read_loop(); });
}

Client::PendingCall Client::send(const std::string& method, std::optional<RawJson> params) {
    start();

    SessionState st = impl_->session.state();
    if (st == SessionState::Closed) {
        throw ConnectionClosedError("Connection closed");
    }
    if (st != SessionState::Ready && method != "initialize") {
        throw NotInitializedError("client not initialized");
    }

    auto reg = impl_->session.register_request(method);
    JsonRpcRequest req{RequestId{reg.id}, method, std::move(params)};
    try {
        impl_->transport->write_line(Codec::encode(req));
    } catch (const TransportError&) {
        impl_->session.cancel_request(reg.id, std::current_exception());
        throw;
    }
    return PendingCall{reg.id, method, std::move(reg.response)};
}

RawJson Client::await(PendingCall& call, const CancellationToken& cancel) {
    if (!call.response.valid()) {
        throw std::logic_error("Response for request " + std::to_string(call.id) +
                               " was already collected");
    }

    Session& session = impl_->session;
    const int64_t id = call.id;
    auto registration = cancel.on_cancel([&session, id] {
        session.cancel_request(id, std::make_exception_ptr(CancelledError("Request cancelled")));
    });

    const auto timeout = impl_->opts.request_timeout;
    if (timeout.count() > 0 &&
        call.response.wait_for(timeout) == std::future_status::timeout) {
        // Loses to a response that completed the entry first.
        if (session.cancel_request(id, std::make_exception_ptr(
                TimeoutError("Request timed out: " + call.method)))) {
            log::logger()->warn("{} (id {}) timed out after {}ms", call.method, id, timeout.count());
        }
    }

    JsonRpcResponse resp = call.response.get();
    if (resp.error) {
        throw RpcProtocolError(resp.error->code, resp.error->message, resp.error->data);
    }
    return resp.result ? *resp.result : RawJson();
}

RawJson Client::call(const std::string& method, std::optional<RawJson> params,
                     const CancellationToken& cancel) {
    auto pending = send(method, std::move(params));
    return await(pending, cancel);
}

void Client::notify(const std::string& method, std::optional<RawJson> params) {
    start();
    if (impl_->session.state() == SessionState::Closed) {
        throw ConnectionClosedError("Connection closed");
    }
    JsonRpcNotification notif{method, std::move(params)};
    impl_->transport->write_line(Codec::encode(notif));
}

nlohmann::json Client::initialize(const CancellationToken& cancel) {
    if (!impl_->session.transition(SessionState::Uninitialized, SessionState::Initializing)) {
        if (impl_->session.state() == SessionState::Closed) {
            throw ConnectionClosedError("Connection closed");
        }
        throw RpcError("initialize already performed");
    }

    InitializeParams params;
    params.capabilities = impl_->opts.capabilities;
    params.client_info = impl_->opts.client_info;
    params.protocol_version = std::string(PROTOCOL_VERSION);

    nlohmann::json result;
    try {
        result = call("initialize", RawJson::from(nlohmann::json(params)), cancel).parse();
    } catch (const std::exception&) {
        // Stays Closed if the connection went away.
        (void)impl_->session.transition(SessionState::Initializing, SessionState::Uninitialized);
        throw;
    }

    if (!impl_->session.transition(SessionState::Initializing, SessionState::Ready)) {
        throw ConnectionClosedError("Connection closed");
    }
    {
        std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
        impl_->server_result = result;
    }
    notify("notifications/initialized");

    if (result.is_object()) {
        log::logger()->info("initialized (protocol {})",
                            result.value("protocolVersion", std::string("unknown")));
    }
    return result;
}

void Client::close() {
    bool join_reader = false;
    {
        std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
        if (impl_->closed) return;
        impl_->closed = true;
        join_reader = impl_->started;
    }

    auto lg = log::logger();
    impl_->stopping = true;
    try {
        impl_->transport->close_write();
    } catch (const TransportError& e) {
        lg->warn("failed to close outbound stream: {}", e.what());
    }
    if (join_reader) {
        try {
            impl_->transport->interrupt();
        } catch (const TransportError& e) {
            lg->error("failed to interrupt reader: {}", e.what());
        }
        if (impl_->reader.joinable()) impl_->reader.join();
    }
    impl_->session.fail_all("Client closed");
}

SessionState Client::state() const {
    return impl_->session.state();
}

size_t Client::pending_count() const {
    return impl_->session.pending_count();
}

nlohmann::json Client::server_info() const {
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
    return impl_->server_result;
}

// ---- MCP methods ----

void Client::ping(const CancellationToken& cancel) {
    call("ping", std::nullopt, cancel);
}

void Client::set_logging_level(LogLevel level, const CancellationToken& cancel) {
    SetLevelParams params;
    params.level = level;
    call("logging/setLevel", RawJson::from(nlohmann::json(params)), cancel);
}

nlohmann::json Client::complete(const nlohmann::json& ref, const CompletionArgument& argument,
                                const CancellationToken& cancel) {
    CompleteParams params;
    params.ref = ref;
    params.argument = argument;
    return call("completion/complete", RawJson::from(nlohmann::json(params)), cancel).parse();
}

nlohmann::json Client::list_resources(std::optional<std::string> cursor,
                                      const CancellationToken& cancel) {
    PaginatedParams params{std::move(cursor)};
    return call("resources/list", RawJson::from(nlohmann::json(params)), cancel).parse();
}

nlohmann::json Client::read_resource(const std::string& uri, const CancellationToken& cancel) {
    ResourceUriParams params{uri};
    return call("resources/read", RawJson::from(nlohmann::json(params)), cancel).parse();
}

void Client::subscribe_resource(const std::string& uri, const CancellationToken& cancel) {
    ResourceUriParams params{uri};
    call("resources/subscribe", RawJson::from(nlohmann::json(params)), cancel);
}

void Client::unsubscribe_resource(const std::string& uri, const CancellationToken& cancel) {
    ResourceUriParams params{uri};
    call("resources/unsubscribe", RawJson::from(nlohmann::json(params)), cancel);
}

nlohmann::json Client::list_prompts(std::optional<std::string> cursor,
                                    const CancellationToken& cancel) {
    PaginatedParams params{std::move(cursor)};
    return call("prompts/list", RawJson::from(nlohmann::json(params)), cancel).parse();
}

nlohmann::json Client::get_prompt(const std::string& name,
                                  const std::map<std::string, std::string>& arguments,
                                  const CancellationToken& cancel) {
    GetPromptParams params{name, arguments};
    return call("prompts/get", RawJson::from(nlohmann::json(params)), cancel).parse();
}

nlohmann::json Client::list_tools(std::optional<std::string> cursor,
                                  const CancellationToken& cancel) {
    PaginatedParams params{std::move(cursor)};
    return call("tools/list", RawJson::from(nlohmann::json(params)), cancel).parse();
}

nlohmann::json Client::call_tool(const std::string& name, const nlohmann::json& arguments,
                                 const CancellationToken& cancel) {
    CallToolParams params{name, arguments};
    return call("tools/call", RawJson::from(nlohmann::json(params)), cancel).parse();
}

} // namespace mcplink
