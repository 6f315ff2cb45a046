#include "mcplink/server.hpp"
#include "mcplink/codec.hpp"
#include "mcplink/error.hpp"
#include "mcplink/log.hpp"
#include "mcplink/transport/stdio_transport.hpp"
#include <stdexcept>

namespace mcplink {

namespace {

const nlohmann::json& empty_result() {
    static const nlohmann::json empty = nlohmann::json::object();
    return empty;
}

Router build_routes(const std::shared_ptr<ResourceHandler>& resources,
                    const std::shared_ptr<PromptHandler>& prompts,
                    const std::shared_ptr<ToolHandler>& tools,
                    const std::shared_ptr<SystemHandler>& system,
                    const std::map<std::string, std::shared_ptr<NotificationHandler>>& notifications,
                    const std::shared_ptr<NotificationHandler>& fallback) {
    Router::Builder routes;

    // ---- System ----
    routes.on_request("initialize", typed_route<InitializeParams>(
        [system](const InitializeParams& p, const CancellationToken& cancel) {
            return system->initialize(p.capabilities, p.client_info, p.protocol_version, cancel);
        }));
    routes.on_request("ping", [system](const RawJson&, const CancellationToken& cancel) {
        system->ping(cancel);
        return empty_result();
    });
    routes.on_request("logging/setLevel", typed_route<SetLevelParams>(
        [system](const SetLevelParams& p, const CancellationToken& cancel) {
            system->set_level(p.level, cancel);
            return empty_result();
        }));
    routes.on_request("completion/complete", typed_route<CompleteParams>(
        [system](const CompleteParams& p, const CancellationToken& cancel) {
            return system->complete(p.ref, p.argument, cancel);
        }));

    // ---- Resources ----
    routes.on_request("resources/list", typed_route<PaginatedParams>(
        [resources](const PaginatedParams& p, const CancellationToken& cancel) {
            return resources->list(p.cursor, cancel);
        }));
    routes.on_request("resources/read", typed_route<ResourceUriParams>(
        [resources](const ResourceUriParams& p, const CancellationToken& cancel) {
            return resources->read(p.uri, cancel);
        }));
    routes.on_request("resources/subscribe", typed_route<ResourceUriParams>(
        [resources](const ResourceUriParams& p, const CancellationToken& cancel) {
            resources->subscribe(p.uri, cancel);
            return empty_result();
        }));
    routes.on_request("resources/unsubscribe", typed_route<ResourceUriParams>(
        [resources](const ResourceUriParams& p, const CancellationToken& cancel) {
            resources->unsubscribe(p.uri, cancel);
            return empty_result();
        }));

    // ---- Prompts ----
    routes.on_request("prompts/list", typed_route<PaginatedParams>(
        [prompts](const PaginatedParams& p, const CancellationToken& cancel) {
            return prompts->list(p.cursor, cancel);
        }));
    routes.on_request("prompts/get", typed_route<GetPromptParams>(
        [prompts](const GetPromptParams& p, const CancellationToken& cancel) {
            return prompts->get(p.name, p.arguments, cancel);
        }));

    // ---- Tools ----
    routes.on_request("tools/list", typed_route<PaginatedParams>(
        [tools](const PaginatedParams& p, const CancellationToken& cancel) {
            return tools->list(p.cursor, cancel);
        }));
    routes.on_request("tools/call", typed_route<CallToolParams>(
        [tools](const CallToolParams& p, const CancellationToken& cancel) {
            return tools->call(p.name, p.arguments, cancel);
        }));

    // ---- Notifications ----
    for (const auto& [method, handler] : notifications) {
        routes.on_notification(method,
            [handler = handler](const Notification& n, const CancellationToken& cancel) {
                handler->handle(n, cancel);
            });
    }
    routes.on_unhandled_notification(
        [fallback](const Notification& n, const CancellationToken& cancel) {
            fallback->handle(n, cancel);
        });

    return routes.build();
}

} // anonymous namespace

// ----------- Server::Impl -----------

struct Server::Impl {
    Options opts;
    Router router;

    Impl(Options o, Router r) : opts(std::move(o)), router(std::move(r)) {}
};

// ----------- Server::Builder -----------

Server::Builder::Builder() = default;

Server::Builder& Server::Builder::with_server_info(Implementation info) {
    opts_.server_info = std::move(info);
    return *this;
}

Server::Builder& Server::Builder::with_resource_handler(std::shared_ptr<ResourceHandler> handler) {
    resources_ = std::move(handler);
    return *this;
}

Server::Builder& Server::Builder::with_prompt_handler(std::shared_ptr<PromptHandler> handler) {
    prompts_ = std::move(handler);
    return *this;
}

Server::Builder& Server::Builder::with_tool_handler(std::shared_ptr<ToolHandler> handler) {
    tools_ = std::move(handler);
    return *this;
}

Server::Builder& Server::Builder::with_system_handler(std::shared_ptr<SystemHandler> handler) {
    system_ = std::move(handler);
    return *this;
}

Server::Builder& Server::Builder::with_notification_handler(
        std::string method, std::shared_ptr<NotificationHandler> handler) {
    if (!handler) {
        throw std::invalid_argument("Notification handler for " + method + " is null");
    }
    notifications_[std::move(method)] = std::move(handler);
    return *this;
}

Server::Builder& Server::Builder::with_fallback_notification_handler(
        std::shared_ptr<NotificationHandler> handler) {
    if (!handler) {
        throw std::invalid_argument("Fallback notification handler is null");
    }
    fallback_notifications_ = std::move(handler);
    return *this;
}

Server Server::Builder::build() {
    auto resources = resources_ ? resources_ : std::make_shared<DefaultResourceHandler>();
    auto prompts = prompts_ ? prompts_ : std::make_shared<DefaultPromptHandler>();
    auto tools = tools_ ? tools_ : std::make_shared<DefaultToolHandler>();
    auto system = system_ ? system_
                          : std::make_shared<DefaultSystemHandler>(opts_.server_info);

    auto fallback = fallback_notifications_ ? fallback_notifications_
                                            : std::make_shared<DefaultNotificationHandler>();

    auto router = build_routes(resources, prompts, tools, system, notifications_, fallback);
    return Server(std::make_unique<Impl>(opts_, std::move(router)));
}

// ----------- Server -----------

Server::Server(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}
Server::~Server() = default;
Server::Server(Server&&) noexcept = default;
Server& Server::operator=(Server&&) noexcept = default;

const Server::Options& Server::options() const {
    return impl_->opts;
}

DispatchResult Server::dispatch_line(std::string_view line, const CancellationToken& cancel) const {
    return impl_->router.dispatch_line(line, cancel);
}

DispatchResult Server::dispatch(const JsonRpcMessage& msg, const CancellationToken& cancel) const {
    return impl_->router.dispatch(msg, cancel);
}

void Server::serve(LineTransport& transport, const CancellationToken& shutdown) const {
    auto lg = log::logger();
    lg->info("{} {} serving", impl_->opts.server_info.name, impl_->opts.server_info.version);

    // Wake the blocked read when shutdown fires; unread input stays buffered.
    auto wakeup = shutdown.on_cancel([&transport, lg] {
        try {
            transport.interrupt();
        } catch (const TransportError& e) {
            lg->error("failed to interrupt transport: {}", e.what());
        }
    });

    std::string line;
    while (!shutdown.is_cancelled()) {
        ReadStatus status = transport.read_line(line);
        if (status == ReadStatus::Eof) {
            lg->info("peer closed the stream");
            break;
        }
        if (status == ReadStatus::Interrupted) continue;

        auto result = impl_->router.dispatch_line(line, shutdown);
        if (result.response) {
            transport.write_line(Codec::encode(*result.response));
        }
    }

    if (shutdown.is_cancelled()) {
        lg->info("shutdown requested, serve loop stopped");
    }
}

void Server::serve_stdio(const CancellationToken& shutdown) const {
    StdioTransport transport;
    serve(transport, shutdown);
}

} // namespace mcplink
