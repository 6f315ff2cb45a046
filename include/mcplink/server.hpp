#pragma once
#include "handlers.hpp"
#include "router.hpp"
#include "types.hpp"
#include "cancellation.hpp"
#include "transport/transport.hpp"
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace mcplink {

/// MCP server: a route table built once from the composed handlers, plus a
/// sequential serve loop. Construct through Server::Builder.
class Server {
public:
    struct Options {
        Implementation server_info{"default", std::nullopt, "1.0.0"};
    };

    class Builder {
    public:
        Builder();

        /// Reported by the default system handler; ignored when a custom
        /// system handler is installed.
        Builder& with_server_info(Implementation info);
        Builder& with_resource_handler(std::shared_ptr<ResourceHandler> handler);
        Builder& with_prompt_handler(std::shared_ptr<PromptHandler> handler);
        Builder& with_tool_handler(std::shared_ptr<ToolHandler> handler);
        Builder& with_system_handler(std::shared_ptr<SystemHandler> handler);
        Builder& with_notification_handler(std::string method,
                                           std::shared_ptr<NotificationHandler> handler);
        /// Receives notifications with no handler of their own.
        /// Defaults to DefaultNotificationHandler.
        Builder& with_fallback_notification_handler(std::shared_ptr<NotificationHandler> handler);

        [[nodiscard]] Server build();

    private:
        Options opts_;
        std::shared_ptr<ResourceHandler> resources_;
        std::shared_ptr<PromptHandler> prompts_;
        std::shared_ptr<ToolHandler> tools_;
        std::shared_ptr<SystemHandler> system_;
        std::map<std::string, std::shared_ptr<NotificationHandler>> notifications_;
        std::shared_ptr<NotificationHandler> fallback_notifications_;
    };

    ~Server();
    Server(Server&&) noexcept;
    Server& operator=(Server&&) noexcept;

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Process one inbound line and return what, if anything, to write back.
    [[nodiscard]] DispatchResult dispatch_line(std::string_view line,
                                               const CancellationToken& cancel = {}) const;
    [[nodiscard]] DispatchResult dispatch(const JsonRpcMessage& msg,
                                          const CancellationToken& cancel = {}) const;

    /// Read, dispatch and answer lines one at a time until the peer closes
    /// the stream or `shutdown` fires. Malformed input never stops the loop;
    /// transport failures are thrown to the caller.
    void serve(LineTransport& transport, const CancellationToken& shutdown = {}) const;

    /// serve() over the process's stdin/stdout.
    void serve_stdio(const CancellationToken& shutdown = {}) const;

    [[nodiscard]] const Options& options() const;

private:
    struct Impl;
    explicit Server(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

} // namespace mcplink
