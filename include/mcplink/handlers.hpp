#pragma once
#include "types.hpp"
#include "cancellation.hpp"
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mcplink {

// Capability interfaces the server routes requests to. Results are the MCP
// result objects as JSON (e.g. {"resources":[...],"nextCursor":"..."}).
// Implementations report failure by throwing: RpcProtocolError selects the
// error code sent back, any other exception becomes InternalError with the
// exception's message. The token fires when the server shuts down.

class ResourceHandler {
public:
    virtual ~ResourceHandler() = default;

    virtual nlohmann::json list(const std::optional<std::string>& cursor,
                                const CancellationToken& cancel) = 0;
    virtual nlohmann::json read(const std::string& uri, const CancellationToken& cancel) = 0;
    virtual void subscribe(const std::string& uri, const CancellationToken& cancel) = 0;
    virtual void unsubscribe(const std::string& uri, const CancellationToken& cancel) = 0;
};

class PromptHandler {
public:
    virtual ~PromptHandler() = default;

    virtual nlohmann::json list(const std::optional<std::string>& cursor,
                                const CancellationToken& cancel) = 0;
    virtual nlohmann::json get(const std::string& name,
                               const std::map<std::string, std::string>& arguments,
                               const CancellationToken& cancel) = 0;
};

class ToolHandler {
public:
    virtual ~ToolHandler() = default;

    virtual nlohmann::json list(const std::optional<std::string>& cursor,
                                const CancellationToken& cancel) = 0;
    virtual nlohmann::json call(const std::string& name, const nlohmann::json& arguments,
                                const CancellationToken& cancel) = 0;
};

class SystemHandler {
public:
    virtual ~SystemHandler() = default;

    virtual nlohmann::json initialize(const nlohmann::json& capabilities,
                                      const Implementation& client_info,
                                      const std::string& protocol_version,
                                      const CancellationToken& cancel) = 0;
    virtual void ping(const CancellationToken& cancel) = 0;
    virtual void set_level(LogLevel level, const CancellationToken& cancel) = 0;
    virtual nlohmann::json complete(const nlohmann::json& ref,
                                    const CompletionArgument& argument,
                                    const CancellationToken& cancel) = 0;
};

class NotificationHandler {
public:
    virtual ~NotificationHandler() = default;

    virtual void handle(const Notification& notification, const CancellationToken& cancel) = 0;
};

// ---------- Defaults ----------
// Used for any capability the server is built without.

class DefaultResourceHandler : public ResourceHandler {
public:
    nlohmann::json list(const std::optional<std::string>& cursor,
                        const CancellationToken& cancel) override;
    nlohmann::json read(const std::string& uri, const CancellationToken& cancel) override;
    void subscribe(const std::string& uri, const CancellationToken& cancel) override;
    void unsubscribe(const std::string& uri, const CancellationToken& cancel) override;
};

class DefaultPromptHandler : public PromptHandler {
public:
    nlohmann::json list(const std::optional<std::string>& cursor,
                        const CancellationToken& cancel) override;
    nlohmann::json get(const std::string& name,
                       const std::map<std::string, std::string>& arguments,
                       const CancellationToken& cancel) override;
};

class DefaultToolHandler : public ToolHandler {
public:
    nlohmann::json list(const std::optional<std::string>& cursor,
                        const CancellationToken& cancel) override;
    nlohmann::json call(const std::string& name, const nlohmann::json& arguments,
                        const CancellationToken& cancel) override;
};

/// Answers initialize with the configured server info, echoes the client's
/// protocol version and advertises resource subscriptions. set_level adjusts
/// the library logger.
class DefaultSystemHandler : public SystemHandler {
public:
    explicit DefaultSystemHandler(Implementation server_info = {"default", std::nullopt, "1.0.0"});

    nlohmann::json initialize(const nlohmann::json& capabilities,
                              const Implementation& client_info,
                              const std::string& protocol_version,
                              const CancellationToken& cancel) override;
    void ping(const CancellationToken& cancel) override;
    void set_level(LogLevel level, const CancellationToken& cancel) override;
    nlohmann::json complete(const nlohmann::json& ref,
                            const CompletionArgument& argument,
                            const CancellationToken& cancel) override;

private:
    Implementation server_info_;
};

class DefaultNotificationHandler : public NotificationHandler {
public:
    void handle(const Notification& notification, const CancellationToken& cancel) override;
};

} // namespace mcplink
