#include "mcplink/handlers.hpp"
#include "mcplink/log.hpp"

namespace mcplink {

namespace {

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:     return spdlog::level::debug;
        case LogLevel::Info:
        case LogLevel::Notice:    return spdlog::level::info;
        case LogLevel::Warning:   return spdlog::level::warn;
        case LogLevel::Error:     return spdlog::level::err;
        case LogLevel::Critical:
        case LogLevel::Alert:
        case LogLevel::Emergency: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

} // anonymous namespace

// ---------- Resources ----------

nlohmann::json DefaultResourceHandler::list(const std::optional<std::string>&,
                                            const CancellationToken&) {
    return {{"resources", nlohmann::json::array()}};
}

nlohmann::json DefaultResourceHandler::read(const std::string&, const CancellationToken&) {
    return {{"contents", nlohmann::json::array()}};
}

void DefaultResourceHandler::subscribe(const std::string&, const CancellationToken&) {}

void DefaultResourceHandler::unsubscribe(const std::string&, const CancellationToken&) {}

// ---------- Prompts ----------

nlohmann::json DefaultPromptHandler::list(const std::optional<std::string>&,
                                          const CancellationToken&) {
    return {{"prompts", nlohmann::json::array()}};
}

nlohmann::json DefaultPromptHandler::get(const std::string&,
                                         const std::map<std::string, std::string>&,
                                         const CancellationToken&) {
    return {{"messages", nlohmann::json::array()}};
}

// ---------- Tools ----------

nlohmann::json DefaultToolHandler::list(const std::optional<std::string>&,
                                        const CancellationToken&) {
    return {{"tools", nlohmann::json::array()}};
}

nlohmann::json DefaultToolHandler::call(const std::string&, const nlohmann::json&,
                                        const CancellationToken&) {
    return {{"content", nlohmann::json::array()}};
}

// ---------- System ----------

DefaultSystemHandler::DefaultSystemHandler(Implementation server_info)
    : server_info_(std::move(server_info)) {
}

nlohmann::json DefaultSystemHandler::initialize(const nlohmann::json&,
                                                const Implementation& client_info,
                                                const std::string& protocol_version,
                                                const CancellationToken&) {
    log::logger()->info("initialize from {} {} (protocol {})",
                        client_info.name, client_info.version, protocol_version);
    return {
        {"protocolVersion", protocol_version},
        {"serverInfo", server_info_},
        {"capabilities", {
            {"resources", {{"listChanged", true}, {"subscribe", true}}}
        }}
    };
}

void DefaultSystemHandler::ping(const CancellationToken&) {}

void DefaultSystemHandler::set_level(LogLevel level, const CancellationToken&) {
    log::set_level(to_spdlog_level(level));
}

nlohmann::json DefaultSystemHandler::complete(const nlohmann::json&,
                                              const CompletionArgument&,
                                              const CancellationToken&) {
    return {{"completion", {{"values", nlohmann::json::array()}}}};
}

// ---------- Notifications ----------

void DefaultNotificationHandler::handle(const Notification& notification,
                                        const CancellationToken&) {
    log::logger()->debug("notification {} ignored", notification.method);
}

} // namespace mcplink
