#pragma once
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mcplink {

// Payload schemas (tool lists, resource contents, prompt messages, ...) are
// not modelled here: handlers produce and consume them as nlohmann::json.
// This header only holds what the dispatch core itself decodes.

struct Implementation {
    std::string name;
    std::optional<std::string> title;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && title == o.title && version == o.version;
    }
};

// ---------- Logging ----------

enum class LogLevel {
    Debug, Info, Notice, Warning, Error, Critical, Alert, Emergency
};

std::string log_level_to_string(LogLevel level);
/// Throws std::invalid_argument for names outside the MCP level set.
LogLevel log_level_from_string(const std::string& s);

// ---------- Method parameters ----------

struct InitializeParams {
    nlohmann::json capabilities = nlohmann::json::object();
    Implementation client_info;
    std::string protocol_version;
};

struct PaginatedParams {
    std::optional<std::string> cursor;
};

struct ResourceUriParams {
    std::string uri;
};

struct GetPromptParams {
    std::string name;
    std::map<std::string, std::string> arguments;
};

struct CallToolParams {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

struct SetLevelParams {
    LogLevel level = LogLevel::Info;
};

struct CompletionArgument {
    std::string name;
    std::string value;
};

struct CompleteParams {
    nlohmann::json ref;     // {"type":"ref/prompt","name":...} or {"type":"ref/resource","uri":...}
    CompletionArgument argument;
};

/// An inbound notification as seen by a NotificationHandler.
struct Notification {
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

void to_json(nlohmann::json& j, LogLevel level);
void from_json(const nlohmann::json& j, LogLevel& level);

void to_json(nlohmann::json& j, const InitializeParams& t);
void from_json(const nlohmann::json& j, InitializeParams& t);

void to_json(nlohmann::json& j, const PaginatedParams& t);
void from_json(const nlohmann::json& j, PaginatedParams& t);

void to_json(nlohmann::json& j, const ResourceUriParams& t);
void from_json(const nlohmann::json& j, ResourceUriParams& t);

void to_json(nlohmann::json& j, const GetPromptParams& t);
void from_json(const nlohmann::json& j, GetPromptParams& t);

void to_json(nlohmann::json& j, const CallToolParams& t);
void from_json(const nlohmann::json& j, CallToolParams& t);

void to_json(nlohmann::json& j, const SetLevelParams& t);
void from_json(const nlohmann::json& j, SetLevelParams& t);

void to_json(nlohmann::json& j, const CompletionArgument& t);
void from_json(const nlohmann::json& j, CompletionArgument& t);

void to_json(nlohmann::json& j, const CompleteParams& t);
void from_json(const nlohmann::json& j, CompleteParams& t);

} // namespace mcplink
