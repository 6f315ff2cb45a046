#include "mcplink/types.hpp"
#include <stdexcept>

namespace mcplink {

namespace {

// Absent or null params decode like an empty object.
const nlohmann::json& object_or_empty(const nlohmann::json& j) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (j.is_null()) return empty;
    if (!j.is_object()) {
        throw std::invalid_argument("params must be an object");
    }
    return j;
}

} // anonymous namespace

// ---------- Implementation ----------

void to_json(nlohmann::json& j, const Implementation& t) {
    j = nlohmann::json{{"name", t.name}, {"version", t.version}};
    if (t.title) j["title"] = *t.title;
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.at("version").get<std::string>();
    if (j.contains("title")) t.title = j.at("title").get<std::string>();
}

// ---------- LogLevel ----------

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:     return "debug";
        case LogLevel::Info:      return "info";
        case LogLevel::Notice:    return "notice";
        case LogLevel::Warning:   return "warning";
        case LogLevel::Error:     return "error";
        case LogLevel::Critical:  return "critical";
        case LogLevel::Alert:     return "alert";
        case LogLevel::Emergency: return "emergency";
        default:                  return "info";
    }
}

LogLevel log_level_from_string(const std::string& s) {
    if (s == "debug")     return LogLevel::Debug;
    if (s == "info")      return LogLevel::Info;
    if (s == "notice")    return LogLevel::Notice;
    if (s == "warning")   return LogLevel::Warning;
    if (s == "error")     return LogLevel::Error;
    if (s == "critical")  return LogLevel::Critical;
    if (s == "alert")     return LogLevel::Alert;
    if (s == "emergency") return LogLevel::Emergency;
    throw std::invalid_argument("Unknown logging level: " + s);
}

void to_json(nlohmann::json& j, LogLevel level) {
    j = log_level_to_string(level);
}

void from_json(const nlohmann::json& j, LogLevel& level) {
    level = log_level_from_string(j.get<std::string>());
}

// ---------- Method parameters ----------

void to_json(nlohmann::json& j, const InitializeParams& t) {
    j = nlohmann::json{
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"clientInfo", t.client_info}
    };
}

void from_json(const nlohmann::json& j, InitializeParams& t) {
    const auto& o = object_or_empty(j);
    t.protocol_version = o.at("protocolVersion").get<std::string>();
    t.client_info = o.at("clientInfo").get<Implementation>();
    t.capabilities = o.at("capabilities");
    if (!t.capabilities.is_object()) {
        throw std::invalid_argument("capabilities must be an object");
    }
}

void to_json(nlohmann::json& j, const PaginatedParams& t) {
    j = nlohmann::json::object();
    if (t.cursor) j["cursor"] = *t.cursor;
}

void from_json(const nlohmann::json& j, PaginatedParams& t) {
    const auto& o = object_or_empty(j);
    if (o.contains("cursor") && !o.at("cursor").is_null()) {
        t.cursor = o.at("cursor").get<std::string>();
    }
}

void to_json(nlohmann::json& j, const ResourceUriParams& t) {
    j = nlohmann::json{{"uri", t.uri}};
}

void from_json(const nlohmann::json& j, ResourceUriParams& t) {
    t.uri = object_or_empty(j).at("uri").get<std::string>();
}

void to_json(nlohmann::json& j, const GetPromptParams& t) {
    j = nlohmann::json{{"name", t.name}};
    if (!t.arguments.empty()) j["arguments"] = t.arguments;
}

void from_json(const nlohmann::json& j, GetPromptParams& t) {
    const auto& o = object_or_empty(j);
    t.name = o.at("name").get<std::string>();
    if (o.contains("arguments") && !o.at("arguments").is_null()) {
        t.arguments = o.at("arguments").get<std::map<std::string, std::string>>();
    }
}

void to_json(nlohmann::json& j, const CallToolParams& t) {
    j = nlohmann::json{{"name", t.name}, {"arguments", t.arguments}};
}

void from_json(const nlohmann::json& j, CallToolParams& t) {
    const auto& o = object_or_empty(j);
    t.name = o.at("name").get<std::string>();
    t.arguments = o.value("arguments", nlohmann::json::object());
    if (t.arguments.is_null()) t.arguments = nlohmann::json::object();
    if (!t.arguments.is_object()) {
        throw std::invalid_argument("arguments must be an object");
    }
}

void to_json(nlohmann::json& j, const SetLevelParams& t) {
    j = nlohmann::json{{"level", t.level}};
}

void from_json(const nlohmann::json& j, SetLevelParams& t) {
    from_json(object_or_empty(j).at("level"), t.level);
}

void to_json(nlohmann::json& j, const CompletionArgument& t) {
    j = nlohmann::json{{"name", t.name}, {"value", t.value}};
}

void from_json(const nlohmann::json& j, CompletionArgument& t) {
    t.name = j.at("name").get<std::string>();
    t.value = j.at("value").get<std::string>();
}

void to_json(nlohmann::json& j, const CompleteParams& t) {
    j = nlohmann::json{{"ref", t.ref}, {"argument", t.argument}};
}

void from_json(const nlohmann::json& j, CompleteParams& t) {
    const auto& o = object_or_empty(j);
    t.ref = o.at("ref");
    if (!t.ref.is_object() || !t.ref.contains("type")) {
        throw std::invalid_argument("ref must be an object with a type");
    }
    t.argument = o.at("argument").get<CompletionArgument>();
}

} // namespace mcplink
