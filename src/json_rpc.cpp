#include "mcplink/json_rpc.hpp"
#include <stdexcept>

namespace mcplink {

std::string to_string(const RequestId& id) {
    if (auto* i = std::get_if<int64_t>(&id)) return std::to_string(*i);
    if (auto* s = std::get_if<std::string>(&id)) return "\"" + *s + "\"";
    return "null";
}

void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else if (j.is_null()) {
        id = nullptr;
    } else {
        throw std::invalid_argument("RequestId must be integer, string or null");
    }
}

void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    if (j.contains("data")) e.data = j.at("data");
}

JsonRpcResponse make_result(RequestId id, const nlohmann::json& result) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.result = RawJson::from(result);
    return resp;
}

JsonRpcResponse make_error(RequestId id, int code, std::string message,
                           std::optional<nlohmann::json> data) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.error = JsonRpcError{code, std::move(message), std::move(data)};
    return resp;
}

} // namespace mcplink
