#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <nlohmann/json.hpp>

namespace mcplink {

/// Correlation id: integer, string, or null (null only appears on error
/// responses to messages whose id could not be read).
using RequestId = std::variant<std::nullptr_t, int64_t, std::string>;

inline bool is_null(const RequestId& id) noexcept {
    return std::holds_alternative<std::nullptr_t>(id);
}

/// Human-readable form for logs and error messages.
std::string to_string(const RequestId& id);

void to_json(nlohmann::json& j, const RequestId& id);
void from_json(const nlohmann::json& j, RequestId& id);

/// A JSON value kept in serialized form. Envelope bodies (`params`, `result`,
/// `error.data`) travel as RawJson so the codec never needs their concrete
/// type; whoever knows the method decodes them with get<T>().
class RawJson {
public:
    RawJson() : text_("null") {}
    explicit RawJson(std::string text) : text_(std::move(text)) {}

    static RawJson from(const nlohmann::json& j) { return RawJson(j.dump()); }

    [[nodiscard]] const std::string& text() const noexcept { return text_; }

    /// Throws nlohmann::json::parse_error when the text is not valid JSON.
    [[nodiscard]] nlohmann::json parse() const { return nlohmann::json::parse(text_); }

    template <typename T>
    [[nodiscard]] T get() const { return parse().template get<T>(); }

    // Textual comparison; two RawJson holding equivalent values with
    // different whitespace compare unequal.
    bool operator==(const RawJson& o) const { return text_ == o.text_; }
    bool operator!=(const RawJson& o) const { return text_ != o.text_; }

private:
    std::string text_;
};

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

void to_json(nlohmann::json& j, const JsonRpcError& e);
void from_json(const nlohmann::json& j, JsonRpcError& e);

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    std::optional<RawJson> params;

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

/// Exactly one of `result` / `error` is set on a well-formed response.
struct JsonRpcResponse {
    RequestId id;
    std::optional<RawJson> result;
    std::optional<JsonRpcError> error;

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

struct JsonRpcNotification {
    std::string method;
    std::optional<RawJson> params;

    bool operator==(const JsonRpcNotification& o) const {
        return method == o.method && params == o.params;
    }
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcResponse, JsonRpcNotification>;

/// Build a success response around an already-built result value.
JsonRpcResponse make_result(RequestId id, const nlohmann::json& result);

/// Build an error response.
JsonRpcResponse make_error(RequestId id, int code, std::string message,
                           std::optional<nlohmann::json> data = std::nullopt);

} // namespace mcplink
