#include "mcplink/codec.hpp"
#include "mcplink/error.hpp"
#include "mcplink/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <optional>
#include <string>

namespace mcplink {

namespace {

// Envelope fields as found on the wire, before any classification.
struct EnvelopeFields {
    bool has_jsonrpc = false;
    std::optional<std::string> jsonrpc;     // nullopt if present but not a string

    bool has_id = false;
    bool id_valid = true;
    RequestId id = nullptr;

    bool has_method = false;
    std::optional<std::string> method;      // nullopt if present but not a string

    std::optional<std::string> params;
    std::optional<std::string> result;
    std::optional<std::string> error;
};

[[noreturn]] void fail_parse(simdjson::error_code ec) {
    throw RpcEnvelopeError(error::ParseError,
                           std::string("Parse error: ") + simdjson::error_message(ec));
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' ||
                          s.back() == '\n' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

std::optional<std::string> read_string(simdjson::ondemand::value& val) {
    std::string_view sv;
    if (val.get_string().get(sv)) return std::nullopt;
    return std::string(sv);
}

std::string read_raw(simdjson::ondemand::value& val) {
    std::string_view sv;
    if (auto ec = val.raw_json().get(sv)) fail_parse(ec);
    return std::string(trim(sv));
}

void read_id(simdjson::ondemand::value& val, EnvelopeFields& f) {
    simdjson::ondemand::json_type type;
    if (auto ec = val.type().get(type)) fail_parse(ec);
    switch (type) {
        case simdjson::ondemand::json_type::number: {
            int64_t i = 0;
            if (val.get_int64().get(i)) {
                f.id_valid = false;     // fractional or out of range
            } else {
                f.id = i;
            }
            break;
        }
        case simdjson::ondemand::json_type::string: {
            auto s = read_string(val);
            if (s) f.id = std::move(*s); else f.id_valid = false;
            break;
        }
        case simdjson::ondemand::json_type::null:
            f.id = nullptr;
            break;
        default:
            f.id_valid = false;
            break;
    }
}

EnvelopeFields scan_envelope(std::string_view raw) {
    simdjson::padded_string padded(raw.data(), raw.size());

    // On-Demand only checks what it visits: skipped members and raw bodies
    // are never validated. Check the whole document up front.
    simdjson::dom::parser validator;
    simdjson::dom::element root;
    if (auto ec = validator.parse(padded).get(root)) fail_parse(ec);
    if (!root.is_object()) {
        // Includes batches.
        throw RpcEnvelopeError(error::InvalidRequest,
                               "Invalid Request: message must be a JSON object");
    }

    simdjson::ondemand::parser parser;
    simdjson::ondemand::document doc;
    if (auto ec = parser.iterate(padded).get(doc)) fail_parse(ec);

    simdjson::ondemand::object obj;
    if (auto ec = doc.get_object().get(obj)) fail_parse(ec);

    EnvelopeFields f;
    for (auto field : obj) {
        std::string_view key;
        if (auto ec = field.unescaped_key().get(key)) fail_parse(ec);
        simdjson::ondemand::value val;
        if (auto ec = field.value().get(val)) fail_parse(ec);

        if (key == "jsonrpc") {
            f.has_jsonrpc = true;
            f.jsonrpc = read_string(val);
        } else if (key == "id") {
            f.has_id = true;
            read_id(val, f);
        } else if (key == "method") {
            f.has_method = true;
            f.method = read_string(val);
        } else if (key == "params") {
            f.params = read_raw(val);
        } else if (key == "result") {
            f.result = read_raw(val);
        } else if (key == "error") {
            f.error = read_raw(val);
        }
        // Unknown members are skipped.
    }

    if (!doc.at_end()) {
        throw RpcEnvelopeError(error::ParseError, "Parse error: trailing content after message");
    }
    return f;
}

JsonRpcError decode_error_object(const std::string& raw, const RequestId& id) {
    try {
        auto j = nlohmann::json::parse(raw);
        if (!j.is_object() || !j.contains("code") || !j.at("code").is_number_integer() ||
            !j.contains("message") || !j.at("message").is_string()) {
            throw RpcEnvelopeError(error::InvalidRequest,
                                   "Invalid Request: malformed error object", id);
        }
        return j.get<JsonRpcError>();
    } catch (const nlohmann::json::exception& e) {
        throw RpcEnvelopeError(error::InvalidRequest,
                               std::string("Invalid Request: malformed error object: ") + e.what(),
                               id);
    }
}

// Raw bodies are spliced verbatim; whitespace newlines are the only ones a
// valid JSON text can contain, so flattening them keeps the framing intact.
void append_raw(std::string& out, const std::string& text) {
    for (char c : text) {
        out.push_back((c == '\n' || c == '\r') ? ' ' : c);
    }
}

std::string dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// RequestId is an alias of a std::variant, so ADL never reaches our to_json.
std::string dump_id(const RequestId& id) {
    nlohmann::json j;
    to_json(j, id);
    return dump(j);
}

} // anonymous namespace

JsonRpcMessage Codec::decode(std::string_view raw) {
    if (raw.empty()) {
        throw RpcEnvelopeError(error::ParseError, "Parse error: empty input");
    }

    EnvelopeFields f = scan_envelope(raw);
    RequestId known_id = f.id_valid ? f.id : RequestId{nullptr};

    if (!f.has_jsonrpc || !f.jsonrpc || *f.jsonrpc != JSONRPC_VERSION) {
        throw RpcEnvelopeError(error::InvalidRequest,
                               "Invalid Request: jsonrpc must be \"2.0\"", known_id);
    }
    if (!f.id_valid) {
        throw RpcEnvelopeError(error::InvalidRequest,
                               "Invalid Request: id must be an integer, string or null");
    }
    if (f.has_method && !f.method) {
        throw RpcEnvelopeError(error::InvalidRequest,
                               "Invalid Request: method must be a string", known_id);
    }

    if (f.has_method) {
        if (f.has_id) {
            if (is_null(f.id)) {
                throw RpcEnvelopeError(error::InvalidRequest,
                                       "Invalid Request: request id must not be null");
            }
            JsonRpcRequest req;
            req.id = std::move(f.id);
            req.method = std::move(*f.method);
            if (f.params) req.params = RawJson(std::move(*f.params));
            return req;
        }
        JsonRpcNotification notif;
        notif.method = std::move(*f.method);
        if (f.params) notif.params = RawJson(std::move(*f.params));
        return notif;
    }

    if (f.has_id) {
        if (f.result.has_value() == f.error.has_value()) {
            throw RpcEnvelopeError(error::InvalidRequest,
                                   "Invalid Request: response needs exactly one of result or error",
                                   known_id);
        }
        JsonRpcResponse resp;
        resp.id = f.id;
        if (f.result) {
            if (is_null(f.id)) {
                throw RpcEnvelopeError(error::InvalidRequest,
                                       "Invalid Request: success response id must not be null");
            }
            resp.result = RawJson(std::move(*f.result));
        } else {
            resp.error = decode_error_object(*f.error, f.id);
        }
        return resp;
    }

    throw RpcEnvelopeError(error::InvalidRequest,
                           "Invalid Request: missing both 'id' and 'method'");
}

std::string Codec::encode(const JsonRpcMessage& msg) {
    std::string out;
    out.reserve(128);
    out += "{\"jsonrpc\":\"";
    out += JSONRPC_VERSION;
    out += '"';

    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        out += ",\"id\":";
        out += dump_id(req->id);
        out += ",\"method\":";
        out += dump(nlohmann::json(req->method));
        if (req->params) {
            out += ",\"params\":";
            append_raw(out, req->params->text());
        }
    } else if (const auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
        out += ",\"id\":";
        out += dump_id(resp->id);
        if (resp->error) {
            out += ",\"error\":";
            out += dump(nlohmann::json(*resp->error));
        } else {
            out += ",\"result\":";
            append_raw(out, resp->result ? resp->result->text() : std::string("null"));
        }
    } else if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        out += ",\"method\":";
        out += dump(nlohmann::json(notif->method));
        if (notif->params) {
            out += ",\"params\":";
            append_raw(out, notif->params->text());
        }
    }

    out += '}';
    return out;
}

} // namespace mcplink
