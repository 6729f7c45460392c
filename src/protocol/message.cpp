#include "ragmcp/protocol/message.hpp"

#include <array>

namespace ragmcp {
namespace {

constexpr std::array<std::string_view, 8> kLoggingLevels{
    "debug", "info", "notice", "warning", "error", "critical", "alert", "emergency"
};

std::string json_type_name(const Json& node) {
    return std::string(node.type_name());
}

bool is_valid_params_type(const Json& node) {
    const bool is_object = node.is_object();
    const bool is_array = node.is_array();
    return (is_object == true) || (is_array == true);
}

std::optional<RequestId> parse_id(const Json& id_node) {
    if (id_node.is_number_integer() == true) {
        return RequestId{id_node.get<std::int64_t>()};
    }
    if (id_node.is_string() == true) {
        return RequestId{id_node.get<std::string>()};
    }
    return std::nullopt;
}

tl::unexpected<DecodeError> invalid(
    std::string detail,
    std::optional<RequestId> id = std::nullopt
) {
    return tl::unexpected(DecodeError{
        McpError::invalid_request("Invalid message: " + detail),
        std::move(id),
        true});
}

McpResult<void> require_string(const Json& params, const char* field) {
    const bool present = params.contains(field);
    if (present == false) {
        return tl::unexpected(McpError::validation(field, "string", "undefined"));
    }
    const Json& node = params.at(field);
    if (node.is_string() == false) {
        return tl::unexpected(McpError::validation(field, "string", json_type_name(node)));
    }
    return {};
}

McpResult<void> optional_object(const Json& params, const char* field) {
    const bool present = params.contains(field);
    if (present == false) {
        return {};
    }
    const Json& node = params.at(field);
    if (node.is_object() == false) {
        return tl::unexpected(McpError::validation(field, "object", json_type_name(node)));
    }
    return {};
}

McpResult<void> require_object_params(const Json& params) {
    if (params.is_object() == false) {
        return tl::unexpected(McpError::validation("params", "object", json_type_name(params)));
    }
    return {};
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Message Types
// ═══════════════════════════════════════════════════════════════════════════

Json id_to_json(const RequestId& id) {
    Json out;
    std::visit([&out](const auto& value) { out = value; }, id);
    return out;
}

std::string id_to_string(const RequestId& id) {
    if (std::holds_alternative<std::int64_t>(id)) {
        return std::to_string(std::get<std::int64_t>(id));
    }
    return std::get<std::string>(id);
}

Response Response::success(RequestId id, Json result) {
    return Response{std::move(id), std::move(result)};
}

Response Response::failure(std::optional<RequestId> id, McpError error) {
    return Response{std::move(id), tl::unexpected(std::move(error))};
}

MessageKind kind_of(const Message& message) noexcept {
    switch (message.index()) {
        case 0:  return MessageKind::Request;
        case 1:  return MessageKind::Response;
        default: return MessageKind::Notification;
    }
}

std::string_view to_string(MessageKind kind) noexcept {
    switch (kind) {
        case MessageKind::Request:      return "request";
        case MessageKind::Response:     return "response";
        case MessageKind::Notification: return "notification";
    }
    return "unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// MessageCodec
// ═══════════════════════════════════════════════════════════════════════════

MessageCodec::MessageCodec(std::size_t max_message_size)
    : max_message_size_(max_message_size) {}

tl::expected<Message, DecodeError> MessageCodec::decode(std::string_view bytes) const {
    if (bytes.size() > max_message_size_) {
        return tl::unexpected(DecodeError{
            McpError::invalid_request(
                "Message too large: " + std::to_string(bytes.size()) +
                " bytes exceeds limit of " + std::to_string(max_message_size_)),
            std::nullopt,
            false});
    }

    Json payload = Json::parse(bytes, nullptr, false);
    if (payload.is_discarded() == true) {
        return tl::unexpected(DecodeError{
            McpError::parse_error("Invalid JSON: unable to parse message"),
            std::nullopt,
            false});
    }

    return from_json(payload);
}

tl::expected<Message, DecodeError> MessageCodec::from_json(const Json& payload) {
    auto classified = classify(payload);
    if ((classified.has_value() == false) && payload.is_object() && (payload.contains("method") == false)) {
        classified.error().is_response = true;
    }
    return classified;
}

tl::expected<Message, DecodeError> MessageCodec::classify(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(DecodeError{
            McpError::invalid_request("Invalid message: payload must be a JSON object"),
            std::nullopt,
            false});
    }

    // Salvage the id first so every later failure can still be answered.
    std::optional<RequestId> id;
    const bool has_id_field = payload.contains("id");
    bool id_is_null = true;
    if (has_id_field == true) {
        const Json& id_node = payload.at("id");
        id_is_null = id_node.is_null();
        if (id_is_null == false) {
            id = parse_id(id_node);
            if (id.has_value() == false) {
                return invalid("id must be a string, number or null");
            }
        }
    }

    const bool has_version_field = payload.contains("jsonrpc");
    if (has_version_field == false) {
        return invalid("missing jsonrpc version field", id);
    }
    const Json& version_node = payload.at("jsonrpc");
    if ((version_node.is_string() == false) || (version_node != kJsonRpcVersion)) {
        return invalid("jsonrpc must equal \"2.0\"", id);
    }

    std::optional<Json> params;
    const bool has_params_field = payload.contains("params");
    if (has_params_field == true) {
        const Json& params_node = payload.at("params");
        if (is_valid_params_type(params_node) == false) {
            return invalid("params must be an object or array", id);
        }
        params = params_node;
    }

    const bool has_method_field = payload.contains("method");
    if (has_method_field == true) {
        const Json& method_node = payload.at("method");
        if (method_node.is_string() == false) {
            return invalid("method must be a string", id);
        }
        std::string method = method_node.get<std::string>();
        if (id.has_value()) {
            return Request{std::move(*id), std::move(method), std::move(params)};
        }
        if (has_id_field == true) {
            // {"id": null, "method": ...} is neither a request nor a notification
            return invalid("request id must not be null");
        }
        return Notification{std::move(method), std::move(params)};
    }

    const bool has_result = payload.contains("result");
    const bool has_error = payload.contains("error");
    if (has_result && has_error) {
        return invalid("response cannot have both result and error", id);
    }
    if ((has_result == false) && (has_error == false)) {
        return invalid("message is neither request, response nor notification", id);
    }
    if (has_id_field == false) {
        return invalid("response must have an id");
    }

    if (has_result) {
        if (id_is_null) {
            return invalid("successful response must have a non-null id");
        }
        return Response::success(std::move(*id), payload.at("result"));
    }

    const Json& error_node = payload.at("error");
    if (error_node.is_object() == false) {
        return invalid("error must be an object", id);
    }
    const bool code_ok = error_node.contains("code") && error_node.at("code").is_number_integer();
    if (code_ok == false) {
        return invalid("error code must be a number", id);
    }
    const bool message_ok = error_node.contains("message") && error_node.at("message").is_string();
    if (message_ok == false) {
        return invalid("error message must be a string", id);
    }
    return Response::failure(std::move(id), McpError::from_json(error_node));
}

Json MessageCodec::to_json(const Message& message) {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;

    if (const auto* request = std::get_if<Request>(&message)) {
        payload["id"] = id_to_json(request->id);
        payload["method"] = request->method;
        if (request->params.has_value()) {
            payload["params"] = *request->params;
        }
    } else if (const auto* response = std::get_if<Response>(&message)) {
        payload["id"] = response->id.has_value() ? id_to_json(*response->id) : Json(nullptr);
        if (response->outcome.has_value()) {
            payload["result"] = *response->outcome;
        } else {
            payload["error"] = response->outcome.error().to_json();
        }
    } else {
        const auto& notification = std::get<Notification>(message);
        payload["method"] = notification.method;
        if (notification.params.has_value()) {
            payload["params"] = *notification.params;
        }
    }
    return payload;
}

std::string MessageCodec::encode(const Message& message) {
    return to_json(message).dump();
}

// ═══════════════════════════════════════════════════════════════════════════
// Parameter Validation
// ═══════════════════════════════════════════════════════════════════════════

McpResult<void> validate_params(std::string_view method, const Json& params) {
    if (method == methods::Initialize)      return validate_initialize_params(params);
    if (method == methods::ToolsCall)       return validate_tool_call_params(params);
    if (method == methods::ResourcesRead)   return validate_resource_read_params(params);
    if (method == methods::PromptsGet)      return validate_prompt_get_params(params);
    if (method == methods::LoggingSetLevel) return validate_set_level_params(params);
    return {};
}

McpResult<void> validate_initialize_params(const Json& params) {
    if (auto ok = require_object_params(params); !ok) return ok;
    if (auto ok = require_string(params, "protocolVersion"); !ok) return ok;

    if (params.contains("capabilities") == false || params.at("capabilities").is_object() == false) {
        const std::string got = params.contains("capabilities")
            ? json_type_name(params.at("capabilities"))
            : "undefined";
        return tl::unexpected(McpError::validation("capabilities", "object", got));
    }

    if (params.contains("clientInfo") == false || params.at("clientInfo").is_object() == false) {
        const std::string got = params.contains("clientInfo")
            ? json_type_name(params.at("clientInfo"))
            : "undefined";
        return tl::unexpected(McpError::validation("clientInfo", "object", got));
    }
    const Json& info = params.at("clientInfo");
    if (info.contains("name") == false || info.at("name").is_string() == false) {
        return tl::unexpected(McpError::validation("clientInfo.name", "string",
            info.contains("name") ? json_type_name(info.at("name")) : "undefined"));
    }
    if (info.contains("version") == false || info.at("version").is_string() == false) {
        return tl::unexpected(McpError::validation("clientInfo.version", "string",
            info.contains("version") ? json_type_name(info.at("version")) : "undefined"));
    }
    return {};
}

McpResult<void> validate_tool_call_params(const Json& params) {
    if (auto ok = require_object_params(params); !ok) return ok;
    if (auto ok = require_string(params, "name"); !ok) return ok;
    return optional_object(params, "arguments");
}

McpResult<void> validate_resource_read_params(const Json& params) {
    if (auto ok = require_object_params(params); !ok) return ok;
    return require_string(params, "uri");
}

McpResult<void> validate_prompt_get_params(const Json& params) {
    if (auto ok = require_object_params(params); !ok) return ok;
    if (auto ok = require_string(params, "name"); !ok) return ok;
    return optional_object(params, "arguments");
}

McpResult<void> validate_set_level_params(const Json& params) {
    if (auto ok = require_object_params(params); !ok) return ok;
    if (auto ok = require_string(params, "level"); !ok) return ok;

    const std::string level = params.at("level").get<std::string>();
    for (const auto candidate : kLoggingLevels) {
        if (level == candidate) {
            return {};
        }
    }

    std::string valid;
    for (const auto candidate : kLoggingLevels) {
        if (valid.empty() == false) {
            valid += ", ";
        }
        valid += candidate;
    }
    return tl::unexpected(McpError::validation("level", "one of " + valid, level));
}

// ═══════════════════════════════════════════════════════════════════════════
// Logging Helpers
// ═══════════════════════════════════════════════════════════════════════════

std::string summarize(const Message& message) {
    if (const auto* request = std::get_if<Request>(&message)) {
        return "request " + request->method + " id=" + id_to_string(request->id);
    }
    if (const auto* response = std::get_if<Response>(&message)) {
        std::string out = "response id=";
        out += response->id.has_value() ? id_to_string(*response->id) : "null";
        if (response->is_error()) {
            out += " error=" + std::to_string(response->outcome.error().code);
        }
        return out;
    }
    return "notification " + std::get<Notification>(message).method;
}

std::string redact_for_logging(const Message& message) {
    return redact_sensitive(MessageCodec::to_json(message)).dump();
}

}  // namespace ragmcp
