#include "ragmcp/protocol/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace ragmcp {

namespace {

constexpr std::array<std::string_view, 6> kSensitiveFragments{
    "password", "token", "key", "secret", "auth", "credential"
};

constexpr const char* kRedacted = "[REDACTED]";

bool starts_with(std::string_view text, std::string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

McpError make(ErrorKind kind, int code, std::string message, std::optional<Json> data = std::nullopt) {
    return McpError{kind, code, std::move(message), std::move(data)};
}

}  // namespace

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::ParseError:           return "ParseError";
        case ErrorKind::InvalidRequest:       return "InvalidRequest";
        case ErrorKind::MethodNotFound:       return "MethodNotFound";
        case ErrorKind::InvalidParams:        return "InvalidParams";
        case ErrorKind::InternalError:        return "InternalError";
        case ErrorKind::Timeout:              return "Timeout";
        case ErrorKind::ConnectionError:      return "ConnectionError";
        case ErrorKind::TransportError:       return "TransportError";
        case ErrorKind::ToolNotFound:         return "ToolNotFound";
        case ErrorKind::ResourceNotFound:     return "ResourceNotFound";
        case ErrorKind::PromptNotFound:       return "PromptNotFound";
        case ErrorKind::RequestFailed:        return "RequestFailed";
        case ErrorKind::Cancelled:            return "Cancelled";
        case ErrorKind::VersionCompatibility: return "VersionCompatibility";
    }
    return "Unknown";
}

std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Warning:  return "warning";
        case Severity::Error:    return "error";
        case Severity::Critical: return "critical";
    }
    return "error";
}

// ═══════════════════════════════════════════════════════════════════════════
// Factories
// ═══════════════════════════════════════════════════════════════════════════

McpError McpError::parse_error(std::string detail) {
    return make(ErrorKind::ParseError, ErrorCode::ParseError, std::move(detail));
}

McpError McpError::invalid_request(std::string detail) {
    return make(ErrorKind::InvalidRequest, ErrorCode::InvalidRequest, std::move(detail));
}

McpError McpError::method_not_found(std::string_view method) {
    return make(ErrorKind::MethodNotFound, ErrorCode::MethodNotFound,
                "Method not found: " + std::string(method));
}

McpError McpError::invalid_params(std::string detail) {
    return make(ErrorKind::InvalidParams, ErrorCode::InvalidParams, std::move(detail));
}

McpError McpError::internal_error(std::string detail) {
    return make(ErrorKind::InternalError, ErrorCode::InternalError, std::move(detail));
}

McpError McpError::timeout(std::int64_t timeout_ms) {
    return make(ErrorKind::Timeout, ErrorCode::NotFound,
                "Request timed out after " + std::to_string(timeout_ms) + "ms",
                Json{{"timeout", timeout_ms}});
}

McpError McpError::connection_error(std::string detail) {
    return make(ErrorKind::ConnectionError, ErrorCode::RequestFailed, std::move(detail));
}

McpError McpError::transport_error(std::string detail, std::string_view transport_type) {
    return make(ErrorKind::TransportError, ErrorCode::TransportError, std::move(detail),
                Json{{"transportType", std::string(transport_type)}});
}

McpError McpError::tool_not_found(std::string_view name) {
    return make(ErrorKind::ToolNotFound, ErrorCode::NotFound,
                "Tool not found: " + std::string(name));
}

McpError McpError::resource_not_found(std::string_view uri) {
    return make(ErrorKind::ResourceNotFound, ErrorCode::NotFound,
                "Resource not found: " + std::string(uri));
}

McpError McpError::prompt_not_found(std::string_view name) {
    return make(ErrorKind::PromptNotFound, ErrorCode::NotFound,
                "Prompt not found: " + std::string(name));
}

McpError McpError::request_failed(std::string detail) {
    return make(ErrorKind::RequestFailed, ErrorCode::RequestFailed, std::move(detail));
}

McpError McpError::cancelled(std::string detail) {
    return make(ErrorKind::Cancelled, ErrorCode::Cancelled, std::move(detail));
}

McpError McpError::version_mismatch(std::string_view expected, std::string_view actual) {
    return make(ErrorKind::VersionCompatibility, ErrorCode::InvalidRequest,
                "Version compatibility error: expected " + std::string(expected) +
                ", got " + std::string(actual),
                Json{{"expected", std::string(expected)}, {"actual", std::string(actual)}});
}

McpError McpError::validation(
    std::string_view field,
    std::string_view expected,
    std::string_view actual
) {
    return make(ErrorKind::InvalidParams, ErrorCode::InvalidParams,
                "Validation failed for field '" + std::string(field) + "': expected " +
                std::string(expected) + ", got " + std::string(actual),
                Json{{"field", std::string(field)}});
}

McpError McpError::from_transport(const TransportError& error, std::string_view transport_type) {
    switch (error.category) {
        case TransportError::Category::Timeout:
            return make(ErrorKind::Timeout, ErrorCode::NotFound, error.message,
                        Json{{"transportType", std::string(transport_type)}});
        case TransportError::Category::Closed:
            return connection_error(error.message);
        case TransportError::Category::Network:
        case TransportError::Category::Protocol:
            break;
    }
    auto result = transport_error(error.message, transport_type);
    if (error.status_code.has_value()) {
        (*result.data)["status"] = *error.status_code;
    }
    return result;
}

McpError McpError::from_json(const Json& error_object) {
    McpError error;
    if (error_object.is_object() == false) {
        error.message = "Malformed error object";
        return error;
    }

    error.code = error_object.value("code", ErrorCode::InternalError);
    error.message = error_object.value("message", std::string{});
    if (error_object.contains("data")) {
        error.data = error_object.at("data");
    }

    const std::string_view msg = error.message;
    switch (error.code) {
        case ErrorCode::ParseError:     error.kind = ErrorKind::ParseError; break;
        case ErrorCode::MethodNotFound: error.kind = ErrorKind::MethodNotFound; break;
        case ErrorCode::InvalidParams:  error.kind = ErrorKind::InvalidParams; break;
        case ErrorCode::InternalError:  error.kind = ErrorKind::InternalError; break;
        case ErrorCode::TransportError: error.kind = ErrorKind::TransportError; break;
        case ErrorCode::Cancelled:      error.kind = ErrorKind::Cancelled; break;
        case ErrorCode::InvalidRequest:
            error.kind = starts_with(msg, "Version compatibility error")
                ? ErrorKind::VersionCompatibility
                : ErrorKind::InvalidRequest;
            break;
        case ErrorCode::NotFound:
            if (starts_with(msg, "Tool not found")) {
                error.kind = ErrorKind::ToolNotFound;
            } else if (starts_with(msg, "Resource not found")) {
                error.kind = ErrorKind::ResourceNotFound;
            } else if (starts_with(msg, "Prompt not found")) {
                error.kind = ErrorKind::PromptNotFound;
            } else {
                error.kind = ErrorKind::Timeout;
            }
            break;
        case ErrorCode::RequestFailed:
            error.kind = starts_with(msg, "Connection")
                ? ErrorKind::ConnectionError
                : ErrorKind::RequestFailed;
            break;
        default:
            error.kind = ErrorKind::InternalError;
            break;
    }
    return error;
}

// ═══════════════════════════════════════════════════════════════════════════
// Classification
// ═══════════════════════════════════════════════════════════════════════════

bool McpError::is_retryable() const noexcept {
    switch (kind) {
        case ErrorKind::InternalError:
        case ErrorKind::Timeout:
        case ErrorKind::ConnectionError:
        case ErrorKind::TransportError:
            return true;
        default:
            return false;
    }
}

Severity McpError::severity() const noexcept {
    switch (kind) {
        case ErrorKind::InvalidParams:
        case ErrorKind::MethodNotFound:
        case ErrorKind::ToolNotFound:
        case ErrorKind::ResourceNotFound:
        case ErrorKind::PromptNotFound:
        case ErrorKind::Cancelled:
            return Severity::Warning;
        case ErrorKind::ConnectionError:
        case ErrorKind::TransportError:
        case ErrorKind::VersionCompatibility:
            return Severity::Critical;
        default:
            return Severity::Error;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Conversion
// ═══════════════════════════════════════════════════════════════════════════

Json McpError::to_json() const {
    Json payload = Json::object();
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = redact_sensitive(*data);
    }
    return payload;
}

McpError McpError::wrap(std::string_view context) const {
    McpError wrapped = *this;
    wrapped.message = std::string(context) + ": " + message;
    return wrapped;
}

std::string McpError::describe() const {
    return std::string(to_string(kind)) + "(" + std::to_string(code) + "): " + message;
}

// ═══════════════════════════════════════════════════════════════════════════
// Redaction
// ═══════════════════════════════════════════════════════════════════════════

bool is_sensitive_key(std::string_view key) {
    std::string lowered(key);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::any_of(kSensitiveFragments.begin(), kSensitiveFragments.end(),
                       [&lowered](std::string_view fragment) {
                           return lowered.find(fragment) != std::string::npos;
                       });
}

Json redact_sensitive(const Json& value) {
    if (value.is_object()) {
        Json out = Json::object();
        for (const auto& [key, child] : value.items()) {
            if (is_sensitive_key(key)) {
                out[key] = kRedacted;
            } else {
                out[key] = redact_sensitive(child);
            }
        }
        return out;
    }
    if (value.is_array()) {
        Json out = Json::array();
        for (const auto& child : value) {
            out.push_back(redact_sensitive(child));
        }
        return out;
    }
    return value;
}

}  // namespace ragmcp
