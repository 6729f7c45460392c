#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// MCP Error Taxonomy
// ═══════════════════════════════════════════════════════════════════════════
// One error type for every protocol-level failure. Each value carries the
// JSON-RPC code that goes on the wire, a human message and optional
// structured data. Errors travel as values inside McpResult<T>; nothing in
// the public API throws.

#include "ragmcp/transport.hpp"

#include <tl/expected.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ragmcp {

// ─────────────────────────────────────────────────────────────────────────────
// Wire Codes
// ─────────────────────────────────────────────────────────────────────────────

namespace ErrorCode {
    // Standard JSON-RPC 2.0
    inline constexpr int ParseError     = -32700;
    inline constexpr int InvalidRequest = -32600;
    inline constexpr int MethodNotFound = -32601;
    inline constexpr int InvalidParams  = -32602;
    inline constexpr int InternalError  = -32603;

    // MCP-specific
    inline constexpr int NotFound       = -32001;  // also used for timeouts
    inline constexpr int RequestFailed  = -32002;  // execution and connection failures
    inline constexpr int TransportError = -32005;
    inline constexpr int Cancelled      = -32800;
}  // namespace ErrorCode

enum class ErrorKind : std::uint8_t {
    ParseError,
    InvalidRequest,
    MethodNotFound,
    InvalidParams,
    InternalError,
    Timeout,
    ConnectionError,
    TransportError,
    ToolNotFound,
    ResourceNotFound,
    PromptNotFound,
    RequestFailed,
    Cancelled,
    VersionCompatibility
};

enum class Severity : std::uint8_t {
    Warning,
    Error,
    Critical
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;
[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// McpError
// ─────────────────────────────────────────────────────────────────────────────

struct McpError {
    ErrorKind kind{ErrorKind::InternalError};
    int code{ErrorCode::InternalError};
    std::string message;
    std::optional<Json> data;

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static McpError parse_error(std::string detail);
    [[nodiscard]] static McpError invalid_request(std::string detail);
    [[nodiscard]] static McpError method_not_found(std::string_view method);
    [[nodiscard]] static McpError invalid_params(std::string detail);
    [[nodiscard]] static McpError internal_error(std::string detail);
    [[nodiscard]] static McpError timeout(std::int64_t timeout_ms);
    [[nodiscard]] static McpError connection_error(std::string detail);
    [[nodiscard]] static McpError transport_error(std::string detail, std::string_view transport_type);
    [[nodiscard]] static McpError tool_not_found(std::string_view name);
    [[nodiscard]] static McpError resource_not_found(std::string_view uri);
    [[nodiscard]] static McpError prompt_not_found(std::string_view name);
    [[nodiscard]] static McpError request_failed(std::string detail);
    [[nodiscard]] static McpError cancelled(std::string detail = "Operation was cancelled");
    [[nodiscard]] static McpError version_mismatch(std::string_view expected, std::string_view actual);

    /// Structured field validation failure:
    /// "Validation failed for field 'f': expected X, got Y"
    [[nodiscard]] static McpError validation(
        std::string_view field,
        std::string_view expected,
        std::string_view actual
    );

    /// Convert a byte-layer failure into a protocol error.
    [[nodiscard]] static McpError from_transport(const TransportError& error, std::string_view transport_type);

    /// Rebuild an error received from a peer. The kind is recovered from
    /// the code (and message prefix where codes are shared).
    [[nodiscard]] static McpError from_json(const Json& error_object);

    // ─────────────────────────────────────────────────────────────────────────
    // Classification
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] bool is_retryable() const noexcept;
    [[nodiscard]] Severity severity() const noexcept;

    [[nodiscard]] bool is_not_found() const noexcept {
        return kind == ErrorKind::ToolNotFound ||
               kind == ErrorKind::ResourceNotFound ||
               kind == ErrorKind::PromptNotFound;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Conversion
    // ─────────────────────────────────────────────────────────────────────────

    /// JSON-RPC error object; data is redacted.
    [[nodiscard]] Json to_json() const;

    /// Same error with "<context>: " prepended to the message.
    [[nodiscard]] McpError wrap(std::string_view context) const;

    /// One-line form for logs: "Timeout(-32001): Request timed out after 50ms"
    [[nodiscard]] std::string describe() const;
};

template <typename T>
using McpResult = tl::expected<T, McpError>;

// ─────────────────────────────────────────────────────────────────────────────
// Redaction
// ─────────────────────────────────────────────────────────────────────────────

/// True if the key contains password, token, key, secret, auth or credential
/// (case-insensitive).
[[nodiscard]] bool is_sensitive_key(std::string_view key);

/// Deep copy of value with every sensitive key's value replaced by
/// "[REDACTED]".
[[nodiscard]] Json redact_sensitive(const Json& value);

}  // namespace ragmcp
