#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// JSON-RPC 2.0 Message Codec & Validator
// ═══════════════════════════════════════════════════════════════════════════
// decode(bytes) -> Message | DecodeError
// encode(Message) -> bytes
//
// Classification:
//   method + non-null id       -> Request
//   method, no id              -> Notification
//   id + (result xor error)    -> Response
//   anything else              -> InvalidRequest

#include "ragmcp/protocol/errors.hpp"
#include "ragmcp/transport.hpp"

#include <tl/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace ragmcp {

inline constexpr std::string_view kJsonRpcVersion{"2.0"};
inline constexpr std::size_t kDefaultMaxMessageSize = 1 << 20;  // 1 MiB

// ─────────────────────────────────────────────────────────────────────────────
// Method Names
// ─────────────────────────────────────────────────────────────────────────────

namespace methods {
    inline constexpr std::string_view Initialize          = "initialize";
    inline constexpr std::string_view Initialized         = "notifications/initialized";
    inline constexpr std::string_view Ping                = "ping";
    inline constexpr std::string_view ToolsList           = "tools/list";
    inline constexpr std::string_view ToolsCall           = "tools/call";
    inline constexpr std::string_view ResourcesList       = "resources/list";
    inline constexpr std::string_view ResourcesRead       = "resources/read";
    inline constexpr std::string_view ResourcesSubscribe  = "resources/subscribe";
    inline constexpr std::string_view ResourcesUnsubscribe = "resources/unsubscribe";
    inline constexpr std::string_view PromptsList         = "prompts/list";
    inline constexpr std::string_view PromptsGet          = "prompts/get";
    inline constexpr std::string_view LoggingSetLevel     = "logging/setLevel";
    inline constexpr std::string_view Cancelled           = "notifications/cancelled";
    inline constexpr std::string_view Progress            = "notifications/progress";
    inline constexpr std::string_view LogMessage          = "notifications/message";
    inline constexpr std::string_view ToolsListChanged    = "notifications/tools/list_changed";
    inline constexpr std::string_view ResourcesListChanged = "notifications/resources/list_changed";
    inline constexpr std::string_view PromptsListChanged  = "notifications/prompts/list_changed";
}  // namespace methods

// ─────────────────────────────────────────────────────────────────────────────
// Message Types
// ─────────────────────────────────────────────────────────────────────────────

using RequestId = std::variant<std::int64_t, std::string>;

[[nodiscard]] Json id_to_json(const RequestId& id);
[[nodiscard]] std::string id_to_string(const RequestId& id);

struct Request {
    RequestId id;
    std::string method;
    std::optional<Json> params;
};

struct Notification {
    std::string method;
    std::optional<Json> params;
};

/// A response carries exactly one of result/error; the expected<> enforces
/// that. id is empty only for errors answering an unidentifiable request.
struct Response {
    std::optional<RequestId> id;
    McpResult<Json> outcome;

    [[nodiscard]] bool is_error() const noexcept { return outcome.has_value() == false; }

    [[nodiscard]] static Response success(RequestId id, Json result);
    [[nodiscard]] static Response failure(std::optional<RequestId> id, McpError error);
};

using Message = std::variant<Request, Response, Notification>;

enum class MessageKind { Request, Response, Notification };

[[nodiscard]] MessageKind kind_of(const Message& message) noexcept;
[[nodiscard]] std::string_view to_string(MessageKind kind) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Decode Failure
// ─────────────────────────────────────────────────────────────────────────────
// Carries whatever could be salvaged from a bad payload so the caller can
// still answer an identifiable request in-band. A payload without a method
// is a malformed response: it is never answered, only matched by id.

struct DecodeError {
    McpError error;
    std::optional<RequestId> request_id;
    bool is_json_object{false};
    bool is_response{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// MessageCodec
// ─────────────────────────────────────────────────────────────────────────────

class MessageCodec {
public:
    explicit MessageCodec(std::size_t max_message_size = kDefaultMaxMessageSize);

    /// Size check, then parse, then validate and classify.
    [[nodiscard]] tl::expected<Message, DecodeError> decode(std::string_view bytes) const;

    /// Validate and classify an already-parsed payload.
    [[nodiscard]] static tl::expected<Message, DecodeError> from_json(const Json& payload);

    [[nodiscard]] static Json to_json(const Message& message);
    [[nodiscard]] static std::string encode(const Message& message);

    [[nodiscard]] std::size_t max_message_size() const noexcept { return max_message_size_; }

private:
    [[nodiscard]] static tl::expected<Message, DecodeError> classify(const Json& payload);

    std::size_t max_message_size_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Parameter Validation
// ─────────────────────────────────────────────────────────────────────────────
// Each validator returns InvalidParams naming the offending field; none throw.
// Methods without a validator accept any params.

[[nodiscard]] McpResult<void> validate_params(std::string_view method, const Json& params);

[[nodiscard]] McpResult<void> validate_initialize_params(const Json& params);
[[nodiscard]] McpResult<void> validate_tool_call_params(const Json& params);
[[nodiscard]] McpResult<void> validate_resource_read_params(const Json& params);
[[nodiscard]] McpResult<void> validate_prompt_get_params(const Json& params);
[[nodiscard]] McpResult<void> validate_set_level_params(const Json& params);

// ─────────────────────────────────────────────────────────────────────────────
// Logging Helpers
// ─────────────────────────────────────────────────────────────────────────────

/// "request tools/call id=3", "response id=3 error=-32601", ...
[[nodiscard]] std::string summarize(const Message& message);

/// Encoded message with sensitive fields redacted.
[[nodiscard]] std::string redact_for_logging(const Message& message);

}  // namespace ragmcp
