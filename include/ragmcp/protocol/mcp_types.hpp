#ifndef RAGMCP_PROTOCOL_MCP_TYPES_HPP
#define RAGMCP_PROTOCOL_MCP_TYPES_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace ragmcp {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// MCP Protocol Version
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

namespace detail {

inline std::optional<std::string> optional_string(const Json& j, const char* key) {
    if (j.contains(key) && j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    return std::nullopt;
}

inline std::string string_or_empty(const Json& j, const char* key) {
    return optional_string(j, key).value_or("");
}

}  // namespace detail

// ═══════════════════════════════════════════════════════════════════════════
// Client/Server Info
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }

    static Implementation from_json(const Json& j) {
        return {
            detail::string_or_empty(j, "name"),
            detail::string_or_empty(j, "version")
        };
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Capabilities
// ═══════════════════════════════════════════════════════════════════════════

struct ClientCapabilities {
    struct Roots {
        bool list_changed = false;
    };

    std::optional<Roots> roots;
    Json experimental = Json::object();

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (roots) {
            j["roots"] = {{"listChanged", roots->list_changed}};
        }
        if (!experimental.empty()) {
            j["experimental"] = experimental;
        }
        return j;
    }
};

struct ServerCapabilities {
    struct Prompts {
        bool list_changed = false;
    };
    struct Resources {
        bool subscribe = false;
        bool list_changed = false;
    };
    struct Tools {
        bool list_changed = false;
    };
    struct Logging {};

    std::optional<Prompts> prompts;
    std::optional<Resources> resources;
    std::optional<Tools> tools;
    std::optional<Logging> logging;

    /// tools/resources/prompts with listChanged, no subscriptions, logging.
    static ServerCapabilities defaults() {
        ServerCapabilities caps;
        caps.tools = Tools{true};
        caps.resources = Resources{false, true};
        caps.prompts = Prompts{true};
        caps.logging = Logging{};
        return caps;
    }

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (tools) {
            j["tools"] = {{"listChanged", tools->list_changed}};
        }
        if (resources) {
            j["resources"] = {
                {"subscribe", resources->subscribe},
                {"listChanged", resources->list_changed}
            };
        }
        if (prompts) {
            j["prompts"] = {{"listChanged", prompts->list_changed}};
        }
        if (logging) {
            j["logging"] = Json::object();
        }
        return j;
    }

    static ServerCapabilities from_json(const Json& j) {
        ServerCapabilities caps;
        if (j.is_object() == false) {
            return caps;
        }
        if (j.contains("prompts") && j["prompts"].is_object()) {
            caps.prompts = Prompts{j["prompts"].value("listChanged", false)};
        }
        if (j.contains("resources") && j["resources"].is_object()) {
            caps.resources = Resources{
                j["resources"].value("subscribe", false),
                j["resources"].value("listChanged", false)
            };
        }
        if (j.contains("tools") && j["tools"].is_object()) {
            caps.tools = Tools{j["tools"].value("listChanged", false)};
        }
        if (j.contains("logging")) {
            caps.logging = Logging{};
        }
        return caps;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Initialize Request/Response
// ═══════════════════════════════════════════════════════════════════════════

struct InitializeParams {
    std::string protocol_version = MCP_PROTOCOL_VERSION;
    Json capabilities = Json::object();
    Implementation client_info;

    [[nodiscard]] Json to_json() const {
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities},
            {"clientInfo", client_info.to_json()}
        };
    }

    static InitializeParams from_json(const Json& j) {
        InitializeParams params;
        params.protocol_version = detail::string_or_empty(j, "protocolVersion");
        if (j.contains("capabilities") && j["capabilities"].is_object()) {
            params.capabilities = j["capabilities"];
        }
        if (j.contains("clientInfo")) {
            params.client_info = Implementation::from_json(j["clientInfo"]);
        }
        return params;
    }
};

struct InitializeResult {
    std::string protocol_version;
    Json capabilities = Json::object();
    Implementation server_info;
    std::optional<std::string> instructions;

    [[nodiscard]] Json to_json() const {
        Json j = {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities},
            {"serverInfo", server_info.to_json()}
        };
        if (instructions) {
            j["instructions"] = *instructions;
        }
        return j;
    }

    static InitializeResult from_json(const Json& j) {
        InitializeResult result;
        result.protocol_version = detail::string_or_empty(j, "protocolVersion");
        if (j.contains("capabilities") && j["capabilities"].is_object()) {
            result.capabilities = j["capabilities"];
        }
        if (j.contains("serverInfo")) {
            result.server_info = Implementation::from_json(j["serverInfo"]);
        }
        result.instructions = detail::optional_string(j, "instructions");
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

struct Tool {
    std::string name;
    std::optional<std::string> description;
    Json input_schema = Json::object();  // JSON Schema for tool arguments

    static Tool from_json(const Json& j) {
        Tool tool;
        tool.name = detail::string_or_empty(j, "name");
        tool.description = detail::optional_string(j, "description");
        if (j.contains("inputSchema") && j["inputSchema"].is_object()) {
            tool.input_schema = j["inputSchema"];
        }
        return tool;
    }

    /// inputSchema is always present; an absent schema is {}.
    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}};
        if (description) {
            j["description"] = *description;
        }
        j["inputSchema"] = input_schema.is_null() ? Json::object() : input_schema;
        return j;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Content
// ═══════════════════════════════════════════════════════════════════════════

struct TextContent {
    std::string text;

    [[nodiscard]] Json to_json() const {
        return {{"type", "text"}, {"text", text}};
    }
};

struct CallToolResult {
    std::vector<Json> content;  // text, image, resource items as sent
    bool is_error = false;

    static CallToolResult text_result(std::string text, bool is_error = false) {
        CallToolResult result;
        result.content.push_back(TextContent{std::move(text)}.to_json());
        result.is_error = is_error;
        return result;
    }

    /// Concatenation of every text item.
    [[nodiscard]] std::string text() const {
        std::string out;
        for (const auto& item : content) {
            if (item.value("type", "") == "text") {
                out += detail::string_or_empty(item, "text");
            }
        }
        return out;
    }

    [[nodiscard]] Json to_json() const {
        return {{"content", content}, {"isError", is_error}};
    }

    static CallToolResult from_json(const Json& j) {
        CallToolResult result;
        result.is_error = j.value("isError", false);
        if (j.contains("content") && j["content"].is_array()) {
            for (const auto& c : j["content"]) {
                result.content.push_back(c);
            }
        }
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Resources
// ═══════════════════════════════════════════════════════════════════════════

struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;

    static Resource from_json(const Json& j) {
        Resource res;
        res.uri = detail::string_or_empty(j, "uri");
        res.name = detail::string_or_empty(j, "name");
        res.description = detail::optional_string(j, "description");
        res.mime_type = detail::optional_string(j, "mimeType");
        return res;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"uri", uri}, {"name", name}};
        if (description) j["description"] = *description;
        if (mime_type) j["mimeType"] = *mime_type;
        return j;
    }
};

struct ResourceContents {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // Base64 encoded

    static ResourceContents from_json(const Json& j) {
        ResourceContents contents;
        contents.uri = detail::string_or_empty(j, "uri");
        contents.mime_type = detail::optional_string(j, "mimeType");
        contents.text = detail::optional_string(j, "text");
        contents.blob = detail::optional_string(j, "blob");
        return contents;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"uri", uri}};
        if (mime_type) j["mimeType"] = *mime_type;
        if (text) j["text"] = *text;
        if (blob) j["blob"] = *blob;
        return j;
    }
};

struct ReadResourceResult {
    std::vector<ResourceContents> contents;
    bool is_error = false;

    [[nodiscard]] Json to_json() const {
        Json j = {{"contents", Json::array()}};
        for (const auto& c : contents) {
            j["contents"].push_back(c.to_json());
        }
        if (is_error) {
            j["isError"] = true;
        }
        return j;
    }

    static ReadResourceResult from_json(const Json& j) {
        ReadResourceResult result;
        if (j.contains("contents") && j["contents"].is_array()) {
            for (const auto& c : j["contents"]) {
                result.contents.push_back(ResourceContents::from_json(c));
            }
        }
        result.is_error = j.value("isError", false);
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Prompts
// ═══════════════════════════════════════════════════════════════════════════

struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;

    static PromptArgument from_json(const Json& j) {
        PromptArgument arg;
        arg.name = detail::string_or_empty(j, "name");
        arg.description = detail::optional_string(j, "description");
        arg.required = j.value("required", false);
        return arg;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}};
        if (description) j["description"] = *description;
        j["required"] = required;
        return j;
    }
};

struct Prompt {
    std::string name;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;

    static Prompt from_json(const Json& j) {
        Prompt prompt;
        prompt.name = detail::string_or_empty(j, "name");
        prompt.description = detail::optional_string(j, "description");
        if (j.contains("arguments") && j["arguments"].is_array()) {
            for (const auto& a : j["arguments"]) {
                prompt.arguments.push_back(PromptArgument::from_json(a));
            }
        }
        return prompt;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}};
        if (description) j["description"] = *description;
        j["arguments"] = Json::array();
        for (const auto& arg : arguments) {
            j["arguments"].push_back(arg.to_json());
        }
        return j;
    }
};

struct PromptMessage {
    std::string role;  // "user" or "assistant"
    Json content;      // {"type":"text","text":...}

    [[nodiscard]] Json to_json() const {
        return {{"role", role}, {"content", content}};
    }

    static PromptMessage from_json(const Json& j) {
        PromptMessage msg;
        msg.role = detail::string_or_empty(j, "role");
        if (j.contains("content")) {
            msg.content = j["content"];
        }
        return msg;
    }
};

struct GetPromptResult {
    std::optional<std::string> description;
    std::vector<PromptMessage> messages;
    bool is_error{false};  // generation failed; messages carry the reason

    [[nodiscard]] Json to_json() const {
        Json j = {{"messages", Json::array()}};
        if (description) j["description"] = *description;
        for (const auto& m : messages) {
            j["messages"].push_back(m.to_json());
        }
        if (is_error) j["isError"] = true;
        return j;
    }

    static GetPromptResult from_json(const Json& j) {
        GetPromptResult result;
        result.description = detail::optional_string(j, "description");
        result.is_error = j.contains("isError") && j["isError"].is_boolean() && j["isError"].get<bool>();
        if (j.contains("messages") && j["messages"].is_array()) {
            for (const auto& m : j["messages"]) {
                result.messages.push_back(PromptMessage::from_json(m));
            }
        }
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// List Results
// ═══════════════════════════════════════════════════════════════════════════

template <typename Descriptor>
std::vector<Descriptor> descriptors_from_json(const Json& j, const char* key) {
    std::vector<Descriptor> out;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& item : j[key]) {
            out.push_back(Descriptor::from_json(item));
        }
    }
    return out;
}

template <typename Descriptor>
Json descriptors_to_json(const std::vector<Descriptor>& items, const char* key) {
    Json list = Json::array();
    for (const auto& item : items) {
        list.push_back(item.to_json());
    }
    return {{key, std::move(list)}};
}

// ═══════════════════════════════════════════════════════════════════════════
// Notifications
// ═══════════════════════════════════════════════════════════════════════════

struct CancelledNotification {
    Json request_id;  // string or integer, as the peer sent it
    std::optional<std::string> reason;

    [[nodiscard]] Json to_json() const {
        Json j = {{"requestId", request_id}};
        if (reason) j["reason"] = *reason;
        return j;
    }

    static CancelledNotification from_json(const Json& j) {
        CancelledNotification n;
        if (j.contains("requestId")) {
            n.request_id = j["requestId"];
        }
        n.reason = detail::optional_string(j, "reason");
        return n;
    }
};

struct LogMessageNotification {
    std::string level;  // MCP level name
    std::optional<std::string> logger;
    Json data;

    [[nodiscard]] Json to_json() const {
        Json j = {{"level", level}, {"data", data}};
        if (logger) j["logger"] = *logger;
        return j;
    }
};

}  // namespace ragmcp

#endif  // RAGMCP_PROTOCOL_MCP_TYPES_HPP
