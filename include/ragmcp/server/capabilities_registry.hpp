#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Capabilities Registry
// ═══════════════════════════════════════════════════════════════════════════
// In-memory catalog of what a server exposes. Tools and prompts are keyed by
// name, resources by URI. Each entry pairs the descriptor with the coroutine
// that serves it. Registering an existing key replaces the entry.
//
// Listing preserves registration order so tools/list is stable across calls.

#include "ragmcp/protocol/errors.hpp"
#include "ragmcp/protocol/mcp_types.hpp"

#include <asio/awaitable.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ragmcp {

// ─────────────────────────────────────────────────────────────────────────────
// Handler Types
// ─────────────────────────────────────────────────────────────────────────────

using ToolHandler = std::function<asio::awaitable<McpResult<CallToolResult>>(const Json& arguments)>;
using ResourceHandler = std::function<asio::awaitable<McpResult<ReadResourceResult>>(const std::string& uri)>;
using PromptHandler = std::function<asio::awaitable<McpResult<GetPromptResult>>(const Json& arguments)>;

enum class CatalogKind { Tools, Resources, Prompts };

[[nodiscard]] std::string_view to_string(CatalogKind kind) noexcept;

struct ToolEntry {
    Tool descriptor;
    ToolHandler handler;
};

struct ResourceEntry {
    Resource descriptor;
    ResourceHandler handler;
};

struct PromptEntry {
    Prompt descriptor;
    PromptHandler handler;
};

struct RegistryStats {
    std::size_t tools{0};
    std::size_t resources{0};
    std::size_t prompts{0};

    [[nodiscard]] Json to_json() const {
        return {{"toolsCount", tools}, {"resourcesCount", resources}, {"promptsCount", prompts}};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] McpResult<void> validate_tool(const Tool& tool);
[[nodiscard]] McpResult<void> validate_resource(const Resource& resource);
[[nodiscard]] McpResult<void> validate_prompt(const Prompt& prompt);

// ─────────────────────────────────────────────────────────────────────────────
// CapabilitiesRegistry
// ─────────────────────────────────────────────────────────────────────────────

class CapabilitiesRegistry {
public:
    using ListChangedCallback = std::function<void(CatalogKind)>;

    [[nodiscard]] McpResult<void> register_tool(Tool tool, ToolHandler handler);
    [[nodiscard]] McpResult<void> register_resource(Resource resource, ResourceHandler handler);
    [[nodiscard]] McpResult<void> register_prompt(Prompt prompt, PromptHandler handler);

    /// Returns false when nothing was registered under the key
    bool unregister_tool(std::string_view name);
    bool unregister_resource(std::string_view uri);
    bool unregister_prompt(std::string_view name);

    [[nodiscard]] const ToolEntry* find_tool(std::string_view name) const;
    [[nodiscard]] const ResourceEntry* find_resource(std::string_view uri) const;
    [[nodiscard]] const PromptEntry* find_prompt(std::string_view name) const;

    [[nodiscard]] std::vector<Tool> list_tools() const;
    [[nodiscard]] std::vector<Resource> list_resources() const;
    [[nodiscard]] std::vector<Prompt> list_prompts() const;

    /// Fired after every successful register/unregister
    void on_list_changed(ListChangedCallback callback);

    [[nodiscard]] RegistryStats stats() const noexcept;

    /// Drop everything without firing list-changed
    void clear();

private:
    void notify(CatalogKind kind);

    std::vector<ToolEntry> tools_;
    std::vector<ResourceEntry> resources_;
    std::vector<PromptEntry> prompts_;

    ListChangedCallback on_list_changed_;
};

}  // namespace ragmcp
