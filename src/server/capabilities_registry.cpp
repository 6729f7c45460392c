#include "ragmcp/server/capabilities_registry.hpp"
#include "ragmcp/log/logger.hpp"

#include <algorithm>
#include <cctype>

namespace ragmcp {

namespace {

bool is_blank(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

const std::string& key_of(const ToolEntry& e) { return e.descriptor.name; }
const std::string& key_of(const ResourceEntry& e) { return e.descriptor.uri; }
const std::string& key_of(const PromptEntry& e) { return e.descriptor.name; }

template <typename Entry>
auto find_entry(std::vector<Entry>& entries, std::string_view key) {
    return std::find_if(entries.begin(), entries.end(),
                        [key](const Entry& e) { return key_of(e) == key; });
}

template <typename Entry>
const Entry* find_entry_ptr(const std::vector<Entry>& entries, std::string_view key) {
    const auto it = std::find_if(entries.begin(), entries.end(),
                                 [key](const Entry& e) { return key_of(e) == key; });
    return it == entries.end() ? nullptr : &*it;
}

/// Insert or replace in place, keeping the original position
template <typename Entry>
void upsert(std::vector<Entry>& entries, Entry entry) {
    auto it = find_entry(entries, key_of(entry));
    if (it != entries.end()) {
        *it = std::move(entry);
    } else {
        entries.push_back(std::move(entry));
    }
}

template <typename Entry>
bool erase_entry(std::vector<Entry>& entries, std::string_view key) {
    auto it = find_entry(entries, key);
    if (it == entries.end()) {
        return false;
    }
    entries.erase(it);
    return true;
}

template <typename Descriptor, typename Entry>
std::vector<Descriptor> descriptors_of(const std::vector<Entry>& entries) {
    std::vector<Descriptor> out;
    out.reserve(entries.size());
    for (const auto& e : entries) {
        out.push_back(e.descriptor);
    }
    return out;
}

}  // namespace

std::string_view to_string(CatalogKind kind) noexcept {
    switch (kind) {
        case CatalogKind::Tools:     return "tools";
        case CatalogKind::Resources: return "resources";
        case CatalogKind::Prompts:   return "prompts";
    }
    return "unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// Validation
// ═══════════════════════════════════════════════════════════════════════════

McpResult<void> validate_tool(const Tool& tool) {
    if (is_blank(tool.name)) {
        return tl::unexpected(McpError::validation(
            "tool", "valid tool object", "Tool name must be a non-empty string"));
    }
    if (!tool.description) {
        return tl::unexpected(McpError::validation(
            "tool", "valid tool object", "Tool description must be a string"));
    }
    if (!tool.input_schema.is_object()) {
        return tl::unexpected(McpError::validation(
            "tool", "valid tool object", "Tool inputSchema must be an object"));
    }
    return {};
}

McpResult<void> validate_resource(const Resource& resource) {
    if (is_blank(resource.uri)) {
        return tl::unexpected(McpError::validation(
            "resource", "valid resource object", "Resource URI must be a non-empty string"));
    }
    if (resource.name.empty()) {
        return tl::unexpected(McpError::validation(
            "resource", "valid resource object", "Resource name must be a string"));
    }
    return {};
}

McpResult<void> validate_prompt(const Prompt& prompt) {
    if (is_blank(prompt.name)) {
        return tl::unexpected(McpError::validation(
            "prompt", "valid prompt object", "Prompt name must be a non-empty string"));
    }
    if (!prompt.description) {
        return tl::unexpected(McpError::validation(
            "prompt", "valid prompt object", "Prompt description must be a string"));
    }
    for (const auto& arg : prompt.arguments) {
        if (is_blank(arg.name)) {
            return tl::unexpected(McpError::validation(
                "prompt", "valid prompt object", "Prompt argument names must be non-empty"));
        }
    }
    return {};
}

// ═══════════════════════════════════════════════════════════════════════════
// Registration
// ═══════════════════════════════════════════════════════════════════════════

McpResult<void> CapabilitiesRegistry::register_tool(Tool tool, ToolHandler handler) {
    if (auto valid = validate_tool(tool); !valid) {
        return valid;
    }
    if (!handler) {
        return tl::unexpected(McpError::invalid_params("Tool " + tool.name + " has no handler"));
    }
    RAGMCP_LOG_INFO("Tool registered: " + tool.name);
    upsert(tools_, ToolEntry{std::move(tool), std::move(handler)});
    notify(CatalogKind::Tools);
    return {};
}

McpResult<void> CapabilitiesRegistry::register_resource(Resource resource, ResourceHandler handler) {
    if (auto valid = validate_resource(resource); !valid) {
        return valid;
    }
    if (!handler) {
        return tl::unexpected(McpError::invalid_params("Resource " + resource.uri + " has no handler"));
    }
    RAGMCP_LOG_INFO("Resource registered: " + resource.uri);
    upsert(resources_, ResourceEntry{std::move(resource), std::move(handler)});
    notify(CatalogKind::Resources);
    return {};
}

McpResult<void> CapabilitiesRegistry::register_prompt(Prompt prompt, PromptHandler handler) {
    if (auto valid = validate_prompt(prompt); !valid) {
        return valid;
    }
    if (!handler) {
        return tl::unexpected(McpError::invalid_params("Prompt " + prompt.name + " has no handler"));
    }
    RAGMCP_LOG_INFO("Prompt registered: " + prompt.name);
    upsert(prompts_, PromptEntry{std::move(prompt), std::move(handler)});
    notify(CatalogKind::Prompts);
    return {};
}

bool CapabilitiesRegistry::unregister_tool(std::string_view name) {
    if (!erase_entry(tools_, name)) {
        return false;
    }
    RAGMCP_LOG_INFO("Tool unregistered: " + std::string(name));
    notify(CatalogKind::Tools);
    return true;
}

bool CapabilitiesRegistry::unregister_resource(std::string_view uri) {
    if (!erase_entry(resources_, uri)) {
        return false;
    }
    RAGMCP_LOG_INFO("Resource unregistered: " + std::string(uri));
    notify(CatalogKind::Resources);
    return true;
}

bool CapabilitiesRegistry::unregister_prompt(std::string_view name) {
    if (!erase_entry(prompts_, name)) {
        return false;
    }
    RAGMCP_LOG_INFO("Prompt unregistered: " + std::string(name));
    notify(CatalogKind::Prompts);
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Lookup
// ═══════════════════════════════════════════════════════════════════════════

const ToolEntry* CapabilitiesRegistry::find_tool(std::string_view name) const {
    return find_entry_ptr(tools_, name);
}

const ResourceEntry* CapabilitiesRegistry::find_resource(std::string_view uri) const {
    return find_entry_ptr(resources_, uri);
}

const PromptEntry* CapabilitiesRegistry::find_prompt(std::string_view name) const {
    return find_entry_ptr(prompts_, name);
}

std::vector<Tool> CapabilitiesRegistry::list_tools() const {
    return descriptors_of<Tool>(tools_);
}

std::vector<Resource> CapabilitiesRegistry::list_resources() const {
    return descriptors_of<Resource>(resources_);
}

std::vector<Prompt> CapabilitiesRegistry::list_prompts() const {
    return descriptors_of<Prompt>(prompts_);
}

// ═══════════════════════════════════════════════════════════════════════════
// Housekeeping
// ═══════════════════════════════════════════════════════════════════════════

void CapabilitiesRegistry::on_list_changed(ListChangedCallback callback) {
    on_list_changed_ = std::move(callback);
}

RegistryStats CapabilitiesRegistry::stats() const noexcept {
    return RegistryStats{tools_.size(), resources_.size(), prompts_.size()};
}

void CapabilitiesRegistry::clear() {
    RAGMCP_LOG_INFO("Clearing capabilities registry");
    tools_.clear();
    resources_.clear();
    prompts_.clear();
}

void CapabilitiesRegistry::notify(CatalogKind kind) {
    if (!on_list_changed_) {
        return;
    }
    try {
        on_list_changed_(kind);
    } catch (const std::exception& e) {
        RAGMCP_LOG_ERROR("Exception in list-changed callback: " + std::string(e.what()));
    }
}

}  // namespace ragmcp
