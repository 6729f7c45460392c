#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Server Collaborators
// ═══════════════════════════════════════════════════════════════════════════
// The retrieval pipeline and the built-in tools live outside this library.
// McpServer reaches them only through these two interfaces.

#include "ragmcp/protocol/errors.hpp"
#include "ragmcp/protocol/mcp_types.hpp"

#include <asio/awaitable.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ragmcp {

// ─────────────────────────────────────────────────────────────────────────────
// Query Mode
// ─────────────────────────────────────────────────────────────────────────────

enum class QueryMode {
    Simple,          // plain retrieval-augmented answer
    Conversational,  // answer within a conversation thread
    WithTools        // answer that may execute tools
};

[[nodiscard]] std::string_view to_string(QueryMode mode) noexcept;

/// "simple", "conversational", "with_tools"
[[nodiscard]] std::optional<QueryMode> query_mode_from_string(std::string_view name) noexcept;

struct IndexSummary {
    std::size_t documents_loaded{0};
    std::size_t unique_chunks{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// IRagSystem
// ─────────────────────────────────────────────────────────────────────────────

class IRagSystem {
public:
    virtual ~IRagSystem() = default;

    /// Answer text (a JSON string) or an object carrying "answer".
    [[nodiscard]] virtual asio::awaitable<McpResult<Json>> query(
        std::string question,
        QueryMode mode,
        std::string thread_id
    ) = 0;

    [[nodiscard]] virtual asio::awaitable<McpResult<IndexSummary>> index_documents(
        std::vector<std::string> urls,
        std::vector<std::string> local_files
    ) = 0;

    [[nodiscard]] virtual asio::awaitable<McpResult<Json>> status() = 0;
    [[nodiscard]] virtual asio::awaitable<McpResult<Json>> document_collection() = 0;
    [[nodiscard]] virtual asio::awaitable<McpResult<Json>> conversation_history() = 0;
    [[nodiscard]] virtual asio::awaitable<McpResult<Json>> system_stats() = 0;
    [[nodiscard]] virtual asio::awaitable<McpResult<Json>> vectorstore_info() = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// IToolProvider
// ─────────────────────────────────────────────────────────────────────────────

class IToolProvider {
public:
    virtual ~IToolProvider() = default;

    [[nodiscard]] virtual std::vector<Tool> list() const = 0;

    /// A result object with "success": false is reported as isError.
    [[nodiscard]] virtual asio::awaitable<McpResult<Json>> call(
        std::string name,
        Json arguments
    ) = 0;
};

}  // namespace ragmcp
