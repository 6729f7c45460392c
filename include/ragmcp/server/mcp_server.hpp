#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// MCP Server
// ═══════════════════════════════════════════════════════════════════════════
// Exposes a retrieval system (IRagSystem) and an optional tool provider over
// one MCP connection.
//
// Usage:
//   asio::io_context io;
//   auto transport = std::make_unique<StdioTransport>(io.get_executor(), StdioEndpoint{});
//   McpServer server(std::move(transport), rag, tools);
//   asio::co_spawn(io, server.run(), asio::detached);
//   io.run();
//
// Built-in catalog:
//   tools      rag_query, rag_index_documents, rag_status (+ provider tools)
//   resources  rag://documents/collection, rag://conversations/history,
//              rag://system/stats, rag://vectorstore/info
//   prompts    rag_query_simple, rag_query_conversational, rag_query_with_tools

#include "ragmcp/config.hpp"
#include "ragmcp/log/logger.hpp"
#include "ragmcp/protocol/protocol_core.hpp"
#include "ragmcp/server/capabilities_registry.hpp"
#include "ragmcp/server/rag_system.hpp"
#include "ragmcp/transport/async_transport.hpp"

#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace ragmcp {

struct McpServerOptions {
    Implementation info{"ragmcp-server", "1.0.0"};
    std::optional<std::string> instructions;
    ProtocolConfig protocol;

    /// Threshold for notifications/message until the client sets one
    LogLevel log_threshold{LogLevel::Info};
};

class McpServer {
public:
    /// rag may be null: only provider tools are served then.
    McpServer(
        std::unique_ptr<IAsyncTransport> transport,
        std::shared_ptr<IRagSystem> rag,
        std::shared_ptr<IToolProvider> tools = nullptr,
        McpServerOptions options = {}
    );
    ~McpServer();

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Start the transport and the inbound pump.
    [[nodiscard]] asio::awaitable<McpResult<void>> start();

    /// start(), then serve until the transport closes.
    asio::awaitable<void> run();

    asio::awaitable<void> stop();

    [[nodiscard]] bool is_running() const noexcept { return running_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Outbound
    // ─────────────────────────────────────────────────────────────────────────

    /// notifications/message, sent only when level passes the client-set
    /// threshold. level is an MCP level name ("info", "warning", ...).
    [[nodiscard]] asio::awaitable<McpResult<void>> send_log_message(
        std::string level,
        Json data,
        std::optional<std::string> logger = std::nullopt
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Accessors
    // ─────────────────────────────────────────────────────────────────────────

    /// Changes after start() are announced with list_changed notifications.
    [[nodiscard]] CapabilitiesRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] ProtocolCore& core() noexcept { return core_; }
    [[nodiscard]] IAsyncTransport& transport() noexcept { return *transport_; }

    [[nodiscard]] const std::optional<Implementation>& client_info() const noexcept {
        return core_.remote_info();
    }

    [[nodiscard]] static ServerCapabilities advertised_capabilities();

    /// {isRunning, serverInfo, protocol, capabilities, clientInfo}
    [[nodiscard]] Json status() const;

private:
    void register_handlers();
    void register_rag_catalog();
    void register_provider_tools();
    void announce_list_changed(CatalogKind kind);

    asio::awaitable<McpResult<Json>> handle_tools_call(const Json& params);
    asio::awaitable<McpResult<Json>> handle_resources_read(const Json& params);
    asio::awaitable<McpResult<Json>> handle_prompts_get(const Json& params);
    asio::awaitable<McpResult<Json>> handle_set_level(const Json& params);

    asio::awaitable<McpResult<CallToolResult>> rag_query(const Json& args);
    asio::awaitable<McpResult<CallToolResult>> rag_index_documents(const Json& args);
    asio::awaitable<McpResult<CallToolResult>> rag_status(const Json& args);

    std::unique_ptr<IAsyncTransport> transport_;
    std::shared_ptr<IRagSystem> rag_;
    std::shared_ptr<IToolProvider> tools_;
    McpServerOptions options_;

    CapabilitiesRegistry registry_;
    ProtocolCore core_;

    asio::steady_timer closed_signal_;
    std::chrono::steady_clock::time_point started_at_;
    LogLevel log_threshold_;
    bool running_{false};
};

}  // namespace ragmcp
