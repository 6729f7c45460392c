#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// MCP Client
// ═══════════════════════════════════════════════════════════════════════════
// One connection to one remote MCP server: a transport built from the
// ServerConfig plus a ProtocolCore in the client role.
//
// Usage:
//   McpClient client(io.get_executor(), server_config);
//   asio::co_spawn(io, [&]() -> asio::awaitable<void> {
//       auto init = co_await client.connect();
//       auto result = co_await client.call_tool("echo", {{"text", "hi"}});
//       co_await client.close();
//   }, asio::detached);
//   io.run();
//
// After connect() the tool, resource and prompt catalogs are cached. Calls
// naming something outside the cache fail fast with the NotFound kinds.
// Catalogs are cleared on disconnection and never served stale.

#include "ragmcp/config.hpp"
#include "ragmcp/protocol/errors.hpp"
#include "ragmcp/protocol/mcp_types.hpp"
#include "ragmcp/protocol/protocol_core.hpp"
#include "ragmcp/transport/async_transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ragmcp {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Failed
};

[[nodiscard]] std::string_view to_string(ConnectionState state) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Transport Factory
// ─────────────────────────────────────────────────────────────────────────────

using TransportFactory = std::function<McpResult<std::unique_ptr<IAsyncTransport>>(
    asio::any_io_executor executor,
    const ServerConfig& server,
    const ProtocolConfig& protocol
)>;

/// stdio -> StdioTransport (spawns command), http -> HttpClientTransport
[[nodiscard]] TransportFactory default_transport_factory();

// ─────────────────────────────────────────────────────────────────────────────
// McpClient
// ─────────────────────────────────────────────────────────────────────────────

class McpClient {
public:
    using DisconnectedCallback = std::function<void(const std::string& reason)>;
    using ReconnectFailedCallback = std::function<void(const McpError& error)>;
    using NotificationCallback = std::function<void(const std::string& method, const Json& params)>;
    using CatalogChangedCallback = std::function<void()>;

    McpClient(
        asio::any_io_executor executor,
        ServerConfig server,
        ClientConfig config = {},
        TransportFactory factory = default_transport_factory()
    );
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Connection Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Build a fresh transport, handshake, load catalogs. Failures are
    /// wrapped as "Connection failed: ..." keeping the original kind.
    [[nodiscard]] asio::awaitable<McpResult<InitializeResult>> connect();

    /// Tear down core and transport (terminates a spawned server).
    /// An explicit close does not fire on_disconnected. During connect()
    /// it aborts the attempt, which then fails with Cancelled.
    asio::awaitable<void> close();

    /// close(), wait config.retry_delay, connect(). A failure is also
    /// reported through on_reconnect_failed.
    [[nodiscard]] asio::awaitable<McpResult<InitializeResult>> reconnect();

    // ─────────────────────────────────────────────────────────────────────────
    // Operations
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::awaitable<McpResult<CallToolResult>> call_tool(
        std::string name,
        Json arguments = Json::object()
    );

    [[nodiscard]] asio::awaitable<McpResult<ReadResourceResult>> read_resource(std::string uri);

    [[nodiscard]] asio::awaitable<McpResult<GetPromptResult>> get_prompt(
        std::string name,
        Json arguments = Json::object()
    );

    /// Liveness probe via tools/list. Errors are logged and become false.
    [[nodiscard]] asio::awaitable<bool> ping();

    /// Re-fetch every catalog the server advertises.
    [[nodiscard]] asio::awaitable<McpResult<void>> refresh_catalogs();

    /// Request any method (params passed through unvalidated)
    [[nodiscard]] asio::awaitable<McpResult<Json>> request(
        std::string method,
        std::optional<Json> params = std::nullopt
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Catalogs
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::vector<Tool>& tools() const noexcept { return tools_; }
    [[nodiscard]] const std::vector<Resource>& resources() const noexcept { return resources_; }
    [[nodiscard]] const std::vector<Prompt>& prompts() const noexcept { return prompts_; }

    [[nodiscard]] bool has_tool(std::string_view name) const;
    [[nodiscard]] bool has_resource(std::string_view uri) const;
    [[nodiscard]] bool has_prompt(std::string_view name) const;

    // ─────────────────────────────────────────────────────────────────────────
    // State
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::string& name() const noexcept { return server_.name; }
    [[nodiscard]] const ServerConfig& server_config() const noexcept { return server_; }
    [[nodiscard]] ConnectionState state() const noexcept { return state_; }
    [[nodiscard]] bool is_connected() const noexcept { return state_ == ConnectionState::Connected; }
    [[nodiscard]] bool is_initialized() const noexcept;

    [[nodiscard]] std::optional<Implementation> server_info() const;
    [[nodiscard]] std::optional<ServerCapabilities> server_capabilities() const;
    [[nodiscard]] std::optional<std::string> server_instructions() const;

    /// {name, state, initialized, serverInfo, toolCount, resourceCount, promptCount}
    [[nodiscard]] Json status() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Events
    // ─────────────────────────────────────────────────────────────────────────

    void on_disconnected(DisconnectedCallback callback) { on_disconnected_ = std::move(callback); }
    void on_reconnect_failed(ReconnectFailedCallback callback) { on_reconnect_failed_ = std::move(callback); }
    void on_notification(NotificationCallback callback) { on_notification_ = std::move(callback); }

    /// Fired after a list_changed refresh replaced a catalog
    void on_catalog_changed(CatalogChangedCallback callback) { on_catalog_changed_ = std::move(callback); }

private:
    void install_handlers(HandlerTable& table);
    void handle_disconnection(const std::string& reason);
    void clear_catalogs();
    asio::awaitable<void> reload_catalog(std::string list_method, std::shared_ptr<std::atomic<bool>> alive);
    asio::awaitable<McpResult<InitializeResult>> abort_connect(McpError error);

    asio::awaitable<McpResult<void>> load_tools();
    asio::awaitable<McpResult<void>> load_resources();
    asio::awaitable<McpResult<void>> load_prompts();

    /// close() without touching state_
    asio::awaitable<void> teardown();

    [[nodiscard]] McpResult<void> require_initialized() const;

    asio::any_io_executor executor_;
    ServerConfig server_;
    ClientConfig config_;
    TransportFactory factory_;

    std::unique_ptr<IAsyncTransport> transport_;
    std::unique_ptr<ProtocolCore> core_;

    ConnectionState state_{ConnectionState::Disconnected};
    bool close_requested_{false};
    std::optional<std::string> last_error_;

    std::vector<Tool> tools_;
    std::vector<Resource> resources_;
    std::vector<Prompt> prompts_;

    DisconnectedCallback on_disconnected_;
    ReconnectFailedCallback on_reconnect_failed_;
    NotificationCallback on_notification_;
    CatalogChangedCallback on_catalog_changed_;

    std::shared_ptr<std::atomic<bool>> alive_;
};

}  // namespace ragmcp
