#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Server Manager
// ═══════════════════════════════════════════════════════════════════════════
// Owns one McpClient per configured server and merges their catalogs into
// a single namespace.
//
//   - bounded concurrent connects (slot pool, polled)
//   - collision renaming: a second "search" tool from server "web" is
//     published as "web_search"
//   - reconnection with exponential backoff through an IScheduler
//   - periodic ping health checks (advisory)
//
// Usage:
//   ServerManager manager(io.get_executor(), app.servers, app.manager, app.client);
//   co_await manager.start();
//   auto result = co_await manager.call_tool("web_search", {{"q", "asio"}});
//   co_await manager.stop();
//
// All methods must be called from the executor passed at construction.

#include "ragmcp/client/mcp_client.hpp"
#include "ragmcp/config.hpp"
#include "ragmcp/manager/scheduler.hpp"
#include "ragmcp/protocol/errors.hpp"
#include "ragmcp/protocol/mcp_types.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ragmcp {

using ClientFactory = std::function<std::shared_ptr<McpClient>(
    asio::any_io_executor executor,
    const ServerConfig& server,
    const ClientConfig& client
)>;

/// McpClient with default_transport_factory()
[[nodiscard]] ClientFactory default_client_factory();

// ─────────────────────────────────────────────────────────────────────────────
// Status / Aggregation Types
// ─────────────────────────────────────────────────────────────────────────────

struct ServerStatus {
    ConnectionState state{ConnectionState::Connecting};
    std::optional<std::chrono::system_clock::time_point> last_connected;
    int retry_count{0};
    std::optional<std::string> last_error;

    /// {status, lastConnected (ISO-8601 UTC or null), retryCount, lastError}
    [[nodiscard]] Json to_json() const;
};

struct AggregatedEntry {
    std::string public_name;
    std::string server_name;
    std::string original_name;  // name (or uri) on the owning server
    Json descriptor;

    /// {publicName, serverName, descriptor}
    [[nodiscard]] Json to_json() const;
};

struct AggregatedCapabilities {
    std::vector<AggregatedEntry> tools;
    std::vector<AggregatedEntry> resources;
    std::vector<AggregatedEntry> prompts;

    [[nodiscard]] Json to_json() const;
};

struct HealthSummary {
    std::size_t total{0};
    std::size_t healthy{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// ServerManager
// ─────────────────────────────────────────────────────────────────────────────

class ServerManager {
public:
    using ServerEventCallback = std::function<void(const std::string& server_name)>;
    using HealthCallback = std::function<void(const HealthSummary& summary)>;

    /// scheduler may be null: an AsioScheduler on executor is used.
    ServerManager(
        asio::any_io_executor executor,
        std::vector<ServerConfig> servers,
        ServerManagerConfig config = {},
        ClientConfig client_config = {},
        ClientFactory factory = default_client_factory(),
        std::shared_ptr<IScheduler> scheduler = nullptr
    );
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Connect every enabled configured server (when auto_connect) and arm
    /// the health check. Individual connect failures are logged only.
    asio::awaitable<void> start();

    /// Cancel timers and close every client.
    asio::awaitable<void> stop();

    [[nodiscard]] bool is_running() const noexcept { return running_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Servers
    // ─────────────────────────────────────────────────────────────────────────

    /// Connect and publish one server. A duplicate name fails with
    /// InvalidParams; a failed connect leaves the server unowned.
    [[nodiscard]] asio::awaitable<McpResult<void>> add_server(ServerConfig config);

    /// Unknown names fail with "Server X not found".
    [[nodiscard]] asio::awaitable<McpResult<void>> remove_server(std::string name);

    [[nodiscard]] std::shared_ptr<McpClient> client(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> connected_servers() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Routing
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::awaitable<McpResult<CallToolResult>> call_tool(
        std::string public_name,
        Json arguments = Json::object()
    );

    [[nodiscard]] asio::awaitable<McpResult<ReadResourceResult>> read_resource(std::string public_uri);

    [[nodiscard]] asio::awaitable<McpResult<GetPromptResult>> get_prompt(
        std::string public_name,
        Json arguments = Json::object()
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Health
    // ─────────────────────────────────────────────────────────────────────────

    /// Ping every connected client once.
    asio::awaitable<HealthSummary> perform_health_check();

    // ─────────────────────────────────────────────────────────────────────────
    // State
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] AggregatedCapabilities get_aggregated_capabilities() const;
    [[nodiscard]] const std::map<std::string, ServerStatus>& get_server_statuses() const noexcept {
        return statuses_;
    }
    [[nodiscard]] std::optional<ServerStatus> server_status(const std::string& name) const;

    /// Number of connects currently holding a slot
    [[nodiscard]] std::size_t active_connections() const noexcept { return active_connections_; }

    [[nodiscard]] Json status() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Events
    // ─────────────────────────────────────────────────────────────────────────

    void on_server_connected(ServerEventCallback cb) { on_server_connected_ = std::move(cb); }
    void on_server_disconnected(ServerEventCallback cb) { on_server_disconnected_ = std::move(cb); }
    void on_server_removed(ServerEventCallback cb) { on_server_removed_ = std::move(cb); }
    void on_server_failed(ServerEventCallback cb) { on_server_failed_ = std::move(cb); }
    void on_server_unhealthy(ServerEventCallback cb) { on_server_unhealthy_ = std::move(cb); }
    void on_capabilities_updated(ServerEventCallback cb) { on_capabilities_updated_ = std::move(cb); }
    void on_health_check_completed(HealthCallback cb) { on_health_check_completed_ = std::move(cb); }

private:
    using AggregateMap = std::map<std::string, AggregatedEntry>;

    asio::awaitable<void> acquire_slot();
    void release_slot() noexcept;

    void wire_client(McpClient& client, const std::string& name);
    void merge_capabilities(const McpClient& client);
    void purge_capabilities(const std::string& server_name);

    void handle_client_disconnection(const std::string& name, const std::string& reason);
    void schedule_reconnection(const std::string& name);
    asio::awaitable<void> attempt_reconnect(std::string name);

    void schedule_health_check();
    asio::awaitable<void> health_tick();

    void emit(const ServerEventCallback& cb, const std::string& name, const char* event) const;

    asio::any_io_executor executor_;
    std::vector<ServerConfig> servers_;
    ServerManagerConfig config_;
    ClientConfig client_config_;
    ClientFactory factory_;
    std::shared_ptr<IScheduler> scheduler_;

    std::map<std::string, std::shared_ptr<McpClient>> clients_;
    std::map<std::string, ServerStatus> statuses_;

    AggregateMap tools_;
    AggregateMap resources_;
    AggregateMap prompts_;

    std::size_t active_connections_{0};
    bool running_{false};

    // Bumped by stop(); connects that straddle it discard their client
    std::uint64_t epoch_{0};

    ServerEventCallback on_server_connected_;
    ServerEventCallback on_server_disconnected_;
    ServerEventCallback on_server_removed_;
    ServerEventCallback on_server_failed_;
    ServerEventCallback on_server_unhealthy_;
    ServerEventCallback on_capabilities_updated_;
    HealthCallback on_health_check_completed_;

    std::shared_ptr<std::atomic<bool>> alive_;
};

}  // namespace ragmcp
