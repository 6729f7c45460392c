#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════
// Plain structs with defaults. Every struct can be built from a JSON
// document using camelCase keys; missing keys keep their defaults and
// type mismatches produce InvalidParams naming the key.

#include "ragmcp/log/logger.hpp"
#include "ragmcp/protocol/errors.hpp"
#include "ragmcp/protocol/mcp_types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ragmcp {

// ─────────────────────────────────────────────────────────────────────────────
// Protocol
// ─────────────────────────────────────────────────────────────────────────────

struct ProtocolConfig {
    /// Per-request deadline (0 = no timeout)
    std::chrono::milliseconds request_timeout{30000};

    std::size_t max_message_size{1 << 20};  // 1 MiB

    std::string protocol_version{MCP_PROTOCOL_VERSION};
};

// ─────────────────────────────────────────────────────────────────────────────
// Stdio Transport
// ─────────────────────────────────────────────────────────────────────────────

/// How to handle stderr from the subprocess
enum class StderrHandling {
    Discard,     // Redirect to /dev/null
    Passthrough, // Inherit from parent
    Capture      // Capture to an in-memory buffer
};

struct StdioTransportConfig {
    std::string command;
    std::vector<std::string> args;

    /// Added to the child's environment (existing values are overwritten)
    std::map<std::string, std::string> env;

    std::size_t max_message_size{1 << 20};
    StderrHandling stderr_handling{StderrHandling::Passthrough};

    /// Channel buffer size for received messages
    std::size_t channel_capacity{16};

    /// Security: skip shell-metacharacter validation of command and args.
    /// Only for trusted commands such as test fixtures.
    bool skip_command_validation{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Transport
// ─────────────────────────────────────────────────────────────────────────────

struct HttpServerConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{3000};  // 0 = pick a free port
    std::string path{"/mcp"};
    bool enable_cors{true};
    std::size_t max_message_size{1 << 20};

    /// Outbound messages kept while no SSE stream is attached
    std::size_t max_backlog{256};
    std::size_t channel_capacity{64};
};

struct HttpClientConfig {
    std::string url;  // e.g. "http://127.0.0.1:3000/mcp"
    HeaderMap headers;
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds request_timeout{30000};
    bool verify_ssl{true};

    /// Open a GET text/event-stream on start for server-initiated traffic
    bool open_event_stream{true};

    std::size_t max_message_size{1 << 20};
    std::size_t channel_capacity{64};

    /// Worker threads running the blocking HTTP calls
    std::size_t worker_threads{2};
};

// ─────────────────────────────────────────────────────────────────────────────
// Remote Server
// ─────────────────────────────────────────────────────────────────────────────

enum class TransportKind { Stdio, Http };

[[nodiscard]] std::string_view to_string(TransportKind kind) noexcept;

/// One remote MCP server. Identity is the name; immutable once a client
/// is built from it.
struct ServerConfig {
    std::string name;
    TransportKind transport{TransportKind::Stdio};

    // stdio
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool skip_command_validation{false};

    // http
    std::string url;
    HeaderMap headers;
    bool open_event_stream{true};

    bool enabled{true};

    [[nodiscard]] StdioTransportConfig stdio_config(const ProtocolConfig& protocol) const;
    [[nodiscard]] HttpClientConfig http_config(const ProtocolConfig& protocol) const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Client / Manager / Application
// ─────────────────────────────────────────────────────────────────────────────

struct ClientConfig {
    std::string client_name{"ragmcp-client"};
    std::string client_version{"1.0.0"};

    /// Wait before reconnect() re-runs connect()
    std::chrono::milliseconds retry_delay{5000};

    ProtocolConfig protocol;
    Json capabilities = Json::object();
};

struct ServerManagerConfig {
    std::size_t max_concurrent_connections{5};
    bool auto_connect{true};
    int retry_attempts{3};
    std::chrono::milliseconds retry_delay{5000};
    std::chrono::milliseconds health_check_interval{60000};  // 0 disables

    /// Slot-wait polling period
    std::chrono::milliseconds slot_poll_interval{100};

    /// Collision rename: "<server><separator><name>"
    std::string prefix_separator{"_"};
};

struct LoggingConfig {
    std::string level{"info"};
    std::string backend{"spdlog"};  // "spdlog" | "console" | "none"
    std::string file;              // spdlog only: extra file sink
    bool async{false};             // spdlog only: write from a background thread
};

struct AppConfig {
    ServerManagerConfig manager;
    ClientConfig client;
    LoggingConfig logging;
    std::vector<ServerConfig> servers;
};

// ─────────────────────────────────────────────────────────────────────────────
// JSON Loading
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] McpResult<ProtocolConfig> protocol_config_from_json(const Json& j);
[[nodiscard]] McpResult<HttpServerConfig> http_server_config_from_json(const Json& j);
[[nodiscard]] McpResult<ServerConfig> server_config_from_json(const Json& j);
[[nodiscard]] McpResult<ServerManagerConfig> manager_config_from_json(const Json& j);
[[nodiscard]] McpResult<ClientConfig> client_config_from_json(const Json& j);
[[nodiscard]] McpResult<LoggingConfig> logging_config_from_json(const Json& j);

/// {"manager":{...}, "client":{...}, "logging":{...}, "servers":[...]}
/// "servers" may also be an object keyed by server name.
[[nodiscard]] McpResult<AppConfig> app_config_from_json(const Json& j);

[[nodiscard]] McpResult<AppConfig> load_config_file(const std::filesystem::path& path);

/// Logger for a LoggingConfig: "spdlog" (stderr, plus file when set),
/// "console" or "none". Unknown backends or levels are InvalidParams.
[[nodiscard]] McpResult<std::unique_ptr<ILogger>> make_logger(const LoggingConfig& config);

}  // namespace ragmcp
