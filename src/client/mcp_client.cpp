#include "ragmcp/client/mcp_client.hpp"
#include "ragmcp/log/logger.hpp"
#include "ragmcp/transport/http_client_transport.hpp"
#include "ragmcp/transport/stdio_transport.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>

namespace ragmcp {

namespace {

using TransportPtr = std::unique_ptr<IAsyncTransport>;

template <typename Descriptor, typename Key>
bool contains_key(const std::vector<Descriptor>& items, std::string_view key, Key Descriptor::*field) {
    return std::any_of(items.begin(), items.end(),
                       [&](const Descriptor& d) { return d.*field == key; });
}

}  // namespace

std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Failed:       return "failed";
    }
    return "unknown";
}

TransportFactory default_transport_factory() {
    return [](asio::any_io_executor executor,
              const ServerConfig& server,
              const ProtocolConfig& protocol) -> McpResult<TransportPtr> {
        switch (server.transport) {
            case TransportKind::Stdio: {
                if (server.command.empty()) {
                    return tl::unexpected(McpError::invalid_params(
                        "Server " + server.name + " has no command"));
                }
                TransportPtr transport = std::make_unique<StdioTransport>(
                    std::move(executor), server.stdio_config(protocol));
                return McpResult<TransportPtr>(std::move(transport));
            }
            case TransportKind::Http: {
                if (server.url.empty()) {
                    return tl::unexpected(McpError::invalid_params(
                        "Server " + server.name + " has no url"));
                }
                TransportPtr transport = std::make_unique<HttpClientTransport>(
                    std::move(executor), server.http_config(protocol));
                return McpResult<TransportPtr>(std::move(transport));
            }
        }
        return tl::unexpected(McpError::invalid_params(
            "Unsupported transport for server " + server.name));
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

McpClient::McpClient(
    asio::any_io_executor executor,
    ServerConfig server,
    ClientConfig config,
    TransportFactory factory
)
    : executor_(std::move(executor))
    , server_(std::move(server))
    , config_(std::move(config))
    , factory_(std::move(factory))
    , alive_(std::make_shared<std::atomic<bool>>(true))
{}

McpClient::~McpClient() {
    alive_->store(false, std::memory_order_release);
    // core_ goes first (declared after transport_); the transport's own
    // destructor terminates a spawned server
}

// ═══════════════════════════════════════════════════════════════════════════
// Connection Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<McpResult<InitializeResult>> McpClient::connect() {
    if (state_ == ConnectionState::Connecting) {
        co_return tl::unexpected(McpError::connection_error(
            "Connection to " + server_.name + " already in progress"));
    }

    // Previous session, if any, is discarded silently
    state_ = ConnectionState::Connecting;
    close_requested_ = false;
    clear_catalogs();
    co_await teardown();

    RAGMCP_LOG_INFO("Connecting to MCP server " + server_.name + " (" +
                    std::string(to_string(server_.transport)) + ")");

    auto made = factory_(executor_, server_, config_.protocol);
    if (!made) {
        co_return co_await abort_connect(made.error());
    }
    transport_ = std::move(*made);

    auto started = co_await transport_->async_start();
    if (!started) {
        co_return co_await abort_connect(McpError::from_transport(started.error(), transport_->kind()));
    }
    if (close_requested_) {
        co_return co_await abort_connect(McpError::cancelled("Connection closed by client"));
    }

    HandlerTable table;
    install_handlers(table);
    core_ = std::make_unique<ProtocolCore>(*transport_, Role::Client, config_.protocol, std::move(table));
    core_->on_closed([this, alive = alive_](const std::string& reason) {
        if (alive->load(std::memory_order_acquire)) {
            handle_disconnection(reason);
        }
    });
    core_->start();

    auto init = co_await core_->initialize(
        Implementation{config_.client_name, config_.client_version},
        config_.capabilities);
    if (close_requested_) {
        co_return co_await abort_connect(McpError::cancelled("Connection closed by client"));
    }
    if (!init) {
        co_return co_await abort_connect(init.error());
    }

    // Discovery failures leave that catalog empty; the connection stands
    const Json& advertised = init->capabilities;
    if (advertised.contains("tools")) {
        if (auto loaded = co_await load_tools(); !loaded) {
            RAGMCP_LOG_WARN("Failed to load tools from " + server_.name + ": " + loaded.error().message);
        }
    }
    if (advertised.contains("resources")) {
        if (auto loaded = co_await load_resources(); !loaded) {
            RAGMCP_LOG_WARN("Failed to load resources from " + server_.name + ": " + loaded.error().message);
        }
    }
    if (advertised.contains("prompts")) {
        if (auto loaded = co_await load_prompts(); !loaded) {
            RAGMCP_LOG_WARN("Failed to load prompts from " + server_.name + ": " + loaded.error().message);
        }
    }

    if (close_requested_) {
        co_return co_await abort_connect(McpError::cancelled("Connection closed by client"));
    }
    if (!core_ || core_->is_closed()) {
        co_return co_await abort_connect(McpError::connection_error("Connection closed during discovery"));
    }

    state_ = ConnectionState::Connected;
    last_error_.reset();
    RAGMCP_LOG_INFO("Connected to " + server_.name + ": " + std::to_string(tools_.size()) + " tools, " +
                    std::to_string(resources_.size()) + " resources, " +
                    std::to_string(prompts_.size()) + " prompts");
    co_return init;
}

asio::awaitable<McpResult<InitializeResult>> McpClient::abort_connect(McpError error) {
    McpError wrapped = error.wrap("Connection failed");
    RAGMCP_LOG_ERROR("MCP server " + server_.name + ": " + wrapped.message);

    co_await teardown();
    clear_catalogs();
    state_ = close_requested_ ? ConnectionState::Disconnected : ConnectionState::Failed;
    close_requested_ = false;
    last_error_ = wrapped.message;
    co_return tl::unexpected(std::move(wrapped));
}

asio::awaitable<void> McpClient::close() {
    if (state_ == ConnectionState::Connecting) {
        // connect() owns the teardown; closing the core fails its pending
        // requests so the attempt unwinds promptly
        close_requested_ = true;
        if (core_) {
            co_await core_->close("Client closed");
        }
        co_return;
    }
    if (!core_ && !transport_) {
        if (state_ != ConnectionState::Failed) {
            state_ = ConnectionState::Disconnected;
        }
        co_return;
    }
    RAGMCP_LOG_INFO("Closing MCP client connection to " + server_.name);

    // Before teardown so the closing core does not report a disconnection
    state_ = ConnectionState::Disconnected;
    clear_catalogs();
    co_await teardown();
}

asio::awaitable<void> McpClient::teardown() {
    auto alive = alive_;
    if (core_) {
        co_await core_->close("Client closed");
        co_await core_->wait_stopped();
    } else if (transport_) {
        co_await transport_->async_stop();
    }
    if (!alive->load(std::memory_order_acquire)) {
        co_return;
    }
    core_.reset();
    transport_.reset();
}

asio::awaitable<McpResult<InitializeResult>> McpClient::reconnect() {
    auto alive = alive_;
    RAGMCP_LOG_INFO("Attempting to reconnect to " + server_.name);

    co_await close();

    if (config_.retry_delay.count() > 0) {
        asio::steady_timer delay(executor_, config_.retry_delay);
        asio::error_code ec;
        co_await delay.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (!alive->load(std::memory_order_acquire)) {
            co_return tl::unexpected(McpError::cancelled("Client destroyed during reconnect"));
        }
    }

    auto result = co_await connect();
    if (!result) {
        RAGMCP_LOG_ERROR("Reconnection to " + server_.name + " failed: " + result.error().message);
        if (on_reconnect_failed_) {
            try {
                on_reconnect_failed_(result.error());
            } catch (const std::exception& e) {
                RAGMCP_LOG_ERROR("Exception in reconnect-failed callback: " + std::string(e.what()));
            }
        }
    } else {
        RAGMCP_LOG_INFO("Reconnection to " + server_.name + " successful");
    }
    co_return result;
}

// ═══════════════════════════════════════════════════════════════════════════
// Operations
// ═══════════════════════════════════════════════════════════════════════════

McpResult<void> McpClient::require_initialized() const {
    if (!is_initialized()) {
        return tl::unexpected(McpError::connection_error("Client not initialized"));
    }
    return {};
}

bool McpClient::is_initialized() const noexcept {
    return state_ == ConnectionState::Connected && core_ && core_->is_ready();
}

asio::awaitable<McpResult<CallToolResult>> McpClient::call_tool(std::string name, Json arguments) {
    if (auto ready = require_initialized(); !ready) {
        co_return tl::unexpected(ready.error());
    }
    if (!has_tool(name)) {
        co_return tl::unexpected(McpError::tool_not_found(name));
    }

    auto result = co_await core_->send_request(
        std::string(methods::ToolsCall),
        Json{{"name", name}, {"arguments", arguments.is_null() ? Json::object() : std::move(arguments)}});
    if (!result) {
        RAGMCP_LOG_ERROR("Tool call failed: " + name + ": " + result.error().describe());
        co_return tl::unexpected(result.error());
    }
    co_return CallToolResult::from_json(*result);
}

asio::awaitable<McpResult<ReadResourceResult>> McpClient::read_resource(std::string uri) {
    if (auto ready = require_initialized(); !ready) {
        co_return tl::unexpected(ready.error());
    }
    if (!has_resource(uri)) {
        co_return tl::unexpected(McpError::resource_not_found(uri));
    }

    auto result = co_await core_->send_request(std::string(methods::ResourcesRead), Json{{"uri", uri}});
    if (!result) {
        RAGMCP_LOG_ERROR("Resource read failed: " + uri + ": " + result.error().describe());
        co_return tl::unexpected(result.error());
    }
    co_return ReadResourceResult::from_json(*result);
}

asio::awaitable<McpResult<GetPromptResult>> McpClient::get_prompt(std::string name, Json arguments) {
    if (auto ready = require_initialized(); !ready) {
        co_return tl::unexpected(ready.error());
    }
    if (!has_prompt(name)) {
        co_return tl::unexpected(McpError::prompt_not_found(name));
    }

    auto result = co_await core_->send_request(
        std::string(methods::PromptsGet),
        Json{{"name", name}, {"arguments", arguments.is_null() ? Json::object() : std::move(arguments)}});
    if (!result) {
        RAGMCP_LOG_ERROR("Prompt get failed: " + name + ": " + result.error().describe());
        co_return tl::unexpected(result.error());
    }
    co_return GetPromptResult::from_json(*result);
}

asio::awaitable<bool> McpClient::ping() {
    if (!is_initialized()) {
        RAGMCP_LOG_WARN("Ping skipped: client for " + server_.name + " not initialized");
        co_return false;
    }
    auto result = co_await core_->send_request(std::string(methods::ToolsList));
    if (!result) {
        RAGMCP_LOG_WARN("Ping failed for " + server_.name + ": " + result.error().message);
        co_return false;
    }
    co_return true;
}

asio::awaitable<McpResult<Json>> McpClient::request(std::string method, std::optional<Json> params) {
    if (auto ready = require_initialized(); !ready) {
        co_return tl::unexpected(ready.error());
    }
    co_return co_await core_->send_request(std::move(method), std::move(params));
}

asio::awaitable<McpResult<void>> McpClient::refresh_catalogs() {
    if (auto ready = require_initialized(); !ready) {
        co_return tl::unexpected(ready.error());
    }

    const Json advertised = core_->remote_capabilities();
    McpResult<void> outcome;
    if (advertised.contains("tools")) {
        if (auto loaded = co_await load_tools(); !loaded) {
            outcome = loaded;
        }
    }
    if (advertised.contains("resources")) {
        if (auto loaded = co_await load_resources(); !loaded) {
            outcome = loaded;
        }
    }
    if (advertised.contains("prompts")) {
        if (auto loaded = co_await load_prompts(); !loaded) {
            outcome = loaded;
        }
    }
    co_return outcome;
}

// ═══════════════════════════════════════════════════════════════════════════
// Catalogs
// ═══════════════════════════════════════════════════════════════════════════

bool McpClient::has_tool(std::string_view name) const {
    return contains_key(tools_, name, &Tool::name);
}

bool McpClient::has_resource(std::string_view uri) const {
    return contains_key(resources_, uri, &Resource::uri);
}

bool McpClient::has_prompt(std::string_view name) const {
    return contains_key(prompts_, name, &Prompt::name);
}

asio::awaitable<McpResult<void>> McpClient::load_tools() {
    auto result = co_await core_->send_request(std::string(methods::ToolsList));
    if (!result) {
        tools_.clear();
        co_return tl::unexpected(result.error());
    }
    tools_ = descriptors_from_json<Tool>(*result, "tools");
    RAGMCP_LOG_DEBUG("Loaded " + std::to_string(tools_.size()) + " tools from " + server_.name);
    co_return McpResult<void>{};
}

asio::awaitable<McpResult<void>> McpClient::load_resources() {
    auto result = co_await core_->send_request(std::string(methods::ResourcesList));
    if (!result) {
        resources_.clear();
        co_return tl::unexpected(result.error());
    }
    resources_ = descriptors_from_json<Resource>(*result, "resources");
    RAGMCP_LOG_DEBUG("Loaded " + std::to_string(resources_.size()) + " resources from " + server_.name);
    co_return McpResult<void>{};
}

asio::awaitable<McpResult<void>> McpClient::load_prompts() {
    auto result = co_await core_->send_request(std::string(methods::PromptsList));
    if (!result) {
        prompts_.clear();
        co_return tl::unexpected(result.error());
    }
    prompts_ = descriptors_from_json<Prompt>(*result, "prompts");
    RAGMCP_LOG_DEBUG("Loaded " + std::to_string(prompts_.size()) + " prompts from " + server_.name);
    co_return McpResult<void>{};
}

void McpClient::clear_catalogs() {
    tools_.clear();
    resources_.clear();
    prompts_.clear();
}

asio::awaitable<void> McpClient::reload_catalog(std::string list_method, std::shared_ptr<std::atomic<bool>> alive) {
    if (!alive->load(std::memory_order_acquire) || !is_initialized()) {
        co_return;
    }

    McpResult<void> loaded;
    if (list_method == methods::ToolsList) {
        loaded = co_await load_tools();
    } else if (list_method == methods::ResourcesList) {
        loaded = co_await load_resources();
    } else {
        loaded = co_await load_prompts();
    }

    if (!alive->load(std::memory_order_acquire)) {
        co_return;
    }
    if (!loaded) {
        RAGMCP_LOG_WARN("Catalog refresh (" + list_method + ") failed for " + server_.name +
                        ": " + loaded.error().message);
        co_return;
    }
    if (on_catalog_changed_) {
        try {
            on_catalog_changed_();
        } catch (const std::exception& e) {
            RAGMCP_LOG_ERROR("Exception in catalog-changed callback: " + std::string(e.what()));
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Notifications
// ═══════════════════════════════════════════════════════════════════════════

void McpClient::install_handlers(HandlerTable& table) {
    const auto forward = [this](const std::string& method, const Json& params) {
        if (on_notification_) {
            on_notification_(method, params);
        }
    };

    const std::pair<std::string_view, std::string_view> list_changes[] = {
        {methods::ToolsListChanged, methods::ToolsList},
        {methods::ResourcesListChanged, methods::ResourcesList},
        {methods::PromptsListChanged, methods::PromptsList},
    };
    for (const auto& [notification, list_method] : list_changes) {
        table.on_notification(std::string(notification),
            [this, forward, notification = std::string(notification), list_method = std::string(list_method)](
                const Json& params) {
                RAGMCP_LOG_INFO(server_.name + " reported " + notification);
                asio::co_spawn(executor_, reload_catalog(list_method, alive_), asio::detached);
                forward(notification, params);
            });
    }

    table.on_notification(std::string(methods::LogMessage), [this, forward](const Json& params) {
        const std::string level = params.value("level", "info");
        const std::string text = params.contains("data")
            ? (params["data"].is_string() ? params["data"].get<std::string>() : params["data"].dump())
            : std::string{};
        switch (log_level_from_mcp(level).value_or(LogLevel::Info)) {
            case LogLevel::Trace:
            case LogLevel::Debug:   RAGMCP_LOG_DEBUG("[" + server_.name + "] " + text); break;
            case LogLevel::Info:    RAGMCP_LOG_INFO("[" + server_.name + "] " + text); break;
            case LogLevel::Warning: RAGMCP_LOG_WARN("[" + server_.name + "] " + text); break;
            default:                RAGMCP_LOG_ERROR("[" + server_.name + "] " + text); break;
        }
        forward(std::string(methods::LogMessage), params);
    });

    table.on_notification(std::string(methods::Progress), [forward](const Json& params) {
        forward(std::string(methods::Progress), params);
    });
}

void McpClient::handle_disconnection(const std::string& reason) {
    if (state_ != ConnectionState::Connected) {
        return;
    }
    RAGMCP_LOG_WARN("MCP server " + server_.name + " disconnected: " + reason);

    state_ = ConnectionState::Disconnected;
    last_error_ = reason;
    clear_catalogs();

    if (on_disconnected_) {
        try {
            on_disconnected_(reason);
        } catch (const std::exception& e) {
            RAGMCP_LOG_ERROR("Exception in disconnected callback: " + std::string(e.what()));
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// State
// ═══════════════════════════════════════════════════════════════════════════

std::optional<Implementation> McpClient::server_info() const {
    if (!core_) {
        return std::nullopt;
    }
    return core_->remote_info();
}

std::optional<ServerCapabilities> McpClient::server_capabilities() const {
    if (!core_ || !core_->remote_info()) {
        return std::nullopt;
    }
    return ServerCapabilities::from_json(core_->remote_capabilities());
}

std::optional<std::string> McpClient::server_instructions() const {
    if (!core_) {
        return std::nullopt;
    }
    return core_->remote_instructions();
}

Json McpClient::status() const {
    Json j = {
        {"name", server_.name},
        {"transport", std::string(to_string(server_.transport))},
        {"state", std::string(to_string(state_))},
        {"initialized", is_initialized()},
        {"serverInfo", nullptr},
        {"toolCount", tools_.size()},
        {"resourceCount", resources_.size()},
        {"promptCount", prompts_.size()}
    };
    if (auto info = server_info()) {
        j["serverInfo"] = info->to_json();
    }
    if (last_error_) {
        j["lastError"] = *last_error_;
    }
    return j;
}

}  // namespace ragmcp
