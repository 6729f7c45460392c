#include "ragmcp/manager/server_manager.hpp"
#include "ragmcp/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace ragmcp {

namespace {

std::string format_utc(const std::chrono::system_clock::time_point& tp) {
    const auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    gmtime_r(&time_t_val, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::vector<AggregatedEntry> entries_of(const std::map<std::string, AggregatedEntry>& map) {
    std::vector<AggregatedEntry> out;
    out.reserve(map.size());
    for (const auto& [name, entry] : map) {
        out.push_back(entry);
    }
    return out;
}

Json entries_to_json(const std::vector<AggregatedEntry>& entries) {
    Json list = Json::array();
    for (const auto& entry : entries) {
        list.push_back(entry.to_json());
    }
    return list;
}

}  // namespace

ClientFactory default_client_factory() {
    return [](asio::any_io_executor executor, const ServerConfig& server, const ClientConfig& client) {
        return std::make_shared<McpClient>(std::move(executor), server, client);
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// Status / Aggregation Types
// ─────────────────────────────────────────────────────────────────────────────

Json ServerStatus::to_json() const {
    Json j = {
        {"status", std::string(to_string(state))},
        {"lastConnected", nullptr},
        {"retryCount", retry_count}
    };
    if (last_connected) {
        j["lastConnected"] = format_utc(*last_connected);
    }
    if (last_error) {
        j["lastError"] = *last_error;
    }
    return j;
}

Json AggregatedEntry::to_json() const {
    return {
        {"publicName", public_name},
        {"serverName", server_name},
        {"descriptor", descriptor}
    };
}

Json AggregatedCapabilities::to_json() const {
    return {
        {"tools", entries_to_json(tools)},
        {"resources", entries_to_json(resources)},
        {"prompts", entries_to_json(prompts)}
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

ServerManager::ServerManager(
    asio::any_io_executor executor,
    std::vector<ServerConfig> servers,
    ServerManagerConfig config,
    ClientConfig client_config,
    ClientFactory factory,
    std::shared_ptr<IScheduler> scheduler
)
    : executor_(std::move(executor))
    , servers_(std::move(servers))
    , config_(std::move(config))
    , client_config_(std::move(client_config))
    , factory_(std::move(factory))
    , scheduler_(std::move(scheduler))
    , alive_(std::make_shared<std::atomic<bool>>(true))
{
    if (!scheduler_) {
        scheduler_ = std::make_shared<AsioScheduler>(executor_);
    }
}

ServerManager::~ServerManager() {
    alive_->store(false, std::memory_order_release);
    scheduler_->cancel_all();
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> ServerManager::start() {
    if (running_) {
        co_return;
    }
    auto alive = alive_;
    running_ = true;
    RAGMCP_LOG_INFO("Starting MCP server manager");

    if (config_.auto_connect) {
        std::vector<ServerConfig> enabled;
        std::copy_if(servers_.begin(), servers_.end(), std::back_inserter(enabled),
                     [](const ServerConfig& s) { return s.enabled; });
        RAGMCP_LOG_INFO("Connecting to " + std::to_string(enabled.size()) + " configured servers");

        if (!enabled.empty()) {
            // Connects run concurrently; the slot pool bounds them
            auto remaining = std::make_shared<std::size_t>(enabled.size());
            auto all_done = std::make_shared<asio::steady_timer>(
                executor_, std::chrono::steady_clock::time_point::max());

            for (auto& server : enabled) {
                std::string name = server.name;
                asio::co_spawn(
                    executor_,
                    add_server(std::move(server)),
                    [remaining, all_done, name](std::exception_ptr ep, McpResult<void> result) {
                        if (ep) {
                            try {
                                std::rethrow_exception(ep);
                            } catch (const std::exception& e) {
                                RAGMCP_LOG_ERROR("Connecting to " + name + " threw: " + e.what());
                            }
                        } else if (!result) {
                            RAGMCP_LOG_WARN("Failed to connect to server " + name + ": " + result.error().message);
                        }
                        if (--*remaining == 0) {
                            all_done->cancel();
                        }
                    });
            }

            asio::error_code ec;
            co_await all_done->async_wait(asio::redirect_error(asio::use_awaitable, ec));
            if (!alive->load(std::memory_order_acquire)) {
                co_return;
            }
            RAGMCP_LOG_INFO("Connected to " + std::to_string(clients_.size()) + " servers out of " +
                            std::to_string(enabled.size()));
        }
    }

    if (running_) {
        schedule_health_check();
        RAGMCP_LOG_INFO("MCP server manager started");
    }
}

asio::awaitable<void> ServerManager::stop() {
    auto alive = alive_;
    RAGMCP_LOG_INFO("Stopping MCP server manager");

    running_ = false;
    ++epoch_;
    scheduler_->cancel_all();

    auto clients = std::move(clients_);
    clients_.clear();
    statuses_.clear();
    tools_.clear();
    resources_.clear();
    prompts_.clear();

    for (auto& [name, client] : clients) {
        co_await client->close();
        if (!alive->load(std::memory_order_acquire)) {
            co_return;
        }
    }
    RAGMCP_LOG_INFO("MCP server manager stopped");
}

// ═══════════════════════════════════════════════════════════════════════════
// Servers
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<McpResult<void>> ServerManager::add_server(ServerConfig config) {
    const std::string name = config.name;
    if (name.empty()) {
        co_return tl::unexpected(McpError::invalid_params("Server name must not be empty"));
    }
    auto existing = statuses_.find(name);
    if (clients_.contains(name) ||
        (existing != statuses_.end() && existing->second.state == ConnectionState::Connecting)) {
        co_return tl::unexpected(McpError::invalid_params("Server " + name + " already exists"));
    }

    RAGMCP_LOG_INFO("Adding server: " + name);
    const int prior_failures = existing != statuses_.end() ? existing->second.retry_count : 0;
    statuses_[name] = ServerStatus{ConnectionState::Connecting, std::nullopt, prior_failures, std::nullopt};

    auto alive = alive_;
    const std::uint64_t epoch = epoch_;

    co_await acquire_slot();
    if (!alive->load(std::memory_order_acquire)) {
        co_return tl::unexpected(McpError::cancelled("Server manager destroyed"));
    }

    std::shared_ptr<McpClient> client = factory_(executor_, config, client_config_);
    if (!client) {
        release_slot();
        auto& status = statuses_[name];
        status.state = ConnectionState::Failed;
        status.retry_count += 1;
        status.last_error = "Client factory returned null";
        co_return tl::unexpected(McpError::internal_error("Could not create client for " + name));
    }
    wire_client(*client, name);

    auto connected = co_await client->connect();
    if (!alive->load(std::memory_order_acquire)) {
        co_return tl::unexpected(McpError::cancelled("Server manager destroyed"));
    }
    release_slot();

    if (epoch != epoch_) {
        // stop() ran meanwhile
        co_await client->close();
        co_return tl::unexpected(McpError::cancelled("Server manager stopped"));
    }

    if (!connected) {
        RAGMCP_LOG_ERROR("Failed to add server " + name + ": " + connected.error().message);
        auto& status = statuses_[name];
        status.state = ConnectionState::Failed;
        status.retry_count += 1;
        status.last_error = connected.error().message;
        co_return tl::unexpected(connected.error());
    }

    clients_.emplace(name, client);
    auto& status = statuses_[name];
    status.state = ConnectionState::Connected;
    status.last_connected = std::chrono::system_clock::now();
    status.retry_count = 0;
    status.last_error.reset();

    merge_capabilities(*client);
    RAGMCP_LOG_INFO("Successfully connected to server: " + name);
    emit(on_server_connected_, name, "server_connected");
    co_return McpResult<void>{};
}

asio::awaitable<McpResult<void>> ServerManager::remove_server(std::string name) {
    auto it = clients_.find(name);
    if (it == clients_.end()) {
        co_return tl::unexpected(McpError::invalid_params("Server " + name + " not found"));
    }
    RAGMCP_LOG_INFO("Removing server: " + name);

    // Unpublished before closing so routing never reaches a closing client
    auto client = std::move(it->second);
    clients_.erase(it);
    statuses_.erase(name);
    purge_capabilities(name);

    auto alive = alive_;
    co_await client->close();
    if (!alive->load(std::memory_order_acquire)) {
        co_return McpResult<void>{};
    }

    RAGMCP_LOG_INFO("Removed server: " + name);
    emit(on_server_removed_, name, "server_removed");
    co_return McpResult<void>{};
}

std::shared_ptr<McpClient> ServerManager::client(const std::string& name) const {
    auto it = clients_.find(name);
    return it != clients_.end() ? it->second : nullptr;
}

std::vector<std::string> ServerManager::connected_servers() const {
    std::vector<std::string> names;
    for (const auto& [name, client] : clients_) {
        if (client->is_connected()) {
            names.push_back(name);
        }
    }
    return names;
}

// ─────────────────────────────────────────────────────────────────────────────
// Slot Pool
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<void> ServerManager::acquire_slot() {
    auto alive = alive_;
    const std::size_t cap = std::max<std::size_t>(1, config_.max_concurrent_connections);
    while (active_connections_ >= cap) {
        asio::steady_timer poll(executor_, config_.slot_poll_interval);
        asio::error_code ec;
        co_await poll.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (!alive->load(std::memory_order_acquire)) {
            co_return;
        }
    }
    ++active_connections_;
}

void ServerManager::release_slot() noexcept {
    if (active_connections_ > 0) {
        --active_connections_;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Aggregation
// ═══════════════════════════════════════════════════════════════════════════

void ServerManager::merge_capabilities(const McpClient& client) {
    const std::string& server = client.name();

    const auto publish = [&](AggregateMap& map, const std::string& key, Json descriptor, const char* what) {
        std::string public_name = key;
        if (auto clash = map.find(public_name); clash != map.end() && clash->second.server_name != server) {
            public_name = server + config_.prefix_separator + key;
            if (map.contains(public_name)) {
                RAGMCP_LOG_WARN(std::string("Skipping ") + what + " " + key + " from " + server +
                                ": " + public_name + " is taken");
                return;
            }
            RAGMCP_LOG_INFO(std::string(what) + " " + key + " from " + server + " published as " + public_name);
        }
        map[public_name] = AggregatedEntry{public_name, server, key, std::move(descriptor)};
    };

    for (const auto& tool : client.tools()) {
        publish(tools_, tool.name, tool.to_json(), "tool");
    }
    for (const auto& resource : client.resources()) {
        publish(resources_, resource.uri, resource.to_json(), "resource");
    }
    for (const auto& prompt : client.prompts()) {
        publish(prompts_, prompt.name, prompt.to_json(), "prompt");
    }

    RAGMCP_LOG_DEBUG("Updated capabilities from " + server + ": " + std::to_string(client.tools().size()) +
                     " tools, " + std::to_string(client.resources().size()) + " resources, " +
                     std::to_string(client.prompts().size()) + " prompts");
    emit(on_capabilities_updated_, server, "capabilities_updated");
}

void ServerManager::purge_capabilities(const std::string& server_name) {
    const auto owned = [&](const auto& item) { return item.second.server_name == server_name; };
    std::erase_if(tools_, owned);
    std::erase_if(resources_, owned);
    std::erase_if(prompts_, owned);
    RAGMCP_LOG_DEBUG("Removed capabilities from " + server_name);
}

AggregatedCapabilities ServerManager::get_aggregated_capabilities() const {
    return AggregatedCapabilities{entries_of(tools_), entries_of(resources_), entries_of(prompts_)};
}

// ═══════════════════════════════════════════════════════════════════════════
// Client Events / Reconnection
// ═══════════════════════════════════════════════════════════════════════════

void ServerManager::wire_client(McpClient& client, const std::string& name) {
    client.on_disconnected([this, alive = alive_, name](const std::string& reason) {
        if (alive->load(std::memory_order_acquire)) {
            handle_client_disconnection(name, reason);
        }
    });
    client.on_catalog_changed([this, alive = alive_, name] {
        if (!alive->load(std::memory_order_acquire)) {
            return;
        }
        auto it = clients_.find(name);
        if (it == clients_.end() || !it->second->is_connected()) {
            return;
        }
        purge_capabilities(name);
        merge_capabilities(*it->second);
    });
}

void ServerManager::handle_client_disconnection(const std::string& name, const std::string& reason) {
    if (!clients_.contains(name)) {
        return;
    }
    RAGMCP_LOG_WARN("Server " + name + " disconnected: " + reason);

    purge_capabilities(name);
    auto& status = statuses_[name];
    status.state = ConnectionState::Disconnected;
    status.last_error = reason;

    emit(on_server_disconnected_, name, "server_disconnected");

    if (running_) {
        schedule_reconnection(name);
    }
}

void ServerManager::schedule_reconnection(const std::string& name) {
    auto it = statuses_.find(name);
    if (it == statuses_.end()) {
        return;
    }
    auto plan = plan_retry(it->second.retry_count, config_.retry_attempts, config_.retry_delay);
    if (!plan) {
        it->second.state = ConnectionState::Failed;
        RAGMCP_LOG_WARN("Max retry attempts reached for " + name);
        emit(on_server_failed_, name, "server_failed");
        return;
    }

    RAGMCP_LOG_INFO("Scheduling reconnection for " + name + " in " +
                    std::to_string(plan->next_delay.count()) + "ms (attempt " +
                    std::to_string(plan->attempt) + ")");
    scheduler_->schedule(plan->next_delay, [this, alive = alive_, name] {
        if (alive->load(std::memory_order_acquire) && running_) {
            asio::co_spawn(executor_, attempt_reconnect(name), asio::detached);
        }
    });
}

asio::awaitable<void> ServerManager::attempt_reconnect(std::string name) {
    auto it = clients_.find(name);
    if (!running_ || it == clients_.end() || it->second->is_connected()) {
        co_return;
    }
    auto client = it->second;
    auto alive = alive_;
    const std::uint64_t epoch = epoch_;
    statuses_[name].state = ConnectionState::Connecting;

    co_await acquire_slot();
    if (!alive->load(std::memory_order_acquire)) {
        co_return;
    }
    auto connected = co_await client->connect();
    if (!alive->load(std::memory_order_acquire)) {
        co_return;
    }
    release_slot();

    auto current = clients_.find(name);
    if (epoch != epoch_ || current == clients_.end() || current->second != client) {
        // Removed or stopped meanwhile; the client is no longer ours to publish
        co_await client->close();
        co_return;
    }

    auto& status = statuses_[name];
    if (!connected) {
        status.retry_count += 1;
        status.state = ConnectionState::Disconnected;
        status.last_error = connected.error().message;
        RAGMCP_LOG_ERROR("Reconnection failed for " + name + ": " + connected.error().message);
        schedule_reconnection(name);
        co_return;
    }

    status.state = ConnectionState::Connected;
    status.last_connected = std::chrono::system_clock::now();
    status.retry_count = 0;
    status.last_error.reset();

    merge_capabilities(*client);
    RAGMCP_LOG_INFO("Reconnected to server: " + name);
    emit(on_server_connected_, name, "server_connected");
}

// ═══════════════════════════════════════════════════════════════════════════
// Routing
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<McpResult<CallToolResult>> ServerManager::call_tool(std::string public_name, Json arguments) {
    auto entry = tools_.find(public_name);
    if (entry == tools_.end()) {
        co_return tl::unexpected(McpError::tool_not_found(public_name));
    }
    auto owner = client(entry->second.server_name);
    if (!owner) {
        co_return tl::unexpected(McpError::connection_error("Server " + entry->second.server_name + " not connected"));
    }
    const std::string original = entry->second.original_name;
    RAGMCP_LOG_DEBUG("Calling tool " + public_name + " on server " + owner->name());

    auto result = co_await owner->call_tool(original, std::move(arguments));
    if (!result) {
        RAGMCP_LOG_ERROR("Tool call failed: " + public_name + ": " + result.error().message);
    }
    co_return result;
}

asio::awaitable<McpResult<ReadResourceResult>> ServerManager::read_resource(std::string public_uri) {
    auto entry = resources_.find(public_uri);
    if (entry == resources_.end()) {
        co_return tl::unexpected(McpError::resource_not_found(public_uri));
    }
    auto owner = client(entry->second.server_name);
    if (!owner) {
        co_return tl::unexpected(McpError::connection_error("Server " + entry->second.server_name + " not connected"));
    }
    const std::string original = entry->second.original_name;
    RAGMCP_LOG_DEBUG("Reading resource " + public_uri + " from server " + owner->name());

    auto result = co_await owner->read_resource(original);
    if (!result) {
        RAGMCP_LOG_ERROR("Resource read failed: " + public_uri + ": " + result.error().message);
    }
    co_return result;
}

asio::awaitable<McpResult<GetPromptResult>> ServerManager::get_prompt(std::string public_name, Json arguments) {
    auto entry = prompts_.find(public_name);
    if (entry == prompts_.end()) {
        co_return tl::unexpected(McpError::prompt_not_found(public_name));
    }
    auto owner = client(entry->second.server_name);
    if (!owner) {
        co_return tl::unexpected(McpError::connection_error("Server " + entry->second.server_name + " not connected"));
    }
    const std::string original = entry->second.original_name;
    RAGMCP_LOG_DEBUG("Getting prompt " + public_name + " from server " + owner->name());

    auto result = co_await owner->get_prompt(original, std::move(arguments));
    if (!result) {
        RAGMCP_LOG_ERROR("Prompt get failed: " + public_name + ": " + result.error().message);
    }
    co_return result;
}

// ═══════════════════════════════════════════════════════════════════════════
// Health
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<HealthSummary> ServerManager::perform_health_check() {
    RAGMCP_LOG_DEBUG("Performing health check");

    std::vector<std::shared_ptr<McpClient>> targets;
    for (const auto& [name, client] : clients_) {
        if (client->is_connected()) {
            targets.push_back(client);
        }
    }

    auto alive = alive_;
    HealthSummary summary{targets.size(), 0};
    for (const auto& client : targets) {
        const bool healthy = co_await client->ping();
        if (!alive->load(std::memory_order_acquire)) {
            co_return summary;
        }
        if (healthy) {
            ++summary.healthy;
        } else {
            RAGMCP_LOG_WARN("Health check failed for " + client->name());
            emit(on_server_unhealthy_, client->name(), "server_unhealthy");
        }
    }

    RAGMCP_LOG_DEBUG("Health check completed: " + std::to_string(summary.healthy) + "/" +
                     std::to_string(summary.total) + " servers healthy");
    if (on_health_check_completed_) {
        try {
            on_health_check_completed_(summary);
        } catch (const std::exception& e) {
            RAGMCP_LOG_ERROR("Exception in health_check_completed listener: " + std::string(e.what()));
        }
    }
    co_return summary;
}

void ServerManager::schedule_health_check() {
    if (config_.health_check_interval.count() <= 0) {
        return;
    }
    scheduler_->schedule(config_.health_check_interval, [this, alive = alive_] {
        if (alive->load(std::memory_order_acquire) && running_) {
            asio::co_spawn(executor_, health_tick(), asio::detached);
        }
    });
}

asio::awaitable<void> ServerManager::health_tick() {
    auto alive = alive_;
    co_await perform_health_check();
    if (alive->load(std::memory_order_acquire) && running_) {
        schedule_health_check();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// State
// ═══════════════════════════════════════════════════════════════════════════

std::optional<ServerStatus> ServerManager::server_status(const std::string& name) const {
    auto it = statuses_.find(name);
    if (it == statuses_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Json ServerManager::status() const {
    Json servers = Json::object();
    for (const auto& [name, status] : statuses_) {
        Json entry = status.to_json();
        auto owner = clients_.find(name);
        entry["isConnected"] = owner != clients_.end() && owner->second->is_connected();
        entry["clientStatus"] = owner != clients_.end() ? owner->second->status() : Json(nullptr);
        servers[name] = std::move(entry);
    }

    return {
        {"isRunning", running_},
        {"connectedServersCount", connected_servers().size()},
        {"aggregatedToolsCount", tools_.size()},
        {"aggregatedResourcesCount", resources_.size()},
        {"aggregatedPromptsCount", prompts_.size()},
        {"connectedServers", connected_servers()},
        {"serverStatuses", std::move(servers)}
    };
}

void ServerManager::emit(const ServerEventCallback& cb, const std::string& name, const char* event) const {
    if (!cb) {
        return;
    }
    try {
        cb(name);
    } catch (const std::exception& e) {
        RAGMCP_LOG_ERROR(std::string("Exception in ") + event + " listener: " + e.what());
    }
}

}  // namespace ragmcp
