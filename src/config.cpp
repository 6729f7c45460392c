#include "ragmcp/config.hpp"
#include "ragmcp/log/spdlog_logger.hpp"

#include <fstream>
#include <sstream>

namespace ragmcp {

namespace {

McpResult<void> type_error(const char* key, const char* expected, const Json& node) {
    return tl::unexpected(McpError::validation(key, expected, node.type_name()));
}

McpResult<void> read_string(const Json& j, const char* key, std::string& out) {
    if (j.contains(key) == false) return {};
    const Json& node = j.at(key);
    if (node.is_string() == false) return type_error(key, "string", node);
    out = node.get<std::string>();
    return {};
}

McpResult<void> read_bool(const Json& j, const char* key, bool& out) {
    if (j.contains(key) == false) return {};
    const Json& node = j.at(key);
    if (node.is_boolean() == false) return type_error(key, "boolean", node);
    out = node.get<bool>();
    return {};
}

template <typename Integer>
McpResult<void> read_unsigned(const Json& j, const char* key, Integer& out) {
    if (j.contains(key) == false) return {};
    const Json& node = j.at(key);
    const bool ok = node.is_number_unsigned() ||
                    (node.is_number_integer() && node.get<std::int64_t>() >= 0);
    if (ok == false) return type_error(key, "non-negative integer", node);
    out = static_cast<Integer>(node.get<std::uint64_t>());
    return {};
}

McpResult<void> read_int(const Json& j, const char* key, int& out) {
    if (j.contains(key) == false) return {};
    const Json& node = j.at(key);
    if (node.is_number_integer() == false) return type_error(key, "integer", node);
    out = node.get<int>();
    return {};
}

McpResult<void> read_millis(const Json& j, const char* key, std::chrono::milliseconds& out) {
    std::uint64_t raw = static_cast<std::uint64_t>(out.count());
    if (auto ok = read_unsigned(j, key, raw); !ok) return ok;
    out = std::chrono::milliseconds(raw);
    return {};
}

McpResult<void> read_string_list(const Json& j, const char* key, std::vector<std::string>& out) {
    if (j.contains(key) == false) return {};
    const Json& node = j.at(key);
    if (node.is_array() == false) return type_error(key, "array of strings", node);
    std::vector<std::string> values;
    for (const auto& item : node) {
        if (item.is_string() == false) return type_error(key, "array of strings", item);
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
    return {};
}

template <typename Map>
McpResult<void> read_string_map(const Json& j, const char* key, Map& out) {
    if (j.contains(key) == false) return {};
    const Json& node = j.at(key);
    if (node.is_object() == false) return type_error(key, "object of strings", node);
    for (const auto& [name, value] : node.items()) {
        if (value.is_string() == false) return type_error(key, "object of strings", value);
        out[name] = value.template get<std::string>();
    }
    return {};
}

McpResult<void> require_object(const Json& j, const char* what) {
    if (j.is_object() == false) return type_error(what, "object", j);
    return {};
}

}  // namespace

std::string_view to_string(TransportKind kind) noexcept {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Http:  return "http";
    }
    return "unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// ServerConfig -> transport configs
// ═══════════════════════════════════════════════════════════════════════════

StdioTransportConfig ServerConfig::stdio_config(const ProtocolConfig& protocol) const {
    StdioTransportConfig cfg;
    cfg.command = command;
    cfg.args = args;
    cfg.env = env;
    cfg.max_message_size = protocol.max_message_size;
    cfg.skip_command_validation = skip_command_validation;
    return cfg;
}

HttpClientConfig ServerConfig::http_config(const ProtocolConfig& protocol) const {
    HttpClientConfig cfg;
    cfg.url = url;
    cfg.headers = headers;
    cfg.request_timeout = protocol.request_timeout;
    cfg.max_message_size = protocol.max_message_size;
    cfg.open_event_stream = open_event_stream;
    return cfg;
}

// ═══════════════════════════════════════════════════════════════════════════
// JSON Loading
// ═══════════════════════════════════════════════════════════════════════════

McpResult<ProtocolConfig> protocol_config_from_json(const Json& j) {
    ProtocolConfig cfg;
    if (auto ok = require_object(j, "protocol"); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_millis(j, "requestTimeout", cfg.request_timeout); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_unsigned(j, "maxMessageSize", cfg.max_message_size); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_string(j, "protocolVersion", cfg.protocol_version); !ok) {
        return tl::unexpected(ok.error());
    }
    return cfg;
}

McpResult<HttpServerConfig> http_server_config_from_json(const Json& j) {
    HttpServerConfig cfg;
    if (auto ok = require_object(j, "http"); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_string(j, "host", cfg.host); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_unsigned(j, "port", cfg.port); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_string(j, "path", cfg.path); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_bool(j, "enableCors", cfg.enable_cors); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_unsigned(j, "maxMessageSize", cfg.max_message_size); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_unsigned(j, "maxBacklog", cfg.max_backlog); !ok) {
        return tl::unexpected(ok.error());
    }
    return cfg;
}

McpResult<ServerConfig> server_config_from_json(const Json& j) {
    ServerConfig cfg;
    if (auto ok = require_object(j, "server"); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_string(j, "name", cfg.name); !ok) {
        return tl::unexpected(ok.error());
    }
    if (cfg.name.empty()) {
        return tl::unexpected(McpError::validation("name", "non-empty string", "empty"));
    }

    std::string transport = "stdio";
    if (auto ok = read_string(j, "transport", transport); !ok) {
        return tl::unexpected(ok.error());
    }
    if (transport == "stdio") {
        cfg.transport = TransportKind::Stdio;
    } else if (transport == "http") {
        cfg.transport = TransportKind::Http;
    } else {
        return tl::unexpected(McpError::validation("transport", "one of stdio, http", transport));
    }

    if (auto ok = read_string(j, "command", cfg.command); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_string_list(j, "args", cfg.args); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_string_map(j, "env", cfg.env); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_bool(j, "skipCommandValidation", cfg.skip_command_validation); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_string(j, "url", cfg.url); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_string_map(j, "headers", cfg.headers); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_bool(j, "openEventStream", cfg.open_event_stream); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_bool(j, "enabled", cfg.enabled); !ok) {
        return tl::unexpected(ok.error());
    }

    if (cfg.transport == TransportKind::Stdio && cfg.command.empty()) {
        return tl::unexpected(McpError::validation("command", "non-empty string", "undefined"));
    }
    if (cfg.transport == TransportKind::Http && cfg.url.empty()) {
        return tl::unexpected(McpError::validation("url", "non-empty string", "undefined"));
    }
    return cfg;
}

McpResult<ServerManagerConfig> manager_config_from_json(const Json& j) {
    ServerManagerConfig cfg;
    if (auto ok = require_object(j, "manager"); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_unsigned(j, "maxConcurrentConnections", cfg.max_concurrent_connections); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_bool(j, "autoConnect", cfg.auto_connect); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_int(j, "retryAttempts", cfg.retry_attempts); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_millis(j, "retryDelay", cfg.retry_delay); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_millis(j, "healthCheckInterval", cfg.health_check_interval); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_millis(j, "slotPollInterval", cfg.slot_poll_interval); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_string(j, "prefixSeparator", cfg.prefix_separator); !ok) {
        return tl::unexpected(ok.error());
    }
    if (cfg.max_concurrent_connections == 0) {
        return tl::unexpected(McpError::validation("maxConcurrentConnections", "positive integer", "0"));
    }
    return cfg;
}

McpResult<ClientConfig> client_config_from_json(const Json& j) {
    ClientConfig cfg;
    if (auto ok = require_object(j, "client"); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_string(j, "name", cfg.client_name); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_string(j, "version", cfg.client_version); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_millis(j, "retryDelay", cfg.retry_delay); !ok) {
        return tl::unexpected(ok.error());
    }
    if (j.contains("protocol")) {
        auto protocol = protocol_config_from_json(j.at("protocol"));
        if (!protocol) return tl::unexpected(protocol.error());
        cfg.protocol = *protocol;
    }
    if (j.contains("capabilities")) {
        const Json& caps = j.at("capabilities");
        if (caps.is_object() == false) {
            return tl::unexpected(McpError::validation("capabilities", "object", caps.type_name()));
        }
        cfg.capabilities = caps;
    }
    return cfg;
}

McpResult<LoggingConfig> logging_config_from_json(const Json& j) {
    LoggingConfig cfg;
    if (auto ok = require_object(j, "logging"); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_string(j, "level", cfg.level); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_string(j, "backend", cfg.backend); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_string(j, "file", cfg.file); !ok) {
        return tl::unexpected(ok.error());
    }
    if (auto ok = read_bool(j, "async", cfg.async); !ok) {
        return tl::unexpected(ok.error());
    }
    return cfg;
}

McpResult<AppConfig> app_config_from_json(const Json& j) {
    AppConfig app;
    if (auto ok = require_object(j, "config"); !ok) {
        return tl::unexpected(ok.error());
    }

    if (j.contains("manager")) {
        auto manager = manager_config_from_json(j.at("manager"));
        if (!manager) return tl::unexpected(manager.error().wrap("manager"));
        app.manager = *manager;
    }
    if (j.contains("client")) {
        auto client = client_config_from_json(j.at("client"));
        if (!client) return tl::unexpected(client.error().wrap("client"));
        app.client = *client;
    }
    if (j.contains("logging")) {
        auto logging = logging_config_from_json(j.at("logging"));
        if (!logging) return tl::unexpected(logging.error().wrap("logging"));
        app.logging = *logging;
    }

    if (j.contains("servers")) {
        const Json& servers = j.at("servers");
        if (servers.is_array()) {
            for (const auto& entry : servers) {
                auto server = server_config_from_json(entry);
                if (!server) return tl::unexpected(server.error().wrap("servers"));
                app.servers.push_back(std::move(*server));
            }
        } else if (servers.is_object()) {
            for (const auto& [name, entry] : servers.items()) {
                Json named = entry;
                if (named.is_object() && named.contains("name") == false) {
                    named["name"] = name;
                }
                auto server = server_config_from_json(named);
                if (!server) return tl::unexpected(server.error().wrap("servers." + name));
                app.servers.push_back(std::move(*server));
            }
        } else {
            return tl::unexpected(McpError::validation("servers", "array or object", servers.type_name()));
        }
    }
    return app;
}

McpResult<AppConfig> load_config_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return tl::unexpected(McpError::invalid_params("Cannot open config file: " + path.string()));
    }
    std::stringstream contents;
    contents << in.rdbuf();

    Json document = Json::parse(contents.str(), nullptr, false);
    if (document.is_discarded()) {
        return tl::unexpected(McpError::parse_error("Invalid JSON in config file: " + path.string()));
    }
    return app_config_from_json(document);
}

McpResult<std::unique_ptr<ILogger>> make_logger(const LoggingConfig& config) {
    auto level = log_level_from_string(config.level);
    if (!level) {
        return tl::unexpected(McpError::validation("logging.level", "log level name", config.level));
    }

    std::unique_ptr<ILogger> logger;
    if (config.backend == "spdlog") {
        SpdlogOptions options;
        options.level = *level;
        options.file = config.file;
        options.async = config.async;
        try {
            logger = std::make_unique<SpdlogLogger>(options);
        } catch (const spdlog::spdlog_ex& e) {
            return tl::unexpected(McpError::invalid_params(
                "Cannot open log file " + config.file + ": " + e.what()));
        }
    } else if (config.backend == "console") {
        logger = std::make_unique<ConsoleLogger>(*level);
    } else if (config.backend == "none") {
        logger = std::make_unique<NullLogger>();
    } else {
        return tl::unexpected(McpError::validation("logging.backend", "spdlog, console or none", config.backend));
    }
    return logger;
}

}  // namespace ragmcp
