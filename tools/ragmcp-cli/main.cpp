// ─────────────────────────────────────────────────────────────────────────────
// ragmcp-cli - Multi-Server MCP Client
// ─────────────────────────────────────────────────────────────────────────────
// Loads an application config, connects every configured MCP server through
// a ServerManager and runs one command against the merged catalog.
//
// Usage:
//   ragmcp-cli --config servers.json servers
//   ragmcp-cli --config servers.json tools --json
//   ragmcp-cli --config servers.json call echo '{"text":"hello"}'
//   ragmcp-cli --config servers.json read rag://system/stats
//   ragmcp-cli --config servers.json prompt rag_query_simple '{"question":"What is MCP?"}'
//   ragmcp-cli --config servers.json health
//
// Config file:
//   {
//     "logging": {"level": "warn"},
//     "manager": {"maxConcurrentConnections": 2, "healthCheckInterval": 0},
//     "servers": [
//       {"name": "echo", "transport": "stdio", "command": "ragmcp-echo-server"},
//       {"name": "remote", "transport": "http", "url": "http://127.0.0.1:3000/mcp"}
//     ]
//   }

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "ragmcp/config.hpp"
#include "ragmcp/log/logger.hpp"
#include "ragmcp/manager/server_manager.hpp"
#include "ragmcp/protocol/mcp_types.hpp"
#include "ragmcp/transport/stdio_transport.hpp"

#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <asio/use_awaitable.hpp>

#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace ragmcp;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << title << " ═══" << color::c(color::reset) << "\n\n";
}

void print_json(const Json& j) {
    std::cout << j.dump(2) << "\n";
}

void print_entries(const std::string& title, const std::vector<AggregatedEntry>& entries, bool json_output) {
    if (json_output) {
        Json output = Json::array();
        for (const auto& entry : entries) {
            output.push_back(entry.to_json());
        }
        print_json(output);
        return;
    }

    print_header(title);
    if (entries.empty()) {
        std::cout << color::c(color::dim) << "(none available)" << color::c(color::reset) << "\n";
        return;
    }
    for (const auto& entry : entries) {
        std::cout << color::c(color::bold) << color::c(color::yellow) << entry.public_name
                  << color::c(color::reset) << color::c(color::dim) << "  [" << entry.server_name << "]"
                  << color::c(color::reset) << "\n";
        const std::string description = entry.descriptor.value("description", "");
        if (!description.empty()) {
            std::cout << "  " << description << "\n";
        }
    }
}

void print_content(const std::vector<Json>& content) {
    for (const auto& item : content) {
        if (item.is_object() && item.value("type", "") == "text") {
            std::cout << item.value("text", "") << "\n";
        } else {
            print_json(item);
        }
    }
}

std::optional<Json> parse_arguments(const std::string& text) {
    if (text.empty()) {
        return Json::object();
    }
    Json args = Json::parse(text, nullptr, false);
    if (args.is_discarded() || !args.is_object()) {
        print_error("Arguments must be a JSON object: " + text);
        return std::nullopt;
    }
    return args;
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

struct Command {
    std::string name;
    std::vector<std::string> args;
    bool json_output{false};
};

asio::awaitable<int> cmd_servers(ServerManager& manager, bool json_output) {
    if (json_output) {
        print_json(manager.status());
        co_return 0;
    }
    print_header("Servers");
    for (const auto& [name, status] : manager.get_server_statuses()) {
        const bool up = status.state == ConnectionState::Connected;
        std::cout << color::c(up ? color::green : color::red) << (up ? "● " : "○ ")
                  << color::c(color::reset) << color::c(color::bold) << name << color::c(color::reset)
                  << "  " << to_string(status.state);
        if (status.last_error) {
            std::cout << color::c(color::dim) << "  (" << *status.last_error << ")" << color::c(color::reset);
        }
        std::cout << "\n";
    }
    co_return 0;
}

asio::awaitable<int> cmd_call(ServerManager& manager, const Command& cmd) {
    if (cmd.args.empty()) {
        print_error("Usage: call <tool> [json_args]");
        co_return 1;
    }
    auto args = parse_arguments(cmd.args.size() > 1 ? cmd.args[1] : "");
    if (!args) {
        co_return 1;
    }

    auto result = co_await manager.call_tool(cmd.args[0], std::move(*args));
    if (!result) {
        print_error(result.error().describe());
        co_return 1;
    }
    if (cmd.json_output) {
        print_json(result->to_json());
    } else {
        print_content(result->content);
    }
    co_return result->is_error ? 1 : 0;
}

asio::awaitable<int> cmd_read(ServerManager& manager, const Command& cmd) {
    if (cmd.args.empty()) {
        print_error("Usage: read <uri>");
        co_return 1;
    }

    auto result = co_await manager.read_resource(cmd.args[0]);
    if (!result) {
        print_error(result.error().describe());
        co_return 1;
    }
    if (cmd.json_output) {
        print_json(result->to_json());
    } else {
        for (const auto& contents : result->contents) {
            std::cout << color::c(color::dim) << contents.uri << color::c(color::reset) << "\n";
            std::cout << contents.text.value_or("") << "\n";
        }
    }
    co_return result->is_error ? 1 : 0;
}

asio::awaitable<int> cmd_prompt(ServerManager& manager, const Command& cmd) {
    if (cmd.args.empty()) {
        print_error("Usage: prompt <name> [json_args]");
        co_return 1;
    }
    auto args = parse_arguments(cmd.args.size() > 1 ? cmd.args[1] : "");
    if (!args) {
        co_return 1;
    }

    auto result = co_await manager.get_prompt(cmd.args[0], std::move(*args));
    if (!result) {
        print_error(result.error().describe());
        co_return 1;
    }
    if (cmd.json_output) {
        print_json(result->to_json());
    } else {
        if (result->description) {
            std::cout << color::c(color::dim) << *result->description << color::c(color::reset) << "\n";
        }
        for (const auto& message : result->messages) {
            std::cout << color::c(color::bold) << message.role << ": " << color::c(color::reset)
                      << (message.content.is_object() && message.content.contains("text")
                              ? message.content.value("text", "")
                              : message.content.dump())
                      << "\n";
        }
    }
    co_return 0;
}

asio::awaitable<int> cmd_health(ServerManager& manager, bool json_output) {
    auto summary = co_await manager.perform_health_check();
    if (json_output) {
        print_json({{"total", summary.total}, {"healthy", summary.healthy}});
    } else {
        std::cout << summary.healthy << "/" << summary.total << " servers healthy\n";
    }
    co_return summary.healthy == summary.total ? 0 : 1;
}

asio::awaitable<int> run_command(ServerManager& manager, Command cmd) {
    co_await manager.start();

    int exit_code = 0;
    const auto catalog = manager.get_aggregated_capabilities();
    if (cmd.name == "servers") {
        exit_code = co_await cmd_servers(manager, cmd.json_output);
    } else if (cmd.name == "tools") {
        print_entries("Tools", catalog.tools, cmd.json_output);
    } else if (cmd.name == "resources") {
        print_entries("Resources", catalog.resources, cmd.json_output);
    } else if (cmd.name == "prompts") {
        print_entries("Prompts", catalog.prompts, cmd.json_output);
    } else if (cmd.name == "call") {
        exit_code = co_await cmd_call(manager, cmd);
    } else if (cmd.name == "read") {
        exit_code = co_await cmd_read(manager, cmd);
    } else if (cmd.name == "prompt") {
        exit_code = co_await cmd_prompt(manager, cmd);
    } else if (cmd.name == "health") {
        exit_code = co_await cmd_health(manager, cmd.json_output);
    } else {
        print_error("Unknown command: " + cmd.name);
        exit_code = 1;
    }

    co_await manager.stop();
    co_return exit_code;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    // A server that exits mid-write must surface as EPIPE, not end this process
    ragmcp::ignore_sigpipe();

    cxxopts::Options options("ragmcp-cli", "Multi-server MCP client");

    options.add_options()
        ("c,config", "Application config file (JSON)", cxxopts::value<std::string>())
        ("command", "servers | tools | resources | prompts | call | read | prompt | health",
            cxxopts::value<std::string>()->default_value("servers"))
        ("args", "Command arguments", cxxopts::value<std::vector<std::string>>()->default_value(""))
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("l,log-level", "Override logging.level from the config", cxxopts::value<std::string>())
        ("h,help", "Print usage");
    options.parse_positional({"command", "args"});
    options.positional_help("<command> [args...]");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands:\n"
                      << "  servers                  connection state of every server\n"
                      << "  tools | resources | prompts\n"
                      << "                           merged catalog (collisions prefixed with the server name)\n"
                      << "  call <tool> [json]       call a tool\n"
                      << "  read <uri>               read a resource\n"
                      << "  prompt <name> [json]     render a prompt\n"
                      << "  health                   ping every connected server\n";
            return 0;
        }
        if (!result.count("config")) {
            print_error("--config is required");
            std::cout << "\n" << options.help() << "\n";
            return 1;
        }

        color::enabled = !result.count("no-color");

        auto app = load_config_file(result["config"].as<std::string>());
        if (!app) {
            print_error(app.error().describe());
            return 1;
        }
        if (result.count("log-level")) {
            app->logging.level = result["log-level"].as<std::string>();
        }
        auto logger = make_logger(app->logging);
        if (!logger) {
            print_error(logger.error().describe());
            return 1;
        }
        set_logger(std::move(*logger));

        Command cmd;
        cmd.name = result["command"].as<std::string>();
        for (auto& arg : result["args"].as<std::vector<std::string>>()) {
            if (!arg.empty()) {
                cmd.args.push_back(std::move(arg));
            }
        }
        cmd.json_output = result.count("json") > 0;

        asio::io_context io;
        ServerManager manager(io.get_executor(), app->servers, app->manager, app->client);

        int exit_code = 1;
        asio::co_spawn(io, run_command(manager, std::move(cmd)),
            [&exit_code](std::exception_ptr ep, int code) {
                if (ep) {
                    try {
                        std::rethrow_exception(ep);
                    } catch (const std::exception& e) {
                        print_error(e.what());
                    }
                    return;
                }
                exit_code = code;
            });
        io.run();
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
