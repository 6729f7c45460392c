// ─────────────────────────────────────────────────────────────────────────────
// ragmcp-echo-server - Demo MCP Server
// ─────────────────────────────────────────────────────────────────────────────
// Serves the built-in RAG catalog over an in-memory retrieval system plus two
// provider tools:
//   echo   {"text": string}  -> {"success": true, "echo": text}
//   fail   {}                -> {"success": false, "error": "..."} (isError)
//
// Usage:
//   ragmcp-echo-server                              # stdio (stdout = protocol)
//   ragmcp-echo-server --http --port 3000           # HTTP on 127.0.0.1:3000/mcp
//   ragmcp-echo-server --docs notes.md --docs faq.md
//
// Logs go to stderr.

#include <cxxopts.hpp>

#include "ragmcp/config.hpp"
#include "ragmcp/server/in_memory_rag.hpp"
#include "ragmcp/server/mcp_server.hpp"
#include "ragmcp/transport/http_server_transport.hpp"
#include "ragmcp/transport/stdio_transport.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace ragmcp;

// ═══════════════════════════════════════════════════════════════════════════
// Echo Tool Provider
// ═══════════════════════════════════════════════════════════════════════════

class EchoToolProvider final : public IToolProvider {
public:
    [[nodiscard]] std::vector<Tool> list() const override {
        Tool echo;
        echo.name = "echo";
        echo.description = "Echo the given text back";
        echo.input_schema = {
            {"type", "object"},
            {"properties", {{"text", {{"type", "string"}, {"description", "Text to echo"}}}}},
            {"required", {"text"}}
        };

        Tool fail;
        fail.name = "fail";
        fail.description = "Always reports a failed execution";
        fail.input_schema = {{"type", "object"}, {"properties", Json::object()}};

        return {echo, fail};
    }

    [[nodiscard]] asio::awaitable<McpResult<Json>> call(std::string name, Json arguments) override {
        if (name == "echo") {
            if (!arguments.contains("text") || !arguments["text"].is_string()) {
                co_return tl::unexpected(McpError::invalid_params("echo requires a string 'text'"));
            }
            co_return Json{{"success", true}, {"echo", arguments["text"]}};
        }
        if (name == "fail") {
            co_return Json{{"success", false}, {"error", "This tool always fails"}};
        }
        co_return tl::unexpected(McpError::tool_not_found(name));
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    // A client that hangs up mid-write must surface as EPIPE, not end this process
    ragmcp::ignore_sigpipe();

    cxxopts::Options options("ragmcp-echo-server", "Demo MCP server (echo tools + in-memory RAG)");

    options.add_options()
        ("http", "Serve over HTTP instead of stdio")
        ("host", "HTTP bind address", cxxopts::value<std::string>()->default_value("127.0.0.1"))
        ("p,port", "HTTP port (0 = any free port)", cxxopts::value<int>()->default_value("3000"))
        ("path", "HTTP endpoint path", cxxopts::value<std::string>()->default_value("/mcp"))
        ("d,docs", "Local file to index at startup (repeatable)",
            cxxopts::value<std::vector<std::string>>()->default_value(""))
        ("no-rag", "Serve only the provider tools")
        ("l,log-level", "trace | debug | info | warn | error | off",
            cxxopts::value<std::string>()->default_value("info"))
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        LoggingConfig logging;
        logging.level = result["log-level"].as<std::string>();
        auto logger = make_logger(logging);
        if (!logger) {
            std::cerr << "Error: " << logger.error().describe() << "\n";
            return 1;
        }
        set_logger(std::move(*logger));

        asio::io_context io;

        std::shared_ptr<InMemoryRagSystem> rag;
        if (!result.count("no-rag")) {
            rag = std::make_shared<InMemoryRagSystem>();
            std::vector<std::string> files;
            for (const auto& path : result["docs"].as<std::vector<std::string>>()) {
                if (!path.empty()) {
                    files.push_back(path);
                }
            }
            if (!files.empty()) {
                asio::co_spawn(io, rag->index_documents({}, files),
                    [](std::exception_ptr ep, McpResult<IndexSummary> indexed) {
                        if (ep) {
                            RAGMCP_LOG_ERROR("Startup indexing threw");
                        } else if (!indexed) {
                            RAGMCP_LOG_ERROR("Startup indexing failed: " + indexed.error().message);
                        }
                    });
            }
        }

        std::unique_ptr<IAsyncTransport> transport;
        HttpServerTransport* http = nullptr;
        if (result.count("http")) {
            HttpServerConfig config;
            config.host = result["host"].as<std::string>();
            config.port = static_cast<std::uint16_t>(result["port"].as<int>());
            config.path = result["path"].as<std::string>();
            auto server_transport = std::make_unique<HttpServerTransport>(io.get_executor(), config);
            http = server_transport.get();
            transport = std::move(server_transport);
        } else {
            transport = std::make_unique<StdioTransport>(io.get_executor(), StdioEndpoint{});
        }

        McpServerOptions server_options;
        server_options.info = Implementation{"ragmcp-echo-server", "1.0.0"};
        McpServer server(std::move(transport), rag, std::make_shared<EchoToolProvider>(), server_options);

        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&server, &io](const asio::error_code& ec, int /*signal*/) {
            if (!ec) {
                asio::co_spawn(io, server.stop(), asio::detached);
            }
        });

        asio::co_spawn(io, [&]() -> asio::awaitable<void> {
            auto started = co_await server.start();
            if (!started) {
                RAGMCP_LOG_ERROR("Failed to start: " + started.error().describe());
                signals.cancel();
                co_return;
            }
            if (http) {
                // Scripts wait for this line to learn the bound port
                std::cerr << "listening on http://" << result["host"].as<std::string>() << ":"
                          << http->bound_port() << result["path"].as<std::string>() << std::endl;
            }
            co_await server.run();
            signals.cancel();
        }, asio::detached);

        io.run();
        return 0;

    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
