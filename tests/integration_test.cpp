// ─────────────────────────────────────────────────────────────────────────────
// Integration Tests - Client and Server End to End
// ─────────────────────────────────────────────────────────────────────────────
// McpClient against real servers: ragmcp-echo-server spawned over stdio,
// and an in-process McpServer listening over HTTP on a free port.

#include <catch2/catch_test_macros.hpp>

#include "ragmcp/client/mcp_client.hpp"
#include "ragmcp/server/in_memory_rag.hpp"
#include "ragmcp/server/mcp_server.hpp"
#include "ragmcp/transport/http_server_transport.hpp"

#include "mocks/async_helpers.hpp"

#include <asio/io_context.hpp>

#include <filesystem>
#include <fstream>

using namespace ragmcp;
using namespace ragmcp::testing;

#ifndef RAGMCP_ECHO_SERVER_PATH
#error "RAGMCP_ECHO_SERVER_PATH must name the ragmcp-echo-server binary"
#endif

namespace {

ServerConfig echo_server() {
    ServerConfig server;
    server.name = "echo";
    server.transport = TransportKind::Stdio;
    server.command = RAGMCP_ECHO_SERVER_PATH;
    server.args = {"--log-level", "off"};
    // Build trees live outside the allowed command prefixes
    server.skip_command_validation = true;
    return server;
}

std::string first_text(const CallToolResult& result) {
    return result.content.at(0).at("text").get<std::string>();
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Stdio
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Client drives the echo server over stdio", "[integration][stdio]") {
    asio::io_context io;
    McpClient client(io.get_executor(), echo_server());

    auto init = run_sync(io, client.connect());
    REQUIRE(init.has_value());
    REQUIRE(init->server_info.name == "ragmcp-echo-server");
    REQUIRE(client.is_connected());

    REQUIRE(client.tools().size() == 5);
    REQUIRE(client.has_tool("echo"));
    REQUIRE(client.has_tool("rag_query"));
    REQUIRE(client.resources().size() == 4);
    REQUIRE(client.prompts().size() == 3);

    SECTION("provider tools") {
        auto echoed = run_sync(io, client.call_tool("echo", Json{{"text", "hello"}}));
        REQUIRE(echoed.has_value());
        REQUIRE_FALSE(echoed->is_error);
        REQUIRE(Json::parse(first_text(*echoed))["echo"] == "hello");

        auto failed = run_sync(io, client.call_tool("fail"));
        REQUIRE(failed.has_value());
        REQUIRE(failed->is_error);
    }

    SECTION("index then query") {
        const auto path = std::filesystem::temp_directory_path() / "ragmcp_integration_docs.md";
        {
            std::ofstream out(path, std::ios::trunc);
            out << "Asio provides asynchronous networking.\n\nCatch2 is a test framework.\n";
        }

        auto indexed = run_sync(io, client.call_tool("rag_index_documents",
            Json{{"sources", {{"localFiles", Json::array({path.string()})}}}}));
        REQUIRE(indexed.has_value());
        REQUIRE_FALSE(indexed->is_error);
        REQUIRE(first_text(*indexed).rfind("Documents indexed successfully: 1 documents", 0) == 0);

        auto answer = run_sync(io, client.call_tool("rag_query", Json{{"question", "Which test framework?"}}));
        REQUIRE(answer.has_value());
        REQUIRE(first_text(*answer).find("Catch2") != std::string::npos);

        auto stats = run_sync(io, client.read_resource("rag://system/stats"));
        REQUIRE(stats.has_value());
        const Json document = Json::parse(stats->contents.at(0).text.value());
        REQUIRE(document["queries"] == 1);

        std::filesystem::remove(path);
    }

    SECTION("prompts and liveness") {
        auto prompt = run_sync(io, client.get_prompt("rag_query_simple", Json{{"question", "why?"}}));
        REQUIRE(prompt.has_value());
        REQUIRE(prompt->messages.at(0).content["text"] ==
                "Please answer the following question using the RAG system: why?");

        REQUIRE(run_sync(io, client.ping()));
    }

    run_sync(io, client.close());
    REQUIRE(client.state() == ConnectionState::Disconnected);
}

TEST_CASE("A server that exits is reported as a disconnection", "[integration][stdio]") {
    asio::io_context io;
    auto server = echo_server();
    server.args.push_back("--bogus-flag");  // rejected by the option parser; exits at once

    ClientConfig config;
    config.protocol.request_timeout = std::chrono::milliseconds(3000);

    McpClient client(io.get_executor(), server, config);
    auto init = run_sync(io, client.connect());
    REQUIRE_FALSE(init.has_value());
    REQUIRE(init.error().message.rfind("Connection failed", 0) == 0);
    REQUIRE_FALSE(client.is_connected());
}

// ═══════════════════════════════════════════════════════════════════════════
// HTTP
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Client talks to an in-process server over HTTP", "[integration][http]") {
    asio::io_context io;

    HttpServerConfig listen;
    listen.port = 0;
    auto owned = std::make_unique<HttpServerTransport>(io.get_executor(), listen);
    HttpServerTransport* http = owned.get();

    McpServer server(std::move(owned), std::make_shared<InMemoryRagSystem>());
    auto served = std::make_shared<bool>(false);
    asio::co_spawn(io, server.run(), [served](std::exception_ptr ep) {
        if (ep) {
            std::rethrow_exception(ep);
        }
        *served = true;
    });
    REQUIRE(run_until(io, [http] { return http->is_running(); }));

    ServerConfig remote;
    remote.name = "remote";
    remote.transport = TransportKind::Http;
    remote.url = "http://127.0.0.1:" + std::to_string(http->bound_port()) + "/mcp";

    McpClient client(io.get_executor(), remote);
    auto init = run_sync(io, client.connect());
    REQUIRE(init.has_value());
    REQUIRE(init->server_info.name == "ragmcp-server");
    REQUIRE(client.tools().size() == 3);

    auto status = run_sync(io, client.call_tool("rag_status"));
    REQUIRE(status.has_value());
    REQUIRE(Json::parse(first_text(*status))["initialized"] == true);

    // Closing sends DELETE, which ends the server's session
    run_sync(io, client.close());
    REQUIRE(run_until(io, [served] { return *served; }));
}
