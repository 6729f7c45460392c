// ─────────────────────────────────────────────────────────────────────────────
// McpServer Tests
// ─────────────────────────────────────────────────────────────────────────────
// The server runs over MockTransport; the test plays the MCP client by
// injecting envelopes and reading the recorded replies.

#include <catch2/catch_test_macros.hpp>

#include "ragmcp/server/in_memory_rag.hpp"
#include "ragmcp/server/mcp_server.hpp"

#include "mocks/async_helpers.hpp"
#include "mocks/mock_transport.hpp"

#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using namespace ragmcp;
using namespace ragmcp::testing;

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Fixtures
// ─────────────────────────────────────────────────────────────────────────────

class StubToolProvider final : public IToolProvider {
public:
    [[nodiscard]] std::vector<Tool> list() const override {
        return {
            Tool{"web_search", std::string("Search the web"), Json{{"type", "object"}}},
            Tool{"flaky_api", std::string("Always fails"), Json{{"type", "object"}}}
        };
    }

    [[nodiscard]] asio::awaitable<McpResult<Json>> call(std::string name, Json arguments) override {
        calls.push_back(name);
        if (name == "flaky_api") {
            co_return Json{{"success", false}, {"error", "upstream unavailable"}};
        }
        co_return Json{{"success", true}, {"results", Json::array({arguments.value("query", std::string())})}};
    }

    std::vector<std::string> calls;
};

InMemoryRagSystem::Options small_chunks() {
    InMemoryRagSystem::Options options;
    options.max_chunk_size = 40;
    return options;
}

struct ServerHarness {
    asio::io_context io;
    MockTransport* transport{nullptr};
    std::shared_ptr<InMemoryRagSystem> rag;
    std::shared_ptr<StubToolProvider> provider = std::make_shared<StubToolProvider>();
    std::unique_ptr<McpServer> server;
    std::shared_ptr<bool> run_done = std::make_shared<bool>(false);
    int next_id{100};

    explicit ServerHarness(bool with_rag = true, McpServerOptions options = {}) {
        auto owned = std::make_unique<MockTransport>(io.get_executor());
        transport = owned.get();
        if (with_rag) {
            rag = std::make_shared<InMemoryRagSystem>(small_chunks());
        }
        server = std::make_unique<McpServer>(std::move(owned), rag, provider, std::move(options));

        asio::co_spawn(io, server->run(), [done = run_done](std::exception_ptr ep) {
            if (ep) {
                std::rethrow_exception(ep);
            }
            *done = true;
        });
        REQUIRE(run_until(io, [this] { return transport->is_running(); }));
    }

    ~ServerHarness() {
        if (!*run_done) {
            run_sync(io, server->stop());
            run_until(io, [this] { return *run_done; });
        }
    }

    /// Send one request and wait for its response envelope
    Json request(const std::string& method, Json params = Json::object()) {
        const int id = next_id++;
        transport->inject(Json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", std::move(params)}});
        REQUIRE(run_until(io, [&] { return transport->find_response(id).has_value(); }));
        return *transport->find_response(id);
    }

    Json call_tool(const std::string& name, Json arguments = Json::object()) {
        return request("tools/call", Json{{"name", name}, {"arguments", std::move(arguments)}});
    }

    void notify(const std::string& method, Json params = Json::object()) {
        transport->inject(Json{{"jsonrpc", "2.0"}, {"method", method}, {"params", std::move(params)}});
    }

    void handshake() {
        const Json init = request("initialize", Json{
            {"protocolVersion", MCP_PROTOCOL_VERSION},
            {"capabilities", Json::object()},
            {"clientInfo", {{"name", "test-client"}, {"version", "0.9"}}}
        });
        REQUIRE(init.contains("result"));
        notify("notifications/initialized");
        REQUIRE(run_until(io, [this] { return server->core().is_ready(); }));
    }
};

std::vector<std::string> names_in(const Json& list, const char* key, const char* field = "name") {
    std::vector<std::string> names;
    for (const auto& item : list[key]) {
        names.push_back(item[field].get<std::string>());
    }
    return names;
}

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

std::string tool_text(const Json& response) {
    return response["result"]["content"][0]["text"].get<std::string>();
}

Json resource_document(const Json& response) {
    return Json::parse(response["result"]["contents"][0]["text"].get<std::string>());
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Handshake & Catalog
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("initialize advertises the server identity", "[server]") {
    McpServerOptions options;
    options.instructions = "Use rag_query for questions";
    ServerHarness h(true, options);

    const Json init = h.request("initialize", Json{
        {"protocolVersion", MCP_PROTOCOL_VERSION},
        {"capabilities", Json::object()},
        {"clientInfo", {{"name", "test-client"}, {"version", "0.9"}}}
    });

    const Json result = init["result"];
    REQUIRE(result["serverInfo"]["name"] == "ragmcp-server");
    REQUIRE(result["serverInfo"]["version"] == "1.0.0");
    REQUIRE(result["instructions"] == "Use rag_query for questions");
    REQUIRE(result["capabilities"].contains("tools"));
    REQUIRE(result["capabilities"].contains("resources"));
    REQUIRE(result["capabilities"].contains("prompts"));

    h.notify("notifications/initialized");
    REQUIRE(run_until(h.io, [&] { return h.server->core().is_ready(); }));

    const Json status = h.server->status();
    REQUIRE(status["isRunning"] == true);
    REQUIRE(status["clientInfo"]["name"] == "test-client");
    REQUIRE(status["capabilities"]["toolsCount"] == 5);
    REQUIRE(status["protocol"]["state"] == "ready");
}

TEST_CASE("Catalog lists built-in and provider entries", "[server]") {
    ServerHarness h;
    h.handshake();

    const auto tools = names_in(h.request("tools/list")["result"], "tools");
    REQUIRE(tools.size() == 5);
    REQUIRE(contains(tools, "rag_query"));
    REQUIRE(contains(tools, "rag_index_documents"));
    REQUIRE(contains(tools, "rag_status"));
    REQUIRE(contains(tools, "web_search"));
    REQUIRE(contains(tools, "flaky_api"));

    const auto resources = names_in(h.request("resources/list")["result"], "resources", "uri");
    REQUIRE(resources == std::vector<std::string>{
        "rag://documents/collection", "rag://conversations/history",
        "rag://system/stats", "rag://vectorstore/info"});

    const auto prompts = names_in(h.request("prompts/list")["result"], "prompts");
    REQUIRE(prompts == std::vector<std::string>{
        "rag_query_simple", "rag_query_conversational", "rag_query_with_tools"});

    const Json query_tool = h.request("tools/list")["result"]["tools"];
    const auto it = std::find_if(query_tool.begin(), query_tool.end(),
                                 [](const Json& t) { return t["name"] == "rag_query"; });
    REQUIRE((*it)["inputSchema"]["required"] == Json::array({"question"}));
}

TEST_CASE("Without a RAG system only provider tools are served", "[server]") {
    ServerHarness h(false);
    h.handshake();

    const auto tools = names_in(h.request("tools/list")["result"], "tools");
    REQUIRE(tools == std::vector<std::string>{"web_search", "flaky_api"});
    REQUIRE(h.request("resources/list")["result"]["resources"].empty());
    REQUIRE(h.request("prompts/list")["result"]["prompts"].empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("rag_query answers from indexed text", "[server][tools]") {
    ServerHarness h;
    h.rag->add_text("guide.md", "Asio provides asynchronous networking.\n\nCatch2 is a test framework.\n");
    h.handshake();

    const Json response = h.call_tool("rag_query", Json{{"question", "What is Catch2?"}});
    REQUIRE(response["result"]["isError"] == false);
    REQUIRE(tool_text(response) == "Catch2 is a test framework.");
}

TEST_CASE("rag_query reports bad arguments in the result", "[server][tools]") {
    ServerHarness h;
    h.handshake();

    SECTION("unknown mode") {
        const Json response = h.call_tool("rag_query", Json{{"question", "q"}, {"mode", "fancy"}});
        REQUIRE(response["result"]["isError"] == true);
        REQUIRE(tool_text(response) == "RAG query failed: Invalid query mode: fancy");
    }

    SECTION("question of the wrong type") {
        const Json response = h.call_tool("rag_query", Json{{"question", 42}});
        REQUIRE(response["result"]["isError"] == true);
        REQUIRE(tool_text(response) == "RAG query failed: question must be a string");
    }

    SECTION("empty question") {
        const Json response = h.call_tool("rag_query", Json{{"question", "  "}});
        REQUIRE(response["result"]["isError"] == true);
        REQUIRE(tool_text(response) == "RAG query failed: Question must not be empty");
    }
}

TEST_CASE("Conversational queries are kept per thread", "[server][tools]") {
    ServerHarness h;
    h.rag->add_text("notes", "Threads keep history.");
    h.handshake();

    const Json response = h.call_tool("rag_query",
        Json{{"question", "Do threads keep history?"}, {"mode", "conversational"}, {"threadId", "t1"}});
    REQUIRE(response["result"]["isError"] == false);

    const Json history = resource_document(h.request("resources/read", Json{{"uri", "rag://conversations/history"}}));
    REQUIRE(history["threadCount"] == 1);
    REQUIRE(history["threads"]["t1"].size() == 1);
    REQUIRE(history["threads"]["t1"][0]["question"] == "Do threads keep history?");
}

TEST_CASE("rag_index_documents summarizes or reports failure", "[server][tools]") {
    ServerHarness h;
    h.handshake();

    SECTION("urls are recorded") {
        const Json response = h.call_tool("rag_index_documents",
            Json{{"sources", {{"urls", {"https://example.com/a", "https://example.com/b"}}}}});
        REQUIRE(response["result"]["isError"] == false);
        REQUIRE(tool_text(response) == "Documents indexed successfully: 2 documents, 0 unique chunks");
    }

    SECTION("no sources") {
        const Json response = h.call_tool("rag_index_documents", Json{{"sources", Json::object()}});
        REQUIRE(response["result"]["isError"] == true);
        REQUIRE(tool_text(response) == "Document indexing failed: No document sources given");
    }

    SECTION("unreadable file") {
        const Json response = h.call_tool("rag_index_documents",
            Json{{"sources", {{"localFiles", {"/nonexistent/ragmcp/file.txt"}}}}});
        REQUIRE(response["result"]["isError"] == true);
        REQUIRE(tool_text(response).find("Cannot read file") != std::string::npos);
    }

    SECTION("sources missing") {
        const Json response = h.call_tool("rag_index_documents");
        REQUIRE(response["result"]["isError"] == true);
    }
}

TEST_CASE("rag_status returns the system status document", "[server][tools]") {
    ServerHarness h;
    h.rag->add_text("a", "alpha");
    h.handshake();

    const Json status = Json::parse(tool_text(h.call_tool("rag_status")));
    REQUIRE(status["initialized"] == true);
    REQUIRE(status["chunkCount"] == 1);
}

TEST_CASE("Provider tools run through the provider", "[server][tools]") {
    ServerHarness h;
    h.handshake();

    const Json ok = h.call_tool("web_search", Json{{"query", "asio"}});
    REQUIRE(ok["result"]["isError"] == false);
    REQUIRE(Json::parse(tool_text(ok))["results"][0] == "asio");

    const Json failed = h.call_tool("flaky_api");
    REQUIRE(failed["result"]["isError"] == true);
    REQUIRE(tool_text(failed).find("upstream unavailable") != std::string::npos);

    REQUIRE(h.provider->calls == std::vector<std::string>{"web_search", "flaky_api"});
}

TEST_CASE("Unknown tools are a protocol error", "[server][tools]") {
    ServerHarness h;
    h.handshake();

    const Json response = h.call_tool("nope");
    REQUIRE(response["error"]["code"] == ErrorCode::NotFound);
    REQUIRE(response["error"]["message"] == "Tool not found: nope");
}

TEST_CASE("Throwing tool handlers become error results", "[server][tools]") {
    ServerHarness h;
    h.handshake();
    REQUIRE(h.server->registry().register_tool(
        Tool{"explode", std::string("Throws"), Json{{"type", "object"}}},
        [](const Json&) -> asio::awaitable<McpResult<CallToolResult>> {
            throw std::runtime_error("kaboom");
            co_return CallToolResult{};
        }).has_value());

    const Json response = h.call_tool("explode");
    REQUIRE(response["result"]["isError"] == true);
    REQUIRE(tool_text(response) == "Tool execution failed: kaboom");
}

// ═══════════════════════════════════════════════════════════════════════════
// Resources & Prompts
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Resources return JSON documents", "[server][resources]") {
    ServerHarness h;
    h.rag->add_text("manual.txt", "Vector stores hold embeddings.");
    h.handshake();

    const Json read = h.request("resources/read", Json{{"uri", "rag://system/stats"}});
    REQUIRE(read["result"]["contents"][0]["mimeType"] == "application/json");
    REQUIRE(read["result"]["contents"][0]["uri"] == "rag://system/stats");
    const Json stats = resource_document(read);
    REQUIRE(stats["serverInfo"]["name"] == "ragmcp-server");
    REQUIRE(stats["chunks"] == 1);

    const Json collection = resource_document(h.request("resources/read", Json{{"uri", "rag://documents/collection"}}));
    REQUIRE(collection["totalDocuments"] == 1);
    REQUIRE(collection["documents"][0]["source"] == "manual.txt");

    const Json info = resource_document(h.request("resources/read", Json{{"uri", "rag://vectorstore/info"}}));
    REQUIRE(info["type"] == "in-memory");
}

TEST_CASE("Unknown resources are a protocol error", "[server][resources]") {
    ServerHarness h;
    h.handshake();

    const Json response = h.request("resources/read", Json{{"uri", "rag://nope"}});
    REQUIRE(response["error"]["code"] == ErrorCode::NotFound);
    REQUIRE(response["error"]["message"] == "Resource not found: rag://nope");
}

TEST_CASE("Prompts render with their arguments", "[server][prompts]") {
    ServerHarness h;
    h.handshake();

    const Json simple = h.request("prompts/get",
        Json{{"name", "rag_query_simple"}, {"arguments", {{"question", "What is MCP?"}}}});
    REQUIRE(simple["result"]["messages"][0]["role"] == "user");
    REQUIRE(simple["result"]["messages"][0]["content"]["text"] ==
            "Please answer the following question using the RAG system: What is MCP?");

    const Json conversational = h.request("prompts/get",
        Json{{"name", "rag_query_conversational"}, {"arguments", {{"question", "And then?"}}}});
    const std::string text = conversational["result"]["messages"][0]["content"]["text"];
    REQUIRE(text.find("\"default\"") != std::string::npos);
    REQUIRE(text.find("And then?") != std::string::npos);
}

TEST_CASE("Prompt errors are protocol errors", "[server][prompts]") {
    ServerHarness h;
    h.handshake();

    const Json missing = h.request("prompts/get", Json{{"name", "rag_query_simple"}});
    REQUIRE(missing["error"]["code"] == ErrorCode::InvalidParams);
    REQUIRE(missing["error"]["message"] == "Missing required argument 'question' for prompt rag_query_simple");

    const Json unknown = h.request("prompts/get", Json{{"name", "nope"}});
    REQUIRE(unknown["error"]["message"] == "Prompt not found: nope");
}

TEST_CASE("Prompt handler failures are answered in-band", "[server][prompts]") {
    ServerHarness h;
    h.handshake();

    REQUIRE(h.server->registry().register_prompt(
        Prompt{"backend_down", std::string("Needs the backend"), {}},
        [](const Json&) -> asio::awaitable<McpResult<GetPromptResult>> {
            co_return tl::unexpected(McpError::request_failed("vector store offline"));
        }).has_value());
    REQUIRE(h.server->registry().register_prompt(
        Prompt{"explode", std::string("Throws"), {}},
        [](const Json&) -> asio::awaitable<McpResult<GetPromptResult>> {
            throw std::runtime_error("kaboom");
            co_return GetPromptResult{};
        }).has_value());
    REQUIRE(h.server->registry().register_prompt(
        Prompt{"picky", std::nullopt, {}},
        [](const Json&) -> asio::awaitable<McpResult<GetPromptResult>> {
            co_return tl::unexpected(McpError::invalid_params("threadId must be a string"));
        }).has_value());

    const Json failed = h.request("prompts/get", Json{{"name", "backend_down"}});
    REQUIRE_FALSE(failed.contains("error"));
    REQUIRE(failed["result"]["isError"] == true);
    REQUIRE(failed["result"]["messages"][0]["content"]["text"] ==
            "Prompt execution failed: vector store offline");

    const Json thrown = h.request("prompts/get", Json{{"name", "explode"}});
    REQUIRE(thrown["result"]["isError"] == true);
    REQUIRE(thrown["result"]["messages"][0]["content"]["text"] == "Prompt execution failed: kaboom");

    const Json invalid = h.request("prompts/get", Json{{"name", "picky"}});
    REQUIRE(invalid["error"]["code"] == ErrorCode::InvalidParams);

    // The session survives every failure
    REQUIRE(h.request("ping")["result"] == Json::object());
}

// ═══════════════════════════════════════════════════════════════════════════
// Logging
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Log messages respect the default threshold", "[server][logging]") {
    ServerHarness h;
    h.handshake();
    h.transport->clear_sent();

    REQUIRE(run_sync(h.io, h.server->send_log_message("debug", "hidden")).has_value());
    REQUIRE(run_sync(h.io, h.server->send_log_message("info", "shown", std::string("rag"))).has_value());

    REQUIRE(h.transport->sent().size() == 1);
    const Json message = h.transport->sent_json(0);
    REQUIRE(message["method"] == "notifications/message");
    REQUIRE(message["params"]["level"] == "info");
    REQUIRE(message["params"]["data"] == "shown");
    REQUIRE(message["params"]["logger"] == "rag");

    auto bad = run_sync(h.io, h.server->send_log_message("verbose", "x"));
    REQUIRE(bad.error().kind == ErrorKind::InvalidParams);
}

TEST_CASE("logging/setLevel moves the threshold", "[server][logging]") {
    ServerHarness h;
    h.handshake();

    const Json response = h.request("logging/setLevel", Json{{"level", "error"}});
    REQUIRE(response["result"]["success"] == true);

    h.transport->clear_sent();
    REQUIRE(run_sync(h.io, h.server->send_log_message("warning", "hidden")).has_value());
    REQUIRE(run_sync(h.io, h.server->send_log_message("critical", "shown")).has_value());
    REQUIRE(h.transport->sent().size() == 1);

    const Json invalid = h.request("logging/setLevel", Json{{"level", "loud"}});
    REQUIRE(invalid["error"]["code"] == ErrorCode::InvalidParams);

    set_logger(nullptr);
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("list_changed is announced only once the client is ready", "[server][lifecycle]") {
    ServerHarness h;
    const Tool extra{"extra", std::string("Added later"), Json{{"type", "object"}}};
    const auto handler = [](const Json&) -> asio::awaitable<McpResult<CallToolResult>> {
        co_return CallToolResult::text_result("extra");
    };

    REQUIRE(h.server->registry().register_tool(extra, handler).has_value());
    run_for(h.io, 10ms);
    REQUIRE_FALSE(h.transport->find_notification("notifications/tools/list_changed").has_value());

    h.handshake();
    REQUIRE(h.server->registry().unregister_tool("extra"));
    REQUIRE(run_until(h.io, [&] {
        return h.transport->find_notification("notifications/tools/list_changed").has_value();
    }));
}

TEST_CASE("Peer hang-up ends run()", "[server][lifecycle]") {
    ServerHarness h;
    h.handshake();

    h.transport->close_from_peer("client went away");
    REQUIRE(run_until(h.io, [&] { return *h.run_done; }));
    REQUIRE_FALSE(h.server->is_running());
    REQUIRE(h.server->core().is_closed());
}

TEST_CASE("stop() ends run() and rejects a restart", "[server][lifecycle]") {
    ServerHarness h;
    run_sync(h.io, h.server->stop());
    REQUIRE(run_until(h.io, [&] { return *h.run_done; }));
    REQUIRE_FALSE(h.server->is_running());

    auto restarted = run_sync(h.io, h.server->start());
    REQUIRE_FALSE(restarted.has_value());
    REQUIRE(restarted.error().kind == ErrorKind::ConnectionError);
}
