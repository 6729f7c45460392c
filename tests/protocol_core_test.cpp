// ─────────────────────────────────────────────────────────────────────────────
// ProtocolCore Tests
// ─────────────────────────────────────────────────────────────────────────────
// Correlation, dispatch, handshake and shutdown over MockTransport.

#include <catch2/catch_test_macros.hpp>

#include "ragmcp/protocol/protocol_core.hpp"

#include "mocks/async_helpers.hpp"
#include "mocks/mock_transport.hpp"

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ragmcp;
using namespace ragmcp::testing;

namespace {

Json reply_with(const Json& id, Json result) {
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

Json request(int id, const std::string& method, Json params = Json::object()) {
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", std::move(params)}};
}

Json notification(const std::string& method, Json params = Json::object()) {
    return Json{{"jsonrpc", "2.0"}, {"method", method}, {"params", std::move(params)}};
}

/// One core over one started mock transport; closes cleanly on destruction.
struct CoreHarness {
    asio::io_context io;
    MockTransport transport{io.get_executor()};
    std::unique_ptr<ProtocolCore> core;

    explicit CoreHarness(Role role, ProtocolConfig config = {}) {
        core = std::make_unique<ProtocolCore>(transport, role, std::move(config));
    }

    void start() {
        auto started = run_sync(io, transport.async_start());
        REQUIRE(started.has_value());
        core->start();
    }

    void shutdown() {
        run_sync(io, [](ProtocolCore& c) -> asio::awaitable<void> {
            co_await c.close("test finished");
            co_await c.wait_stopped();
        }(*core));
    }

    ~CoreHarness() {
        if (core && !core->is_closed()) {
            shutdown();
        } else if (core) {
            run_sync(io, core->wait_stopped());
        }
    }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Request / Response Correlation
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Requests get increasing ids and resolve with the peer result", "[protocol][core]") {
    CoreHarness h(Role::Client);
    h.transport.set_responder([](const Json& message) -> std::optional<Json> {
        if (!message.contains("id")) {
            return std::nullopt;
        }
        return reply_with(message["id"], Json{{"echo", message["method"]}});
    });
    h.start();

    auto first = run_sync(h.io, h.core->send_request("tools/list"));
    auto second = run_sync(h.io, h.core->send_request("prompts/list", Json::object()));

    REQUIRE(first.has_value());
    REQUIRE((*first)["echo"] == "tools/list");
    REQUIRE((*second)["echo"] == "prompts/list");

    REQUIRE(h.transport.sent_json(0)["id"] == 1);
    REQUIRE(h.transport.sent_json(1)["id"] == 2);
    REQUIRE_FALSE(h.transport.sent_json(0).contains("params"));
    REQUIRE(h.core->status().pending_requests == 0);
    REQUIRE(h.core->status().last_request_id == 2);
}

TEST_CASE("Concurrent requests resolve by id when answered out of order", "[protocol][core]") {
    CoreHarness h(Role::Client);
    h.start();

    auto first = spawn_result(h.io, h.core->send_request("tools/list"));
    auto second = spawn_result(h.io, h.core->send_request("resources/list"));
    REQUIRE(run_until(h.io, [&] { return h.core->status().pending_requests == 2; }));
    REQUIRE(h.transport.sent_json(0)["method"] == "tools/list");
    REQUIRE(h.transport.sent_json(1)["method"] == "resources/list");

    h.transport.inject(reply_with(2, Json{{"answer", "second"}}));
    REQUIRE(run_until(h.io, [&] { return second->has_value(); }));
    REQUIRE_FALSE(first->has_value());
    REQUIRE(h.core->status().pending_requests == 1);

    h.transport.inject(reply_with(1, Json{{"answer", "first"}}));
    REQUIRE(run_until(h.io, [&] { return first->has_value(); }));

    REQUIRE((**first).has_value());
    REQUIRE((**first)->at("answer") == "first");
    REQUIRE((**second).has_value());
    REQUIRE((**second)->at("answer") == "second");
    REQUIRE(h.core->status().pending_requests == 0);
}

TEST_CASE("Error responses reject with the recovered kind", "[protocol][core]") {
    CoreHarness h(Role::Client);
    h.transport.set_responder([](const Json& message) -> std::optional<Json> {
        return Json{{"jsonrpc", "2.0"}, {"id", message["id"]},
                    {"error", McpError::tool_not_found("missing").to_json()}};
    });
    h.start();

    auto result = run_sync(h.io, h.core->send_request("tools/call", Json{{"name", "missing"}}));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::ToolNotFound);
    REQUIRE(result.error().message == "Tool not found: missing");
}

TEST_CASE("Unanswered request times out and a late reply is ignored", "[protocol][core]") {
    CoreHarness h(Role::Client);
    h.start();

    auto result = run_sync(h.io, h.core->send_request("tools/list", std::nullopt, 30ms));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::Timeout);
    REQUIRE(result.error().message == "Request timed out after 30ms");
    REQUIRE(h.core->status().pending_requests == 0);

    h.transport.inject(reply_with(1, Json::object()));
    run_for(h.io, 20ms);
    REQUIRE(h.transport.sent().size() == 1);
    REQUIRE_FALSE(h.core->is_closed());
}

TEST_CASE("Zero timeout waits for the reply", "[protocol][core]") {
    ProtocolConfig config;
    config.request_timeout = 0ms;
    CoreHarness h(Role::Client, config);
    h.start();

    auto slot = spawn_result(h.io, h.core->send_request("slow"));
    run_for(h.io, 40ms);
    REQUIRE_FALSE(slot->has_value());

    h.transport.inject(reply_with(1, Json{{"done", true}}));
    REQUIRE(run_until(h.io, [&] { return slot->has_value(); }));
    REQUIRE((**slot).has_value());
}

TEST_CASE("Send failure rejects with TransportError", "[protocol][core]") {
    CoreHarness h(Role::Client);
    h.start();
    h.transport.fail_sends(TransportError{TransportError::Category::Network, "broken pipe", std::nullopt});

    auto result = run_sync(h.io, h.core->send_request("tools/list"));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::TransportError);
    REQUIRE(result.error().message.find("broken pipe") != std::string::npos);
    REQUIRE((*result.error().data)["transportType"] == "stdio");
    REQUIRE(h.core->status().pending_requests == 0);
}

TEST_CASE("Send failures keep the transport's error category", "[protocol][core]") {
    CoreHarness h(Role::Client);
    h.start();

    SECTION("timeout") {
        h.transport.fail_sends(TransportError{TransportError::Category::Timeout, "HTTP request timed out", std::nullopt});
        auto result = run_sync(h.io, h.core->send_request("tools/call"));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::Timeout);
        REQUIRE(result.error().message == "Failed to send tools/call: HTTP request timed out");
    }

    SECTION("closed") {
        h.transport.fail_sends(TransportError::closed("Session ended"));
        auto result = run_sync(h.io, h.core->send_request("tools/call"));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::ConnectionError);
    }

    REQUIRE(h.core->status().pending_requests == 0);
}

TEST_CASE("A deadline that passes during a slow send wins over the send error", "[protocol][core]") {
    CoreHarness h(Role::Client);
    h.start();
    h.transport.delay_sends(60ms);
    h.transport.fail_sends(TransportError{TransportError::Category::Network, "connection reset", std::nullopt});

    auto result = run_sync(h.io, h.core->send_request("tools/list", std::nullopt, 20ms));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::Timeout);
    REQUIRE(result.error().message == "Request timed out after 20ms");
    REQUIRE(h.core->status().pending_requests == 0);
}

TEST_CASE("close rejects every pending request", "[protocol][core]") {
    CoreHarness h(Role::Client);
    h.start();

    std::string closed_reason;
    int closed_calls = 0;
    h.core->on_closed([&](const std::string& reason) {
        closed_reason = reason;
        ++closed_calls;
    });

    auto a = spawn_result(h.io, h.core->send_request("a"));
    auto b = spawn_result(h.io, h.core->send_request("b"));
    REQUIRE(run_until(h.io, [&] { return h.core->status().pending_requests == 2; }));

    h.shutdown();
    REQUIRE(run_until(h.io, [&] { return a->has_value() && b->has_value(); }));

    REQUIRE((**a).error().kind == ErrorKind::ConnectionError);
    REQUIRE((**a).error().message == "Connection closed");
    REQUIRE((**b).error().kind == ErrorKind::ConnectionError);
    REQUIRE(closed_reason == "test finished");

    // Idempotent, callback fires once, later requests fail fast
    run_sync(h.io, h.core->close("again"));
    REQUIRE(closed_calls == 1);
    auto late = run_sync(h.io, h.core->send_request("c"));
    REQUIRE(late.error().kind == ErrorKind::ConnectionError);
    REQUIRE(h.transport.stop_calls() >= 1);
}

TEST_CASE("Peer hang-up closes the session", "[protocol][core]") {
    CoreHarness h(Role::Client);
    h.start();

    std::string reason;
    h.core->on_closed([&](const std::string& r) { reason = r; });

    auto pending = spawn_result(h.io, h.core->send_request("tools/list"));
    REQUIRE(run_until(h.io, [&] { return h.core->status().pending_requests == 1; }));

    h.transport.close_from_peer("server exited");
    REQUIRE(run_until(h.io, [&] { return pending->has_value(); }));

    REQUIRE((**pending).error().kind == ErrorKind::ConnectionError);
    REQUIRE(h.core->is_closed());
    REQUIRE(reason == "server exited");
}

// ═══════════════════════════════════════════════════════════════════════════
// Inbound Dispatch
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Registered handler answers with the request id", "[protocol][core]") {
    CoreHarness h(Role::Server);
    h.core->handlers().on_request("tools/list", [](const Json&) -> asio::awaitable<McpResult<Json>> {
        co_return Json{{"tools", Json::array()}};
    });
    h.start();

    h.transport.inject(request(11, "tools/list"));
    REQUIRE(run_until(h.io, [&] { return h.transport.find_response(11).has_value(); }));

    const Json response = *h.transport.find_response(11);
    REQUIRE(response["result"]["tools"].is_array());
}

TEST_CASE("Unknown methods are answered with MethodNotFound", "[protocol][core]") {
    CoreHarness h(Role::Server);
    h.start();

    h.transport.inject(request(5, "does/not/exist"));
    REQUIRE(run_until(h.io, [&] { return h.transport.find_response(5).has_value(); }));

    const Json response = *h.transport.find_response(5);
    REQUIRE(response["error"]["code"] == ErrorCode::MethodNotFound);
    REQUIRE(response["error"]["message"] == "Method not found: does/not/exist");
}

TEST_CASE("Handler exceptions become internal errors", "[protocol][core]") {
    CoreHarness h(Role::Server);
    h.core->handlers().on_request("tools/call", [](const Json&) -> asio::awaitable<McpResult<Json>> {
        throw std::runtime_error("vector store offline");
        co_return Json::object();
    });
    h.start();

    h.transport.inject(request(3, "tools/call", Json{{"name", "rag_query"}}));
    REQUIRE(run_until(h.io, [&] { return h.transport.find_response(3).has_value(); }));

    const Json error = (*h.transport.find_response(3))["error"];
    REQUIRE(error["code"] == ErrorCode::InternalError);
    REQUIRE(error["message"] == "Internal error while handling tools/call: vector store offline");
    REQUIRE_FALSE(h.core->is_closed());
}

TEST_CASE("Invalid params never reach the handler", "[protocol][core]") {
    CoreHarness h(Role::Server);
    bool called = false;
    h.core->handlers().on_request("resources/read", [&called](const Json&) -> asio::awaitable<McpResult<Json>> {
        called = true;
        co_return Json::object();
    });
    h.start();

    h.transport.inject(request(8, "resources/read", Json{{"url", "rag://x"}}));
    REQUIRE(run_until(h.io, [&] { return h.transport.find_response(8).has_value(); }));

    REQUIRE((*h.transport.find_response(8))["error"]["code"] == ErrorCode::InvalidParams);
    REQUIRE_FALSE(called);
}

TEST_CASE("Malformed input is answered only when identifiable", "[protocol][core]") {
    CoreHarness h(Role::Server);
    h.start();

    SECTION("unparseable bytes get no reply") {
        h.transport.inject(std::string("{\"jsonrpc\":"));
        run_for(h.io, 30ms);
        REQUIRE(h.transport.sent().empty());
    }

    SECTION("missing version with an id gets InvalidRequest") {
        h.transport.inject(Json{{"id", 9}, {"method", "ping"}});
        REQUIRE(run_until(h.io, [&] { return h.transport.find_response(9).has_value(); }));
        REQUIRE((*h.transport.find_response(9))["error"]["code"] == ErrorCode::InvalidRequest);
    }

    SECTION("request without an id gets a null-id error") {
        h.transport.inject(Json{{"jsonrpc", "1.0"}, {"method", "ping"}});
        REQUIRE(run_until(h.io, [&] { return !h.transport.sent().empty(); }));
        const Json reply = h.transport.sent_json(0);
        REQUIRE(reply["id"].is_null());
        REQUIRE(reply["error"]["code"] == ErrorCode::InvalidRequest);
    }

    SECTION("malformed responses are never answered") {
        h.transport.inject(Json{{"jsonrpc", "2.0"}, {"result", 1}});
        h.transport.inject(Json{{"jsonrpc", "2.0"}, {"id", 4}, {"result", 1},
                                {"error", {{"code", -32603}, {"message", "x"}}}});
        run_for(h.io, 30ms);
        REQUIRE(h.transport.sent().empty());
    }

    REQUIRE_FALSE(h.core->is_closed());
}

TEST_CASE("A malformed response rejects the request it names", "[protocol][core]") {
    CoreHarness h(Role::Client);
    h.start();

    auto slot = spawn_result(h.io, h.core->send_request("tools/list"));
    REQUIRE(run_until(h.io, [&] { return h.core->status().pending_requests == 1; }));

    h.transport.inject(Json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", Json::object()},
                            {"error", {{"code", -32603}, {"message", "x"}}}});
    REQUIRE(run_until(h.io, [&] { return slot->has_value(); }));

    REQUIRE_FALSE((**slot).has_value());
    REQUIRE((**slot).error().kind == ErrorKind::InvalidRequest);
    REQUIRE((**slot).error().message.find("both result and error") != std::string::npos);
    REQUIRE(h.core->status().pending_requests == 0);
    // Only the request itself went out
    REQUIRE(h.transport.sent().size() == 1);
}

TEST_CASE("ping is answered with an empty object", "[protocol][core]") {
    CoreHarness h(Role::Client);
    h.start();

    h.transport.inject(request(1, "ping"));
    REQUIRE(run_until(h.io, [&] { return h.transport.find_response(1).has_value(); }));
    REQUIRE((*h.transport.find_response(1))["result"] == Json::object());
}

TEST_CASE("Notifications reach their handler and throwing handlers are contained", "[protocol][core]") {
    CoreHarness h(Role::Client);
    std::vector<Json> seen;
    h.core->handlers().on_notification("notifications/message", [&seen](const Json& params) {
        seen.push_back(params);
    });
    h.core->handlers().on_notification("notifications/progress", [](const Json&) {
        throw std::runtime_error("bad progress");
    });
    h.start();

    h.transport.inject(notification("notifications/progress", Json{{"progress", 1}}));
    h.transport.inject(notification("notifications/message", Json{{"level", "info"}, {"data", "hi"}}));
    h.transport.inject(notification("notifications/unknown"));
    REQUIRE(run_until(h.io, [&] { return seen.size() == 1; }));

    REQUIRE(seen[0]["data"] == "hi");
    REQUIRE(h.transport.sent().empty());
    REQUIRE_FALSE(h.core->is_closed());
}

// ═══════════════════════════════════════════════════════════════════════════
// Cancellation
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Peer cancellation settles the request", "[protocol][core]") {
    CoreHarness h(Role::Client);
    h.start();

    auto pending = spawn_result(h.io, h.core->send_request("tools/call", Json{{"name", "slow"}}));
    REQUIRE(run_until(h.io, [&] { return h.core->status().pending_requests == 1; }));

    h.transport.inject(notification("notifications/cancelled", Json{{"requestId", 1}, {"reason", "busy"}}));
    REQUIRE(run_until(h.io, [&] { return pending->has_value(); }));
    REQUIRE((**pending).error().kind == ErrorKind::Cancelled);
}

TEST_CASE("Local cancel tells the peer", "[protocol][core]") {
    CoreHarness h(Role::Client);
    h.start();

    auto pending = spawn_result(h.io, h.core->send_request("tools/call", Json{{"name", "slow"}}));
    REQUIRE(run_until(h.io, [&] { return h.core->status().pending_requests == 1; }));

    auto cancelled = run_sync(h.io, h.core->cancel_request(1, "user abort"));
    REQUIRE(cancelled.has_value());
    REQUIRE(run_until(h.io, [&] { return pending->has_value(); }));
    REQUIRE((**pending).error().kind == ErrorKind::Cancelled);

    const auto notice = h.transport.find_notification("notifications/cancelled");
    REQUIRE(notice.has_value());
    REQUIRE((*notice)["params"]["requestId"] == 1);
    REQUIRE((*notice)["params"]["reason"] == "user abort");

    auto unknown = run_sync(h.io, h.core->cancel_request(42));
    REQUIRE_FALSE(unknown.has_value());
    REQUIRE(unknown.error().kind == ErrorKind::InvalidParams);
}

// ═══════════════════════════════════════════════════════════════════════════
// Handshake
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Server answers initialize and becomes ready on initialized", "[protocol][core][handshake]") {
    CoreHarness h(Role::Server);
    h.core->set_local_identity(Implementation{"rag-server", "2.0.0"}, Json{{"tools", Json::object()}},
                               std::string("Ask questions"));
    bool ready = false;
    h.core->on_ready([&ready] { ready = true; });
    h.start();

    h.transport.inject(request(1, "initialize", Json{
        {"protocolVersion", MCP_PROTOCOL_VERSION},
        {"capabilities", Json::object()},
        {"clientInfo", {{"name", "inspector"}, {"version", "0.1"}}}
    }));
    REQUIRE(run_until(h.io, [&] { return h.transport.find_response(1).has_value(); }));

    const Json result = (*h.transport.find_response(1))["result"];
    REQUIRE(result["protocolVersion"] == MCP_PROTOCOL_VERSION);
    REQUIRE(result["serverInfo"]["name"] == "rag-server");
    REQUIRE(result["instructions"] == "Ask questions");
    REQUIRE(result["capabilities"].contains("tools"));
    REQUIRE(h.core->state() == HandshakeState::Initializing);
    REQUIRE(h.core->remote_info()->name == "inspector");

    h.transport.inject(notification("notifications/initialized"));
    REQUIRE(run_until(h.io, [&] { return ready; }));
    REQUIRE(h.core->is_ready());
}

TEST_CASE("Server rejects a different protocol version", "[protocol][core][handshake]") {
    CoreHarness h(Role::Server);
    h.start();

    h.transport.inject(request(1, "initialize", Json{
        {"protocolVersion", "1999-01-01"},
        {"capabilities", Json::object()},
        {"clientInfo", {{"name", "old"}, {"version", "0.1"}}}
    }));
    REQUIRE(run_until(h.io, [&] { return h.transport.find_response(1).has_value(); }));

    const Json error = (*h.transport.find_response(1))["error"];
    REQUIRE(error["code"] == ErrorCode::InvalidRequest);
    REQUIRE(error["message"] == "Version compatibility error: expected 2024-11-05, got 1999-01-01");
    REQUIRE(h.core->state() == HandshakeState::Uninitialized);
}

TEST_CASE("Client handshake sends initialize then initialized", "[protocol][core][handshake]") {
    CoreHarness h(Role::Client);
    h.transport.set_responder([](const Json& message) -> std::optional<Json> {
        if (message.value("method", "") != "initialize") {
            return std::nullopt;
        }
        return reply_with(message["id"], Json{
            {"protocolVersion", MCP_PROTOCOL_VERSION},
            {"capabilities", {{"tools", Json::object()}}},
            {"serverInfo", {{"name", "remote"}, {"version", "3.1"}}}
        });
    });
    h.start();

    auto result = run_sync(h.io, h.core->initialize(Implementation{"ragmcp-client", "1.0.0"}));
    REQUIRE(result.has_value());
    REQUIRE(result->server_info.name == "remote");
    REQUIRE(h.core->is_ready());
    REQUIRE(h.core->remote_capabilities().contains("tools"));

    REQUIRE(h.transport.sent_methods() == std::vector<std::string>{"initialize", "notifications/initialized"});
    REQUIRE(h.transport.sent_json(0)["params"]["clientInfo"]["name"] == "ragmcp-client");
}

TEST_CASE("Client refuses a server speaking another version", "[protocol][core][handshake]") {
    CoreHarness h(Role::Client);
    h.transport.set_responder([](const Json& message) -> std::optional<Json> {
        return reply_with(message["id"], Json{
            {"protocolVersion", "2030-01-01"},
            {"capabilities", Json::object()},
            {"serverInfo", {{"name", "future"}, {"version", "9"}}}
        });
    });
    h.start();

    auto result = run_sync(h.io, h.core->initialize(Implementation{"c", "1"}));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::VersionCompatibility);
    REQUIRE(h.core->state() == HandshakeState::Uninitialized);
    REQUIRE(h.transport.sent_methods() == std::vector<std::string>{"initialize"});
}

TEST_CASE("initialize is refused in the server role", "[protocol][core][handshake]") {
    CoreHarness h(Role::Server);
    h.start();
    auto result = run_sync(h.io, h.core->initialize(Implementation{"c", "1"}));
    REQUIRE(result.error().kind == ErrorKind::InvalidRequest);
}
