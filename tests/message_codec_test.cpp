// ─────────────────────────────────────────────────────────────────────────────
// MessageCodec Tests
// ─────────────────────────────────────────────────────────────────────────────
// Classification, validation and encoding of JSON-RPC 2.0 envelopes.

#include <catch2/catch_test_macros.hpp>

#include "ragmcp/protocol/mcp_types.hpp"
#include "ragmcp/protocol/message.hpp"

#include <string>

using namespace ragmcp;

namespace {

const MessageCodec codec;

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Classification
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Request with integer id decodes", "[protocol][codec]") {
    auto decoded = codec.decode(R"({"jsonrpc":"2.0","id":3,"method":"tools/list","params":{}})");
    REQUIRE(decoded.has_value());
    REQUIRE(kind_of(*decoded) == MessageKind::Request);

    const auto& request = std::get<Request>(*decoded);
    REQUIRE(std::get<std::int64_t>(request.id) == 3);
    REQUIRE(request.method == "tools/list");
    REQUIRE(request.params.has_value());
    REQUIRE(request.params->is_object());
}

TEST_CASE("Request with string id keeps the id", "[protocol][codec]") {
    auto decoded = codec.decode(R"({"jsonrpc":"2.0","id":"abc","method":"ping"})");
    REQUIRE(decoded.has_value());

    const auto& request = std::get<Request>(*decoded);
    REQUIRE(std::get<std::string>(request.id) == "abc");
    REQUIRE_FALSE(request.params.has_value());
}

TEST_CASE("Message without id is a notification", "[protocol][codec]") {
    auto decoded = codec.decode(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    REQUIRE(decoded.has_value());
    REQUIRE(kind_of(*decoded) == MessageKind::Notification);
    REQUIRE(std::get<Notification>(*decoded).method == "notifications/initialized");
}

TEST_CASE("Result response decodes", "[protocol][codec]") {
    auto decoded = codec.decode(R"({"jsonrpc":"2.0","id":7,"result":{"ok":true}})");
    REQUIRE(decoded.has_value());
    REQUIRE(kind_of(*decoded) == MessageKind::Response);

    const auto& response = std::get<Response>(*decoded);
    REQUIRE_FALSE(response.is_error());
    REQUIRE((*response.outcome)["ok"] == true);
}

TEST_CASE("Error response recovers the error kind", "[protocol][codec]") {
    auto decoded = codec.decode(
        R"({"jsonrpc":"2.0","id":7,"error":{"code":-32601,"message":"Method not found: nope"}})");
    REQUIRE(decoded.has_value());

    const auto& response = std::get<Response>(*decoded);
    REQUIRE(response.is_error());
    REQUIRE(response.outcome.error().kind == ErrorKind::MethodNotFound);
    REQUIRE(response.outcome.error().code == ErrorCode::MethodNotFound);
}

// ═══════════════════════════════════════════════════════════════════════════
// Rejections
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Unparseable bytes are a parse error without id", "[protocol][codec]") {
    auto decoded = codec.decode("{not json");
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().error.kind == ErrorKind::ParseError);
    REQUIRE(decoded.error().error.code == ErrorCode::ParseError);
    REQUIRE_FALSE(decoded.error().request_id.has_value());
    REQUIRE_FALSE(decoded.error().is_json_object);
}

TEST_CASE("Non-object payload is an invalid request", "[protocol][codec]") {
    auto decoded = codec.decode("[1,2,3]");
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().error.kind == ErrorKind::InvalidRequest);
    REQUIRE_FALSE(decoded.error().is_json_object);
}

TEST_CASE("Missing jsonrpc field keeps the salvaged id", "[protocol][codec]") {
    auto decoded = codec.decode(R"({"id":9,"method":"ping"})");
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().error.kind == ErrorKind::InvalidRequest);
    REQUIRE(decoded.error().is_json_object);
    REQUIRE(decoded.error().request_id.has_value());
    REQUIRE(std::get<std::int64_t>(*decoded.error().request_id) == 9);
}

TEST_CASE("Wrong jsonrpc version is rejected", "[protocol][codec]") {
    auto decoded = codec.decode(R"({"jsonrpc":"1.0","id":1,"method":"ping"})");
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().error.message.find("2.0") != std::string::npos);
}

TEST_CASE("Null id on a request is rejected", "[protocol][codec]") {
    auto decoded = codec.decode(R"({"jsonrpc":"2.0","id":null,"method":"ping"})");
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().error.kind == ErrorKind::InvalidRequest);
}

TEST_CASE("Scalar params are rejected", "[protocol][codec]") {
    auto decoded = codec.decode(R"({"jsonrpc":"2.0","id":2,"method":"ping","params":5})");
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().error.message.find("params") != std::string::npos);
    REQUIRE(std::get<std::int64_t>(*decoded.error().request_id) == 2);
}

TEST_CASE("Response with both result and error is rejected", "[protocol][codec]") {
    auto decoded = codec.decode(
        R"({"jsonrpc":"2.0","id":1,"result":{},"error":{"code":-32603,"message":"x"}})");
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().error.kind == ErrorKind::InvalidRequest);
    REQUIRE(decoded.error().is_response);
    REQUIRE(std::get<std::int64_t>(*decoded.error().request_id) == 1);
}

TEST_CASE("Only method-less failures are marked as responses", "[protocol][codec]") {
    auto bad_request = codec.decode(R"({"jsonrpc":"2.0","id":3,"method":7})");
    REQUIRE_FALSE(bad_request.has_value());
    REQUIRE_FALSE(bad_request.error().is_response);

    auto bare = codec.decode(R"({"jsonrpc":"2.0"})");
    REQUIRE_FALSE(bare.has_value());
    REQUIRE(bare.error().is_response);

    auto not_object = codec.decode("[1,2]");
    REQUIRE_FALSE(not_object.has_value());
    REQUIRE_FALSE(not_object.error().is_response);
}

TEST_CASE("Error object without integer code is rejected", "[protocol][codec]") {
    auto decoded = codec.decode(R"({"jsonrpc":"2.0","id":1,"error":{"code":"x","message":"m"}})");
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().error.message.find("error code") != std::string::npos);
}

TEST_CASE("Oversized message is rejected before parsing", "[protocol][codec]") {
    const MessageCodec small(32);
    const std::string payload =
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"long"}})";

    auto decoded = small.decode(payload);
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().error.kind == ErrorKind::InvalidRequest);
    REQUIRE(decoded.error().error.message.find("Message too large") != std::string::npos);
}

// ═══════════════════════════════════════════════════════════════════════════
// Encoding
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Encoded request carries version, id and method", "[protocol][codec]") {
    const Json j = MessageCodec::to_json(Request{RequestId{std::int64_t{4}}, "tools/call", Json{{"name", "x"}}});
    REQUIRE(j["jsonrpc"] == "2.0");
    REQUIRE(j["id"] == 4);
    REQUIRE(j["method"] == "tools/call");
    REQUIRE(j["params"]["name"] == "x");
}

TEST_CASE("Notification without params omits the field", "[protocol][codec]") {
    const Json j = MessageCodec::to_json(Notification{"notifications/initialized", std::nullopt});
    REQUIRE_FALSE(j.contains("id"));
    REQUIRE_FALSE(j.contains("params"));
}

TEST_CASE("Failure without id encodes a null id", "[protocol][codec]") {
    const Json j = MessageCodec::to_json(Response::failure(std::nullopt, McpError::parse_error("bad")));
    REQUIRE(j["id"].is_null());
    REQUIRE(j["error"]["code"] == ErrorCode::ParseError);
    REQUIRE_FALSE(j.contains("result"));
}

TEST_CASE("Encoded response decodes to the same outcome", "[protocol][codec]") {
    const std::string bytes = MessageCodec::encode(Response::success(RequestId{std::string("r-1")}, Json{{"n", 1}}));
    auto decoded = codec.decode(bytes);
    REQUIRE(decoded.has_value());

    const auto& response = std::get<Response>(*decoded);
    REQUIRE(std::get<std::string>(*response.id) == "r-1");
    REQUIRE((*response.outcome)["n"] == 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Parameter Validation
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("tools/call requires a string name", "[protocol][validation]") {
    auto missing = validate_params("tools/call", Json::object());
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().kind == ErrorKind::InvalidParams);
    REQUIRE(missing.error().message == "Validation failed for field 'name': expected string, got undefined");

    auto wrong_args = validate_params("tools/call", Json{{"name", "x"}, {"arguments", Json::array()}});
    REQUIRE_FALSE(wrong_args.has_value());
    REQUIRE(wrong_args.error().data.value()["field"] == "arguments");

    REQUIRE(validate_params("tools/call", Json{{"name", "x"}, {"arguments", Json::object()}}).has_value());
}

TEST_CASE("initialize requires version, capabilities and client info", "[protocol][validation]") {
    Json params = {
        {"protocolVersion", MCP_PROTOCOL_VERSION},
        {"capabilities", Json::object()},
        {"clientInfo", {{"name", "c"}, {"version", "1"}}}
    };
    REQUIRE(validate_initialize_params(params).has_value());

    params["clientInfo"].erase("version");
    auto result = validate_initialize_params(params);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().data.value()["field"] == "clientInfo.version");

    params.erase("capabilities");
    REQUIRE(validate_initialize_params(params).error().data.value()["field"] == "capabilities");
}

TEST_CASE("resources/read and prompts/get validate their keys", "[protocol][validation]") {
    REQUIRE_FALSE(validate_resource_read_params(Json{{"uri", 5}}).has_value());
    REQUIRE(validate_resource_read_params(Json{{"uri", "rag://x"}}).has_value());

    REQUIRE_FALSE(validate_prompt_get_params(Json::array()).has_value());
    REQUIRE(validate_prompt_get_params(Json{{"name", "p"}}).has_value());
}

TEST_CASE("logging/setLevel accepts only MCP level names", "[protocol][validation]") {
    REQUIRE(validate_set_level_params(Json{{"level", "warning"}}).has_value());
    REQUIRE(validate_set_level_params(Json{{"level", "emergency"}}).has_value());

    auto result = validate_set_level_params(Json{{"level", "verbose"}});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().message.find("one of debug, info") != std::string::npos);
}

TEST_CASE("Methods without a validator accept anything", "[protocol][validation]") {
    REQUIRE(validate_params("tools/list", Json::array()).has_value());
    REQUIRE(validate_params("custom/method", Json{{"x", 1}}).has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Logging Helpers
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("summarize names the message briefly", "[protocol][codec]") {
    REQUIRE(summarize(Request{RequestId{std::int64_t{3}}, "tools/call", std::nullopt}) == "request tools/call id=3");
    REQUIRE(summarize(Response::failure(RequestId{std::int64_t{3}}, McpError::method_not_found("x"))) ==
            "response id=3 error=-32601");
    REQUIRE(summarize(Notification{"notifications/progress", std::nullopt}) == "notification notifications/progress");
}

TEST_CASE("redact_for_logging hides credentials", "[protocol][codec]") {
    const std::string logged = redact_for_logging(
        Request{RequestId{std::int64_t{1}}, "tools/call",
                Json{{"name", "fetch"}, {"arguments", {{"apiKey", "s3cr3t-value"}}}}});
    REQUIRE(logged.find("s3cr3t-value") == std::string::npos);
    REQUIRE(logged.find("[REDACTED]") != std::string::npos);
    REQUIRE(logged.find("fetch") != std::string::npos);
}
