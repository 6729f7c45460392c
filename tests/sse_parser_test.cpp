#include <catch2/catch_test_macros.hpp>
#include "ragmcp/transport/sse.hpp"

#include <string>

using ragmcp::SseEvent;
using ragmcp::SseParser;
using ragmcp::SseParserConfig;
using ragmcp::TransportError;
using ragmcp::format_sse_event;

TEST_CASE("SseParser yields one event per blank line", "[sse][parser]") {
    SseParser parser;

    auto events = parser.feed("data: {\"jsonrpc\":\"2.0\",\"method\":\"ping\",\"id\":1}\n\n");

    REQUIRE(events.has_value());
    REQUIRE(events->size() == 1);
    REQUIRE((*events)[0].data == "{\"jsonrpc\":\"2.0\",\"method\":\"ping\",\"id\":1}");
    REQUIRE_FALSE((*events)[0].event.has_value());
    REQUIRE_FALSE((*events)[0].id.has_value());
}

TEST_CASE("SseParser keeps event, id and retry fields", "[sse][parser]") {
    SseParser parser;

    auto events = parser.feed("event: message\nid: 42\nretry: 3000\ndata: {}\n\n");

    REQUIRE(events->size() == 1);
    const SseEvent& event = (*events)[0];
    REQUIRE(event.event.value() == "message");
    REQUIRE(event.id.value() == "42");
    REQUIRE(event.retry.value() == 3000);
    REQUIRE(event.data == "{}");
}

TEST_CASE("SseParser joins data lines with newlines", "[sse][parser]") {
    SseParser parser;
    auto events = parser.feed("data: first\ndata:second\ndata: third\n\n");
    REQUIRE((*events)[0].data == "first\nsecond\nthird");
}

TEST_CASE("SseParser resumes across arbitrary chunk splits", "[sse][parser]") {
    SseParser parser;

    auto first = parser.feed("da");
    REQUIRE(first->empty());
    auto second = parser.feed("ta: hel");
    REQUIRE(second->empty());
    auto third = parser.feed("lo\r");
    REQUIRE(third->empty());
    auto fourth = parser.feed("\n\r\ndata: next\n\n");

    REQUIRE(fourth->size() == 2);
    REQUIRE((*fourth)[0].data == "hello");
    REQUIRE((*fourth)[1].data == "next");
    REQUIRE(parser.buffer_size() == 0);
}

TEST_CASE("SseParser skips comments and unknown fields", "[sse][parser]") {
    SseParser parser;
    auto events = parser.feed(": keep-alive\n\nfoo: bar\ndata: real\n\n");
    REQUIRE(events->size() == 1);
    REQUIRE((*events)[0].data == "real");
}

TEST_CASE("SseParser rejects malformed retry values", "[sse][parser]") {
    SseParser parser;
    auto events = parser.feed("retry: 10s\ndata: x\n\nretry: -1\ndata: y\n\n");
    REQUIRE(events->size() == 2);
    REQUIRE_FALSE((*events)[0].retry.has_value());
    REQUIRE_FALSE((*events)[1].retry.has_value());
}

TEST_CASE("SseParser drops events above the size limit", "[sse][parser]") {
    SseParser parser(SseParserConfig{1024, 8});

    auto events = parser.feed("data: 0123456789\n\ndata: small\n\n");
    REQUIRE(events.has_value());
    REQUIRE(events->size() == 1);
    REQUIRE((*events)[0].data == "small");
}

TEST_CASE("SseParser fails when an unterminated line overflows", "[sse][parser]") {
    SseParser parser(SseParserConfig{16, 1024});

    auto result = parser.feed("data: this line never ends and keeps going");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().category == TransportError::Category::Protocol);
    REQUIRE(result.error().message.rfind("SSE buffer overflow", 0) == 0);

    // The parser starts over after an overflow
    REQUIRE(parser.buffer_size() == 0);
    auto after = parser.feed("data: ok\n\n");
    REQUIRE(after->size() == 1);
}

TEST_CASE("SseParser reset discards partial input", "[sse][parser]") {
    SseParser parser;
    (void)parser.feed("data: partial");
    parser.reset();
    auto events = parser.feed("data: fresh\n\n");
    REQUIRE((*events)[0].data == "fresh");
}

TEST_CASE("format_sse_event output parses back", "[sse][format]") {
    const std::string wire = format_sse_event("line one\nline two", "message", "7");
    REQUIRE(wire == "event: message\nid: 7\ndata: line one\ndata: line two\n\n");

    SseParser parser;
    auto events = parser.feed(wire);
    REQUIRE(events->size() == 1);
    REQUIRE((*events)[0].data == "line one\nline two");
    REQUIRE((*events)[0].id.value() == "7");
}
