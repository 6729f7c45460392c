#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Server-Sent Events
// ═══════════════════════════════════════════════════════════════════════════
// Framing (https://html.spec.whatwg.org/multipage/server-sent-events.html):
//   event: <event-type>     (optional, defaults to "message")
//   id: <event-id>          (optional)
//   data: <payload>         (one or more lines)
//   retry: <milliseconds>   (optional reconnection hint)
//   <blank line>            (end of event)

#include "ragmcp/transport.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ragmcp {

struct SseEvent {
    std::optional<std::string> id;
    std::optional<std::string> event;
    std::string data;  // data lines joined with '\n'
    std::optional<std::uint32_t> retry;
};

struct SseParserConfig {
    /// Unterminated input kept between feeds
    std::size_t max_buffer_size{1024 * 1024};

    /// Events with more data than this are dropped
    std::size_t max_event_size{1024 * 1024};
};

/// Incremental parser: chunks may split lines and events anywhere.
class SseParser {
public:
    SseParser() = default;
    explicit SseParser(SseParserConfig config) : config_(config) {}

    /// Complete events contained in the data fed so far. Fails with a
    /// Protocol error when unterminated input outgrows max_buffer_size.
    [[nodiscard]] TransportResult<std::vector<SseEvent>> feed(std::string_view chunk);

    void reset();

    [[nodiscard]] std::size_t buffer_size() const noexcept { return buffer_.size(); }

private:
    /// True when the line was blank (event complete).
    bool process_line(std::string_view line);
    SseEvent take_event();

    SseParserConfig config_;
    std::string buffer_;
    SseEvent current_;
    bool has_fields_{false};
    bool has_data_{false};
};

/// Encode one event; multi-line data becomes several data: lines.
[[nodiscard]] std::string format_sse_event(
    std::string_view data,
    std::optional<std::string_view> event = std::nullopt,
    std::optional<std::string_view> id = std::nullopt
);

}  // namespace ragmcp
