#include "ragmcp/transport/sse.hpp"

#include <charconv>

namespace ragmcp {

TransportResult<std::vector<SseEvent>> SseParser::feed(std::string_view chunk) {
    std::vector<SseEvent> events;

    buffer_.append(chunk);

    std::size_t start = 0;
    std::size_t newline = 0;
    while ((newline = buffer_.find('\n', start)) != std::string::npos) {
        std::string_view line(buffer_.data() + start, newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        start = newline + 1;

        if (process_line(line)) {
            if (current_.data.size() > config_.max_event_size) {
                current_ = SseEvent{};
                has_fields_ = false;
                has_data_ = false;
                continue;
            }
            if (has_fields_) {
                events.push_back(take_event());
            }
        }
    }
    buffer_.erase(0, start);

    if (buffer_.size() > config_.max_buffer_size) {
        const auto size = buffer_.size();
        reset();
        return tl::unexpected(TransportError{
            TransportError::Category::Protocol,
            "SSE buffer overflow: " + std::to_string(size) + " bytes exceeds limit of " +
                std::to_string(config_.max_buffer_size),
            std::nullopt});
    }
    return events;
}

void SseParser::reset() {
    buffer_.clear();
    current_ = SseEvent{};
    has_fields_ = false;
    has_data_ = false;
}

bool SseParser::process_line(std::string_view line) {
    if (line.empty()) {
        return true;
    }
    if (line.front() == ':') {
        return false;  // comment / keep-alive
    }

    std::string_view field = line;
    std::string_view value;
    if (const auto colon = line.find(':'); colon != std::string_view::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.remove_prefix(1);
        }
    }

    if (field == "data") {
        if (has_data_) {
            current_.data += '\n';
        }
        current_.data += value;
        has_data_ = true;
        has_fields_ = true;
    } else if (field == "event") {
        current_.event = std::string(value);
        has_fields_ = true;
    } else if (field == "id") {
        current_.id = std::string(value);
        has_fields_ = true;
    } else if (field == "retry") {
        std::uint32_t retry_ms = 0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), retry_ms);
        if (ec == std::errc{} && ptr == value.data() + value.size()) {
            current_.retry = retry_ms;
            has_fields_ = true;
        }
    }
    return false;
}

SseEvent SseParser::take_event() {
    SseEvent event = std::move(current_);
    current_ = SseEvent{};
    has_fields_ = false;
    has_data_ = false;
    return event;
}

std::string format_sse_event(
    std::string_view data,
    std::optional<std::string_view> event,
    std::optional<std::string_view> id
) {
    std::string out;
    out.reserve(data.size() + 16);
    if (event) {
        out.append("event: ").append(*event).append("\n");
    }
    if (id) {
        out.append("id: ").append(*id).append("\n");
    }
    std::size_t start = 0;
    for (;;) {
        const auto newline = data.find('\n', start);
        out.append("data: ").append(data.substr(start, newline - start)).append("\n");
        if (newline == std::string_view::npos) {
            break;
        }
        start = newline + 1;
    }
    out.append("\n");
    return out;
}

}  // namespace ragmcp
