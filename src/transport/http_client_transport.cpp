#include "ragmcp/transport/http_client_transport.hpp"
#include "ragmcp/transport/sse.hpp"
#include "ragmcp/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/use_awaitable.hpp>

#include <chrono>

namespace ragmcp {

namespace {

constexpr const char* kJsonContentType = "application/json";
constexpr auto kDeliverRetryInterval = std::chrono::milliseconds(5);

const HeaderMap kPostHeaders{
    {"Accept", "application/json, text/event-stream"}
};

/// A reply body worth handing to the protocol layer: a JSON-RPC envelope
/// (or batch), not a bare {"success":true} acknowledgement.
bool is_envelope(const std::string& body) {
    if (body.empty()) {
        return false;
    }
    const Json parsed = Json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return false;
    }
    if (parsed.is_object()) {
        return parsed.contains("jsonrpc");
    }
    return parsed.is_array() && !parsed.empty();
}

/// {"type":"connection","status":"connected"} and similar stream markers
bool is_status_event(const std::string& data) {
    const Json parsed = Json::parse(data, nullptr, false);
    return parsed.is_object() && parsed.contains("type") && !parsed.contains("jsonrpc");
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

HttpClientTransport::HttpClientTransport(
    asio::any_io_executor executor,
    HttpClientConfig config,
    std::unique_ptr<IHttpClient> http_client
)
    : config_(std::move(config))
    , executor_(std::move(executor))
    , http_(std::move(http_client))
    , pool_(config_.worker_threads == 0 ? 1 : config_.worker_threads)
{}

HttpClientTransport::~HttpClientTransport() {
    running_ = false;
    http_->cancel();
    if (inbound_) {
        inbound_->close();
    }
    if (stream_thread_.joinable()) {
        stream_thread_.join();
    }
    pool_.join();
}

// ═══════════════════════════════════════════════════════════════════════════
// IAsyncTransport Interface
// ═══════════════════════════════════════════════════════════════════════════

asio::any_io_executor HttpClientTransport::get_executor() {
    return executor_;
}

asio::awaitable<TransportResult<void>> HttpClientTransport::async_start() {
    if (running_) {
        co_return tl::unexpected(TransportError{
            TransportError::Category::Protocol, "Transport already running", std::nullopt});
    }
    if (config_.url.empty()) {
        co_return tl::unexpected(TransportError{
            TransportError::Category::Network, "No URL configured", std::nullopt});
    }

    http_->reset();
    http_->set_base_url(config_.url);
    http_->set_default_headers(config_.headers);
    http_->set_connect_timeout(config_.connect_timeout);
    http_->set_read_timeout(config_.request_timeout);
    http_->set_verify_ssl(config_.verify_ssl);

    inbound_ = std::make_unique<InboundChannel>(executor_, config_.channel_capacity);
    end_of_stream_ = false;
    running_ = true;

    if (config_.open_event_stream) {
        stream_thread_ = std::thread([this] { event_stream_loop(); });
    }

    RAGMCP_LOG_INFO("HttpClientTransport started: " + config_.url);
    co_return TransportResult<void>{};
}

asio::awaitable<void> HttpClientTransport::async_stop() {
    if (!running_) {
        co_return;
    }
    running_ = false;

    // Best effort: tell the server the session is over
    IHttpClient* http = http_.get();
    auto deleted = co_await asio::co_spawn(
        pool_.get_executor(),
        [http]() -> asio::awaitable<HttpClientResult<HttpClientResponse>> {
            co_return http->del("");
        },
        asio::use_awaitable);
    if (!deleted) {
        RAGMCP_LOG_DEBUG("DELETE on stop failed: " + deleted.error().message);
    }

    http_->cancel();
    inbound_->close();

    // The stream thread notices cancel() within about a second; join off the loop
    std::thread* stream = &stream_thread_;
    co_await asio::co_spawn(
        pool_.get_executor(),
        [stream]() -> asio::awaitable<void> {
            if (stream->joinable()) {
                stream->join();
            }
            co_return;
        },
        asio::use_awaitable);

    RAGMCP_LOG_INFO("HttpClientTransport stopped");
}

asio::awaitable<TransportResult<void>> HttpClientTransport::async_send(std::string payload) {
    if (!running_) {
        co_return tl::unexpected(TransportError{
            TransportError::Category::Network, "Transport not running", std::nullopt});
    }
    if (payload.size() > config_.max_message_size) {
        co_return tl::unexpected(TransportError{
            TransportError::Category::Protocol,
            "Message too large: " + std::to_string(payload.size()) + " bytes",
            std::nullopt});
    }

    IHttpClient* http = http_.get();
    auto response = co_await asio::co_spawn(
        pool_.get_executor(),
        [http, body = std::move(payload)]() -> asio::awaitable<HttpClientResult<HttpClientResponse>> {
            co_return http->post("", body, kJsonContentType, kPostHeaders);
        },
        asio::use_awaitable);

    if (!response) {
        co_return tl::unexpected(response.error().to_transport_error());
    }
    if (!response->is_success()) {
        co_return tl::unexpected(TransportError{
            TransportError::Category::Protocol,
            "HTTP " + std::to_string(response->status_code) + ": " + response->body,
            response->status_code});
    }

    try {
        if (response->is_sse()) {
            SseParser parser(SseParserConfig{config_.max_message_size, config_.max_message_size});
            auto events = parser.feed(response->body);
            if (events) {
                for (auto& event : *events) {
                    if (!event.data.empty() && !is_status_event(event.data)) {
                        co_await inbound_->async_send(asio::error_code{},
                            TransportResult<std::string>(std::move(event.data)), asio::use_awaitable);
                    }
                }
            }
        } else if (is_envelope(response->body)) {
            co_await inbound_->async_send(asio::error_code{},
                TransportResult<std::string>(std::move(response->body)), asio::use_awaitable);
        }
    } catch (const std::system_error&) {
        // stopped while handing the reply over; the POST itself succeeded
    }
    co_return TransportResult<void>{};
}

asio::awaitable<TransportResult<std::string>> HttpClientTransport::async_receive() {
    if (!inbound_) {
        co_return tl::unexpected(TransportError{
            TransportError::Category::Network, "Transport not running", std::nullopt});
    }
    if (end_of_stream_) {
        co_return tl::unexpected(TransportError::closed());
    }
    try {
        auto result = co_await inbound_->async_receive(asio::use_awaitable);
        if (!result && result.error().category == TransportError::Category::Closed) {
            end_of_stream_ = true;
        }
        co_return result;
    } catch (const std::system_error&) {
        end_of_stream_ = true;
        co_return tl::unexpected(TransportError::closed());
    }
}

bool HttpClientTransport::is_running() const {
    return running_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Event Stream
// ═══════════════════════════════════════════════════════════════════════════

void HttpClientTransport::deliver(TransportResult<std::string> item) {
    while (!inbound_->try_send(asio::error_code{}, item)) {
        if (!running_ || !inbound_->is_open()) {
            return;  // stopped; nobody is reading any more
        }
        std::this_thread::sleep_for(kDeliverRetryInterval);
    }
}

void HttpClientTransport::event_stream_loop() {
    SseParser parser(SseParserConfig{config_.max_message_size, config_.max_message_size});
    bool overflowed = false;

    auto result = http_->stream_get("", {}, [&](std::string_view chunk) {
        stream_open_ = true;
        auto events = parser.feed(chunk);
        if (!events) {
            RAGMCP_LOG_ERROR("Event stream: " + events.error().message);
            overflowed = true;
            deliver(tl::unexpected(events.error()));
            return false;
        }
        for (auto& event : *events) {
            if (event.data.empty() || is_status_event(event.data)) {
                continue;
            }
            deliver(std::move(event.data));
        }
        return running_.load();
    });

    const bool was_open = stream_open_.exchange(false);
    if (!running_ || overflowed) {
        return;
    }

    if (!result) {
        RAGMCP_LOG_WARN("Event stream unavailable: " + result.error().message);
        if (was_open) {
            deliver(tl::unexpected(TransportError::closed("Event stream lost: " + result.error().message)));
        }
        return;
    }
    if (!result->is_success()) {
        // Servers without GET support answer 405; POST replies still work
        RAGMCP_LOG_INFO("Event stream not offered (HTTP " + std::to_string(result->status_code) + ")");
        return;
    }

    RAGMCP_LOG_INFO("Event stream closed by server");
    deliver(tl::unexpected(TransportError::closed("Server closed the event stream")));
}

}  // namespace ragmcp
