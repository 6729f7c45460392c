#include "ragmcp/transport/http_server_transport.hpp"
#include "ragmcp/transport/sse.hpp"
#include "ragmcp/log/logger.hpp"

#include <httplib.h>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>
#include <chrono>

namespace ragmcp {

namespace {

// SSE writers re-check for shutdown at least this often
constexpr auto kStreamPollInterval = std::chrono::milliseconds(200);
constexpr auto kInboundRetryInterval = std::chrono::milliseconds(5);

void reply_json(httplib::Response& res, int status, const Json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

std::string connection_event() {
    return format_sse_event(Json{{"type", "connection"}, {"status", "connected"}}.dump());
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

HttpServerTransport::HttpServerTransport(asio::any_io_executor executor, HttpServerConfig config)
    : config_(std::move(config))
    , executor_(std::move(executor))
{}

HttpServerTransport::~HttpServerTransport() {
    if (running_) {
        running_ = false;
        close_all_streams();
        if (inbound_) {
            inbound_->close();
        }
        server_->stop();
    }
    if (listener_.joinable()) {
        listener_.join();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// IAsyncTransport Interface
// ═══════════════════════════════════════════════════════════════════════════

asio::any_io_executor HttpServerTransport::get_executor() {
    return executor_;
}

asio::awaitable<TransportResult<void>> HttpServerTransport::async_start() {
    if (running_) {
        co_return tl::unexpected(TransportError{
            TransportError::Category::Protocol, "Transport already running", std::nullopt});
    }
    if (listener_.joinable()) {
        listener_.join();  // previous run
    }

    server_ = std::make_unique<httplib::Server>();
    inbound_ = std::make_unique<InboundChannel>(executor_, config_.channel_capacity);
    end_of_stream_ = false;
    register_routes();

    if (config_.port == 0) {
        const int port = server_->bind_to_any_port(config_.host);
        if (port <= 0) {
            co_return tl::unexpected(TransportError{
                TransportError::Category::Network,
                "Failed to bind " + config_.host + " on any port",
                std::nullopt});
        }
        bound_port_ = static_cast<std::uint16_t>(port);
    } else {
        if (!server_->bind_to_port(config_.host, config_.port)) {
            co_return tl::unexpected(TransportError{
                TransportError::Category::Network,
                "Failed to bind " + config_.host + ":" + std::to_string(config_.port),
                std::nullopt});
        }
        bound_port_ = config_.port;
    }

    running_ = true;
    listener_ = std::thread([this] {
        if (!server_->listen_after_bind() && running_) {
            RAGMCP_LOG_ERROR("HTTP listener stopped unexpectedly");
        }
    });

    RAGMCP_LOG_INFO("HttpServerTransport listening on http://" + config_.host + ":" +
                    std::to_string(bound_port_) + config_.path);
    co_return TransportResult<void>{};
}

asio::awaitable<void> HttpServerTransport::async_stop() {
    if (!running_) {
        co_return;
    }
    running_ = false;

    close_all_streams();
    inbound_->close();
    server_->stop();

    // Stream writers wake within kStreamPollInterval, so this join is short
    if (listener_.joinable()) {
        listener_.join();
    }

    RAGMCP_LOG_INFO("HttpServerTransport stopped");
}

asio::awaitable<TransportResult<void>> HttpServerTransport::async_send(std::string payload) {
    if (!running_) {
        co_return tl::unexpected(TransportError{
            TransportError::Category::Network, "Transport not running", std::nullopt});
    }

    std::string event = format_sse_event(payload);
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        if (streams_.empty()) {
            backlog_.push_back(std::move(event));
            if (backlog_.size() > config_.max_backlog) {
                backlog_.pop_front();
                RAGMCP_LOG_WARN("No event stream attached; dropped oldest queued message");
            }
        } else {
            for (auto& stream : streams_) {
                stream->queue.push_back(event);
            }
        }
    }
    streams_cv_.notify_all();
    co_return TransportResult<void>{};
}

asio::awaitable<TransportResult<std::string>> HttpServerTransport::async_receive() {
    if (!inbound_) {
        co_return tl::unexpected(TransportError{
            TransportError::Category::Network, "Transport not running", std::nullopt});
    }
    if (end_of_stream_) {
        co_return tl::unexpected(TransportError::closed());
    }
    try {
        co_return co_await inbound_->async_receive(asio::use_awaitable);
    } catch (const std::system_error&) {
        end_of_stream_ = true;
        co_return tl::unexpected(TransportError::closed("HTTP session closed"));
    }
}

bool HttpServerTransport::is_running() const {
    return running_;
}

std::size_t HttpServerTransport::open_stream_count() const {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    return streams_.size();
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Event Streams
// ═══════════════════════════════════════════════════════════════════════════

void HttpServerTransport::attach_stream(const std::shared_ptr<EventStream>& stream) {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    stream->queue.push_back(connection_event());
    for (auto& queued : backlog_) {
        stream->queue.push_back(std::move(queued));
    }
    backlog_.clear();
    streams_.push_back(stream);
}

void HttpServerTransport::detach_stream(const std::shared_ptr<EventStream>& stream) {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    stream->closed = true;
    streams_.erase(std::remove(streams_.begin(), streams_.end(), stream), streams_.end());
}

void HttpServerTransport::close_all_streams() {
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        for (auto& stream : streams_) {
            stream->closed = true;
        }
        streams_.clear();
        backlog_.clear();
    }
    streams_cv_.notify_all();
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Routes
// ═══════════════════════════════════════════════════════════════════════════

void HttpServerTransport::register_routes() {
    if (config_.enable_cors) {
        server_->set_default_headers({
            {"Access-Control-Allow-Origin", "*"},
            {"Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS"},
            {"Access-Control-Allow-Headers", "Content-Type, Authorization"},
            {"Access-Control-Max-Age", "86400"}
        });
    }

    server_->Options(".*", [](const httplib::Request&, httplib::Response& res) {
        res.status = 200;
    });

    // ─────────────────────────────────────────────────────────────────────────
    // POST: one inbound message
    // ─────────────────────────────────────────────────────────────────────────

    server_->Post(config_.path, [this](const httplib::Request& req, httplib::Response& res) {
        const std::string content_type = req.get_header_value("Content-Type");
        if (content_type.find("application/json") == std::string::npos) {
            reply_json(res, 400, {{"error", "Content-Type must be application/json"}});
            return;
        }
        if (req.body.size() > config_.max_message_size) {
            reply_json(res, 413, {{"error", "Payload too large"}});
            return;
        }
        if (Json::parse(req.body, nullptr, false).is_discarded()) {
            reply_json(res, 400, {{"error", "Invalid JSON"}});
            return;
        }
        if (!running_) {
            reply_json(res, 503, {{"error", "Transport closed"}});
            return;
        }

        // Wait for room in the inbound queue while the session lasts
        const TransportResult<std::string> item(req.body);
        while (!inbound_->try_send(asio::error_code{}, item)) {
            if (!running_ || !inbound_->is_open()) {
                reply_json(res, 503, {{"error", "Transport closed"}});
                return;
            }
            std::this_thread::sleep_for(kInboundRetryInterval);
        }
        reply_json(res, 200, {{"success", true}});
    });

    // ─────────────────────────────────────────────────────────────────────────
    // GET: server-sent events
    // ─────────────────────────────────────────────────────────────────────────

    server_->Get(config_.path, [this](const httplib::Request&, httplib::Response& res) {
        auto stream = std::make_shared<EventStream>();
        attach_stream(stream);
        RAGMCP_LOG_DEBUG("Event stream attached");

        res.set_header("Cache-Control", "no-cache");
        res.set_header("Connection", "keep-alive");
        res.set_chunked_content_provider(
            "text/event-stream",
            [this, stream](std::size_t /*offset*/, httplib::DataSink& sink) {
                std::unique_lock<std::mutex> lock(streams_mutex_);
                streams_cv_.wait_for(lock, kStreamPollInterval, [this, &stream] {
                    return !stream->queue.empty() || stream->closed || !running_;
                });
                if (stream->closed || !running_) {
                    return false;
                }
                while (!stream->queue.empty()) {
                    std::string chunk = std::move(stream->queue.front());
                    stream->queue.pop_front();
                    lock.unlock();
                    if (!sink.write(chunk.data(), chunk.size())) {
                        return false;
                    }
                    lock.lock();
                }
                return true;
            },
            [this, stream](bool /*success*/) {
                detach_stream(stream);
                RAGMCP_LOG_DEBUG("Event stream detached");
            });
    });

    // ─────────────────────────────────────────────────────────────────────────
    // DELETE: end of session
    // ─────────────────────────────────────────────────────────────────────────

    server_->Delete(config_.path, [this](const httplib::Request&, httplib::Response& res) {
        reply_json(res, 200, {{"success", true}, {"message", "Connection closed"}});
        RAGMCP_LOG_INFO("Client ended the HTTP session");
        asio::post(executor_, [this] {
            asio::co_spawn(executor_, async_stop(), asio::detached);
        });
    });

    // Any other method on the endpoint
    const auto not_allowed = [](const httplib::Request&, httplib::Response& res) {
        reply_json(res, 405, {{"error", "Method not allowed"}});
    };
    server_->Put(config_.path, not_allowed);
    server_->Patch(config_.path, not_allowed);

    server_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.status == 404) {
            reply_json(res, 404, {{"error", "Not found"}});
        }
    });

    server_->set_exception_handler(
        [](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
            std::string message = "Internal server error";
            try {
                if (ep) {
                    std::rethrow_exception(ep);
                }
            } catch (const std::exception& e) {
                message = e.what();
            } catch (...) {
                RAGMCP_LOG_ERROR("Unknown exception in HTTP handler");
            }
            RAGMCP_LOG_ERROR("HTTP handler failed: " + message);
            reply_json(res, 500, {{"error", message}});
        });
}

}  // namespace ragmcp
