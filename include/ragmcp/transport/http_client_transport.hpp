#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// HTTP Client Transport
// ═══════════════════════════════════════════════════════════════════════════
// Talks to a remote MCP server over HTTP:
//   - one POST per outbound message (2xx = delivered; a JSON-RPC body in
//     the reply is delivered inbound)
//   - optional GET text/event-stream for server-initiated messages
//   - DELETE on stop (best effort)
//
// The HTTP calls block, so they run on a private worker pool and hand
// results back through a concurrent channel.

#include "ragmcp/config.hpp"
#include "ragmcp/transport/async_transport.hpp"
#include "ragmcp/transport/http_client.hpp"

#include <asio/experimental/concurrent_channel.hpp>
#include <asio/thread_pool.hpp>

#include <atomic>
#include <memory>
#include <thread>

namespace ragmcp {

class HttpClientTransport : public IAsyncTransport {
public:
    HttpClientTransport(
        asio::any_io_executor executor,
        HttpClientConfig config,
        std::unique_ptr<IHttpClient> http_client = make_http_client()
    );
    ~HttpClientTransport() override;

    HttpClientTransport(const HttpClientTransport&) = delete;
    HttpClientTransport& operator=(const HttpClientTransport&) = delete;

    [[nodiscard]] asio::any_io_executor get_executor() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override;
    [[nodiscard]] asio::awaitable<void> async_stop() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(std::string payload) override;
    [[nodiscard]] asio::awaitable<TransportResult<std::string>> async_receive() override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] std::string_view kind() const noexcept override { return "http"; }

    /// True while the GET event stream is attached
    [[nodiscard]] bool is_event_stream_open() const noexcept { return stream_open_; }

private:
    void event_stream_loop();

    /// Hand one inbound payload (or error) to async_receive. Blocks the
    /// calling stream thread while the channel is full.
    void deliver(TransportResult<std::string> item);

    HttpClientConfig config_;
    asio::any_io_executor executor_;
    std::unique_ptr<IHttpClient> http_;

    asio::thread_pool pool_;
    std::thread stream_thread_;

    using InboundChannel = asio::experimental::concurrent_channel<
        void(asio::error_code, TransportResult<std::string>)
    >;
    std::unique_ptr<InboundChannel> inbound_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stream_open_{false};
    bool end_of_stream_{false};
};

}  // namespace ragmcp
