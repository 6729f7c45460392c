#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// HTTP Server Transport
// ═══════════════════════════════════════════════════════════════════════════
// Serves one MCP peer over HTTP (cpp-httplib):
//
//   POST   <path>  one JSON-RPC message in; answers {"success":true}
//   GET    <path>  text/event-stream; every outbound message is a data: event
//   DELETE <path>  ends the session and closes the transport
//   OPTIONS *      CORS preflight
//
// httplib runs its handlers on its own worker threads. They hand inbound
// payloads to the event loop through a concurrent channel and pick up
// outbound messages from per-stream queues.

#include "ragmcp/config.hpp"
#include "ragmcp/transport/async_transport.hpp"

#include <asio/experimental/concurrent_channel.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace httplib {
class Server;
}

namespace ragmcp {

class HttpServerTransport : public IAsyncTransport {
public:
    HttpServerTransport(asio::any_io_executor executor, HttpServerConfig config);
    ~HttpServerTransport() override;

    HttpServerTransport(const HttpServerTransport&) = delete;
    HttpServerTransport& operator=(const HttpServerTransport&) = delete;

    [[nodiscard]] asio::any_io_executor get_executor() override;

    /// Binds and starts listening; fails with Network if the port is taken.
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override;
    [[nodiscard]] asio::awaitable<void> async_stop() override;

    /// Queues the payload on every open event stream (or the backlog)
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(std::string payload) override;
    [[nodiscard]] asio::awaitable<TransportResult<std::string>> async_receive() override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] std::string_view kind() const noexcept override { return "http"; }

    /// Port actually bound (differs from config when config.port == 0)
    [[nodiscard]] std::uint16_t bound_port() const noexcept { return bound_port_; }

    [[nodiscard]] std::size_t open_stream_count() const;

private:
    struct EventStream {
        std::deque<std::string> queue;  // formatted SSE events
        bool closed{false};
    };

    void register_routes();
    void attach_stream(const std::shared_ptr<EventStream>& stream);
    void detach_stream(const std::shared_ptr<EventStream>& stream);
    void close_all_streams();

    HttpServerConfig config_;
    asio::any_io_executor executor_;

    std::unique_ptr<httplib::Server> server_;
    std::thread listener_;
    std::uint16_t bound_port_{0};

    using InboundChannel = asio::experimental::concurrent_channel<
        void(asio::error_code, TransportResult<std::string>)
    >;
    std::unique_ptr<InboundChannel> inbound_;

    mutable std::mutex streams_mutex_;
    std::condition_variable streams_cv_;
    std::vector<std::shared_ptr<EventStream>> streams_;
    std::deque<std::string> backlog_;

    std::atomic<bool> running_{false};
    bool end_of_stream_{false};
};

}  // namespace ragmcp
