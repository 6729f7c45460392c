#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Async Transport Interface
// ═══════════════════════════════════════════════════════════════════════════
// Coroutine-based byte transport using ASIO. One payload is one encoded
// JSON-RPC envelope; transports never look inside it.
//
// Event model:
//   async_start() succeeds       -> connected
//   async_receive() yields bytes -> message
//   async_receive() yields error -> error
//   Category::Closed             -> closed (no further messages)

#include "ragmcp/transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace ragmcp {

class IAsyncTransport {
public:
    virtual ~IAsyncTransport() = default;

    /// Get the executor associated with this transport
    [[nodiscard]] virtual asio::any_io_executor get_executor() = 0;

    /// Start the transport (spawn, connect or listen; start readers)
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_start() = 0;

    /// Stop the transport. Pending and future receives yield Closed.
    [[nodiscard]] virtual asio::awaitable<void> async_stop() = 0;

    /// Send one encoded message. Fails with Network when not running.
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_send(std::string payload) = 0;

    /// Next inbound payload, or an error. Closed means end of stream.
    [[nodiscard]] virtual asio::awaitable<TransportResult<std::string>> async_receive() = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /// "stdio" or "http"; used for TransportError data
    [[nodiscard]] virtual std::string_view kind() const noexcept = 0;
};

}  // namespace ragmcp
