#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Protocol Core
// ═══════════════════════════════════════════════════════════════════════════
// Transport-agnostic JSON-RPC session shared by the client and server roles.
//
//   - request/response correlation via pending_requests_ (one-slot channel
//     and timeout timer per request)
//   - injected HandlerTable for inbound requests and notifications
//   - initialize handshake (client side: initialize(); server side: a
//     built-in "initialize" handler)
//   - built-ins: ping, notifications/cancelled, notifications/initialized
//
// Usage (client role):
//   ProtocolCore core(transport, Role::Client, config);
//   co_await transport.async_start();
//   core.start();
//   auto init = co_await core.initialize({"my-client", "1.0"});
//   auto tools = co_await core.send_request("tools/list");
//   co_await core.close();
//
// All methods must be called from the transport's executor; the core keeps
// its own state on a strand over it.

#include "ragmcp/config.hpp"
#include "ragmcp/protocol/errors.hpp"
#include "ragmcp/protocol/mcp_types.hpp"
#include "ragmcp/protocol/message.hpp"
#include "ragmcp/transport/async_transport.hpp"

#include <asio/awaitable.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace ragmcp {

enum class Role { Client, Server };

enum class HandshakeState {
    Uninitialized,
    Initializing,
    Ready,
    Closed
};

[[nodiscard]] std::string_view to_string(Role role) noexcept;
[[nodiscard]] std::string_view to_string(HandshakeState state) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Handler Table
// ─────────────────────────────────────────────────────────────────────────────

/// Handles one inbound request. params is {} when the request had none.
using RequestHandler = std::function<asio::awaitable<McpResult<Json>>(const Json& params)>;

/// Handles one inbound notification. Exceptions are logged, never fatal.
using NotificationHandler = std::function<void(const Json& params)>;

class HandlerTable {
public:
    void on_request(std::string method, RequestHandler handler);
    void on_notification(std::string method, NotificationHandler handler);

    [[nodiscard]] std::optional<RequestHandler> find_request(std::string_view method) const;
    [[nodiscard]] std::optional<NotificationHandler> find_notification(std::string_view method) const;

    [[nodiscard]] bool has_request(std::string_view method) const;

private:
    std::unordered_map<std::string, RequestHandler> requests_;
    std::unordered_map<std::string, NotificationHandler> notifications_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Status
// ─────────────────────────────────────────────────────────────────────────────

struct CoreStatus {
    HandshakeState state{HandshakeState::Uninitialized};
    std::size_t pending_requests{0};
    std::int64_t last_request_id{0};
    Role role{Role::Client};

    [[nodiscard]] Json to_json() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// ProtocolCore
// ─────────────────────────────────────────────────────────────────────────────

class ProtocolCore {
public:
    ProtocolCore(
        IAsyncTransport& transport,
        Role role,
        ProtocolConfig config = {},
        HandlerTable handlers = {}
    );
    ~ProtocolCore();

    ProtocolCore(const ProtocolCore&) = delete;
    ProtocolCore& operator=(const ProtocolCore&) = delete;

    /// Register handlers before start()
    [[nodiscard]] HandlerTable& handlers() noexcept { return handlers_; }

    /// Identity answered to "initialize" (server role)
    void set_local_identity(
        Implementation info,
        Json capabilities,
        std::optional<std::string> instructions = std::nullopt
    );

    /// Fired once, with the reason, when the session closes for any cause
    void on_closed(std::function<void(const std::string& reason)> callback);

    /// Server role: fired when notifications/initialized arrives
    void on_ready(std::function<void()> callback);

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Spawn the inbound pump. The transport must already be started.
    void start();

    /// Client role handshake. A protocolVersion other than the configured
    /// one fails with VersionCompatibility and leaves the core uninitialized.
    [[nodiscard]] asio::awaitable<McpResult<InitializeResult>> initialize(
        Implementation client_info,
        Json capabilities = Json::object()
    );

    /// Reject everything outstanding with ConnectionError, stop the
    /// transport, fire on_closed. Idempotent.
    asio::awaitable<void> close(std::string reason = "Connection closed");

    /// Resumes once the inbound pump has exited. Call after close() and
    /// before destroying the transport. Never call from a handler.
    asio::awaitable<void> wait_stopped();

    // ─────────────────────────────────────────────────────────────────────────
    // Messaging
    // ─────────────────────────────────────────────────────────────────────────

    /// Resolves with the peer's result, or rejects with its error, Timeout,
    /// TransportError (send failed) or ConnectionError (closed meanwhile).
    [[nodiscard]] asio::awaitable<McpResult<Json>> send_request(
        std::string method,
        std::optional<Json> params = std::nullopt,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    [[nodiscard]] asio::awaitable<McpResult<void>> send_notification(
        std::string method,
        std::optional<Json> params = std::nullopt
    );

    /// Reject a local pending request with Cancelled and tell the peer.
    [[nodiscard]] asio::awaitable<McpResult<void>> cancel_request(
        std::int64_t id,
        std::string reason = "Request cancelled"
    );

    /// Decode and route one inbound payload.
    asio::awaitable<void> process_message(std::string payload);

    // ─────────────────────────────────────────────────────────────────────────
    // State
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] CoreStatus status() const;
    [[nodiscard]] HandshakeState state() const noexcept { return state_; }
    [[nodiscard]] bool is_ready() const noexcept { return state_ == HandshakeState::Ready; }
    [[nodiscard]] bool is_closed() const noexcept { return state_ == HandshakeState::Closed; }
    [[nodiscard]] Role role() const noexcept { return role_; }

    [[nodiscard]] const std::optional<Implementation>& remote_info() const noexcept { return remote_info_; }
    [[nodiscard]] const Json& remote_capabilities() const noexcept { return remote_capabilities_; }
    [[nodiscard]] const std::optional<std::string>& remote_instructions() const noexcept {
        return remote_instructions_;
    }

    [[nodiscard]] const ProtocolConfig& config() const noexcept { return config_; }

private:
    struct PendingRequest {
        using ResponseChannel = asio::experimental::channel<
            void(asio::error_code, McpResult<Json>)
        >;
        // shared: the waiter keeps the channel alive even after the entry
        // has been erased by a timeout, response or close
        std::shared_ptr<ResponseChannel> channel;
        std::unique_ptr<asio::steady_timer> timeout_timer;
        std::chrono::steady_clock::time_point created_at;
        std::string method;

        explicit PendingRequest(asio::any_io_executor exec, std::string method_name)
            : channel(std::make_shared<ResponseChannel>(exec, 1))
            , timeout_timer(std::make_unique<asio::steady_timer>(exec))
            , created_at(std::chrono::steady_clock::now())
            , method(std::move(method_name))
        {}
    };

    asio::awaitable<void> reader_loop(std::shared_ptr<std::atomic<bool>> alive);
    asio::awaitable<void> handle_request(Request request);
    void handle_response(Response response);
    void handle_notification(const Notification& notification);

    asio::awaitable<McpResult<Json>> handle_initialize(const Json& params);

    asio::awaitable<void> send_response(Response response);

    /// Resolve a pending request exactly once and drop its entry.
    bool settle(std::int64_t id, McpResult<Json> outcome);

    IAsyncTransport& transport_;
    Role role_;
    ProtocolConfig config_;
    HandlerTable handlers_;
    MessageCodec codec_;

    asio::strand<asio::any_io_executor> strand_;

    std::map<std::int64_t, std::unique_ptr<PendingRequest>> pending_requests_;
    std::int64_t next_request_id_{0};

    HandshakeState state_{HandshakeState::Uninitialized};
    bool started_{false};
    bool reader_active_{false};
    asio::steady_timer reader_done_;

    Implementation local_info_{"ragmcp", "1.0.0"};
    Json local_capabilities_ = Json::object();
    std::optional<std::string> local_instructions_;

    std::optional<Implementation> remote_info_;
    Json remote_capabilities_ = Json::object();
    std::optional<std::string> remote_instructions_;

    std::function<void(const std::string&)> on_closed_;
    std::function<void()> on_ready_;

    // Cleared in the destructor; timers and the pump check it after resuming
    std::shared_ptr<std::atomic<bool>> alive_;
};

}  // namespace ragmcp
