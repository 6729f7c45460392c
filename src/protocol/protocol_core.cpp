#include "ragmcp/protocol/protocol_core.hpp"
#include "ragmcp/log/logger.hpp"

#include <asio/bind_executor.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>

namespace ragmcp {

std::string_view to_string(Role role) noexcept {
    switch (role) {
        case Role::Client: return "client";
        case Role::Server: return "server";
    }
    return "unknown";
}

std::string_view to_string(HandshakeState state) noexcept {
    switch (state) {
        case HandshakeState::Uninitialized: return "uninitialized";
        case HandshakeState::Initializing:  return "initializing";
        case HandshakeState::Ready:         return "ready";
        case HandshakeState::Closed:        return "closed";
    }
    return "unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// HandlerTable
// ═══════════════════════════════════════════════════════════════════════════

void HandlerTable::on_request(std::string method, RequestHandler handler) {
    requests_[std::move(method)] = std::move(handler);
}

void HandlerTable::on_notification(std::string method, NotificationHandler handler) {
    notifications_[std::move(method)] = std::move(handler);
}

std::optional<RequestHandler> HandlerTable::find_request(std::string_view method) const {
    const auto it = requests_.find(std::string(method));
    if (it == requests_.end() || !it->second) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<NotificationHandler> HandlerTable::find_notification(std::string_view method) const {
    const auto it = notifications_.find(std::string(method));
    if (it == notifications_.end() || !it->second) {
        return std::nullopt;
    }
    return it->second;
}

bool HandlerTable::has_request(std::string_view method) const {
    return requests_.contains(std::string(method));
}

Json CoreStatus::to_json() const {
    return {
        {"state", std::string(to_string(state))},
        {"pendingRequests", pending_requests},
        {"lastRequestId", last_request_id},
        {"role", std::string(to_string(role))}
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

ProtocolCore::ProtocolCore(
    IAsyncTransport& transport,
    Role role,
    ProtocolConfig config,
    HandlerTable handlers
)
    : transport_(transport)
    , role_(role)
    , config_(std::move(config))
    , handlers_(std::move(handlers))
    , codec_(config_.max_message_size)
    , strand_(asio::make_strand(transport_.get_executor()))
    , reader_done_(transport_.get_executor())
    , alive_(std::make_shared<std::atomic<bool>>(true))
{}

ProtocolCore::~ProtocolCore() {
    // Pending timer handlers and a suspended pump check this before touching members
    alive_->store(false, std::memory_order_release);

    for (auto& [id, req] : pending_requests_) {
        if (req && req->timeout_timer) {
            req->timeout_timer->cancel();
        }
    }
    // Owners call close() first; nothing can be awaited here
}

void ProtocolCore::set_local_identity(
    Implementation info,
    Json capabilities,
    std::optional<std::string> instructions
) {
    local_info_ = std::move(info);
    local_capabilities_ = std::move(capabilities);
    local_instructions_ = std::move(instructions);
}

void ProtocolCore::on_closed(std::function<void(const std::string& reason)> callback) {
    on_closed_ = std::move(callback);
}

void ProtocolCore::on_ready(std::function<void()> callback) {
    on_ready_ = std::move(callback);
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

void ProtocolCore::start() {
    if (started_) {
        return;
    }
    started_ = true;
    reader_active_ = true;
    reader_done_.expires_at(std::chrono::steady_clock::time_point::max());
    asio::co_spawn(strand_, reader_loop(alive_), asio::detached);
}

asio::awaitable<void> ProtocolCore::wait_stopped() {
    if (!reader_active_) {
        co_return;
    }
    asio::error_code ec;
    co_await reader_done_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
}

asio::awaitable<McpResult<InitializeResult>> ProtocolCore::initialize(
    Implementation client_info,
    Json capabilities
) {
    if (role_ != Role::Client) {
        co_return tl::unexpected(McpError::invalid_request("initialize() is only valid in the client role"));
    }
    if (state_ == HandshakeState::Closed) {
        co_return tl::unexpected(McpError::connection_error("Connection closed"));
    }

    state_ = HandshakeState::Initializing;

    InitializeParams params;
    params.protocol_version = config_.protocol_version;
    params.capabilities = std::move(capabilities);
    params.client_info = std::move(client_info);

    auto result = co_await send_request(std::string(methods::Initialize), params.to_json());
    if (!result) {
        if (state_ != HandshakeState::Closed) {
            state_ = HandshakeState::Uninitialized;
        }
        co_return tl::unexpected(result.error());
    }

    auto init_result = InitializeResult::from_json(*result);
    if (init_result.protocol_version != config_.protocol_version) {
        // Never silently downgrade
        state_ = HandshakeState::Uninitialized;
        co_return tl::unexpected(McpError::version_mismatch(
            config_.protocol_version, init_result.protocol_version));
    }

    remote_info_ = init_result.server_info;
    remote_capabilities_ = init_result.capabilities;
    remote_instructions_ = init_result.instructions;

    auto notified = co_await send_notification(std::string(methods::Initialized));
    if (!notified) {
        if (state_ != HandshakeState::Closed) {
            state_ = HandshakeState::Uninitialized;
        }
        co_return tl::unexpected(notified.error());
    }

    state_ = HandshakeState::Ready;
    RAGMCP_LOG_INFO("MCP session initialized with " + init_result.server_info.name +
                    " " + init_result.server_info.version);
    co_return init_result;
}

asio::awaitable<void> ProtocolCore::close(std::string reason) {
    if (state_ == HandshakeState::Closed) {
        co_return;
    }
    state_ = HandshakeState::Closed;

    const auto outstanding = pending_requests_.size();
    for (auto& [id, req] : pending_requests_) {
        req->timeout_timer->cancel();
        req->channel->try_send(asio::error_code{},
            McpResult<Json>(tl::unexpected(McpError::connection_error("Connection closed"))));
    }
    pending_requests_.clear();

    co_await transport_.async_stop();

    RAGMCP_LOG_INFO("Protocol session closed (" + reason + "), rejected " +
                    std::to_string(outstanding) + " pending request(s)");

    if (on_closed_) {
        auto callback = std::move(on_closed_);
        on_closed_ = nullptr;
        try {
            callback(reason);
        } catch (const std::exception& e) {
            RAGMCP_LOG_ERROR("Exception in close callback: " + std::string(e.what()));
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Messaging
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<McpResult<Json>> ProtocolCore::send_request(
    std::string method,
    std::optional<Json> params,
    std::optional<std::chrono::milliseconds> timeout
) {
    if (state_ == HandshakeState::Closed) {
        co_return tl::unexpected(McpError::connection_error("Connection closed"));
    }

    const std::int64_t id = ++next_request_id_;
    Request request{id, method, std::move(params)};
    std::string payload = codec_.encode(request);

    auto [slot, inserted] = pending_requests_.emplace(
        id, std::make_unique<PendingRequest>(transport_.get_executor(), method));
    auto& req = slot->second;

    const auto deadline = timeout.value_or(config_.request_timeout);
    if (deadline.count() > 0) {
        req->timeout_timer->expires_after(deadline);
        req->timeout_timer->async_wait(asio::bind_executor(strand_,
            [this, id, deadline, alive = alive_](asio::error_code ec) {
                if (!alive->load(std::memory_order_acquire)) {
                    return;  // core destroyed
                }
                if (ec) {
                    return;  // cancelled: settled some other way
                }
                if (settle(id, tl::unexpected(McpError::timeout(deadline.count())))) {
                    RAGMCP_LOG_WARN("Request " + std::to_string(id) + " timed out after " +
                                    std::to_string(deadline.count()) + "ms");
                }
            }
        ));
    }

    if (get_logger().should_log(LogLevel::Trace)) {
        RAGMCP_LOG_TRACE("-> " + redact_for_logging(request));
    }

    // Keep the channel alive across the await: a timeout may erase the entry
    auto channel = req->channel;

    auto sent = co_await transport_.async_send(std::move(payload));
    if (!sent) {
        if (auto it = pending_requests_.find(id); it != pending_requests_.end()) {
            it->second->timeout_timer->cancel();
            pending_requests_.erase(it);
        }
        // A slow send may have outlived the deadline or a close: that outcome wins
        std::optional<McpResult<Json>> settled;
        channel->try_receive([&settled](asio::error_code, McpResult<Json> outcome) {
            settled = std::move(outcome);
        });
        if (settled) {
            co_return std::move(*settled);
        }
        co_return tl::unexpected(McpError::from_transport(sent.error(), transport_.kind())
            .wrap("Failed to send " + method));
    }

    try {
        auto result = co_await channel->async_receive(asio::use_awaitable);
        co_return result;
    } catch (const std::system_error&) {
        if (auto it = pending_requests_.find(id); it != pending_requests_.end()) {
            it->second->timeout_timer->cancel();
            pending_requests_.erase(it);
        }
        co_return tl::unexpected(McpError::connection_error("Connection closed"));
    }
}

asio::awaitable<McpResult<void>> ProtocolCore::send_notification(
    std::string method,
    std::optional<Json> params
) {
    if (state_ == HandshakeState::Closed) {
        co_return tl::unexpected(McpError::connection_error("Connection closed"));
    }

    Notification notification{std::move(method), std::move(params)};
    auto sent = co_await transport_.async_send(codec_.encode(notification));
    if (!sent) {
        co_return tl::unexpected(McpError::transport_error(
            "Failed to send " + notification.method + ": " + sent.error().message,
            transport_.kind()));
    }
    co_return McpResult<void>{};
}

asio::awaitable<McpResult<void>> ProtocolCore::cancel_request(std::int64_t id, std::string reason) {
    if (!settle(id, tl::unexpected(McpError::cancelled("Request cancelled: " + reason)))) {
        co_return tl::unexpected(McpError::invalid_params(
            "No pending request with id " + std::to_string(id)));
    }

    CancelledNotification notice{id, reason};
    co_return co_await send_notification(std::string(methods::Cancelled), notice.to_json());
}

bool ProtocolCore::settle(std::int64_t id, McpResult<Json> outcome) {
    auto it = pending_requests_.find(id);
    if (it == pending_requests_.end()) {
        return false;
    }
    it->second->timeout_timer->cancel();
    it->second->channel->try_send(asio::error_code{}, std::move(outcome));
    pending_requests_.erase(it);
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Status
// ═══════════════════════════════════════════════════════════════════════════

CoreStatus ProtocolCore::status() const {
    return CoreStatus{state_, pending_requests_.size(), next_request_id_, role_};
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Inbound Pump
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> ProtocolCore::reader_loop(std::shared_ptr<std::atomic<bool>> alive) {
    for (;;) {
        auto received = co_await transport_.async_receive();
        if (!alive->load(std::memory_order_acquire)) {
            co_return;
        }
        if (state_ == HandshakeState::Closed) {
            break;
        }

        if (!received) {
            const auto& error = received.error();
            if (error.category == TransportError::Category::Closed) {
                RAGMCP_LOG_INFO("Transport closed: " + error.message);
            } else {
                RAGMCP_LOG_ERROR("Transport error: " + error.message);
            }
            co_await close(error.message);
            if (!alive->load(std::memory_order_acquire)) {
                co_return;
            }
            break;
        }

        co_await process_message(std::move(*received));
        if (!alive->load(std::memory_order_acquire)) {
            co_return;
        }
    }

    reader_active_ = false;
    reader_done_.cancel();
}

asio::awaitable<void> ProtocolCore::process_message(std::string payload) {
    auto decoded = codec_.decode(payload);
    if (!decoded) {
        const DecodeError& failure = decoded.error();
        RAGMCP_LOG_WARN("Rejected inbound message: " + failure.error.describe());

        if (failure.is_response) {
            // Never answer a response; fail the request it claims to settle
            if (failure.request_id.has_value()) {
                if (const auto* numeric = std::get_if<std::int64_t>(&*failure.request_id)) {
                    settle(*numeric, tl::unexpected(failure.error));
                }
            }
        } else if (failure.request_id.has_value()) {
            co_await send_response(Response::failure(failure.request_id, failure.error));
        } else if (failure.is_json_object) {
            co_await send_response(Response::failure(std::nullopt, failure.error));
        }
        co_return;
    }

    Message& message = *decoded;
    if (get_logger().should_log(LogLevel::Trace)) {
        RAGMCP_LOG_TRACE("<- " + redact_for_logging(message));
    }

    if (auto* request = std::get_if<Request>(&message)) {
        // Handlers run concurrently so a slow one never blocks correlation
        asio::co_spawn(strand_, handle_request(std::move(*request)), asio::detached);
    } else if (auto* response = std::get_if<Response>(&message)) {
        handle_response(std::move(*response));
    } else {
        handle_notification(std::get<Notification>(message));
    }
}

asio::awaitable<void> ProtocolCore::handle_request(Request request) {
    auto alive = alive_;
    const Json params = request.params.value_or(Json::object());

    McpResult<Json> outcome = tl::unexpected(McpError::method_not_found(request.method));

    auto handler = handlers_.find_request(request.method);
    const bool builtin_initialize = !handler && role_ == Role::Server &&
                                    request.method == methods::Initialize;
    const bool builtin_ping = !handler && request.method == methods::Ping;

    if (handler || builtin_initialize || builtin_ping) {
        if (auto valid = validate_params(request.method, params); !valid) {
            outcome = tl::unexpected(valid.error());
        } else if (builtin_initialize) {
            outcome = co_await handle_initialize(params);
        } else if (builtin_ping) {
            outcome = Json::object();
        } else {
            try {
                outcome = co_await (*handler)(params);
            } catch (const std::exception& e) {
                RAGMCP_LOG_ERROR("Handler for " + request.method + " threw: " + e.what());
                outcome = tl::unexpected(McpError::internal_error(
                    "Internal error while handling " + request.method + ": " + e.what()));
            }
        }
    } else {
        RAGMCP_LOG_DEBUG("No handler for " + request.method);
    }

    if (!alive->load(std::memory_order_acquire) || state_ == HandshakeState::Closed) {
        co_return;
    }
    co_await send_response(Response{request.id, std::move(outcome)});
}

asio::awaitable<McpResult<Json>> ProtocolCore::handle_initialize(const Json& params) {
    auto init = InitializeParams::from_json(params);
    if (init.protocol_version != config_.protocol_version) {
        RAGMCP_LOG_WARN("Rejecting client " + init.client_info.name + ": protocol " +
                        init.protocol_version);
        co_return tl::unexpected(McpError::version_mismatch(
            config_.protocol_version, init.protocol_version));
    }

    remote_info_ = init.client_info;
    remote_capabilities_ = init.capabilities;
    if (state_ == HandshakeState::Uninitialized) {
        state_ = HandshakeState::Initializing;
    }

    InitializeResult result;
    result.protocol_version = config_.protocol_version;
    result.capabilities = local_capabilities_;
    result.server_info = local_info_;
    result.instructions = local_instructions_;

    RAGMCP_LOG_INFO("Client connected: " + init.client_info.name + " " + init.client_info.version);
    co_return result.to_json();
}

void ProtocolCore::handle_response(Response response) {
    if (!response.id.has_value()) {
        const std::string detail = response.is_error() ? response.outcome.error().describe() : "result";
        RAGMCP_LOG_WARN("Received response without id: " + detail);
        return;
    }
    const auto* numeric = std::get_if<std::int64_t>(&*response.id);
    if (numeric == nullptr || !settle(*numeric, std::move(response.outcome))) {
        RAGMCP_LOG_WARN("Received response for unknown request ID: " + id_to_string(*response.id));
    }
}

void ProtocolCore::handle_notification(const Notification& notification) {
    const Json params = notification.params.value_or(Json::object());

    if (notification.method == methods::Cancelled) {
        const auto notice = CancelledNotification::from_json(params);
        if (notice.request_id.is_number_integer()) {
            const auto id = notice.request_id.get<std::int64_t>();
            if (settle(id, tl::unexpected(McpError::cancelled("Request cancelled")))) {
                RAGMCP_LOG_INFO("Peer cancelled request " + std::to_string(id) +
                                (notice.reason ? ": " + *notice.reason : std::string{}));
            }
        }
    } else if (notification.method == methods::Initialized && role_ == Role::Server) {
        if (state_ != HandshakeState::Closed) {
            state_ = HandshakeState::Ready;
            if (on_ready_) {
                try {
                    on_ready_();
                } catch (const std::exception& e) {
                    RAGMCP_LOG_ERROR("Exception in ready callback: " + std::string(e.what()));
                }
            }
        }
    }

    auto handler = handlers_.find_notification(notification.method);
    if (!handler) {
        if (notification.method != methods::Cancelled && notification.method != methods::Initialized) {
            RAGMCP_LOG_DEBUG("Ignoring notification " + notification.method);
        }
        return;
    }

    try {
        (*handler)(params);
    } catch (const std::exception& e) {
        RAGMCP_LOG_ERROR("Exception in notification handler for " + notification.method +
                         ": " + e.what());
    }
}

asio::awaitable<void> ProtocolCore::send_response(Response response) {
    std::string payload = codec_.encode(response);
    if (get_logger().should_log(LogLevel::Trace)) {
        RAGMCP_LOG_TRACE("-> " + redact_for_logging(response));
    }
    auto sent = co_await transport_.async_send(std::move(payload));
    if (!sent) {
        RAGMCP_LOG_ERROR("Failed to send response: " + sent.error().message);
    }
}

}  // namespace ragmcp
