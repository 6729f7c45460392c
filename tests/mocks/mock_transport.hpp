#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// MockTransport - In-process IAsyncTransport for protocol tests
// ═══════════════════════════════════════════════════════════════════════════
// Inbound payloads are queued by the test with inject(); outbound payloads
// are recorded. An optional responder answers each sent message in-band,
// which turns the mock into a scripted peer.

#include "ragmcp/transport/async_transport.hpp"

#include <asio/experimental/channel.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ragmcp::testing {

class MockTransport final : public IAsyncTransport {
public:
    /// Returns the envelope to deliver back, or nullopt for no reply
    using Responder = std::function<std::optional<Json>(const Json& message)>;

    explicit MockTransport(asio::any_io_executor executor, std::string kind = "stdio")
        : executor_(std::move(executor))
        , inbound_(executor_, 256)
        , kind_(std::move(kind))
    {}

    ~MockTransport() override {
        if (on_destroyed_) {
            on_destroyed_();
        }
    }

    // ─────────────────────────────────────────────────────────────────────────
    // IAsyncTransport
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::any_io_executor get_executor() override { return executor_; }

    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override {
        ++start_calls_;
        if (start_error_) {
            co_return tl::unexpected(*start_error_);
        }
        running_ = true;
        stopped_ = false;
        co_return TransportResult<void>{};
    }

    [[nodiscard]] asio::awaitable<void> async_stop() override {
        ++stop_calls_;
        running_ = false;
        if (!stopped_) {
            stopped_ = true;
            inbound_.cancel();
        }
        co_return;
    }

    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(std::string payload) override {
        if (!running_) {
            co_return tl::unexpected(TransportError{
                TransportError::Category::Network, "Transport not running", std::nullopt});
        }
        if (send_delay_.count() > 0) {
            asio::steady_timer timer(executor_, send_delay_);
            asio::error_code ec;
            co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        }
        if (send_error_) {
            co_return tl::unexpected(*send_error_);
        }
        sent_.push_back(payload);

        if (responder_) {
            Json message = Json::parse(payload, nullptr, false);
            if (!message.is_discarded()) {
                if (auto reply = responder_(message)) {
                    inject(reply->dump());
                }
            }
        }
        co_return TransportResult<void>{};
    }

    [[nodiscard]] asio::awaitable<TransportResult<std::string>> async_receive() override {
        if (stopped_) {
            co_return tl::unexpected(TransportError::closed());
        }
        asio::error_code ec;
        auto item = co_await inbound_.async_receive(asio::redirect_error(asio::use_awaitable, ec));
        if (ec || stopped_) {
            co_return tl::unexpected(TransportError::closed());
        }
        co_return item;
    }

    [[nodiscard]] bool is_running() const override { return running_; }
    [[nodiscard]] std::string_view kind() const noexcept override { return kind_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Test Controls
    // ─────────────────────────────────────────────────────────────────────────

    void inject(std::string payload) {
        inbound_.try_send(asio::error_code{}, TransportResult<std::string>(std::move(payload)));
    }

    void inject(const Json& message) { inject(message.dump()); }

    void inject_error(TransportError error) {
        inbound_.try_send(asio::error_code{}, TransportResult<std::string>(tl::unexpected(std::move(error))));
    }

    /// The remote end hangs up
    void close_from_peer(std::string reason = "Peer closed") {
        inject_error(TransportError::closed(std::move(reason)));
    }

    void set_responder(Responder responder) { responder_ = std::move(responder); }
    void fail_start(TransportError error) { start_error_ = std::move(error); }
    void fail_sends(TransportError error) { send_error_ = std::move(error); }
    /// Every send parks this long before it completes or fails
    void delay_sends(std::chrono::milliseconds delay) { send_delay_ = delay; }
    void on_destroyed(std::function<void()> callback) { on_destroyed_ = std::move(callback); }

    // ─────────────────────────────────────────────────────────────────────────
    // Inspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::vector<std::string>& sent() const noexcept { return sent_; }

    [[nodiscard]] Json sent_json(std::size_t index) const { return Json::parse(sent_.at(index)); }

    [[nodiscard]] std::vector<std::string> sent_methods() const {
        std::vector<std::string> methods;
        for (const auto& payload : sent_) {
            Json message = Json::parse(payload, nullptr, false);
            if (!message.is_discarded() && message.contains("method")) {
                methods.push_back(message["method"].get<std::string>());
            }
        }
        return methods;
    }

    /// The response (result or error) sent for request id, if any
    [[nodiscard]] std::optional<Json> find_response(const Json& id) const {
        for (const auto& payload : sent_) {
            Json message = Json::parse(payload, nullptr, false);
            if (message.is_discarded() || message.contains("method")) {
                continue;
            }
            if (message.contains("id") && message["id"] == id) {
                return message;
            }
        }
        return std::nullopt;
    }

    /// Last notification with this method, if any
    [[nodiscard]] std::optional<Json> find_notification(std::string_view method) const {
        std::optional<Json> found;
        for (const auto& payload : sent_) {
            Json message = Json::parse(payload, nullptr, false);
            if (message.is_discarded() || message.contains("id")) {
                continue;
            }
            if (message.value("method", "") == method) {
                found = message;
            }
        }
        return found;
    }

    void clear_sent() { sent_.clear(); }

    [[nodiscard]] int start_calls() const noexcept { return start_calls_; }
    [[nodiscard]] int stop_calls() const noexcept { return stop_calls_; }

private:
    using InboundChannel = asio::experimental::channel<
        void(asio::error_code, TransportResult<std::string>)
    >;

    asio::any_io_executor executor_;
    InboundChannel inbound_;
    std::string kind_;

    bool running_{false};
    bool stopped_{false};
    int start_calls_{0};
    int stop_calls_{0};

    std::optional<TransportError> start_error_;
    std::optional<TransportError> send_error_;
    std::chrono::milliseconds send_delay_{0};
    Responder responder_;
    std::function<void()> on_destroyed_;

    std::vector<std::string> sent_;
};

}  // namespace ragmcp::testing
