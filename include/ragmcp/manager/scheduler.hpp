#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Scheduler
// ═══════════════════════════════════════════════════════════════════════════
// Delayed task execution for reconnection backoff and health checks.
// AsioScheduler runs on steady_timers; tests substitute a manual clock.

#include <asio/any_io_executor.hpp>
#include <asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>

namespace ragmcp {

class IScheduler {
public:
    using Task = std::function<void()>;

    virtual ~IScheduler() = default;

    /// Run task once after delay. Tasks never run after cancel_all().
    virtual void schedule(std::chrono::milliseconds delay, Task task) = 0;

    virtual void cancel_all() = 0;

    [[nodiscard]] virtual std::size_t pending() const = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// AsioScheduler
// ─────────────────────────────────────────────────────────────────────────────

class AsioScheduler final : public IScheduler {
public:
    explicit AsioScheduler(asio::any_io_executor executor);
    ~AsioScheduler() override;

    AsioScheduler(const AsioScheduler&) = delete;
    AsioScheduler& operator=(const AsioScheduler&) = delete;

    void schedule(std::chrono::milliseconds delay, Task task) override;
    void cancel_all() override;
    [[nodiscard]] std::size_t pending() const override { return timers_.size(); }

private:
    asio::any_io_executor executor_;
    std::map<std::uint64_t, std::shared_ptr<asio::steady_timer>> timers_;
    std::uint64_t next_id_{0};
    std::shared_ptr<std::atomic<bool>> alive_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Retry Backoff
// ─────────────────────────────────────────────────────────────────────────────

/// Next reconnection attempt for a server
struct RetryState {
    int attempt{0};  // 1-based attempt number being scheduled
    std::chrono::milliseconds next_delay{0};
};

/// delay = base * 2^failures. std::nullopt once failures reach max_attempts.
[[nodiscard]] std::optional<RetryState> plan_retry(
    int failures,
    int max_attempts,
    std::chrono::milliseconds base_delay
) noexcept;

}  // namespace ragmcp
