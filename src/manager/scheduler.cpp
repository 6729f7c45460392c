#include "ragmcp/manager/scheduler.hpp"
#include "ragmcp/log/logger.hpp"

#include <algorithm>
#include <exception>
#include <string>

namespace ragmcp {

AsioScheduler::AsioScheduler(asio::any_io_executor executor)
    : executor_(std::move(executor))
    , alive_(std::make_shared<std::atomic<bool>>(true))
{}

AsioScheduler::~AsioScheduler() {
    alive_->store(false, std::memory_order_release);
    cancel_all();
}

void AsioScheduler::schedule(std::chrono::milliseconds delay, Task task) {
    const std::uint64_t id = next_id_++;
    auto timer = std::make_shared<asio::steady_timer>(executor_, delay);
    timers_.emplace(id, timer);

    // The handler owns the timer; the map entry only allows cancellation
    timer->async_wait([this, id, timer, alive = alive_, task = std::move(task)](const asio::error_code& ec) {
        if (!alive->load(std::memory_order_acquire)) {
            return;
        }
        timers_.erase(id);
        if (ec) {
            return;
        }
        try {
            task();
        } catch (const std::exception& e) {
            RAGMCP_LOG_ERROR("Scheduled task threw: " + std::string(e.what()));
        }
    });
}

void AsioScheduler::cancel_all() {
    for (auto& [id, timer] : timers_) {
        timer->cancel();
    }
    timers_.clear();
}

std::optional<RetryState> plan_retry(
    int failures,
    int max_attempts,
    std::chrono::milliseconds base_delay
) noexcept {
    if (failures < 0) {
        failures = 0;
    }
    if (failures >= max_attempts) {
        return std::nullopt;
    }
    // Exponent capped so a misconfigured attempt count cannot overflow
    const int exponent = std::min(failures, 20);
    return RetryState{failures + 1, base_delay * (std::int64_t{1} << exponent)};
}

}  // namespace ragmcp
