#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// ManualScheduler - IScheduler driven by the test's own clock
// ═══════════════════════════════════════════════════════════════════════════

#include "ragmcp/manager/scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <vector>

namespace ragmcp::testing {

class ManualScheduler final : public IScheduler {
public:
    void schedule(std::chrono::milliseconds delay, Task task) override {
        tasks_.push_back(Entry{now_ + delay, next_seq_++, std::move(task)});
        requested_delays_.push_back(delay);
    }

    void cancel_all() override {
        tasks_.clear();
        ++cancel_calls_;
    }

    [[nodiscard]] std::size_t pending() const override { return tasks_.size(); }

    /// Move the clock forward and run every task that fell due, earliest
    /// first. Tasks scheduled while running are due no sooner than now.
    std::size_t advance(std::chrono::milliseconds step) {
        now_ += step;
        std::size_t ran = 0;
        for (;;) {
            auto due = std::min_element(tasks_.begin(), tasks_.end(), [](const Entry& a, const Entry& b) {
                return a.due != b.due ? a.due < b.due : a.seq < b.seq;
            });
            if (due == tasks_.end() || due->due > now_) {
                break;
            }
            Task task = std::move(due->task);
            tasks_.erase(due);
            task();
            ++ran;
        }
        return ran;
    }

    [[nodiscard]] const std::vector<std::chrono::milliseconds>& requested_delays() const noexcept {
        return requested_delays_;
    }

    [[nodiscard]] int cancel_calls() const noexcept { return cancel_calls_; }

private:
    struct Entry {
        std::chrono::milliseconds due;
        std::uint64_t seq;
        Task task;
    };

    std::chrono::milliseconds now_{0};
    std::uint64_t next_seq_{0};
    std::vector<Entry> tasks_;
    std::vector<std::chrono::milliseconds> requested_delays_;
    int cancel_calls_{0};
};

}  // namespace ragmcp::testing
