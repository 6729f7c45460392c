#pragma once

#include "ragmcp/log/logger.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace ragmcp {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - the default backend
// ─────────────────────────────────────────────────────────────────────────────
// Sinks are stderr (colored) and an optional file. With `async` set, records
// are queued to spdlog's shared thread pool and written off the caller's
// thread; a full queue blocks the caller rather than dropping records.

struct SpdlogOptions {
    std::string name{"ragmcp"};    // shown by %n
    LogLevel level{LogLevel::Info};
    bool to_stderr{true};
    std::string file;              // empty: no file sink
    bool async{false};
    std::size_t async_queue_size{8192};
    std::string pattern{"%Y-%m-%d %H:%M:%S.%e %^%-8l%$[%n] %v (%s:%#)"};
};

class SpdlogLogger final : public ILogger {
public:
    /// Throws spdlog::spdlog_ex when the file sink cannot be opened.
    explicit SpdlogLogger(const SpdlogOptions& options);

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] LogLevel level() const noexcept override {
        return level_.load(std::memory_order_relaxed);
    }

    void set_level(LogLevel level) noexcept override;

    void flush() override;

    [[nodiscard]] spdlog::logger& backend() noexcept { return *logger_; }

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<LogLevel> level_;
};

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;

}  // namespace ragmcp
