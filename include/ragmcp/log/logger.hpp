#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Logging
// ═══════════════════════════════════════════════════════════════════════════
// Library code logs through one process-wide ILogger reached with
// get_logger(). The level scale uses the severity names spdlog and MCP's
// logging/setLevel share, so a level read from a config file or sent by a
// peer lands on a backend as is.
//
// No backend here writes to stdout: in stdio server mode stdout carries the
// protocol stream.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace ragmcp {

// ─────────────────────────────────────────────────────────────────────────────
// Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Critical,
    Off
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:    return "trace";
        case LogLevel::Debug:    return "debug";
        case LogLevel::Info:     return "info";
        case LogLevel::Warning:  return "warning";
        case LogLevel::Error:    return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off:      return "off";
    }
    return "off";
}

/// True when a record at `level` passes `threshold`
[[nodiscard]] constexpr bool passes(LogLevel level, LogLevel threshold) noexcept {
    return level != LogLevel::Off &&
           static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(threshold);
}

/// Config-file names: case-insensitive, "warn" accepted for "warning".
[[nodiscard]] std::optional<LogLevel> log_level_from_string(std::string_view name) noexcept;

/// logging/setLevel and notifications/message names (RFC 5424). notice folds
/// into info; alert and emergency into critical.
[[nodiscard]] std::optional<LogLevel> log_level_from_mcp(std::string_view mcp_level) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// LogRecord
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    /// Called only for records that passed should_log()
    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual LogLevel level() const noexcept = 0;

    /// Moved at runtime by logging/setLevel
    virtual void set_level(LogLevel level) noexcept = 0;

    virtual void flush() {}

    [[nodiscard]] bool should_log(LogLevel record_level) const noexcept {
        return passes(record_level, level());
    }

    void write(
        LogLevel record_level,
        std::string_view message,
        std::source_location location = std::source_location::current()
    ) {
        if (should_log(record_level)) {
            log(LogRecord{record_level, std::string(message), std::chrono::system_clock::now(), location});
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord&) override {}
    [[nodiscard]] LogLevel level() const noexcept override { return LogLevel::Off; }
    void set_level(LogLevel) noexcept override {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────
// One plain line per record, no colors:
//   2026-10-19 14:02:11.481 warning [protocol_core.cpp:42] message

class ConsoleLogger final : public ILogger {
public:
    /// Writes to std::cerr
    explicit ConsoleLogger(LogLevel threshold = LogLevel::Info);

    /// `out` must outlive the logger
    ConsoleLogger(std::ostream& out, LogLevel threshold);

    void log(const LogRecord& record) override;

    [[nodiscard]] LogLevel level() const noexcept override {
        return threshold_.load(std::memory_order_relaxed);
    }

    void set_level(LogLevel level) noexcept override {
        threshold_.store(level, std::memory_order_relaxed);
    }

    void flush() override;

private:
    std::ostream& out_;
    std::atomic<LogLevel> threshold_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

/// The installed logger; a NullLogger until set_logger() is called
[[nodiscard]] ILogger& get_logger() noexcept;

/// Install a logger. nullptr goes back to the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// Arguments are only evaluated when the record would be kept.

#define RAGMCP_LOG_AT(level, msg) \
    do { if (::ragmcp::get_logger().should_log(level)) \
         ::ragmcp::get_logger().write(level, msg); } while (false)

#define RAGMCP_LOG_TRACE(msg) RAGMCP_LOG_AT(::ragmcp::LogLevel::Trace, msg)
#define RAGMCP_LOG_DEBUG(msg) RAGMCP_LOG_AT(::ragmcp::LogLevel::Debug, msg)
#define RAGMCP_LOG_INFO(msg)  RAGMCP_LOG_AT(::ragmcp::LogLevel::Info, msg)
#define RAGMCP_LOG_WARN(msg)  RAGMCP_LOG_AT(::ragmcp::LogLevel::Warning, msg)
#define RAGMCP_LOG_ERROR(msg) RAGMCP_LOG_AT(::ragmcp::LogLevel::Error, msg)

}  // namespace ragmcp
