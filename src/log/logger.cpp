#include "ragmcp/log/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace ragmcp {

namespace {

std::string timestamp_text(std::chrono::system_clock::time_point tp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis;
    return out.str();
}

std::string_view basename(std::string_view path) noexcept {
    const auto slash = path.find_last_of('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Level Names
// ─────────────────────────────────────────────────────────────────────────────

std::optional<LogLevel> log_level_from_string(std::string_view name) noexcept {
    std::array<char, 16> lowered{};
    if (name.empty() || name.size() >= lowered.size()) {
        return std::nullopt;
    }
    std::transform(name.begin(), name.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const std::string_view key(lowered.data(), name.size());

    if (key == "warn") {
        return LogLevel::Warning;
    }
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warning,
                       LogLevel::Error, LogLevel::Critical, LogLevel::Off}) {
        if (key == to_string(level)) {
            return level;
        }
    }
    return std::nullopt;
}

std::optional<LogLevel> log_level_from_mcp(std::string_view mcp_level) noexcept {
    if (mcp_level == "notice") {
        return LogLevel::Info;
    }
    if (mcp_level == "alert" || mcp_level == "emergency") {
        return LogLevel::Critical;
    }
    // The remaining MCP names are spelled like ours; trace and off are not MCP levels
    for (auto level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warning,
                       LogLevel::Error, LogLevel::Critical}) {
        if (mcp_level == to_string(level)) {
            return level;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────

ConsoleLogger::ConsoleLogger(LogLevel threshold)
    : ConsoleLogger(std::cerr, threshold)
{}

ConsoleLogger::ConsoleLogger(std::ostream& out, LogLevel threshold)
    : out_(out)
    , threshold_(threshold)
{}

void ConsoleLogger::log(const LogRecord& record) {
    std::ostringstream line;
    line << timestamp_text(record.timestamp) << ' '
         << std::left << std::setw(8) << to_string(record.level)
         << '[' << basename(record.location.file_name()) << ':' << record.location.line() << "] "
         << record.message << '\n';

    // Lines from concurrent threads must not interleave
    static std::mutex write_mutex;
    std::lock_guard<std::mutex> lock(write_mutex);
    out_ << line.str();
}

void ConsoleLogger::flush() {
    out_.flush();
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

struct GlobalLogger {
    std::mutex mutex;
    std::unique_ptr<ILogger> instance{std::make_unique<NullLogger>()};
};

GlobalLogger& global() {
    static GlobalLogger state;
    return state;
}

}  // namespace

ILogger& get_logger() noexcept {
    auto& state = global();
    std::lock_guard<std::mutex> lock(state.mutex);
    return *state.instance;
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    auto& state = global();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (logger) {
        state.instance = std::move(logger);
    } else {
        state.instance = std::make_unique<NullLogger>();
    }
}

}  // namespace ragmcp
