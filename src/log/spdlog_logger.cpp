#include "ragmcp/log/spdlog_logger.hpp"

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <utility>
#include <vector>

namespace ragmcp {

namespace {

std::vector<spdlog::sink_ptr> make_sinks(const SpdlogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;
    if (options.to_stderr) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    if (!options.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file));
    }
    return sinks;
}

// spdlog keeps one pool per process; the first async logger sizes it.
std::shared_ptr<spdlog::details::thread_pool> async_pool(std::size_t queue_size) {
    static std::once_flag created;
    std::call_once(created, [queue_size] { spdlog::init_thread_pool(queue_size, 1); });
    return spdlog::thread_pool();
}

std::shared_ptr<spdlog::logger> make_backend(const SpdlogOptions& options) {
    auto sinks = make_sinks(options);
    if (options.async) {
        return std::make_shared<spdlog::async_logger>(
            options.name, sinks.begin(), sinks.end(),
            async_pool(options.async_queue_size),
            spdlog::async_overflow_policy::block);
    }
    return std::make_shared<spdlog::logger>(options.name, sinks.begin(), sinks.end());
}

}  // namespace

spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warning:  return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
    }
    return spdlog::level::off;
}

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger
// ─────────────────────────────────────────────────────────────────────────────

SpdlogLogger::SpdlogLogger(const SpdlogOptions& options)
    : logger_(make_backend(options))
    , level_(options.level)
{
    logger_->set_pattern(options.pattern);
    logger_->set_level(to_spdlog_level(options.level));
    // Anything at error or above is on disk before the call returns
    logger_->flush_on(spdlog::level::err);
}

void SpdlogLogger::log(const LogRecord& record) {
    const spdlog::source_loc where{
        record.location.file_name(),
        static_cast<int>(record.location.line()),
        record.location.function_name()
    };
    logger_->log(where, to_spdlog_level(record.level), "{}", record.message);
}

void SpdlogLogger::set_level(LogLevel level) noexcept {
    level_.store(level, std::memory_order_relaxed);
    logger_->set_level(to_spdlog_level(level));
}

void SpdlogLogger::flush() {
    logger_->flush();
}

}  // namespace ragmcp
