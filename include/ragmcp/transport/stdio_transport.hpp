#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Stdio Transport
// ═══════════════════════════════════════════════════════════════════════════
// Newline-delimited JSON over a pair of file descriptors.
//
// Client role: spawns the configured command and talks to its stdin/stdout.
// Server role: wraps descriptors the process already owns (stdin/stdout by
// default, or a pipe pair in tests).
//
// Key features:
// - Non-blocking reads via asio::posix::stream_descriptor
// - Persistent read buffer: partial lines survive across reads
// - Buffered message channel for backpressure handling
// - Graceful shutdown with SIGTERM -> SIGKILL escalation
//
// The transport never changes signal dispositions. A host that writes to a
// peer which may exit must ignore SIGPIPE itself (ignore_sigpipe() does it);
// writes to a closed pipe then fail with EPIPE instead of ending the process.

#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "StdioTransport is only available on POSIX-compatible systems"
#endif

#include "ragmcp/config.hpp"
#include "ragmcp/transport/async_transport.hpp"

#include <asio/experimental/channel.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unistd.h>

#include <sys/types.h>  // pid_t

namespace ragmcp {

/// Descriptors for the server role
struct StdioEndpoint {
    int read_fd{STDIN_FILENO};
    int write_fd{STDOUT_FILENO};
};

class StdioTransport : public IAsyncTransport {
public:
    /// Client role: spawn config.command on async_start()
    StdioTransport(asio::any_io_executor executor, StdioTransportConfig config);

    /// Server role: adopt the given descriptors (closed on stop)
    StdioTransport(asio::any_io_executor executor, StdioEndpoint endpoint,
                   std::size_t max_message_size = 1 << 20);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;
    StdioTransport(StdioTransport&&) = delete;
    StdioTransport& operator=(StdioTransport&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // IAsyncTransport interface
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::any_io_executor get_executor() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override;
    [[nodiscard]] asio::awaitable<void> async_stop() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(std::string payload) override;
    [[nodiscard]] asio::awaitable<TransportResult<std::string>> async_receive() override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] std::string_view kind() const noexcept override { return "stdio"; }

    // ─────────────────────────────────────────────────────────────────────────
    // Process-specific methods
    // ─────────────────────────────────────────────────────────────────────────

    /// Child process PID (-1 if none)
    [[nodiscard]] pid_t child_pid() const;

    [[nodiscard]] bool is_child_alive() const;

    /// Only valid after the process has been reaped
    [[nodiscard]] std::optional<int> exit_code() const;

    /// Captured stderr output (stderr_handling == Capture only)
    [[nodiscard]] std::string get_stderr() const;

private:
    // Loops hold the alive token: they may resume after the transport is gone
    asio::awaitable<void> reader_loop(std::shared_ptr<std::atomic<bool>> alive);
    asio::awaitable<void> stderr_reader_loop(std::shared_ptr<std::atomic<bool>> alive);
    asio::awaitable<TransportResult<std::string>> read_line_message(const std::shared_ptr<std::atomic<bool>>& alive);

    TransportResult<void> spawn_process();
    TransportResult<void> adopt_descriptors();
    void terminate_process();
    void check_child_status();
    void close_streams();

    StdioTransportConfig config_;
    std::optional<StdioEndpoint> endpoint_;  // set in server role

    asio::any_io_executor executor_;
    asio::strand<asio::any_io_executor> strand_;

    std::unique_ptr<asio::posix::stream_descriptor> write_stream_;
    std::unique_ptr<asio::posix::stream_descriptor> read_stream_;
    std::unique_ptr<asio::posix::stream_descriptor> stderr_stream_;

    // producer: reader_loop, consumer: async_receive
    using MessageChannel = asio::experimental::channel<
        void(asio::error_code, TransportResult<std::string>)
    >;
    std::unique_ptr<MessageChannel> message_channel_;

    // One slot: holding it means owning the write side
    using WriteLock = asio::experimental::channel<void(asio::error_code)>;
    std::unique_ptr<WriteLock> write_lock_;

    pid_t child_pid_{-1};
    std::atomic<bool> running_{false};
    bool end_of_stream_{false};
    std::optional<int> exit_code_;

    std::string read_buffer_;

    mutable std::mutex stderr_mutex_;
    std::string stderr_buffer_;

    std::shared_ptr<std::atomic<bool>> alive_{std::make_shared<std::atomic<bool>>(true)};
};

/// Process-wide: set SIGPIPE to ignored. Call once from main().
bool ignore_sigpipe() noexcept;

}  // namespace ragmcp
