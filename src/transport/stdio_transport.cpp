#include "ragmcp/transport/stdio_transport.hpp"
#include "ragmcp/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/read_until.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <sys/wait.h>
#include <unistd.h>
#include <signal.h>
#include <fcntl.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <string_view>
#include <vector>

extern char** environ;

namespace ragmcp {

namespace {

constexpr useconds_t kProcessTerminationWaitUs = 100'000;  // 100ms wait before SIGKILL

TransportError make_error(TransportError::Category cat, const std::string& msg) {
    return TransportError{cat, msg, std::nullopt};
}

#if defined(__APPLE__)
const std::vector<std::string> kAllowedCommandPrefixes = {
    "/usr/bin/", "/usr/local/bin/", "/bin/", "/opt/homebrew/bin/",
    "/usr/sbin/", "/sbin/", "/Applications/"
};
#else
const std::vector<std::string> kAllowedCommandPrefixes = {
    "/usr/bin/", "/usr/local/bin/", "/bin/", "/usr/sbin/", "/sbin/",
    "/snap/bin/", "/home/", "/opt/"
};
#endif

/// Rejects shell metacharacters and absolute paths outside the usual
/// binary locations.
bool is_safe_command(const std::string& command, const std::vector<std::string>& args) {
    if (command.empty()) {
        return false;
    }

    const std::string dangerous_chars = ";|&$`\\\"'<>(){}[]!#~";
    const auto has_dangerous = [&dangerous_chars](const std::string& text) {
        return text.find_first_of(dangerous_chars) != std::string::npos;
    };
    if (has_dangerous(command)) {
        return false;
    }
    for (const auto& arg : args) {
        if (has_dangerous(arg)) {
            return false;
        }
    }

    if (command.front() == '/') {
        for (const auto& prefix : kAllowedCommandPrefixes) {
            if (command.rfind(prefix, 0) == 0) {
                return true;
            }
        }
        return false;
    }
    return true;
}

std::string_view trim(std::string_view text) {
    constexpr std::string_view kWhitespace{" \t\r\n"};
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

}  // namespace

bool ignore_sigpipe() noexcept {
    struct sigaction action {};
    action.sa_handler = SIG_IGN;
    sigemptyset(&action.sa_mask);
    return sigaction(SIGPIPE, &action, nullptr) == 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

StdioTransport::StdioTransport(asio::any_io_executor executor, StdioTransportConfig config)
    : config_(std::move(config))
    , executor_(std::move(executor))
    , strand_(asio::make_strand(executor_))
{
    read_buffer_.reserve(4096);
}

StdioTransport::StdioTransport(
    asio::any_io_executor executor,
    StdioEndpoint endpoint,
    std::size_t max_message_size
)
    : endpoint_(endpoint)
    , executor_(std::move(executor))
    , strand_(asio::make_strand(executor_))
{
    config_.max_message_size = max_message_size;
    read_buffer_.reserve(4096);
}

StdioTransport::~StdioTransport() {
    alive_->store(false, std::memory_order_release);

    // Synchronous cleanup - can't co_await in destructor
    if (running_) {
        running_ = false;
        close_streams();
        terminate_process();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// IAsyncTransport Interface
// ═══════════════════════════════════════════════════════════════════════════

asio::any_io_executor StdioTransport::get_executor() {
    return executor_;
}

asio::awaitable<TransportResult<void>> StdioTransport::async_start() {
    if (running_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Protocol,
            "Transport already running"
        ));
    }

    TransportResult<void> opened;
    if (endpoint_.has_value()) {
        opened = adopt_descriptors();
    } else {
        if (!config_.skip_command_validation && !is_safe_command(config_.command, config_.args)) {
            co_return tl::unexpected(make_error(
                TransportError::Category::Protocol,
                "Command validation failed: potentially unsafe command or arguments"
            ));
        }
        opened = spawn_process();
    }
    if (!opened) {
        co_return opened;
    }

    message_channel_ = std::make_unique<MessageChannel>(executor_, config_.channel_capacity);
    write_lock_ = std::make_unique<WriteLock>(executor_, 1);
    read_buffer_.clear();
    end_of_stream_ = false;

    running_ = true;

    asio::co_spawn(strand_, reader_loop(alive_), asio::detached);

    if (config_.stderr_handling == StderrHandling::Capture && stderr_stream_ && stderr_stream_->is_open()) {
        asio::co_spawn(strand_, stderr_reader_loop(alive_), asio::detached);
    }

    if (endpoint_.has_value()) {
        RAGMCP_LOG_INFO("StdioTransport serving on fds " + std::to_string(endpoint_->read_fd) +
                        "/" + std::to_string(endpoint_->write_fd));
    } else {
        RAGMCP_LOG_INFO("StdioTransport started: " + config_.command +
                        " (pid " + std::to_string(child_pid_) + ")");
    }

    co_return TransportResult<void>{};
}

asio::awaitable<void> StdioTransport::async_stop() {
    if (!running_) {
        co_return;
    }

    running_ = false;

    // Cancels pending reads/writes; the reader loop sees operation_aborted
    close_streams();

    if (message_channel_) {
        message_channel_->close();
    }
    if (write_lock_) {
        write_lock_->close();
    }

    terminate_process();

    RAGMCP_LOG_INFO("StdioTransport stopped");
}

asio::awaitable<TransportResult<void>> StdioTransport::async_send(std::string payload) {
    if (!running_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Transport not running"
        ));
    }

    payload.push_back('\n');

    try {
        co_await write_lock_->async_send(asio::error_code{}, asio::use_awaitable);
    } catch (const std::system_error&) {
        co_return tl::unexpected(TransportError::closed("Transport closed during send"));
    }

    TransportResult<void> outcome;
    try {
        co_await asio::async_write(*write_stream_, asio::buffer(payload), asio::use_awaitable);
    } catch (const std::system_error& e) {
        outcome = tl::unexpected(make_error(
            TransportError::Category::Network,
            "Write failed: " + std::string(e.what())
        ));
    }

    write_lock_->try_receive([](asio::error_code) {});
    co_return outcome;
}

asio::awaitable<TransportResult<std::string>> StdioTransport::async_receive() {
    if (!message_channel_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Transport not running"
        ));
    }
    if (end_of_stream_) {
        co_return tl::unexpected(TransportError::closed());
    }

    try {
        auto result = co_await message_channel_->async_receive(asio::use_awaitable);
        if (!result && result.error().category == TransportError::Category::Closed) {
            end_of_stream_ = true;
        }
        co_return result;
    } catch (const std::system_error&) {
        // Channel closed by async_stop
        end_of_stream_ = true;
        co_return tl::unexpected(TransportError::closed());
    }
}

bool StdioTransport::is_running() const {
    return running_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Process-Specific Methods
// ═══════════════════════════════════════════════════════════════════════════

pid_t StdioTransport::child_pid() const {
    return child_pid_;
}

bool StdioTransport::is_child_alive() const {
    if (child_pid_ <= 0) {
        return false;
    }
    return kill(child_pid_, 0) == 0;
}

std::optional<int> StdioTransport::exit_code() const {
    return exit_code_;
}

std::string StdioTransport::get_stderr() const {
    if (config_.stderr_handling != StderrHandling::Capture) {
        return {};
    }
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    return stderr_buffer_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Reader Loop
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> StdioTransport::reader_loop(std::shared_ptr<std::atomic<bool>> alive) {
    while (running_) {
        auto result = co_await read_line_message(alive);
        if (!alive->load(std::memory_order_acquire)) {
            co_return;
        }

        if (!result) {
            if (!running_) {
                break;  // graceful shutdown
            }
            const bool is_eof = result.error().category == TransportError::Category::Closed;
            if (is_eof) {
                check_child_status();
            } else {
                RAGMCP_LOG_WARN("StdioTransport read error: " + result.error().message);
            }
            try {
                co_await message_channel_->async_send(
                    asio::error_code{}, std::move(result), asio::use_awaitable);
            } catch (const std::system_error&) {
                break;
            }
            if (!alive->load(std::memory_order_acquire)) {
                co_return;
            }
            if (!is_eof) {
                // The stream is unusable after a framing error
                message_channel_->try_send(
                    asio::error_code{},
                    TransportResult<std::string>(tl::unexpected(TransportError::closed())));
            }
            break;
        }

        try {
            co_await message_channel_->async_send(
                asio::error_code{}, std::move(result), asio::use_awaitable);
        } catch (const std::system_error&) {
            break;  // channel closed
        }
        if (!alive->load(std::memory_order_acquire)) {
            co_return;
        }
    }
}

asio::awaitable<void> StdioTransport::stderr_reader_loop(std::shared_ptr<std::atomic<bool>> alive) {
    std::array<char, 4096> buffer;
    while (running_) {
        try {
            std::size_t n = co_await stderr_stream_->async_read_some(
                asio::buffer(buffer),
                asio::use_awaitable
            );
            if (!alive->load(std::memory_order_acquire)) {
                co_return;
            }
            if (n == 0) {
                break;
            }
            std::lock_guard<std::mutex> lock(stderr_mutex_);
            stderr_buffer_.append(buffer.data(), n);
        } catch (const std::system_error& e) {
            if (!alive->load(std::memory_order_acquire)) {
                co_return;
            }
            if (running_ && e.code() != asio::error::eof) {
                RAGMCP_LOG_WARN("Stderr read error: " + std::string(e.what()));
            }
            break;
        }
    }
}

asio::awaitable<TransportResult<std::string>> StdioTransport::read_line_message(
    const std::shared_ptr<std::atomic<bool>>& alive
) {
    const std::size_t limit = config_.max_message_size;

    for (;;) {
        const auto newline = read_buffer_.find('\n');
        if (newline == std::string::npos) {
            if (read_buffer_.size() > limit) {
                co_return tl::unexpected(make_error(
                    TransportError::Category::Protocol,
                    "Message too large: line exceeds " + std::to_string(limit) + " bytes"
                ));
            }
            try {
                // Appends to read_buffer_; bytes past the newline stay for the next call
                co_await asio::async_read_until(
                    *read_stream_,
                    asio::dynamic_buffer(read_buffer_, limit + 1),
                    '\n',
                    asio::use_awaitable
                );
            } catch (const std::system_error& e) {
                if (!alive->load(std::memory_order_acquire)) {
                    co_return tl::unexpected(TransportError::closed());
                }
                if (e.code() == asio::error::eof) {
                    co_return tl::unexpected(TransportError::closed(
                        endpoint_.has_value() ? "Input stream closed" : "Process exited"));
                }
                if (e.code() == asio::error::not_found) {
                    co_return tl::unexpected(make_error(
                        TransportError::Category::Protocol,
                        "Message too large: line exceeds " + std::to_string(limit) + " bytes"
                    ));
                }
                if (e.code() == asio::error::operation_aborted || !running_) {
                    co_return tl::unexpected(TransportError::closed());
                }
                co_return tl::unexpected(make_error(
                    TransportError::Category::Network,
                    "Failed to read line: " + std::string(e.what())
                ));
            }
            if (!alive->load(std::memory_order_acquire)) {
                co_return tl::unexpected(TransportError::closed());
            }
            continue;
        }

        const std::string_view line = trim(std::string_view(read_buffer_).substr(0, newline));
        std::string message(line);
        read_buffer_.erase(0, newline + 1);

        if (message.empty()) {
            continue;
        }
        if (message.size() > limit) {
            co_return tl::unexpected(make_error(
                TransportError::Category::Protocol,
                "Message too large: line exceeds " + std::to_string(limit) + " bytes"
            ));
        }
        co_return message;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Process Management
// ═══════════════════════════════════════════════════════════════════════════

TransportResult<void> StdioTransport::adopt_descriptors() {
    try {
        read_stream_ = std::make_unique<asio::posix::stream_descriptor>(executor_, endpoint_->read_fd);
        write_stream_ = std::make_unique<asio::posix::stream_descriptor>(executor_, endpoint_->write_fd);
    } catch (const std::system_error& e) {
        return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Failed to adopt descriptors: " + std::string(e.what())
        ));
    }
    return {};
}

TransportResult<void> StdioTransport::spawn_process() {
    // Pre-allocate argv and envp BEFORE fork(): after fork() only the calling
    // thread exists in the child, and a malloc mutex held by another thread
    // would deadlock any allocation there.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(config_.args.size() + 1);
    argv_storage.push_back(config_.command);
    for (const auto& arg : config_.args) {
        argv_storage.push_back(arg);
    }
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& str : argv_storage) {
        argv.push_back(str.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    std::vector<char*> envp;
    if (!config_.env.empty()) {
        for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
            const std::string_view text(*entry);
            const std::string name(text.substr(0, text.find('=')));
            if (config_.env.count(name) == 0) {
                env_storage.emplace_back(text);
            }
        }
        for (const auto& [name, value] : config_.env) {
            env_storage.push_back(name + "=" + value);
        }
        envp.reserve(env_storage.size() + 1);
        for (auto& str : env_storage) {
            envp.push_back(str.data());
        }
        envp.push_back(nullptr);
    }

    int stdin_pipe[2];
    int stdout_pipe[2];
    int stderr_pipe[2] = {-1, -1};

    if (pipe(stdin_pipe) == -1) {
        return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Failed to create pipes: " + std::string(strerror(errno))
        ));
    }
    if (pipe(stdout_pipe) == -1) {
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Failed to create pipes: " + std::string(strerror(errno))
        ));
    }
    if (config_.stderr_handling == StderrHandling::Capture && pipe(stderr_pipe) == -1) {
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Failed to create stderr pipe: " + std::string(strerror(errno))
        ));
    }

    pid_t pid = fork();

    if (pid == -1) {
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        if (stderr_pipe[0] != -1) {
            close(stderr_pipe[0]);
            close(stderr_pipe[1]);
        }
        return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Failed to fork: " + std::string(strerror(errno))
        ));
    }

    if (pid == 0) {
        // Child process - NO ALLOCATIONS ALLOWED
        dup2(stdin_pipe[0], STDIN_FILENO);
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);

        switch (config_.stderr_handling) {
            case StderrHandling::Discard: {
                int devnull = open("/dev/null", O_WRONLY);
                if (devnull != -1) {
                    dup2(devnull, STDERR_FILENO);
                    close(devnull);
                }
                break;
            }
            case StderrHandling::Passthrough:
                break;
            case StderrHandling::Capture:
                dup2(stderr_pipe[1], STDERR_FILENO);
                close(stderr_pipe[0]);
                close(stderr_pipe[1]);
                break;
        }

        if (!envp.empty()) {
            environ = envp.data();
        }
        signal(SIGPIPE, SIG_DFL);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    // Parent process
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);

    write_stream_ = std::make_unique<asio::posix::stream_descriptor>(executor_, stdin_pipe[1]);
    read_stream_ = std::make_unique<asio::posix::stream_descriptor>(executor_, stdout_pipe[0]);

    if (config_.stderr_handling == StderrHandling::Capture) {
        close(stderr_pipe[1]);
        stderr_stream_ = std::make_unique<asio::posix::stream_descriptor>(executor_, stderr_pipe[0]);
    }

    child_pid_ = pid;
    exit_code_.reset();
    return {};
}

void StdioTransport::close_streams() {
    for (auto* stream : {write_stream_.get(), read_stream_.get(), stderr_stream_.get()}) {
        if (stream != nullptr && stream->is_open()) {
            asio::error_code ec;
            stream->close(ec);
        }
    }
}

void StdioTransport::terminate_process() {
    if (child_pid_ <= 0) {
        return;
    }

    kill(child_pid_, SIGTERM);

    int status = 0;
    int result = waitpid(child_pid_, &status, WNOHANG);

    if (result == 0) {
        usleep(kProcessTerminationWaitUs);
        result = waitpid(child_pid_, &status, WNOHANG);

        if (result == 0) {
            kill(child_pid_, SIGKILL);
            result = waitpid(child_pid_, &status, 0);
        }
    }

    if (result > 0) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = -WTERMSIG(status);
        }
    }

    child_pid_ = -1;
}

void StdioTransport::check_child_status() {
    if (child_pid_ <= 0) {
        return;
    }

    int status = 0;
    const pid_t result = waitpid(child_pid_, &status, WNOHANG);
    if (result > 0) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = -WTERMSIG(status);
        }
        RAGMCP_LOG_INFO("Child process " + std::to_string(child_pid_) + " exited");
        child_pid_ = -1;
    }
}

}  // namespace ragmcp
