#include "ProcessTransport.hpp"
#include "McpError.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcp_bridge {

namespace {

constexpr int kPollIntervalMs = 100;
constexpr std::size_t kMaxMessageBytes = 16 * 1024 * 1024;
constexpr std::size_t kMaxStderrLineBytes = 64 * 1024;
constexpr std::chrono::milliseconds kTermGracePeriod{500};

void close_fd(int& fd) {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

void set_non_blocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

std::string errno_message(const std::string& what, int error) {
    return what + ": " + std::strerror(error);
}

// Current environment with the descriptor's overrides applied.
std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> entries;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string item(*entry);
        std::string key = item.substr(0, item.find('='));
        if (overrides.find(key) == overrides.end()) {
            entries.push_back(std::move(item));
        }
    }
    for (const auto& [key, value] : overrides) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

std::vector<char*> to_pointer_array(std::vector<std::string>& strings) {
    std::vector<char*> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto& item : strings) {
        pointers.push_back(item.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

} // namespace

ProcessTransport::ProcessTransport(ServerDescriptor descriptor)
    : descriptor_(std::move(descriptor)) {}

ProcessTransport::~ProcessTransport() {
    close();
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

void ProcessTransport::start() {
    if (pid_ != -1) {
        throw std::logic_error("MCP server process already started");
    }
    if (descriptor_.command.empty()) {
        throw McpError::spawn_failed("empty command");
    }

    // Writes to a dead server must fail with EPIPE instead of killing us.
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, [] { std::signal(SIGPIPE, SIG_IGN); });

    int to_child[2] = {-1, -1};
    int from_child[2] = {-1, -1};
    int err_child[2] = {-1, -1};
    if (::pipe2(to_child, O_CLOEXEC) != 0 ||
        ::pipe2(from_child, O_CLOEXEC) != 0 ||
        ::pipe2(err_child, O_CLOEXEC) != 0) {
        const int error = errno;
        for (int fd : {to_child[0], to_child[1], from_child[0], from_child[1],
                       err_child[0], err_child[1]}) {
            if (fd != -1) {
                ::close(fd);
            }
        }
        throw McpError::spawn_failed(errno_message("failed to create pipes", error));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, to_child[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, from_child[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, err_child[1], STDERR_FILENO);

    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    posix_spawnattr_setsigdefault(&attributes, &default_signals);
    posix_spawnattr_setsigmask(&attributes, &empty_mask);
    posix_spawnattr_setpgroup(&attributes, 0);
    posix_spawnattr_setflags(&attributes,
        POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);

    std::vector<std::string> argv_strings;
    argv_strings.push_back(descriptor_.command);
    argv_strings.insert(argv_strings.end(), descriptor_.args.begin(), descriptor_.args.end());
    std::vector<std::string> env_strings = build_environment(descriptor_.env);
    std::vector<char*> argv = to_pointer_array(argv_strings);
    std::vector<char*> envp = to_pointer_array(env_strings);

    pid_t child_pid = -1;
    const int spawn_status = ::posix_spawnp(&child_pid, descriptor_.command.c_str(),
                                            &actions, &attributes, argv.data(), envp.data());

    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attributes);
    ::close(to_child[0]);
    ::close(from_child[1]);
    ::close(err_child[1]);

    if (spawn_status != 0) {
        ::close(to_child[1]);
        ::close(from_child[0]);
        ::close(err_child[0]);
        throw McpError::spawn_failed(descriptor_.command + ": " + std::strerror(spawn_status));
    }

    pid_ = child_pid;
    stdin_fd_ = to_child[1];
    stdout_fd_ = from_child[0];
    stderr_fd_ = err_child[0];
    set_non_blocking(stdin_fd_);
    set_non_blocking(stdout_fd_);
    set_non_blocking(stderr_fd_);
    open_ = true;

    spdlog::info("MCP server '{}': spawned '{}' (pid {})",
                 descriptor_.name, descriptor_.command, pid_);
}

json ProcessTransport::read_message() {
    while (true) {
        const auto newline_pos = read_buffer_.find('\n');
        if (newline_pos != std::string::npos) {
            std::string line = read_buffer_.substr(0, newline_pos);
            read_buffer_.erase(0, newline_pos + 1);

            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty()) {
                continue;
            }

            try {
                return json::parse(line);
            } catch (const json::parse_error& e) {
                throw McpError(ErrorKind::Protocol,
                               std::string("malformed message from server: ") + e.what());
            }
        }

        if (!open_ || eof_ || stdout_fd_ == -1) {
            return json();
        }

        std::array<pollfd, 2> fds{};
        fds[0].fd = stdout_fd_;
        fds[0].events = POLLIN;
        nfds_t count = 1;
        if (stderr_fd_ != -1) {
            fds[1].fd = stderr_fd_;
            fds[1].events = POLLIN;
            count = 2;
        }

        const int poll_result = ::poll(fds.data(), count, kPollIntervalMs);
        if (poll_result < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw McpError(ErrorKind::Transport, errno_message("poll failed", errno));
        }
        if (poll_result == 0) {
            continue;
        }

        if (count == 2 && (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            drain_stderr();
        }

        if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            std::array<char, 4096> buffer{};
            const ssize_t bytes = ::read(stdout_fd_, buffer.data(), buffer.size());
            if (bytes > 0) {
                read_buffer_.append(buffer.data(), static_cast<std::size_t>(bytes));
                if (read_buffer_.size() > kMaxMessageBytes &&
                    read_buffer_.find('\n') == std::string::npos) {
                    read_buffer_.clear();
                    throw McpError(ErrorKind::Transport, "message from server exceeds size limit");
                }
            } else if (bytes == 0) {
                spdlog::info("MCP server '{}' closed stdout", descriptor_.name);
                eof_ = true;
                return json();
            } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                throw McpError(ErrorKind::Transport,
                               errno_message("failed to read from MCP server", errno));
            }
        }
    }
}

void ProcessTransport::write_message(const json& message) {
    write_message_until(message, std::chrono::steady_clock::time_point::max(), nullptr);
}

void ProcessTransport::write_message_until(const json& message,
                                           std::chrono::steady_clock::time_point deadline,
                                           const CancellationToken* cancel) {
    const std::string line = message.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";

    // Another writer may be stuck on a full pipe; wait for it in slices
    std::unique_lock<std::timed_mutex> lock(write_mutex_, std::defer_lock);
    while (!lock.try_lock_for(std::chrono::milliseconds(kPollIntervalMs))) {
        if (!open_) {
            throw McpError(ErrorKind::Transport, "MCP server stdin is closed");
        }
        if (cancel != nullptr && cancel->is_cancelled()) {
            throw McpError(ErrorKind::Cancelled, "write to MCP server cancelled");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw McpError(ErrorKind::Timeout, "timed out waiting to write to MCP server");
        }
    }

    if (!open_ || stdin_fd_ == -1) {
        throw McpError(ErrorKind::Transport, "MCP server stdin is closed");
    }

    std::size_t written = 0;
    while (written < line.size()) {
        const ssize_t bytes = ::write(stdin_fd_, line.data() + written, line.size() - written);
        if (bytes > 0) {
            written += static_cast<std::size_t>(bytes);
            continue;
        }
        if (bytes < 0 && errno == EINTR) {
            continue;
        }
        if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (!open_) {
                throw McpError(ErrorKind::Transport, "transport closed while writing");
            }

            const bool cancelled = cancel != nullptr && cancel->is_cancelled();
            if (cancelled || std::chrono::steady_clock::now() >= deadline) {
                if (written > 0) {
                    // The server would read a truncated line; nothing after it can be framed
                    open_ = false;
                    spdlog::warn("MCP server '{}': gave up after writing {} of {} bytes",
                                 descriptor_.name, written, line.size());
                    throw McpError(ErrorKind::Transport,
                                   "MCP server stopped reading its stdin mid-message");
                }
                if (cancelled) {
                    throw McpError(ErrorKind::Cancelled, "write to MCP server cancelled");
                }
                throw McpError(ErrorKind::Timeout, "timed out writing to MCP server");
            }

            pollfd pfd{};
            pfd.fd = stdin_fd_;
            pfd.events = POLLOUT;
            ::poll(&pfd, 1, kPollIntervalMs);
            continue;
        }
        throw McpError(ErrorKind::Transport,
                       errno_message("failed to write to MCP server stdin", errno));
    }
}

bool ProcessTransport::is_open() const {
    return open_ && !eof_;
}

void ProcessTransport::close() {
    std::call_once(close_once_, [this] {
        open_ = false;
        {
            std::lock_guard<std::timed_mutex> lock(write_mutex_);
            close_fd(stdin_fd_);
        }
        terminate_child();
    });
}

void ProcessTransport::drain_stderr() {
    std::array<char, 4096> buffer{};
    const ssize_t bytes = ::read(stderr_fd_, buffer.data(), buffer.size());
    if (bytes > 0) {
        stderr_buffer_.append(buffer.data(), static_cast<std::size_t>(bytes));
        log_stderr_lines();
    } else if (bytes == 0 || (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)) {
        if (!stderr_buffer_.empty()) {
            spdlog::debug("[{}] stderr: {}", descriptor_.name, stderr_buffer_);
            stderr_buffer_.clear();
        }
        close_fd(stderr_fd_);
    }
}

void ProcessTransport::log_stderr_lines() {
    std::size_t newline_pos;
    while ((newline_pos = stderr_buffer_.find('\n')) != std::string::npos) {
        std::string line = stderr_buffer_.substr(0, newline_pos);
        stderr_buffer_.erase(0, newline_pos + 1);
        if (!line.empty()) {
            spdlog::debug("[{}] stderr: {}", descriptor_.name, line);
        }
    }
    if (stderr_buffer_.size() > kMaxStderrLineBytes) {
        spdlog::debug("[{}] stderr: {}", descriptor_.name, stderr_buffer_);
        stderr_buffer_.clear();
    }
}

bool ProcessTransport::wait_for_exit(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        int status = 0;
        const pid_t result = ::waitpid(pid_, &status, WNOHANG);
        if (result == pid_ || (result < 0 && errno == ECHILD)) {
            if (result == pid_ && WIFEXITED(status)) {
                spdlog::debug("MCP server '{}' exited with status {}",
                              descriptor_.name, WEXITSTATUS(status));
            } else if (result == pid_ && WIFSIGNALED(status)) {
                spdlog::debug("MCP server '{}' terminated by signal {}",
                              descriptor_.name, WTERMSIG(status));
            }
            pid_ = -1;
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

void ProcessTransport::terminate_child() {
    if (pid_ <= 0) {
        return;
    }
    if (wait_for_exit(descriptor_.shutdown_timeout)) {
        return;
    }

    spdlog::warn("MCP server '{}' did not exit after stdin closed, sending SIGTERM",
                 descriptor_.name);
    ::kill(-pid_, SIGTERM);
    if (wait_for_exit(kTermGracePeriod)) {
        return;
    }

    spdlog::warn("MCP server '{}' ignored SIGTERM, sending SIGKILL", descriptor_.name);
    ::kill(-pid_, SIGKILL);
    int status = 0;
    ::waitpid(pid_, &status, 0);
    pid_ = -1;
}

} // namespace mcp_bridge
