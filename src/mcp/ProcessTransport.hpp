#pragma once

#include "ITransport.hpp"
#include "config/McpConfig.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <sys/types.h>

namespace mcp_bridge {

/**
 * @brief Transport talking to an MCP server subprocess over its stdio
 *
 * Spawns the server described by a ServerDescriptor with pipes attached to
 * its stdin, stdout and stderr. Messages are newline-delimited JSON.
 * Lines the server writes to stderr are forwarded to the debug log.
 *
 * The child runs in its own process group. close() performs a graceful
 * shutdown: close stdin, wait for exit, then SIGTERM, then SIGKILL.
 */
class ProcessTransport : public ITransport {
public:
    explicit ProcessTransport(ServerDescriptor descriptor);
    ~ProcessTransport() override;

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    /**
     * @brief Launch the server process
     * @throws McpError (Spawn) if the process cannot be started
     */
    void start();

    json read_message() override;
    void write_message(const json& message) override;

    /**
     * @brief Write while the server may have stopped draining its stdin
     *
     * Waits for pipe space until deadline or cancellation. Giving up after
     * part of the line went out closes the transport.
     */
    void write_message_until(const json& message, std::chrono::steady_clock::time_point deadline,
                             const CancellationToken* cancel) override;
    bool is_open() const override;
    void close() override;

    /**
     * @brief Process id of the server, or -1 when not running
     */
    pid_t pid() const { return pid_; }

private:
    void drain_stderr();
    void log_stderr_lines();
    bool wait_for_exit(std::chrono::milliseconds timeout);
    void terminate_child();

    ServerDescriptor descriptor_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::atomic<bool> open_{false};
    std::atomic<bool> eof_{false};
    std::timed_mutex write_mutex_;
    std::once_flag close_once_;
    std::string read_buffer_;
    std::string stderr_buffer_;
};

} // namespace mcp_bridge
