#pragma once

#include "core/CancellationToken.hpp"
#include <chrono>
#include <nlohmann/json.hpp>

namespace mcp_bridge {

using json = nlohmann::json;

/**
 * @brief Abstract interface for MCP transport mechanisms
 *
 * Implementations handle reading/writing JSON-RPC messages via different
 * transport protocols (child process stdio, own stdio, ...).
 * One reader thread and any number of writer threads may use a transport
 * concurrently; writers serialize among themselves.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read next JSON-RPC message from transport
     *
     * Blocks until a message arrives, the peer closes, or close() is called.
     *
     * @return JSON message, or null JSON on EOF/close
     * @throws McpError (Protocol) for a line that is not valid JSON;
     *         the transport stays usable
     * @throws McpError (Transport) for an unrecoverable read failure
     */
    virtual json read_message() = 0;

    /**
     * @brief Write JSON-RPC message to transport
     * @param message JSON message to write
     * @throws McpError (Transport) if the peer is gone
     */
    virtual void write_message(const json& message) = 0;

    /**
     * @brief Write a message, giving up at deadline or on cancellation
     *
     * Transports whose writes cannot block indefinitely keep the default,
     * which ignores the limits.
     *
     * @throws McpError (Timeout or Cancelled) if nothing was written yet
     * @throws McpError (Transport) if the message was cut off mid-line;
     *         the transport is unusable afterwards
     */
    virtual void write_message_until(const json& message,
                                     std::chrono::steady_clock::time_point /*deadline*/,
                                     const CancellationToken* /*cancel*/) {
        write_message(message);
    }

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;

    /**
     * @brief Close the transport and release the peer
     *
     * Idempotent. Unblocks a pending read_message().
     */
    virtual void close() = 0;
};

} // namespace mcp_bridge
