#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace mcp_bridge {

/**
 * @brief Failure categories for MCP client operations
 */
enum class ErrorKind {
    Config,        // Bad server entry or unsupported transport
    Spawn,         // Subprocess could not be launched
    Protocol,      // Malformed or unexpected message
    Rpc,           // Server answered with a JSON-RPC error object
    Timeout,       // No response within the deadline
    Transport,     // Broken pipe, EOF, process exit
    Disconnected,  // Call attempted on a closed connection
    Cancelled      // Caller aborted the call or the session was closed
};

/**
 * @brief Convert ErrorKind to a short lowercase name
 */
std::string_view to_string(ErrorKind kind);

/**
 * @brief Exception raised by the MCP client layer
 *
 * Carries an ErrorKind so callers can tell connection faults from
 * call-level failures. Rpc errors also carry the JSON-RPC error code.
 */
class McpError : public std::runtime_error {
public:
    McpError(ErrorKind kind, const std::string& message);

    /**
     * @brief Build an Rpc error from a JSON-RPC error object
     * @param code JSON-RPC error code
     * @param message Error message reported by the server
     */
    static McpError rpc(long long code, const std::string& message);

    static McpError spawn_failed(const std::string& detail);
    static McpError timeout();
    static McpError disconnected();

    ErrorKind kind() const noexcept { return kind_; }
    long long rpc_code() const noexcept { return rpc_code_; }

    /**
     * @brief True for failures that leave the connection unusable
     *
     * Transport, Protocol and Disconnected are connection faults.
     * Rpc, Timeout and Cancelled only fail the call that raised them.
     */
    bool is_connection_fault() const noexcept;

private:
    ErrorKind kind_;
    long long rpc_code_ = 0;
};

} // namespace mcp_bridge
