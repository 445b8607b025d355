#pragma once

#include "ProtocolSession.hpp"
#include "TransportFactory.hpp"
#include "core/CancellationToken.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_bridge {

enum class ConnectionStatus {
    Disconnected,
    Connecting,
    Connected,
    Failed
};

std::string_view to_string(ConnectionStatus status);

/**
 * @brief Snapshot of a client's connection state
 *
 * cause is set for Failed, and for Disconnected after a transport failure.
 */
struct ConnectionState {
    ConnectionStatus status = ConnectionStatus::Disconnected;
    std::string cause;
};

/**
 * @brief Connection to one MCP server
 *
 * Owns the server's transport and ProtocolSession exclusively. State machine:
 * Disconnected -> Connecting -> {Connected, Failed}; Connected ->
 * Disconnected on transport failure or disconnect().
 *
 * Thread-safe. Any number of calls may be in flight at once; they are
 * multiplexed on the one session. A transport-level failure in any call
 * moves the client to Disconnected so later calls fail fast.
 */
class ServerClient {
public:
    /**
     * @brief Construct a disconnected client
     * @param name Unique server name
     * @param factory Creates the transport on connect()
     */
    explicit ServerClient(std::string name,
                          TransportFactory factory = default_transport_factory());
    ~ServerClient();

    ServerClient(const ServerClient&) = delete;
    ServerClient& operator=(const ServerClient&) = delete;

    /**
     * @brief Spawn the server, perform the handshake and discover tools
     *
     * Blocks until the client is Connected or Failed. A JSON-RPC error
     * answer to tools/list leaves the client Connected with no tools.
     *
     * @param descriptor Resolved server description
     * @throws McpError with the failure cause; the client is then Failed
     * @throws std::logic_error if already Connected or Connecting
     */
    void connect(const ServerDescriptor& descriptor);

    /**
     * @brief Non-blocking connection check
     */
    bool is_connected() const noexcept { return connected_; }

    ConnectionState state() const;

    const std::string& name() const { return name_; }

    /**
     * @brief Tools cached at discovery (or the last refresh_tools())
     */
    std::vector<ToolDescriptor> tools() const;

    /**
     * @brief True once the server announced that its tool list changed
     */
    bool tools_stale() const noexcept { return tools_stale_; }

    ServerInfo server_info() const;
    ServerCapabilities capabilities() const;
    ServerDescriptor descriptor() const;

    /**
     * @brief Invoke a remote tool
     * @param remote_name Tool name as reported by the server
     * @param arguments JSON object with tool arguments
     * @param cancel Optional token to abort the wait
     * @return Decoded result; is_error reports an application-level failure
     * @throws McpError (Disconnected) without any I/O if not connected,
     *         otherwise any McpError raised by the call
     */
    ToolCallResult call_tool(const std::string& remote_name, const json& arguments,
                             const CancellationToken* cancel = nullptr);

    /**
     * @brief Re-list the server's tools and replace the cached set
     *
     * Clears the stale flag.
     */
    std::vector<ToolDescriptor> refresh_tools();

    std::vector<ResourceDescriptor> list_resources();
    ResourceReadResult read_resource(const std::string& uri);

    /**
     * @brief Terminate the server and fail pending calls with Cancelled
     *
     * Idempotent.
     */
    void disconnect();

private:
    struct ActiveSession {
        std::shared_ptr<ProtocolSession> session;
        std::chrono::milliseconds timeout{0};
    };

    ActiveSession active_session() const;

    template <typename Fn>
    auto with_session(Fn&& fn);

    void handle_notification(const std::string& method, const json& params);
    void handle_close(const std::string& reason);
    void handle_transport_failure(const ProtocolSession* failed, const std::string& cause);

    std::string name_;
    TransportFactory factory_;

    mutable std::mutex mutex_;
    ConnectionState state_;
    std::shared_ptr<ProtocolSession> session_;
    ServerDescriptor descriptor_;
    ServerInfo server_info_;
    ServerCapabilities capabilities_;
    std::vector<ToolDescriptor> tools_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> tools_stale_{false};
};

} // namespace mcp_bridge
