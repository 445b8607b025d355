#pragma once

#include "ITransport.hpp"
#include "McpError.hpp"
#include "Protocol.hpp"
#include "core/CancellationToken.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mcp_bridge {

/**
 * @brief JSON-RPC session with one MCP server over a transport
 *
 * Assigns monotonically increasing request ids and keeps a table of
 * pending requests. A dedicated reader thread routes every response to
 * the waiter with the matching id, so any number of threads may have
 * requests in flight at once and responses may arrive in any order.
 *
 * Unparsable inbound lines are logged and skipped. EOF or a read failure
 * fails every pending request with a Transport error and invokes the
 * close handler.
 */
class ProtocolSession {
public:
    using NotificationHandler = std::function<void(const std::string& method, const json& params)>;
    using CloseHandler = std::function<void(const std::string& reason)>;

    /**
     * @brief Construct session over a transport
     * @param server_name Server name used in log messages
     * @param transport Connected transport, owned by the session
     */
    ProtocolSession(std::string server_name, std::unique_ptr<ITransport> transport);
    ~ProtocolSession();

    ProtocolSession(const ProtocolSession&) = delete;
    ProtocolSession& operator=(const ProtocolSession&) = delete;

    /**
     * @brief Install handler for server notifications
     *
     * Must be called before start(). Runs on the reader thread.
     */
    void set_notification_handler(NotificationHandler handler);

    /**
     * @brief Install handler invoked once when the server side goes away
     *
     * Must be called before start(). Runs on the reader thread and is not
     * invoked for an explicit close().
     */
    void set_close_handler(CloseHandler handler);

    /**
     * @brief Start the reader thread
     */
    void start();

    /**
     * @brief Perform the MCP initialize handshake
     *
     * Sends "initialize", validates the answer, then sends the
     * "notifications/initialized" notification.
     *
     * @param client_info Name and version announced to the server
     * @param timeout Bound on the whole exchange
     * @return Server's initialize result
     * @throws McpError (Timeout, Protocol, Rpc, Transport)
     */
    InitializeResult initialize(const ClientInfo& client_info, std::chrono::milliseconds timeout);

    /**
     * @brief Send a request and wait for its result
     * @param method JSON-RPC method name
     * @param params Parameters (null to omit)
     * @param timeout Maximum time for sending the request and receiving the response
     * @param cancel Optional token; cancelling releases the pending slot
     * @return The response's "result" value
     * @throws McpError (Rpc, Timeout, Cancelled, Transport, Disconnected, Protocol)
     */
    json request(const std::string& method, const json& params,
                 std::chrono::milliseconds timeout,
                 const CancellationToken* cancel = nullptr);

    /**
     * @brief Send a notification (no response expected)
     * @throws McpError (Transport, Disconnected, Timeout)
     */
    void notify(const std::string& method, const json& params = json());

    /**
     * @brief Close transport, fail pending requests with Cancelled, stop reader
     *
     * Idempotent. Must not be called from a handler.
     */
    void close();

    bool is_open() const { return open_; }

    /**
     * @brief Number of requests awaiting a response
     */
    std::size_t pending_count() const;

    const std::string& server_name() const { return server_name_; }

private:
    void reader_loop();
    void dispatch(const json& message);
    void handle_response(const json& message);
    void handle_server_request(const json& message);
    void connection_lost(const std::string& reason);
    void fail_all_pending(ErrorKind kind, const std::string& reason);
    void release(long long id);
    void write(const json& message, std::chrono::steady_clock::time_point deadline,
               const CancellationToken* cancel = nullptr);

    std::string server_name_;
    std::unique_ptr<ITransport> transport_;
    NotificationHandler notification_handler_;
    CloseHandler close_handler_;

    std::thread reader_;
    std::atomic<bool> open_{false};
    std::atomic<long long> next_id_{1};
    std::once_flag close_once_;

    mutable std::mutex pending_mutex_;
    std::map<long long, std::promise<json>> pending_;
};

} // namespace mcp_bridge
