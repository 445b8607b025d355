#pragma once

#include "ITransport.hpp"
#include "tools/ToolRegistry.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace mcp_bridge {

using json = nlohmann::json;

/**
 * @brief MCP server exposing a ToolRegistry over JSON-RPC 2.0
 *
 * Lets another MCP host use every aggregated remote tool and built-in
 * tool through one connection.
 * Supports methods: initialize, tools/list, tools/call, ping
 */
class GatewayServer {
public:
    /**
     * @brief Construct gateway over a transport
     * @param transport Transport to serve on (typically StdioTransport)
     * @param registry Tools to expose
     */
    GatewayServer(std::unique_ptr<ITransport> transport, std::shared_ptr<ToolRegistry> registry);

    /**
     * @brief Start server main loop
     *
     * Blocks until stop() is called or the transport reaches EOF.
     * Reads requests, dispatches them, sends responses.
     */
    void run();

    /**
     * @brief Signal server to stop gracefully
     *
     * Safe to call from another thread or a signal handler.
     */
    void stop();

    bool initialized() const { return initialized_; }

private:
    /**
     * @brief Handle one incoming JSON-RPC message
     * @return Response, or null JSON for notifications
     */
    json handle_request(const json& request);

    /**
     * @brief Handle tools/list method
     * @return Registered tools with schemas and annotations
     */
    json handle_tools_list();

    /**
     * @brief Handle tools/call method
     * @param params Request parameters with tool name and arguments
     * @return MCP tool result with a single text item
     */
    json handle_tools_call(const json& params);

    /**
     * @brief Handle initialize method (MCP handshake)
     * @param params Client capabilities and info
     * @return Server capabilities and info
     */
    json handle_initialize(const json& params);

    std::unique_ptr<ITransport> transport_;
    std::shared_ptr<ToolRegistry> registry_;
    std::atomic<bool> running_{false};
    std::atomic<bool> initialized_{false};
};

} // namespace mcp_bridge
