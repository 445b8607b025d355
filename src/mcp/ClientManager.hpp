#pragma once

#include "ServerClient.hpp"
#include "TransportFactory.hpp"
#include "config/McpConfig.hpp"
#include "tools/ToolRegistry.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace mcp_bridge {

/**
 * @brief Owns the ServerClients for every configured MCP server
 *
 * Connections are attempted concurrently and fail independently: a server
 * that cannot be spawned, hangs in its handshake or crashes only affects
 * its own client.
 */
class ClientManager {
public:
    explicit ClientManager(TransportFactory factory = default_transport_factory());
    ~ClientManager();

    ClientManager(const ClientManager&) = delete;
    ClientManager& operator=(const ClientManager&) = delete;

    /**
     * @brief Create and connect a client for every enabled server
     *
     * Returns once every attempt is Connected or Failed. Failed clients are
     * kept, so get_client() finds every enabled server afterwards. Does
     * nothing when the configuration disables the MCP client.
     */
    void connect_all(const McpConfig& config);

    /**
     * @brief (server name, tool) pairs of all connected clients
     *
     * Reflects the cached discovery results, ordered by server name.
     */
    std::vector<std::pair<std::string, ToolDescriptor>> discovered_tools() const;

    /**
     * @brief Lookup a client by server name
     * @return Client, or nullptr if no such server was configured
     */
    std::shared_ptr<ServerClient> get_client(const std::string& name) const;

    std::vector<std::string> server_names() const;
    std::size_t connected_count() const;

    /**
     * @brief Register one McpToolAdapter per discovered tool
     *
     * Name collisions are logged and the colliding tool skipped.
     * @return Number of adapters registered
     */
    std::size_t register_tools(ToolRegistry& registry) const;

    /**
     * @brief Re-list one server's tools and replace its adapters
     * @return Number of adapters registered for the server
     * @throws std::invalid_argument for an unknown server
     * @throws McpError if the server cannot be queried
     */
    std::size_t refresh_tools(const std::string& server, ToolRegistry& registry);

    /**
     * @brief Disconnect every client
     *
     * Idempotent.
     */
    void shutdown();

private:
    std::size_t register_client_tools(const std::shared_ptr<ServerClient>& client,
                                      const std::vector<ToolDescriptor>& tools,
                                      ToolRegistry& registry) const;

    TransportFactory factory_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ServerClient>> clients_;
};

} // namespace mcp_bridge
