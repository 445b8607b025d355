#include "ClientManager.hpp"
#include "McpToolAdapter.hpp"
#include "config/ConfigResolver.hpp"
#include <spdlog/spdlog.h>
#include <future>
#include <stdexcept>

namespace mcp_bridge {

ClientManager::ClientManager(TransportFactory factory)
    : factory_(std::move(factory)) {
    if (!factory_) {
        throw std::invalid_argument("Transport factory cannot be null");
    }
}

ClientManager::~ClientManager() {
    shutdown();
}

void ClientManager::connect_all(const McpConfig& config) {
    if (!config.client_enabled) {
        spdlog::info("MCP client disabled by configuration");
        return;
    }

    std::vector<std::pair<std::shared_ptr<ServerClient>, ServerDescriptor>> attempts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, raw] : config.servers) {
            if (!raw.enabled) {
                spdlog::info("MCP server '{}' is disabled, skipping", name);
                continue;
            }
            if (clients_.count(name) != 0) {
                spdlog::warn("MCP server '{}' already has a client, skipping", name);
                continue;
            }
            auto client = std::make_shared<ServerClient>(name, factory_);
            clients_.emplace(name, client);
            attempts.emplace_back(client, ConfigResolver::resolve(name, raw));
        }
    }

    std::vector<std::future<void>> pending;
    pending.reserve(attempts.size());
    for (const auto& attempt : attempts) {
        pending.push_back(std::async(std::launch::async,
            [client = attempt.first, descriptor = attempt.second] {
                try {
                    client->connect(descriptor);
                } catch (const std::exception& e) {
                    // The client is Failed and keeps the cause
                    spdlog::debug("MCP server '{}' connect attempt ended: {}", client->name(), e.what());
                }
            }));
    }
    for (auto& attempt : pending) {
        attempt.get();
    }

    spdlog::info("{} of {} MCP servers connected", connected_count(), attempts.size());
}

std::vector<std::pair<std::string, ToolDescriptor>> ClientManager::discovered_tools() const {
    std::vector<std::pair<std::string, ToolDescriptor>> result;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [name, client] : clients_) {
        if (!client->is_connected()) {
            continue;
        }
        for (auto& tool : client->tools()) {
            result.emplace_back(name, std::move(tool));
        }
    }
    return result;
}

std::shared_ptr<ServerClient> ClientManager::get_client(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(name);
    return it == clients_.end() ? nullptr : it->second;
}

std::vector<std::string> ClientManager::server_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(clients_.size());
    for (const auto& [name, client] : clients_) {
        names.push_back(name);
    }
    return names;
}

std::size_t ClientManager::connected_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& [name, client] : clients_) {
        if (client->is_connected()) {
            ++count;
        }
    }
    return count;
}

std::size_t ClientManager::register_tools(ToolRegistry& registry) const {
    std::size_t registered = 0;
    for (const auto& name : server_names()) {
        auto client = get_client(name);
        if (client && client->is_connected()) {
            registered += register_client_tools(client, client->tools(), registry);
        }
    }
    spdlog::info("Registered {} MCP tools", registered);
    return registered;
}

std::size_t ClientManager::refresh_tools(const std::string& server, ToolRegistry& registry) {
    auto client = get_client(server);
    if (!client) {
        throw std::invalid_argument("Unknown MCP server: " + server);
    }

    auto tools = client->refresh_tools();

    // A name prefix alone would also match a server called "{server}__x"
    std::size_t removed = 0;
    for (const auto& tool : registry.tools()) {
        auto adapter = std::dynamic_pointer_cast<McpToolAdapter>(tool);
        if (adapter && adapter->server_name() == server && registry.unregister_tool(adapter->name())) {
            ++removed;
        }
    }
    spdlog::debug("MCP server '{}': dropped {} adapters before refresh", server, removed);

    return register_client_tools(client, tools, registry);
}

void ClientManager::shutdown() {
    std::vector<std::shared_ptr<ServerClient>> clients;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, client] : clients_) {
            clients.push_back(client);
        }
    }
    if (clients.empty()) {
        return;
    }

    spdlog::debug("Shutting down {} MCP clients", clients.size());

    // Each disconnect may wait out a grace period; run them side by side
    std::vector<std::future<void>> pending;
    pending.reserve(clients.size());
    for (const auto& client : clients) {
        pending.push_back(std::async(std::launch::async, [client] { client->disconnect(); }));
    }
    for (auto& disconnect : pending) {
        disconnect.get();
    }
}

std::size_t ClientManager::register_client_tools(const std::shared_ptr<ServerClient>& client,
                                                 const std::vector<ToolDescriptor>& tools,
                                                 ToolRegistry& registry) const {
    std::size_t registered = 0;
    for (const auto& tool : tools) {
        try {
            registry.register_tool(std::make_shared<McpToolAdapter>(client, tool));
            ++registered;
        } catch (const std::invalid_argument& e) {
            spdlog::warn("MCP server '{}': skipping tool '{}': {}", client->name(), tool.name, e.what());
        }
    }
    return registered;
}

} // namespace mcp_bridge
