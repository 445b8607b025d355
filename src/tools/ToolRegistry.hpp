#pragma once

#include "ITool.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mcp_bridge {

/**
 * @brief Name-indexed set of tools available to the agent
 *
 * Holds built-in tools and MCP adapters side by side. Thread-safe; tools
 * run outside the registry lock, so a long call never blocks registration.
 */
class ToolRegistry {
public:
    /**
     * @brief Add a tool
     * @throws std::invalid_argument if the tool is null, its name is empty,
     *         or a tool with the same name is already registered
     */
    void register_tool(std::shared_ptr<ITool> tool);

    /**
     * @brief Remove a tool by name
     * @return true if a tool was removed
     */
    bool unregister_tool(const std::string& name);

    /**
     * @brief Lookup by name
     * @return Tool, or nullptr if absent
     */
    std::shared_ptr<ITool> find(const std::string& name) const;

    /**
     * @brief All tools, ordered by name
     */
    std::vector<std::shared_ptr<ITool>> tools() const;

    std::size_t size() const;

    /**
     * @brief Execute a tool by name
     *
     * An unknown name yields ToolResult::error("Unknown tool: {name}").
     * An exception escaping the tool is converted to an error result.
     */
    ToolResult execute(const std::string& name, const json& arguments,
                       const ToolContext& context = {}) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ITool>> tools_;
};

} // namespace mcp_bridge
