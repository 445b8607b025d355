#pragma once

#include "ITool.hpp"
#include "mcp/ClientManager.hpp"
#include <memory>

namespace mcp_bridge {

/**
 * @brief Built-in tool reporting the state of every configured MCP server
 *
 * Returns a JSON document with, per server: name, connection status,
 * failure cause, trust level, server info, tool count and stale flag.
 */
class McpServersTool : public ITool {
public:
    /**
     * @brief Construct tool with manager reference
     * @param manager Client manager to report on
     */
    explicit McpServersTool(std::shared_ptr<const ClientManager> manager);

    std::string name() const override { return "mcp_servers"; }
    std::string description() const override;
    ToolCategory category() const override { return ToolCategory::ReadOnly; }
    json parameters_schema() const override;
    RiskLevel risk_level() const override { return RiskLevel::Safe; }

    /**
     * @brief Report server states
     * @param arguments Optional "server" string restricting the report
     */
    ToolResult execute(const json& arguments, const ToolContext& context) override;

private:
    std::shared_ptr<const ClientManager> manager_;
};

} // namespace mcp_bridge
