#pragma once

#include "ServerClient.hpp"
#include "tools/ITool.hpp"
#include <memory>
#include <string>
#include <vector>

namespace mcp_bridge {

/**
 * @brief Presents one remote MCP tool through the ITool interface
 *
 * Name is "mcp__{server}__{tool}". Description, schema and annotations are
 * a snapshot taken at discovery. The adapter does not keep its client
 * alive; once the ClientManager drops the client, execute() reports the
 * server as disconnected.
 */
class McpToolAdapter : public ITool {
public:
    /**
     * @brief Bind a discovered tool to its client
     * @param client Client that discovered the tool
     * @param tool Descriptor from tools/list
     */
    McpToolAdapter(const std::shared_ptr<ServerClient>& client, ToolDescriptor tool);

    /**
     * @brief Build the registry name for a remote tool
     * @param server Server name
     * @param tool Remote tool name
     * @return "mcp__{server}__{tool}"
     */
    static std::string namespaced_name(const std::string& server, const std::string& tool);

    std::string name() const override { return name_; }
    std::string description() const override { return tool_.description; }

    /**
     * @brief ReadOnly for read-only tools, Network for everything else
     */
    ToolCategory category() const override;

    json parameters_schema() const override { return tool_.input_schema; }

    /**
     * @brief Dangerous if destructive, else Safe if read-only, else Moderate
     */
    RiskLevel risk_level() const override;

    /**
     * @brief Call the remote tool
     *
     * Fails without touching the transport when the server is disconnected.
     * The server's isError flag selects error or success; content items are
     * flattened with format_tool_content().
     */
    ToolResult execute(const json& arguments, const ToolContext& context) override;

    const std::string& server_name() const { return server_name_; }
    const ToolDescriptor& remote_tool() const { return tool_; }

private:
    std::weak_ptr<ServerClient> client_;
    std::string server_name_;
    ToolDescriptor tool_;
    std::string name_;
};

/**
 * @brief Flatten tool result content to text
 *
 * Items are joined with '\n' in order. Text is copied verbatim, images
 * become "[Image: {mime}]", resources contribute their text, else a
 * "[Resource blob: N bytes]" placeholder, else their URI.
 */
std::string format_tool_content(const std::vector<ToolCallContent>& content);

} // namespace mcp_bridge
