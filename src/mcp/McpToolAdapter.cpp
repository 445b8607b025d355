#include "McpToolAdapter.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcp_bridge {

namespace {

std::string format_item(const ToolCallContent& item) {
    if (const auto* text = std::get_if<TextContent>(&item)) {
        return text->text;
    }
    if (const auto* image = std::get_if<ImageContent>(&item)) {
        return "[Image: " + image->mime_type + "]";
    }

    const auto& resource = std::get<ResourceContent>(item);
    if (resource.text) {
        return *resource.text;
    }
    if (resource.blob) {
        return "[Resource blob: " + std::to_string(resource.blob->size()) + " bytes]";
    }
    return resource.uri;
}

} // namespace

McpToolAdapter::McpToolAdapter(const std::shared_ptr<ServerClient>& client, ToolDescriptor tool)
    : client_(client), tool_(std::move(tool)) {
    if (!client) {
        throw std::invalid_argument("Client cannot be null");
    }
    server_name_ = client->name();
    name_ = namespaced_name(server_name_, tool_.name);
}

std::string McpToolAdapter::namespaced_name(const std::string& server, const std::string& tool) {
    return "mcp__" + server + "__" + tool;
}

ToolCategory McpToolAdapter::category() const {
    // Anything that is not read-only may reach outside the local system
    return tool_.annotations.read_only_hint ? ToolCategory::ReadOnly : ToolCategory::Network;
}

RiskLevel McpToolAdapter::risk_level() const {
    if (tool_.annotations.destructive_hint) {
        return RiskLevel::Dangerous;
    }
    if (tool_.annotations.read_only_hint) {
        return RiskLevel::Safe;
    }
    return RiskLevel::Moderate;
}

ToolResult McpToolAdapter::execute(const json& arguments, const ToolContext& context) {
    auto client = client_.lock();
    if (!client || !client->is_connected()) {
        return ToolResult::error("MCP server '" + server_name_ + "' is disconnected");
    }

    try {
        ToolCallResult result = client->call_tool(tool_.name, arguments, context.cancel);
        std::string output = format_tool_content(result.content);
        if (result.is_error) {
            return ToolResult::error(std::move(output));
        }
        return ToolResult::success(std::move(output));
    } catch (const std::exception& e) {
        spdlog::warn("{}: {}", name_, e.what());
        return ToolResult::error("MCP tool call failed (server '" + server_name_ + "'): " + e.what());
    }
}

std::string format_tool_content(const std::vector<ToolCallContent>& content) {
    std::string output;
    for (std::size_t i = 0; i < content.size(); ++i) {
        if (i > 0) {
            output += '\n';
        }
        output += format_item(content[i]);
    }
    return output;
}

} // namespace mcp_bridge
