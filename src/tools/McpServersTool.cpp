#include "McpServersTool.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcp_bridge {

namespace {

json describe_client(const ServerClient& client) {
    ConnectionState state = client.state();
    ServerDescriptor descriptor = client.descriptor();

    json entry = {
        {"name", client.name()},
        {"status", std::string(to_string(state.status))},
        {"trust_level", std::string(to_string(descriptor.trust_level))},
        {"command", descriptor.command}
    };
    if (!state.cause.empty()) {
        entry["cause"] = state.cause;
    }
    if (state.status == ConnectionStatus::Connected) {
        ServerInfo info = client.server_info();
        entry["server"] = {{"name", info.name}, {"version", info.version}};
        entry["tools"] = client.tools().size();
        entry["tools_stale"] = client.tools_stale();
    }
    return entry;
}

} // namespace

McpServersTool::McpServersTool(std::shared_ptr<const ClientManager> manager)
    : manager_(std::move(manager)) {
    if (!manager_) {
        throw std::invalid_argument("Client manager cannot be null");
    }
}

std::string McpServersTool::description() const {
    return "List configured MCP servers with connection status, trust level and tool count";
}

json McpServersTool::parameters_schema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"server", {
                {"type", "string"},
                {"description", "Only report this server"}
            }}
        }}
    };
}

ToolResult McpServersTool::execute(const json& arguments, const ToolContext& /*context*/) {
    std::string only;
    if (arguments.is_object() && arguments.contains("server")) {
        if (!arguments["server"].is_string()) {
            return ToolResult::error("server must be a string");
        }
        only = arguments["server"].get<std::string>();
    }

    json servers = json::array();
    for (const auto& name : manager_->server_names()) {
        if (!only.empty() && name != only) {
            continue;
        }
        if (auto client = manager_->get_client(name)) {
            servers.push_back(describe_client(*client));
        }
    }

    if (!only.empty() && servers.empty()) {
        return ToolResult::error("Unknown MCP server: " + only);
    }

    spdlog::debug("McpServersTool: reporting {} servers", servers.size());
    return ToolResult::success(json{{"servers", servers}}.dump(2));
}

} // namespace mcp_bridge
