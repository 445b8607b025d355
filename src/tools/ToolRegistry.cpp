#include "ToolRegistry.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcp_bridge {

void ToolRegistry::register_tool(std::shared_ptr<ITool> tool) {
    if (!tool) {
        throw std::invalid_argument("Tool cannot be null");
    }

    std::string name = tool->name();
    if (name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (tools_.count(name) != 0) {
        throw std::invalid_argument("Tool already registered: " + name);
    }
    tools_.emplace(name, std::move(tool));
    spdlog::debug("Registered tool: {}", name);
}

bool ToolRegistry::unregister_tool(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.erase(name) != 0;
}

std::shared_ptr<ITool> ToolRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<ITool>> ToolRegistry::tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<ITool>> result;
    result.reserve(tools_.size());
    for (const auto& [name, tool] : tools_) {
        result.push_back(tool);
    }
    return result;
}

std::size_t ToolRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.size();
}

ToolResult ToolRegistry::execute(const std::string& name, const json& arguments,
                                 const ToolContext& context) const {
    auto tool = find(name);
    if (!tool) {
        return ToolResult::error("Unknown tool: " + name);
    }

    spdlog::debug("Executing tool: {}", name);
    try {
        return tool->execute(arguments, context);
    } catch (const std::exception& e) {
        spdlog::error("Tool '{}' threw: {}", name, e.what());
        return ToolResult::error("Tool '" + name + "' failed: " + e.what());
    }
}

} // namespace mcp_bridge
