#pragma once

#include "core/CancellationToken.hpp"
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace mcp_bridge {

using json = nlohmann::json;

/**
 * @brief What a tool does to the world, for permission decisions
 */
enum class ToolCategory {
    ReadOnly,
    Write,
    Execute,
    Network
};

enum class RiskLevel {
    Safe,
    Moderate,
    Dangerous
};

std::string_view to_string(ToolCategory category);
std::string_view to_string(RiskLevel risk);

/**
 * @brief Outcome of a tool execution as seen by the agent
 */
struct ToolResult {
    bool is_error = false;
    std::string output;

    static ToolResult success(std::string output) { return {false, std::move(output)}; }
    static ToolResult error(std::string output) { return {true, std::move(output)}; }
};

/**
 * @brief Per-invocation context passed to ITool::execute
 */
struct ToolContext {
    /// Cancelling aborts the in-flight call; may be null
    const CancellationToken* cancel = nullptr;
};

/**
 * @brief Capability interface shared by built-in tools and remote MCP tools
 *
 * execute() reports every failure through ToolResult::error instead of
 * throwing.
 */
class ITool {
public:
    virtual ~ITool() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual ToolCategory category() const = 0;

    /**
     * @brief JSON Schema of the arguments object
     */
    virtual json parameters_schema() const = 0;

    virtual RiskLevel risk_level() const = 0;

    /**
     * @brief Run the tool
     * @param arguments JSON object matching parameters_schema()
     * @param context Cancellation and other per-call state
     * @return Success or error text for the agent
     */
    virtual ToolResult execute(const json& arguments, const ToolContext& context) = 0;
};

} // namespace mcp_bridge
