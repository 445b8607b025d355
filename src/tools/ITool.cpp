#include "ITool.hpp"

namespace mcp_bridge {

std::string_view to_string(ToolCategory category) {
    switch (category) {
        case ToolCategory::ReadOnly: return "read_only";
        case ToolCategory::Write:    return "write";
        case ToolCategory::Execute:  return "execute";
        case ToolCategory::Network:  return "network";
    }
    return "unknown";
}

std::string_view to_string(RiskLevel risk) {
    switch (risk) {
        case RiskLevel::Safe:      return "safe";
        case RiskLevel::Moderate:  return "moderate";
        case RiskLevel::Dangerous: return "dangerous";
    }
    return "unknown";
}

} // namespace mcp_bridge
