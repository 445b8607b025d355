#pragma once

namespace mcp_bridge {

constexpr const char* kBridgeName = "mcp-bridge";
constexpr const char* kBridgeVersion = "1.0.0";

} // namespace mcp_bridge
