#include "McpError.hpp"

namespace mcp_bridge {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Config:       return "config";
        case ErrorKind::Spawn:        return "spawn";
        case ErrorKind::Protocol:     return "protocol";
        case ErrorKind::Rpc:          return "rpc";
        case ErrorKind::Timeout:      return "timeout";
        case ErrorKind::Transport:    return "transport";
        case ErrorKind::Disconnected: return "disconnected";
        case ErrorKind::Cancelled:    return "cancelled";
    }
    return "unknown";
}

McpError::McpError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

McpError McpError::rpc(long long code, const std::string& message) {
    McpError error(ErrorKind::Rpc,
                   "MCP server error: JSON-RPC error " + std::to_string(code) + ": " + message);
    error.rpc_code_ = code;
    return error;
}

McpError McpError::spawn_failed(const std::string& detail) {
    return McpError(ErrorKind::Spawn, "failed to spawn MCP server: " + detail);
}

McpError McpError::timeout() {
    return McpError(ErrorKind::Timeout, "MCP request timed out");
}

McpError McpError::disconnected() {
    return McpError(ErrorKind::Disconnected, "MCP server disconnected");
}

bool McpError::is_connection_fault() const noexcept {
    return kind_ == ErrorKind::Transport ||
           kind_ == ErrorKind::Protocol ||
           kind_ == ErrorKind::Disconnected;
}

} // namespace mcp_bridge
