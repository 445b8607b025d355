#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_bridge {

using json = nlohmann::json;

/**
 * @brief Per-server trust classification
 *
 * Informs permission policy enforced outside this library.
 */
enum class TrustLevel {
    Trusted,
    Untrusted,
    Sandbox
};

std::string_view to_string(TrustLevel level);

/**
 * @brief Parse a trust level name ("trusted", "untrusted", "sandbox")
 * @return TrustLevel, or std::nullopt if the name is not recognized
 */
std::optional<TrustLevel> trust_level_from_string(std::string_view name);

constexpr std::chrono::milliseconds kDefaultHandshakeTimeout{30000};
constexpr std::chrono::milliseconds kDefaultRequestTimeout{60000};
constexpr std::chrono::milliseconds kDefaultShutdownTimeout{5000};

/**
 * @brief One server entry exactly as written in configuration
 *
 * Values may still contain ${VAR} tokens.
 */
struct RawServerConfig {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string transport = "stdio";
    std::string trust_level = "untrusted";
    bool enabled = true;
    std::chrono::milliseconds handshake_timeout = kDefaultHandshakeTimeout;
    std::chrono::milliseconds request_timeout = kDefaultRequestTimeout;
};

/**
 * @brief Resolved, immutable description of one MCP server
 *
 * Produced by ConfigResolver::resolve with environment expansion applied.
 */
struct ServerDescriptor {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string transport = "stdio";
    TrustLevel trust_level = TrustLevel::Untrusted;
    std::chrono::milliseconds handshake_timeout = kDefaultHandshakeTimeout;
    std::chrono::milliseconds request_timeout = kDefaultRequestTimeout;
    std::chrono::milliseconds shutdown_timeout = kDefaultShutdownTimeout;
};

/**
 * @brief MCP fragment of the application configuration
 */
struct McpConfig {
    bool client_enabled = true;
    std::map<std::string, RawServerConfig> servers;

    /// Problems found while parsing; the affected servers were skipped
    std::vector<std::string> diagnostics;
};

/**
 * @brief Parse the MCP configuration fragment
 *
 * Accepts "servers" or its alias "mcpServers". Malformed server entries are
 * skipped and reported in McpConfig::diagnostics.
 *
 * @param document JSON object holding the fragment
 * @return Parsed configuration
 * @throws McpError (Config) if the document is not a JSON object
 */
McpConfig parse_mcp_config(const json& document);

/**
 * @brief Read and parse a JSON configuration file
 * @param path Path to the file
 * @throws McpError (Config) if the file is unreadable or not valid JSON
 */
McpConfig load_mcp_config(const std::filesystem::path& path);

} // namespace mcp_bridge
