#include "McpConfig.hpp"
#include "mcp/McpError.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>

namespace mcp_bridge {

namespace {

std::chrono::milliseconds read_timeout(const json& entry, const char* key,
                                       std::chrono::milliseconds fallback) {
    if (!entry.contains(key)) {
        return fallback;
    }
    const json& value = entry[key];
    if (!value.is_number_integer() || value.get<long long>() <= 0) {
        throw std::invalid_argument(std::string("'") + key + "' must be a positive integer");
    }
    return std::chrono::milliseconds(value.get<long long>());
}

RawServerConfig parse_server_entry(const json& entry) {
    if (!entry.is_object()) {
        throw std::invalid_argument("entry is not an object");
    }
    if (!entry.contains("command") || !entry["command"].is_string()) {
        throw std::invalid_argument("missing or non-string 'command'");
    }

    RawServerConfig raw;
    raw.command = entry["command"].get<std::string>();

    if (entry.contains("args")) {
        if (!entry["args"].is_array()) {
            throw std::invalid_argument("'args' must be an array");
        }
        for (const auto& arg : entry["args"]) {
            if (!arg.is_string()) {
                throw std::invalid_argument("'args' contains a non-string value");
            }
            raw.args.push_back(arg.get<std::string>());
        }
    }

    if (entry.contains("env")) {
        if (!entry["env"].is_object()) {
            throw std::invalid_argument("'env' must be an object");
        }
        for (const auto& [key, value] : entry["env"].items()) {
            if (!value.is_string()) {
                throw std::invalid_argument("env value for '" + key + "' is not a string");
            }
            raw.env[key] = value.get<std::string>();
        }
    }

    if (entry.contains("transport")) {
        if (!entry["transport"].is_string()) {
            throw std::invalid_argument("'transport' must be a string");
        }
        raw.transport = entry["transport"].get<std::string>();
    }

    if (entry.contains("enabled")) {
        if (!entry["enabled"].is_boolean()) {
            throw std::invalid_argument("'enabled' must be a boolean");
        }
        raw.enabled = entry["enabled"].get<bool>();
    }

    if (entry.contains("permissions")) {
        const json& permissions = entry["permissions"];
        if (!permissions.is_object()) {
            throw std::invalid_argument("'permissions' must be an object");
        }
        if (permissions.contains("trust_level")) {
            if (!permissions["trust_level"].is_string()) {
                throw std::invalid_argument("'permissions.trust_level' must be a string");
            }
            raw.trust_level = permissions["trust_level"].get<std::string>();
        }
    }

    raw.handshake_timeout = read_timeout(entry, "handshake_timeout_ms", kDefaultHandshakeTimeout);
    raw.request_timeout = read_timeout(entry, "request_timeout_ms", kDefaultRequestTimeout);
    return raw;
}

} // namespace

std::string_view to_string(TrustLevel level) {
    switch (level) {
        case TrustLevel::Trusted:   return "trusted";
        case TrustLevel::Untrusted: return "untrusted";
        case TrustLevel::Sandbox:   return "sandbox";
    }
    return "untrusted";
}

std::optional<TrustLevel> trust_level_from_string(std::string_view name) {
    if (name == "trusted") {
        return TrustLevel::Trusted;
    }
    if (name == "untrusted") {
        return TrustLevel::Untrusted;
    }
    if (name == "sandbox") {
        return TrustLevel::Sandbox;
    }
    return std::nullopt;
}

McpConfig parse_mcp_config(const json& document) {
    if (!document.is_object()) {
        throw McpError(ErrorKind::Config, "MCP configuration must be a JSON object");
    }

    McpConfig config;
    if (document.contains("client_enabled")) {
        if (!document["client_enabled"].is_boolean()) {
            throw McpError(ErrorKind::Config, "'client_enabled' must be a boolean");
        }
        config.client_enabled = document["client_enabled"].get<bool>();
    }

    const char* servers_key = document.contains("servers") ? "servers" : "mcpServers";
    if (!document.contains(servers_key)) {
        return config;
    }

    const json& servers = document[servers_key];
    if (!servers.is_object()) {
        throw McpError(ErrorKind::Config, std::string("'") + servers_key + "' must be an object");
    }

    for (const auto& [name, entry] : servers.items()) {
        if (name.empty()) {
            config.diagnostics.push_back("skipping server with empty name");
            spdlog::warn("MCP config: {}", config.diagnostics.back());
            continue;
        }
        try {
            config.servers[name] = parse_server_entry(entry);
        } catch (const std::invalid_argument& e) {
            config.diagnostics.push_back("server '" + name + "': " + e.what());
            spdlog::warn("MCP config: skipping {}", config.diagnostics.back());
        }
    }

    spdlog::debug("Parsed MCP config with {} servers ({} skipped)",
                  config.servers.size(), config.diagnostics.size());
    return config;
}

McpConfig load_mcp_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw McpError(ErrorKind::Config, "cannot open config file: " + path.string());
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw McpError(ErrorKind::Config,
                       "invalid JSON in " + path.string() + ": " + e.what());
    }

    spdlog::info("Loaded MCP config from {}", path.string());
    return parse_mcp_config(document);
}

} // namespace mcp_bridge
