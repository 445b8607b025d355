#include "ConfigResolver.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>

namespace mcp_bridge {

std::string ConfigResolver::expand_env_vars(std::string_view input) {
    std::string result;
    result.reserve(input.size());

    std::size_t pos = 0;
    while (pos < input.size()) {
        std::size_t start = input.find("${", pos);
        if (start == std::string_view::npos) {
            result.append(input.substr(pos));
            break;
        }
        result.append(input.substr(pos, start - pos));

        std::size_t end = input.find('}', start + 2);
        if (end == std::string_view::npos) {
            result.append(input.substr(start));
            break;
        }

        std::string name(input.substr(start + 2, end - start - 2));
        const char* value = name.empty() ? nullptr : std::getenv(name.c_str());
        if (value != nullptr) {
            result.append(value);
        } else {
            result.append(input.substr(start, end - start + 1));
        }
        pos = end + 1;
    }

    return result;
}

ServerDescriptor ConfigResolver::resolve(const std::string& name, const RawServerConfig& raw) {
    ServerDescriptor descriptor;
    descriptor.name = name;
    descriptor.command = expand_env_vars(raw.command);

    descriptor.args.reserve(raw.args.size());
    for (const auto& arg : raw.args) {
        descriptor.args.push_back(expand_env_vars(arg));
    }

    for (const auto& [key, value] : raw.env) {
        descriptor.env[key] = expand_env_vars(value);
    }

    descriptor.transport = raw.transport;
    descriptor.handshake_timeout = raw.handshake_timeout;
    descriptor.request_timeout = raw.request_timeout;

    if (auto level = trust_level_from_string(raw.trust_level)) {
        descriptor.trust_level = *level;
    } else {
        spdlog::warn("MCP server '{}': unknown trust level '{}', using untrusted",
                     name, raw.trust_level);
        descriptor.trust_level = TrustLevel::Untrusted;
    }

    return descriptor;
}

} // namespace mcp_bridge
