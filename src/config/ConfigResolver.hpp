#pragma once

#include "McpConfig.hpp"
#include <string>
#include <string_view>

namespace mcp_bridge {

/**
 * @brief Turns raw server configuration into ServerDescriptors
 *
 * Pure functions: no I/O besides reading the process environment,
 * and no failure modes. Misconfiguration stays visible in the output
 * instead of aborting startup.
 */
class ConfigResolver {
public:
    /**
     * @brief Substitute ${NAME} tokens with environment variable values
     *
     * A variable that is not set leaves its token verbatim. Substituted
     * values are not scanned again. An unterminated "${" is copied as is.
     *
     * @param input String that may contain ${NAME} tokens
     * @return Expanded string
     */
    static std::string expand_env_vars(std::string_view input);

    /**
     * @brief Build the descriptor for one server
     *
     * Applies expand_env_vars to the command, every argument and every
     * env value. An unknown trust level falls back to untrusted.
     *
     * @param name Unique server name (configuration key)
     * @param raw Server entry as configured
     * @return Resolved descriptor
     */
    static ServerDescriptor resolve(const std::string& name, const RawServerConfig& raw);
};

} // namespace mcp_bridge
