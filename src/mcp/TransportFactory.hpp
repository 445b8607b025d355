#pragma once

#include "ITransport.hpp"
#include "config/McpConfig.hpp"
#include <functional>
#include <memory>

namespace mcp_bridge {

/**
 * @brief Creates a connected transport for a server descriptor
 *
 * Extension point for transports other than stdio. The returned transport
 * must be ready for read_message/write_message. Implementations report
 * failures with McpError (Spawn or Config).
 */
using TransportFactory = std::function<std::unique_ptr<ITransport>(const ServerDescriptor&)>;

/**
 * @brief Factory supporting the "stdio" transport via ProcessTransport
 *
 * Any other transport name raises McpError (Config).
 */
TransportFactory default_transport_factory();

} // namespace mcp_bridge
