#include "TransportFactory.hpp"
#include "McpError.hpp"
#include "ProcessTransport.hpp"

namespace mcp_bridge {

TransportFactory default_transport_factory() {
    return [](const ServerDescriptor& descriptor) -> std::unique_ptr<ITransport> {
        if (descriptor.transport != "stdio") {
            throw McpError(ErrorKind::Config,
                           "transport '" + descriptor.transport + "' not supported (only stdio)");
        }
        auto transport = std::make_unique<ProcessTransport>(descriptor);
        transport->start();
        return transport;
    };
}

} // namespace mcp_bridge
