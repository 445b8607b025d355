#pragma once

#include "ITransport.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace mcp_bridge {

/**
 * @brief Transport using standard input/output streams
 *
 * Reads JSON messages line-by-line from stdin
 * Writes JSON messages line-by-line to stdout with flush
 * Used by GatewayServer when mcp-bridge itself is launched by an MCP host.
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    json read_message() override;
    void write_message(const json& message) override;
    bool is_open() const override;

    /**
     * @brief Mark the transport closed
     *
     * A read already blocked inside the input stream returns only when the
     * stream delivers data or EOF.
     */
    void close() override;

private:
    std::istream& in_;
    std::ostream& out_;
    std::mutex write_mutex_;
    std::atomic<bool> closed_{false};
};

} // namespace mcp_bridge
