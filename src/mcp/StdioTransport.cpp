#include "StdioTransport.hpp"
#include "McpError.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace mcp_bridge {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    spdlog::debug("StdioTransport initialized");
}

json StdioTransport::read_message() {
    std::string line;

    while (!closed_) {
        if (!std::getline(in_, line)) {
            if (in_.eof()) {
                spdlog::debug("Reached end of input stream");
            } else {
                spdlog::error("Error reading from input stream");
            }
            return json();  // Return empty JSON on EOF or error
        }

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        try {
            json message = json::parse(line);
            spdlog::debug("Read message: {}", line);
            return message;
        } catch (const json::parse_error& e) {
            throw McpError(ErrorKind::Protocol, std::string("JSON parse error: ") + e.what());
        }
    }

    return json();
}

void StdioTransport::write_message(const json& message) {
    if (closed_) {
        throw McpError(ErrorKind::Transport, "stdio transport is closed");
    }

    std::string serialized = message.dump();
    std::lock_guard<std::mutex> lock(write_mutex_);
    out_ << serialized << std::endl;  // std::endl flushes automatically
    if (!out_.good()) {
        throw McpError(ErrorKind::Transport, "failed to write to output stream");
    }
    spdlog::debug("Wrote message: {}", serialized);
}

bool StdioTransport::is_open() const {
    return !closed_ && in_.good() && out_.good();
}

void StdioTransport::close() {
    closed_ = true;
}

} // namespace mcp_bridge
