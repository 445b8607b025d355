#include "GatewayServer.hpp"
#include "McpError.hpp"
#include "Protocol.hpp"
#include "core/Version.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcp_bridge {

GatewayServer::GatewayServer(std::unique_ptr<ITransport> transport,
                             std::shared_ptr<ToolRegistry> registry)
    : transport_(std::move(transport)), registry_(std::move(registry)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    if (!registry_) {
        throw std::invalid_argument("Tool registry cannot be null");
    }
    spdlog::info("GatewayServer initialized");
}

void GatewayServer::run() {
    running_ = true;
    spdlog::info("GatewayServer starting main loop");

    while (running_ && transport_->is_open()) {
        json request;
        try {
            request = transport_->read_message();
        } catch (const McpError& e) {
            if (e.kind() != ErrorKind::Protocol) {
                spdlog::error("Transport failure: {}", e.what());
                break;
            }
            spdlog::warn("Unparsable request: {}", e.what());
            try {
                transport_->write_message(make_error_response(json(), rpc_error::PARSE_ERROR,
                                                              "Parse error"));
            } catch (const McpError& write_error) {
                spdlog::error("Failed to send parse error response: {}", write_error.what());
                break;
            }
            continue;
        }

        // Null message indicates EOF or closed transport
        if (request.is_null()) {
            spdlog::info("Input closed, stopping server");
            break;
        }

        json response = handle_request(request);

        // Notifications produce no response
        if (response.is_null()) {
            continue;
        }

        try {
            transport_->write_message(response);
        } catch (const McpError& e) {
            spdlog::error("Failed to send response: {}", e.what());
            break;
        }
    }

    running_ = false;
    spdlog::info("GatewayServer stopped");
}

void GatewayServer::stop() {
    running_ = false;
    transport_->close();
}

json GatewayServer::handle_request(const json& request) {
    // Validate JSON-RPC 2.0 format
    if (!request.is_object() || !request.contains("jsonrpc") || request["jsonrpc"] != kJsonRpcVersion) {
        return make_error_response(json(), rpc_error::INVALID_REQUEST,
                                   "Invalid Request: missing or invalid jsonrpc field");
    }

    json id = request.value("id", json());

    if (!request.contains("method") || !request["method"].is_string()) {
        return make_error_response(id, rpc_error::INVALID_REQUEST,
                                   "Invalid Request: missing method field");
    }

    std::string method = request["method"];
    json params = request.value("params", json::object());

    if (!request.contains("id")) {
        if (method == "notifications/initialized") {
            spdlog::info("Client sent initialized notification, gateway is ready");
        } else {
            spdlog::debug("Ignoring notification: {}", method);
        }
        return json();
    }

    spdlog::debug("Handling request: method={}, id={}", method, id.dump());

    try {
        if (method == "initialize") {
            json result = handle_initialize(params);
            initialized_ = true;
            return make_response(id, result);
        } else if (method == "tools/list") {
            return make_response(id, handle_tools_list());
        } else if (method == "tools/call") {
            return make_response(id, handle_tools_call(params));
        } else if (method == "ping") {
            return make_response(id, json::object());
        } else {
            return make_error_response(id, rpc_error::METHOD_NOT_FOUND, "Method not found: " + method);
        }
    } catch (const std::invalid_argument& e) {
        return make_error_response(id, rpc_error::INVALID_PARAMS, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Error handling method {}: {}", method, e.what());
        return make_error_response(id, rpc_error::INTERNAL_ERROR, std::string("Internal error: ") + e.what());
    }
}

json GatewayServer::handle_tools_list() {
    json tools_array = json::array();

    for (const auto& tool : registry_->tools()) {
        tools_array.push_back({
            {"name", tool->name()},
            {"description", tool->description()},
            {"inputSchema", tool->parameters_schema()},
            {"annotations", {
                {"readOnlyHint", tool->category() == ToolCategory::ReadOnly},
                {"destructiveHint", tool->risk_level() == RiskLevel::Dangerous}
            }}
        });
    }

    spdlog::debug("Returning {} tools", tools_array.size());
    return {{"tools", tools_array}};
}

json GatewayServer::handle_tools_call(const json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        throw std::invalid_argument("Missing required parameter: name");
    }

    std::string tool_name = params["name"];
    json arguments = params.value("arguments", json::object());

    spdlog::debug("Calling tool: {} with args: {}", tool_name, arguments.dump());

    ToolResult result = registry_->execute(tool_name, arguments);

    return {
        {"content", json::array({
            {
                {"type", "text"},
                {"text", result.output}
            }
        })},
        {"isError", result.is_error}
    };
}

json GatewayServer::handle_initialize(const json& params) {
    spdlog::info("Handling initialize request");

    if (params.contains("clientInfo")) {
        std::string client_name = params["clientInfo"].value("name", "unknown");
        std::string client_version = params["clientInfo"].value("version", "unknown");
        spdlog::info("Client: {} version {}", client_name, client_version);
    }

    return {
        {"protocolVersion", kMcpProtocolVersion},
        {"capabilities", {
            {"tools", json::object()}
        }},
        {"serverInfo", {
            {"name", kBridgeName},
            {"version", kBridgeVersion}
        }}
    };
}

} // namespace mcp_bridge
