#include "Protocol.hpp"
#include "McpError.hpp"

namespace mcp_bridge {

namespace {

std::optional<std::string> optional_string(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

bool optional_bool(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return false;
    }
    return j[key].get<bool>();
}

bool has_id(const json& message) {
    return message.contains("id") && !message["id"].is_null();
}

} // namespace

MessageType classify_message(const json& message) {
    if (!message.is_object()) {
        return MessageType::Invalid;
    }
    if (message.contains("method")) {
        if (!message["method"].is_string()) {
            return MessageType::Invalid;
        }
        return has_id(message) ? MessageType::Request : MessageType::Notification;
    }
    if (message.contains("id") && (message.contains("result") || message.contains("error"))) {
        return MessageType::Response;
    }
    return MessageType::Invalid;
}

json make_request(long long id, const std::string& method, const json& params) {
    json request = {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"method", method}
    };
    if (!params.is_null()) {
        request["params"] = params;
    }
    return request;
}

json make_notification(const std::string& method, const json& params) {
    json notification = {
        {"jsonrpc", kJsonRpcVersion},
        {"method", method}
    };
    if (!params.is_null()) {
        notification["params"] = params;
    }
    return notification;
}

json make_response(const json& id, const json& result) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"result", result}
    };
}

json make_error_response(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

json unwrap_response(const json& response) {
    if (response.contains("error") && !response["error"].is_null()) {
        const json& error = response["error"];
        long long code = rpc_error::INTERNAL_ERROR;
        std::string message = error.dump();
        if (error.is_object()) {
            if (error.contains("code") && error["code"].is_number_integer()) {
                code = error["code"].get<long long>();
            }
            if (error.contains("message") && error["message"].is_string()) {
                message = error["message"].get<std::string>();
            }
        }
        throw McpError::rpc(code, message);
    }
    if (!response.contains("result")) {
        throw McpError(ErrorKind::Protocol, "response carries neither result nor error");
    }
    return response["result"];
}

ToolCallContent parse_tool_call_content(const json& item) {
    const std::string type = item.at("type").get<std::string>();
    if (type == "text") {
        return TextContent{item.at("text").get<std::string>()};
    }
    if (type == "image") {
        return ImageContent{
            item.at("data").get<std::string>(),
            item.at("mimeType").get<std::string>()
        };
    }
    if (type == "resource") {
        return item.at("resource").get<ResourceContent>();
    }
    return TextContent{"[Unsupported content: " + type + "]"};
}

void to_json(json& j, const ClientInfo& info) {
    j = {{"name", info.name}, {"version", info.version}};
}

void from_json(const json& j, ServerInfo& info) {
    info.name = j.value("name", "");
    info.version = j.value("version", "");
}

void from_json(const json& j, ServerCapabilities& capabilities) {
    capabilities = ServerCapabilities{};
    if (j.contains("tools") && j["tools"].is_object()) {
        capabilities.tools = true;
        capabilities.tools_list_changed = optional_bool(j["tools"], "listChanged");
    }
    if (j.contains("resources") && j["resources"].is_object()) {
        capabilities.resources = true;
        capabilities.resources_subscribe = optional_bool(j["resources"], "subscribe");
        capabilities.resources_list_changed = optional_bool(j["resources"], "listChanged");
    }
    capabilities.prompts = j.contains("prompts") && !j["prompts"].is_null();
    capabilities.logging = j.contains("logging") && !j["logging"].is_null();
}

void from_json(const json& j, InitializeResult& result) {
    result.protocol_version = j.at("protocolVersion").get<std::string>();
    result.capabilities = j.contains("capabilities") && j["capabilities"].is_object()
        ? j["capabilities"].get<ServerCapabilities>()
        : ServerCapabilities{};
    result.server_info = j.contains("serverInfo") && j["serverInfo"].is_object()
        ? j["serverInfo"].get<ServerInfo>()
        : ServerInfo{};
}

void from_json(const json& j, ToolAnnotations& annotations) {
    annotations.read_only_hint = optional_bool(j, "readOnlyHint");
    annotations.destructive_hint = optional_bool(j, "destructiveHint");
    annotations.idempotent_hint = optional_bool(j, "idempotentHint");
    annotations.open_world_hint = optional_bool(j, "openWorldHint");
}

void from_json(const json& j, ToolDescriptor& tool) {
    tool.name = j.at("name").get<std::string>();
    tool.description = optional_string(j, "description").value_or("MCP tool: " + tool.name);

    if (j.contains("inputSchema") && j["inputSchema"].is_object()) {
        tool.input_schema = j["inputSchema"];
    } else {
        tool.input_schema = {{"type", "object"}, {"properties", json::object()}};
    }

    tool.annotations = j.contains("annotations") && j["annotations"].is_object()
        ? j["annotations"].get<ToolAnnotations>()
        : ToolAnnotations{};
}

void from_json(const json& j, ResourceContent& content) {
    content.uri = j.at("uri").get<std::string>();
    content.mime_type = optional_string(j, "mimeType");
    content.text = optional_string(j, "text");
    content.blob = optional_string(j, "blob");
}

void from_json(const json& j, ToolCallResult& result) {
    result.content.clear();
    if (j.contains("content") && !j["content"].is_null()) {
        if (!j["content"].is_array()) {
            throw McpError(ErrorKind::Protocol, "tool result 'content' is not an array");
        }
        for (const auto& item : j["content"]) {
            result.content.push_back(parse_tool_call_content(item));
        }
    }
    result.is_error = optional_bool(j, "isError");
}

void from_json(const json& j, ResourceDescriptor& resource) {
    resource.uri = j.at("uri").get<std::string>();
    resource.name = j.value("name", resource.uri);
    resource.description = optional_string(j, "description");
    resource.mime_type = optional_string(j, "mimeType");
}

void from_json(const json& j, ResourceReadResult& result) {
    result.contents.clear();
    if (j.contains("contents") && !j["contents"].is_null()) {
        if (!j["contents"].is_array()) {
            throw McpError(ErrorKind::Protocol, "resource 'contents' is not an array");
        }
        for (const auto& item : j["contents"]) {
            result.contents.push_back(item.get<ResourceContent>());
        }
    }
}

} // namespace mcp_bridge
