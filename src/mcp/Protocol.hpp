#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_bridge {

using json = nlohmann::json;

constexpr const char* kJsonRpcVersion = "2.0";
constexpr const char* kMcpProtocolVersion = "2025-11-25";

// Standard JSON-RPC error codes
namespace rpc_error {
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
} // namespace rpc_error

/**
 * @brief Shape of an inbound JSON-RPC message
 */
enum class MessageType {
    Request,       // method + non-null id
    Response,      // id + result or error
    Notification,  // method, no id
    Invalid
};

MessageType classify_message(const json& message);

json make_request(long long id, const std::string& method, const json& params);
json make_notification(const std::string& method, const json& params = json());
json make_response(const json& id, const json& result);
json make_error_response(const json& id, int code, const std::string& message);

/**
 * @brief Extract the result of a JSON-RPC response
 * @param response Full response message
 * @return Value of the "result" member
 * @throws McpError (Rpc) if the response carries an error object,
 *         McpError (Protocol) if it carries neither result nor error
 */
json unwrap_response(const json& response);

struct ClientInfo {
    std::string name;
    std::string version;
};

struct ServerInfo {
    std::string name;
    std::string version;
};

struct ServerCapabilities {
    bool tools = false;
    bool tools_list_changed = false;
    bool resources = false;
    bool resources_subscribe = false;
    bool resources_list_changed = false;
    bool prompts = false;
    bool logging = false;
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    ServerInfo server_info;
};

/**
 * @brief Behavior hints a server attaches to a tool
 *
 * Each hint is optional on the wire and defaults to false.
 */
struct ToolAnnotations {
    bool read_only_hint = false;
    bool destructive_hint = false;
    bool idempotent_hint = false;
    bool open_world_hint = false;
};

/**
 * @brief A remote tool as reported by tools/list
 */
struct ToolDescriptor {
    std::string name;
    std::string description;
    json input_schema;  // Server-defined JSON Schema, opaque here
    ToolAnnotations annotations;
};

struct TextContent {
    std::string text;
};

struct ImageContent {
    std::string data;  // base64 payload
    std::string mime_type;
};

struct ResourceContent {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // base64 payload
};

using ToolCallContent = std::variant<TextContent, ImageContent, ResourceContent>;

struct ToolCallResult {
    std::vector<ToolCallContent> content;
    bool is_error = false;
};

struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;
};

struct ResourceReadResult {
    std::vector<ResourceContent> contents;
};

/**
 * @brief Decode one content item of a tool result
 *
 * Unknown content types become a TextContent placeholder.
 *
 * @throws json::exception if a known type is missing required fields
 */
ToolCallContent parse_tool_call_content(const json& item);

void to_json(json& j, const ClientInfo& info);
void from_json(const json& j, ServerInfo& info);
void from_json(const json& j, ServerCapabilities& capabilities);
void from_json(const json& j, InitializeResult& result);
void from_json(const json& j, ToolAnnotations& annotations);
void from_json(const json& j, ToolDescriptor& tool);
void from_json(const json& j, ResourceContent& content);
void from_json(const json& j, ToolCallResult& result);
void from_json(const json& j, ResourceDescriptor& resource);
void from_json(const json& j, ResourceReadResult& result);

} // namespace mcp_bridge
