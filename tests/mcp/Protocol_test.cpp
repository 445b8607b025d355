#include <gtest/gtest.h>
#include "mcp/McpError.hpp"
#include "mcp/Protocol.hpp"

using namespace mcp_bridge;

TEST(ProtocolTest, ClassifiesMessages) {
    EXPECT_EQ(classify_message(json::parse(R"({"jsonrpc":"2.0","id":1,"method":"ping"})")),
              MessageType::Request);
    EXPECT_EQ(classify_message(json::parse(R"({"jsonrpc":"2.0","method":"notifications/message"})")),
              MessageType::Notification);
    EXPECT_EQ(classify_message(json::parse(R"({"jsonrpc":"2.0","id":1,"result":{}})")),
              MessageType::Response);
    EXPECT_EQ(classify_message(json::parse(R"({"jsonrpc":"2.0","id":1,"error":{"code":1,"message":"x"}})")),
              MessageType::Response);
    EXPECT_EQ(classify_message(json::parse(R"({"jsonrpc":"2.0","id":1})")), MessageType::Invalid);
    EXPECT_EQ(classify_message(json::array()), MessageType::Invalid);
    EXPECT_EQ(classify_message(json::parse(R"({"method":5})")), MessageType::Invalid);
}

TEST(ProtocolTest, RequestOmitsNullParams) {
    json request = make_request(7, "tools/list", json());
    EXPECT_EQ(request["jsonrpc"], "2.0");
    EXPECT_EQ(request["id"], 7);
    EXPECT_EQ(request["method"], "tools/list");
    EXPECT_FALSE(request.contains("params"));
}

TEST(ProtocolTest, UnwrapResponseReturnsResult) {
    json response = make_response(1, {{"value", 42}});
    EXPECT_EQ(unwrap_response(response)["value"], 42);
}

TEST(ProtocolTest, UnwrapResponseRaisesRpcError) {
    json response = make_error_response(1, rpc_error::INVALID_PARAMS, "bad arguments");
    try {
        unwrap_response(response);
        FAIL() << "Expected McpError";
    } catch (const McpError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Rpc);
        EXPECT_EQ(e.rpc_code(), rpc_error::INVALID_PARAMS);
        EXPECT_STREQ(e.what(), "MCP server error: JSON-RPC error -32602: bad arguments");
        EXPECT_FALSE(e.is_connection_fault());
    }
}

TEST(ProtocolTest, InitializeResultParsesCapabilities) {
    auto result = json::parse(R"({
        "protocolVersion": "2025-11-25",
        "capabilities": {"tools": {"listChanged": true}, "resources": {"subscribe": true}, "logging": {}},
        "serverInfo": {"name": "srv", "version": "2.1"}
    })").get<InitializeResult>();

    EXPECT_EQ(result.protocol_version, "2025-11-25");
    EXPECT_TRUE(result.capabilities.tools);
    EXPECT_TRUE(result.capabilities.tools_list_changed);
    EXPECT_TRUE(result.capabilities.resources);
    EXPECT_TRUE(result.capabilities.resources_subscribe);
    EXPECT_FALSE(result.capabilities.resources_list_changed);
    EXPECT_FALSE(result.capabilities.prompts);
    EXPECT_TRUE(result.capabilities.logging);
    EXPECT_EQ(result.server_info.name, "srv");
    EXPECT_EQ(result.server_info.version, "2.1");
}

TEST(ProtocolTest, InitializeResultRequiresProtocolVersion) {
    EXPECT_THROW(json::parse(R"({"capabilities": {}})").get<InitializeResult>(), json::exception);
}

TEST(ProtocolTest, ToolDescriptorDefaults) {
    auto tool = json::parse(R"({"name": "read_file"})").get<ToolDescriptor>();

    EXPECT_EQ(tool.name, "read_file");
    EXPECT_EQ(tool.description, "MCP tool: read_file");
    EXPECT_EQ(tool.input_schema, json::parse(R"({"type":"object","properties":{}})"));
    EXPECT_FALSE(tool.annotations.read_only_hint);
    EXPECT_FALSE(tool.annotations.destructive_hint);
    EXPECT_FALSE(tool.annotations.idempotent_hint);
    EXPECT_FALSE(tool.annotations.open_world_hint);
}

TEST(ProtocolTest, ToolDescriptorKeepsSchemaAndAnnotations) {
    auto tool = json::parse(R"({
        "name": "rm",
        "description": "Remove a file",
        "inputSchema": {"type": "object", "properties": {"path": {"type": "string"}}},
        "annotations": {"destructiveHint": true, "openWorldHint": false}
    })").get<ToolDescriptor>();

    EXPECT_EQ(tool.description, "Remove a file");
    EXPECT_EQ(tool.input_schema["properties"]["path"]["type"], "string");
    EXPECT_TRUE(tool.annotations.destructive_hint);
    EXPECT_FALSE(tool.annotations.open_world_hint);
}

TEST(ProtocolTest, ToolCallResultDecodesContentVariants) {
    auto result = json::parse(R"({
        "content": [
            {"type": "text", "text": "hello"},
            {"type": "image", "data": "iVBORw0K", "mimeType": "image/png"},
            {"type": "resource", "resource": {"uri": "file:///a.txt", "text": "body"}},
            {"type": "audio", "data": "AAAA", "mimeType": "audio/wav"}
        ],
        "isError": true
    })").get<ToolCallResult>();

    ASSERT_EQ(result.content.size(), 4);
    EXPECT_TRUE(result.is_error);
    EXPECT_EQ(std::get<TextContent>(result.content[0]).text, "hello");
    EXPECT_EQ(std::get<ImageContent>(result.content[1]).mime_type, "image/png");

    const auto& resource = std::get<ResourceContent>(result.content[2]);
    EXPECT_EQ(resource.uri, "file:///a.txt");
    EXPECT_EQ(resource.text, std::optional<std::string>("body"));
    EXPECT_FALSE(resource.blob.has_value());

    EXPECT_EQ(std::get<TextContent>(result.content[3]).text, "[Unsupported content: audio]");
}

TEST(ProtocolTest, ToolCallResultWithoutContentIsEmpty) {
    auto result = json::object().get<ToolCallResult>();
    EXPECT_TRUE(result.content.empty());
    EXPECT_FALSE(result.is_error);
}

TEST(ProtocolTest, ToolCallResultRejectsNonArrayContent) {
    try {
        json::parse(R"({"content": "text"})").get<ToolCallResult>();
        FAIL() << "Expected McpError";
    } catch (const McpError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Protocol);
    }
}

TEST(ProtocolTest, ResourceReadResultDecodesBlob) {
    auto result = json::parse(R"({
        "contents": [{"uri": "mem://x", "mimeType": "application/octet-stream", "blob": "AQID"}]
    })").get<ResourceReadResult>();

    ASSERT_EQ(result.contents.size(), 1);
    EXPECT_EQ(result.contents[0].mime_type, std::optional<std::string>("application/octet-stream"));
    EXPECT_EQ(result.contents[0].blob, std::optional<std::string>("AQID"));
}
