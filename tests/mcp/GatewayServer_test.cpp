#include "mcp/GatewayServer.hpp"
#include "mcp/Protocol.hpp"
#include "MockTransport.hpp"
#include <gtest/gtest.h>
#include <thread>

using namespace mcp_bridge;
using json = nlohmann::json;

namespace {

class CountingTool : public ITool {
public:
    CountingTool(std::string name, ToolCategory category, RiskLevel risk, bool fail = false)
        : name_(std::move(name)), category_(category), risk_(risk), fail_(fail) {}

    std::string name() const override { return name_; }
    std::string description() const override { return "Counts calls"; }
    ToolCategory category() const override { return category_; }
    json parameters_schema() const override {
        return {{"type", "object"}, {"properties", {{"input", {{"type", "string"}}}}}};
    }
    RiskLevel risk_level() const override { return risk_; }

    ToolResult execute(const json& arguments, const ToolContext&) override {
        ++calls;
        if (fail_) {
            return ToolResult::error("failed on purpose");
        }
        return ToolResult::success(arguments.value("input", "") + " #" + std::to_string(calls));
    }

    int calls = 0;

private:
    std::string name_;
    ToolCategory category_;
    RiskLevel risk_;
    bool fail_;
};

json request(int id, const std::string& method, const json& params = json::object()) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", params}
    };
}

} // namespace

class GatewayServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        mock_transport_raw = new MockTransport();
        registry = std::make_shared<ToolRegistry>();
        auto transport = std::unique_ptr<ITransport>(mock_transport_raw);
        server = std::make_unique<GatewayServer>(std::move(transport), registry);
    }

    /// Run the server over the queued messages until EOF
    std::vector<json> run_with(const std::vector<json>& messages) {
        for (const auto& message : messages) {
            mock_transport_raw->push_message(message);
        }
        mock_transport_raw->finish();
        server->run();
        return mock_transport_raw->written();
    }

    MockTransport* mock_transport_raw = nullptr;
    std::shared_ptr<ToolRegistry> registry;
    std::unique_ptr<GatewayServer> server;
};

TEST_F(GatewayServerTest, ToolsListEmpty) {
    auto responses = run_with({request(1, "tools/list")});

    ASSERT_EQ(responses.size(), 1);
    json response = responses[0];

    EXPECT_EQ(response["jsonrpc"], "2.0");
    EXPECT_EQ(response["id"], 1);
    EXPECT_TRUE(response.contains("result"));
    EXPECT_TRUE(response["result"]["tools"].is_array());
    EXPECT_EQ(response["result"]["tools"].size(), 0);
}

TEST_F(GatewayServerTest, InitializeHandshake) {
    auto responses = run_with({
        request(1, "initialize", {{"protocolVersion", kMcpProtocolVersion},
                                  {"clientInfo", {{"name", "host"}, {"version", "9"}}}}),
        make_notification("notifications/initialized")
    });

    // The notification gets no response
    ASSERT_EQ(responses.size(), 1);
    json result = responses[0]["result"];
    EXPECT_EQ(result["protocolVersion"], kMcpProtocolVersion);
    EXPECT_TRUE(result["capabilities"]["tools"].is_object());
    EXPECT_EQ(result["serverInfo"]["name"], "mcp-bridge");
    EXPECT_TRUE(server->initialized());
}

TEST_F(GatewayServerTest, ToolsListReflectsRegistryAndAnnotations) {
    registry->register_tool(std::make_shared<CountingTool>("reader", ToolCategory::ReadOnly, RiskLevel::Safe));
    registry->register_tool(std::make_shared<CountingTool>("wiper", ToolCategory::Network, RiskLevel::Dangerous));

    auto responses = run_with({request(1, "tools/list")});

    ASSERT_EQ(responses.size(), 1);
    json tools = responses[0]["result"]["tools"];
    ASSERT_EQ(tools.size(), 2);

    EXPECT_EQ(tools[0]["name"], "reader");
    EXPECT_EQ(tools[0]["description"], "Counts calls");
    EXPECT_EQ(tools[0]["inputSchema"]["type"], "object");
    EXPECT_EQ(tools[0]["annotations"]["readOnlyHint"], true);
    EXPECT_EQ(tools[0]["annotations"]["destructiveHint"], false);

    EXPECT_EQ(tools[1]["name"], "wiper");
    EXPECT_EQ(tools[1]["annotations"]["readOnlyHint"], false);
    EXPECT_EQ(tools[1]["annotations"]["destructiveHint"], true);
}

TEST_F(GatewayServerTest, RegisterAndCallTool) {
    auto tool = std::make_shared<CountingTool>("test_tool", ToolCategory::ReadOnly, RiskLevel::Safe);
    registry->register_tool(tool);

    auto responses = run_with({
        request(1, "tools/list"),
        request(2, "tools/call", {{"name", "test_tool"}, {"arguments", {{"input", "test_value"}}}})
    });

    ASSERT_EQ(responses.size(), 2);
    EXPECT_EQ(responses[0]["result"]["tools"].size(), 1);

    json call_response = responses[1];
    EXPECT_EQ(call_response["id"], 2);
    EXPECT_EQ(call_response["result"]["isError"], false);
    EXPECT_EQ(call_response["result"]["content"][0]["type"], "text");
    EXPECT_EQ(call_response["result"]["content"][0]["text"], "test_value #1");
    EXPECT_EQ(tool->calls, 1);
}

TEST_F(GatewayServerTest, ToolErrorMapsToIsError) {
    registry->register_tool(std::make_shared<CountingTool>("broken", ToolCategory::Write,
                                                           RiskLevel::Moderate, true));

    auto responses = run_with({request(1, "tools/call", {{"name", "broken"}})});

    ASSERT_EQ(responses.size(), 1);
    EXPECT_EQ(responses[0]["result"]["isError"], true);
    EXPECT_EQ(responses[0]["result"]["content"][0]["text"], "failed on purpose");
}

TEST_F(GatewayServerTest, CallNonexistentTool) {
    auto responses = run_with({
        request(1, "tools/call", {{"name", "nonexistent_tool"}, {"arguments", json::object()}})
    });

    ASSERT_EQ(responses.size(), 1);
    EXPECT_EQ(responses[0]["result"]["isError"], true);
    EXPECT_EQ(responses[0]["result"]["content"][0]["text"], "Unknown tool: nonexistent_tool");
}

TEST_F(GatewayServerTest, CallWithoutNameIsInvalidParams) {
    auto responses = run_with({request(1, "tools/call", {{"arguments", json::object()}})});

    ASSERT_EQ(responses.size(), 1);
    EXPECT_EQ(responses[0]["error"]["code"], rpc_error::INVALID_PARAMS);
}

TEST_F(GatewayServerTest, InvalidMethod) {
    auto responses = run_with({request(1, "invalid/method")});

    ASSERT_EQ(responses.size(), 1);
    json response = responses[0];
    EXPECT_EQ(response["jsonrpc"], "2.0");
    EXPECT_EQ(response["id"], 1);
    EXPECT_TRUE(response.contains("error"));
    EXPECT_EQ(response["error"]["code"], -32601);  // Method not found
}

TEST_F(GatewayServerTest, InvalidRequests) {
    auto responses = run_with({
        json{{"id", 1}, {"method", "tools/list"}},
        json{{"jsonrpc", "2.0"}, {"id", 2}}
    });

    ASSERT_EQ(responses.size(), 2);
    EXPECT_EQ(responses[0]["error"]["code"], -32600);
    EXPECT_EQ(responses[1]["error"]["code"], -32600);
    EXPECT_EQ(responses[1]["id"], 2);
}

TEST_F(GatewayServerTest, ParseErrorKeepsServing) {
    mock_transport_raw->push_malformed("{broken");
    auto responses = run_with({request(2, "ping")});

    ASSERT_EQ(responses.size(), 2);
    EXPECT_EQ(responses[0]["error"]["code"], -32700);
    EXPECT_TRUE(responses[0]["id"].is_null());
    EXPECT_EQ(responses[1]["id"], 2);
    EXPECT_EQ(responses[1]["result"], json::object());
}

TEST_F(GatewayServerTest, MultipleRequests) {
    auto tool = std::make_shared<CountingTool>("counter", ToolCategory::ReadOnly, RiskLevel::Safe);
    registry->register_tool(tool);

    std::vector<json> requests;
    for (int i = 1; i <= 3; i++) {
        requests.push_back(request(i, "tools/call", {{"name", "counter"}, {"arguments", json::object()}}));
    }

    auto responses = run_with(requests);

    EXPECT_EQ(tool->calls, 3);
    ASSERT_EQ(responses.size(), 3);
    for (const auto& response : responses) {
        EXPECT_EQ(response["jsonrpc"], "2.0");
    }
}

TEST_F(GatewayServerTest, StopEndsLoop) {
    std::thread runner([this] { server->run(); });
    server->stop();
    runner.join();

    EXPECT_TRUE(mock_transport_raw->closed());
}
