#include "tools/ToolRegistry.hpp"
#include "tools/McpServersTool.hpp"
#include "mcp/McpError.hpp"
#include "../mcp/MockTransport.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace mcp_bridge;
using namespace std::chrono_literals;

namespace {

class StubTool : public ITool {
public:
    explicit StubTool(std::string name, bool throws = false)
        : name_(std::move(name)), throws_(throws) {}

    std::string name() const override { return name_; }
    std::string description() const override { return "stub"; }
    ToolCategory category() const override { return ToolCategory::ReadOnly; }
    json parameters_schema() const override { return json::object(); }
    RiskLevel risk_level() const override { return RiskLevel::Safe; }

    ToolResult execute(const json& arguments, const ToolContext&) override {
        if (throws_) {
            throw std::runtime_error("boom");
        }
        return ToolResult::success(name_ + ":" + arguments.dump());
    }

private:
    std::string name_;
    bool throws_;
};

std::vector<std::string> names_of(const ToolRegistry& registry) {
    std::vector<std::string> names;
    for (const auto& tool : registry.tools()) {
        names.push_back(tool->name());
    }
    return names;
}

} // namespace

TEST(ToolRegistryTest, RegisterAndFind) {
    ToolRegistry registry;
    registry.register_tool(std::make_shared<StubTool>("read"));

    EXPECT_EQ(registry.size(), 1);
    ASSERT_NE(registry.find("read"), nullptr);
    EXPECT_EQ(registry.find("read")->name(), "read");
    EXPECT_EQ(registry.find("write"), nullptr);
}

TEST(ToolRegistryTest, RejectsInvalidRegistrations) {
    ToolRegistry registry;
    registry.register_tool(std::make_shared<StubTool>("read"));

    EXPECT_THROW(registry.register_tool(nullptr), std::invalid_argument);
    EXPECT_THROW(registry.register_tool(std::make_shared<StubTool>("")), std::invalid_argument);
    EXPECT_THROW(registry.register_tool(std::make_shared<StubTool>("read")), std::invalid_argument);
    EXPECT_EQ(registry.size(), 1);
}

TEST(ToolRegistryTest, ToolsAreOrderedByName) {
    ToolRegistry registry;
    registry.register_tool(std::make_shared<StubTool>("zeta"));
    registry.register_tool(std::make_shared<StubTool>("alpha"));
    registry.register_tool(std::make_shared<StubTool>("mcp__fs__read"));

    EXPECT_EQ(names_of(registry), (std::vector<std::string>{"alpha", "mcp__fs__read", "zeta"}));
}

TEST(ToolRegistryTest, UnregisterTool) {
    ToolRegistry registry;
    registry.register_tool(std::make_shared<StubTool>("read"));

    EXPECT_TRUE(registry.unregister_tool("read"));
    EXPECT_FALSE(registry.unregister_tool("read"));
    EXPECT_EQ(registry.size(), 0);
}

TEST(ToolRegistryTest, ExecuteDispatchesByName) {
    ToolRegistry registry;
    registry.register_tool(std::make_shared<StubTool>("echo"));

    ToolResult result = registry.execute("echo", {{"x", 1}});
    EXPECT_FALSE(result.is_error);
    EXPECT_EQ(result.output, "echo:{\"x\":1}");
}

TEST(ToolRegistryTest, ExecuteUnknownToolIsError) {
    ToolRegistry registry;

    ToolResult result = registry.execute("missing", json::object());
    EXPECT_TRUE(result.is_error);
    EXPECT_EQ(result.output, "Unknown tool: missing");
}

TEST(ToolRegistryTest, ThrowingToolBecomesError) {
    ToolRegistry registry;
    registry.register_tool(std::make_shared<StubTool>("explode", true));

    ToolResult result = registry.execute("explode", json::object());
    EXPECT_TRUE(result.is_error);
    EXPECT_EQ(result.output, "Tool 'explode' failed: boom");
}

TEST(ToolEnumsTest, Names) {
    EXPECT_EQ(to_string(ToolCategory::ReadOnly), "read_only");
    EXPECT_EQ(to_string(ToolCategory::Network), "network");
    EXPECT_EQ(to_string(RiskLevel::Moderate), "moderate");
    EXPECT_EQ(to_string(RiskLevel::Dangerous), "dangerous");
}

class McpServersToolTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto mock = std::make_shared<MockTransport>();
        mock->set_responder(scripted_mcp_server(json::array({json{{"name", "read"}}, json{{"name", "write"}}})));

        manager = std::make_shared<ClientManager>(
            [mock](const ServerDescriptor& descriptor) -> std::unique_ptr<ITransport> {
                if (descriptor.name != "fs") {
                    throw McpError::spawn_failed(descriptor.command + ": No such file or directory");
                }
                return mock_transport_factory(mock)(descriptor);
            });

        RawServerConfig fs;
        fs.command = "fs-server";
        fs.trust_level = "trusted";
        fs.handshake_timeout = 2s;
        fs.request_timeout = 2s;
        config.servers["fs"] = fs;

        RawServerConfig broken;
        broken.command = "no-such-server";
        config.servers["broken"] = broken;

        manager->connect_all(config);
        tool = std::make_unique<McpServersTool>(manager);
    }

    void TearDown() override {
        tool.reset();
        manager->shutdown();
    }

    McpConfig config;
    std::shared_ptr<ClientManager> manager;
    std::unique_ptr<McpServersTool> tool;
};

TEST_F(McpServersToolTest, Metadata) {
    EXPECT_EQ(tool->name(), "mcp_servers");
    EXPECT_EQ(tool->category(), ToolCategory::ReadOnly);
    EXPECT_EQ(tool->risk_level(), RiskLevel::Safe);
    EXPECT_TRUE(tool->parameters_schema()["properties"].contains("server"));
}

TEST_F(McpServersToolTest, ReportsEveryServer) {
    ToolResult result = tool->execute(json::object(), {});
    ASSERT_FALSE(result.is_error) << result.output;

    json report = json::parse(result.output);
    ASSERT_EQ(report["servers"].size(), 2);

    const json& broken = report["servers"][0];
    EXPECT_EQ(broken["name"], "broken");
    EXPECT_EQ(broken["status"], "failed");
    EXPECT_EQ(broken["trust_level"], "untrusted");
    EXPECT_NE(broken["cause"].get<std::string>().find("no-such-server"), std::string::npos);
    EXPECT_FALSE(broken.contains("tools"));

    const json& fs = report["servers"][1];
    EXPECT_EQ(fs["name"], "fs");
    EXPECT_EQ(fs["status"], "connected");
    EXPECT_EQ(fs["trust_level"], "trusted");
    EXPECT_EQ(fs["command"], "fs-server");
    EXPECT_EQ(fs["server"]["name"], "scripted");
    EXPECT_EQ(fs["tools"], 2);
    EXPECT_EQ(fs["tools_stale"], false);
    EXPECT_FALSE(fs.contains("cause"));
}

TEST_F(McpServersToolTest, FiltersByServer) {
    ToolResult result = tool->execute({{"server", "fs"}}, {});
    ASSERT_FALSE(result.is_error) << result.output;

    json report = json::parse(result.output);
    ASSERT_EQ(report["servers"].size(), 1);
    EXPECT_EQ(report["servers"][0]["name"], "fs");
}

TEST_F(McpServersToolTest, UnknownServerIsError) {
    ToolResult result = tool->execute({{"server", "nope"}}, {});
    EXPECT_TRUE(result.is_error);
    EXPECT_EQ(result.output, "Unknown MCP server: nope");
}

TEST_F(McpServersToolTest, NonStringServerIsError) {
    ToolResult result = tool->execute({{"server", 7}}, {});
    EXPECT_TRUE(result.is_error);
    EXPECT_EQ(result.output, "server must be a string");
}

TEST_F(McpServersToolTest, ReportsDisconnectAfterShutdown) {
    manager->shutdown();

    json report = json::parse(tool->execute({{"server", "fs"}}, {}).output);
    EXPECT_EQ(report["servers"][0]["status"], "disconnected");
    EXPECT_FALSE(report["servers"][0].contains("tools"));
}
