#include "config/McpConfig.hpp"
#include "core/Version.hpp"
#include "mcp/ClientManager.hpp"
#include "mcp/GatewayServer.hpp"
#include "mcp/McpError.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/McpServersTool.hpp"
#include "tools/ToolRegistry.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <iostream>
#include <memory>
#include <atomic>

namespace {
    std::atomic<bool> shutdown_requested{false};
    mcp_bridge::GatewayServer* global_server = nullptr;

    void signal_handler(int /*signal*/) {
        shutdown_requested = true;
        if (global_server) {
            global_server->stop();
        }
    }

    void setup_signal_handlers() {
        // No SA_RESTART: a read blocked on stdin returns so the loop can exit
        struct sigaction action {};
        action.sa_handler = signal_handler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(SIGINT, &action, nullptr);
        sigaction(SIGTERM, &action, nullptr);
    }

    bool apply_log_level(const std::string& log_level) {
        if (log_level == "trace") {
            spdlog::set_level(spdlog::level::trace);
        } else if (log_level == "debug") {
            spdlog::set_level(spdlog::level::debug);
        } else if (log_level == "info") {
            spdlog::set_level(spdlog::level::info);
        } else if (log_level == "warn") {
            spdlog::set_level(spdlog::level::warn);
        } else if (log_level == "error") {
            spdlog::set_level(spdlog::level::err);
        } else if (log_level == "critical") {
            spdlog::set_level(spdlog::level::critical);
        } else {
            return false;
        }
        return true;
    }

    void log_server_summary(const mcp_bridge::ClientManager& manager) {
        for (const auto& name : manager.server_names()) {
            auto client = manager.get_client(name);
            if (!client) {
                continue;
            }
            auto state = client->state();
            if (state.cause.empty()) {
                spdlog::info("MCP server '{}': {}", name, mcp_bridge::to_string(state.status));
            } else {
                spdlog::info("MCP server '{}': {} ({})", name,
                             mcp_bridge::to_string(state.status), state.cause);
            }
        }
    }

    int run_list(const mcp_bridge::ToolRegistry& registry, const mcp_bridge::ClientManager& manager) {
        for (const auto& tool : registry.tools()) {
            std::cout << tool->name() << '\t'
                      << mcp_bridge::to_string(tool->category()) << '\t'
                      << mcp_bridge::to_string(tool->risk_level()) << '\t'
                      << tool->description() << '\n';
        }
        std::cout.flush();
        log_server_summary(manager);
        return 0;
    }

    int run_call(const mcp_bridge::ToolRegistry& registry, const std::string& tool_name,
                 const nlohmann::json& arguments) {
        mcp_bridge::ToolResult result = registry.execute(tool_name, arguments);
        if (result.is_error) {
            std::cerr << result.output << std::endl;
            return 2;
        }
        std::cout << result.output << std::endl;
        return 0;
    }

    int run_serve(const std::shared_ptr<mcp_bridge::ToolRegistry>& registry) {
        auto transport = std::make_unique<mcp_bridge::StdioTransport>();
        mcp_bridge::GatewayServer server(std::move(transport), registry);

        // Store global reference for signal handler
        global_server = &server;
        if (!shutdown_requested) {
            server.run();
        }
        global_server = nullptr;

        spdlog::info("Gateway stopped cleanly");
        return 0;
    }
}

int main(int argc, char** argv) {
    // Parse command-line arguments
    CLI::App app{"mcp-bridge - expose MCP tool servers as one tool registry"};

    std::string config_path = "mcp.json";
    app.add_option("-c,--config", config_path, "MCP configuration file (JSON)")
        ->default_val("mcp.json");

    std::string log_level = "info";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("info");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    app.add_subcommand("list", "Connect to every server and list the available tools");

    auto* call_cmd = app.add_subcommand("call", "Connect and execute one tool");
    std::string tool_name;
    call_cmd->add_option("tool", tool_name, "Tool name (e.g. mcp__filesystem__read_file)")->required();
    std::string args_text = "{}";
    call_cmd->add_option("--args", args_text, "Tool arguments as a JSON object")->default_val("{}");

    auto* serve_cmd = app.add_subcommand("serve", "Serve all tools as an MCP server on stdin/stdout");

    app.require_subcommand(0, 1);

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << mcp_bridge::kBridgeName << " version " << mcp_bridge::kBridgeVersion << std::endl;
        return 0;
    }

    // Logs go to stderr; stdout carries tool output and the gateway protocol
    spdlog::set_default_logger(spdlog::stderr_color_mt("mcp-bridge"));
    if (!apply_log_level(log_level)) {
        std::cerr << "Invalid log level: " << log_level << std::endl;
        return 1;
    }

    nlohmann::json call_args = nlohmann::json::object();
    if (call_cmd->parsed()) {
        try {
            call_args = nlohmann::json::parse(args_text);
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "Invalid --args JSON: " << e.what() << std::endl;
            return 1;
        }
        if (!call_args.is_object()) {
            std::cerr << "--args must be a JSON object" << std::endl;
            return 1;
        }
    }

    mcp_bridge::McpConfig config;
    try {
        config = mcp_bridge::load_mcp_config(config_path);
    } catch (const mcp_bridge::McpError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    spdlog::info("Starting {} {}", mcp_bridge::kBridgeName, mcp_bridge::kBridgeVersion);
    spdlog::debug("Log level: {}", log_level);

    if (serve_cmd->parsed()) {
        setup_signal_handlers();
    }

    auto manager = std::make_shared<mcp_bridge::ClientManager>();
    auto registry = std::make_shared<mcp_bridge::ToolRegistry>();
    int exit_code = 0;

    try {
        manager->connect_all(config);

        registry->register_tool(std::make_shared<mcp_bridge::McpServersTool>(manager));
        manager->register_tools(*registry);

        if (serve_cmd->parsed()) {
            exit_code = run_serve(registry);
        } else if (call_cmd->parsed()) {
            exit_code = run_call(*registry, tool_name, call_args);
        } else {
            exit_code = run_list(*registry, *manager);
        }
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        exit_code = 1;
    }

    manager->shutdown();
    return exit_code;
}
